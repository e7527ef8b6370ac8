#include "codepair/curl_transport.h"
#include <curl/curl.h>
#include <mutex>
#include <stdexcept>

namespace codepair {

namespace {

std::once_flag curl_init_flag;

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    size_t total = size * nmemb;
    if (out->size() + total > MAX_OUTPUT_SIZE * 2) {
        return 0;  // abort oversized responses
    }
    out->append(ptr, total);
    return total;
}

} // namespace

CurlTransport::CurlTransport() {
    std::call_once(curl_init_flag, []() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
    });
}

CurlTransport::~CurlTransport() = default;

HttpResult CurlTransport::post(const std::string& url, const std::string& body,
                               const std::map<std::string, std::string>& headers,
                               std::chrono::milliseconds timeout) {
    HttpResult result;

    CURL* curl = curl_easy_init();
    if (!curl) {
        result.transport_error = "curl_easy_init failed";
        return result;
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& [key, value] : headers) {
        header_list = curl_slist_append(header_list, (key + ": " + value).c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "codepair/1.0");
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &result.body);

    CURLcode code = curl_easy_perform(curl);
    if (code == CURLE_OK) {
        result.transport_ok = true;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.status_code);
    } else {
        result.transport_error = curl_easy_strerror(code);
    }

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);
    return result;
}

} // namespace codepair
