#pragma once

#include "codepair/gateway.h"

namespace codepair {

// libcurl-backed transport, one easy handle per request
class CurlTransport : public HttpTransport {
public:
    CurlTransport();
    ~CurlTransport() override;

    HttpResult post(const std::string& url, const std::string& body,
                    const std::map<std::string, std::string>& headers,
                    std::chrono::milliseconds timeout) override;
};

} // namespace codepair
