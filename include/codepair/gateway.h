#pragma once

#include <string>
#include <map>
#include <memory>
#include <chrono>
#include <functional>
#include "codepair/constants.h"
#include "codepair/executor.h"
#include "codepair/language.h"

namespace codepair {

struct HttpResult {
    bool transport_ok = false;     // false: DNS/connect/timeout, no status
    long status_code = 0;
    std::string body;
    std::string transport_error;
};

// Outbound HTTP seam; CurlTransport in production, fakes in tests
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResult post(const std::string& url, const std::string& body,
                            const std::map<std::string, std::string>& headers,
                            std::chrono::milliseconds timeout) = 0;
};

// Bounded retry for rate-limited responses
struct RetryPolicy {
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    int max_attempts = GATEWAY_MAX_ATTEMPTS;
    std::chrono::milliseconds fixed_delay{GATEWAY_RETRY_DELAY_MS};
    Sleeper sleep;                                  // default: std::this_thread::sleep_for

    // Delay before attempt number `attempt` (1-based, so attempt >= 2)
    std::chrono::milliseconds delay(int attempt) const;

    void wait_before(int attempt) const;
};

struct GatewayConfig {
    std::string url = "https://emkc.org/api/v2/piston";
    std::chrono::milliseconds run_timeout{GATEWAY_RUN_TIMEOUT_MS};
    std::chrono::milliseconds http_timeout{GATEWAY_HTTP_TIMEOUT_MS};
    size_t max_code_size = MAX_CODE_SIZE;
};

// Executes code on a Piston-compatible remote service
class RemoteGateway : public CodeExecutor {
public:
    RemoteGateway(std::shared_ptr<HttpTransport> transport,
                  LanguageTable languages = LanguageTable::defaults(),
                  const GatewayConfig& config = GatewayConfig{},
                  RetryPolicy retry = RetryPolicy{});

    ExecutionResult execute(const std::string& code, Language language) override;

    // Request body for the remote service
    static std::string build_request(const LanguageSpec& spec, const std::string& code,
                                     std::chrono::milliseconds run_timeout);

    // Map a 2xx response body to a result
    static ExecutionResult parse_response(const std::string& body);

    static std::string remote_filename(const LanguageSpec& spec);

private:
    std::shared_ptr<HttpTransport> transport_;
    LanguageTable languages_;
    GatewayConfig config_;
    RetryPolicy retry_;
};

} // namespace codepair
