#pragma once
#include <string>
#include <vector>
#include <utility>
#include <atomic>

namespace agentmem {

// Initialize HTTP subsystem (call once at startup).
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0; // 0 = transport failure, timeout or abort
    std::string body;
};

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // POST `body` to `url`. When `abort_flag` is non-null it is polled during
    // the transfer (~1s granularity) and a raised flag aborts the request.
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_ms = 120000,
                              const std::atomic<bool>* abort_flag = nullptr) = 0;
};

// libcurl implementation
class CurlHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_ms = 120000,
                      const std::atomic<bool>* abort_flag = nullptr) override;
};

// HTTP POST with JSON body
HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_ms = 120000,
                       const std::atomic<bool>* abort_flag = nullptr);

} // namespace agentmem
