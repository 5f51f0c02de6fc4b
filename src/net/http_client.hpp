#pragma once
#include <string>
#include <utility>
#include <vector>

namespace mahilo::net {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpResponse {
    int status = 0;            // 0 when no response was received
    std::string body;
    std::string error;         // transport error, empty on any HTTP response

    bool is_success() const { return error.empty() && status >= 200 && status < 300; }
};

// Outbound POST seam used for webhook delivery
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const HeaderList& headers,
                              int timeout_ms) = 0;
};

// cpp-httplib implementation. A fresh connection per attempt.
class HttplibClient final : public HttpClient {
public:
    HttplibClient() = default;

    // Non-copyable
    HttplibClient(const HttplibClient&) = delete;
    HttplibClient& operator=(const HttplibClient&) = delete;

    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const HeaderList& headers,
                      int timeout_ms) override;
};

} // namespace mahilo::net
