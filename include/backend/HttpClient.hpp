#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace listui::backend {

struct HttpResponse {
    long status = 0;
    std::string body;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // nullopt on connection-level failure (DNS, TLS, timeout).
    virtual std::optional<HttpResponse> get(const std::string& url) = 0;
};

// libcurl easy handle, reused between requests. One thread at a time.
class HttpClient : public HttpTransport {
public:
    explicit HttpClient(std::chrono::seconds timeout);
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    std::optional<HttpResponse> get(const std::string& url) override;

    static std::string escape(const std::string& value);

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl_;
};

}  // namespace listui::backend
