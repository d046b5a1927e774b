#pragma once

#include "HttpTransport.hpp"
#include "AuthProvider.hpp"
#include "UrlUtils.hpp"
#include <atomic>
#include <memory>
#include <string>

namespace httplib {
    class Client;
}

struct TransportOptions {
    int timeout_seconds = 60;
    std::string user_agent = "boltsql";
};

// HttpTransport over a cpp-httplib client bound to one base URL
class HttplibTransport : public HttpTransport {
public:
    /**
     * @param base_url "scheme://host[:port][/path]"; https is assumed without a scheme
     * @param auth Bearer credential source, or nullptr for unauthenticated endpoints
     */
    HttplibTransport(const std::string& base_url,
                     std::shared_ptr<AuthProvider> auth,
                     TransportOptions options = {});
    ~HttplibTransport() override;

    HttplibTransport(const HttplibTransport&) = delete;
    HttplibTransport& operator=(const HttplibTransport&) = delete;

    HttpResponse request(const std::string& method,
                         const std::string& path,
                         const QueryParams& params = {},
                         const std::string& body = "",
                         const std::string& content_type = "text/plain;charset=UTF-8") override;

    void close() override;
    bool is_closed() const override { return closed_; }

    const UrlParts& base() const { return base_; }

private:
    HttpResponse send_once(const std::string& method,
                           const std::string& target,
                           const std::string& body,
                           const std::string& content_type);

    UrlParts base_;
    std::shared_ptr<AuthProvider> auth_;
    TransportOptions options_;
    std::unique_ptr<httplib::Client> client_;
    std::atomic<bool> closed_{false};
};
