#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>

using QueryParams = std::map<std::string, std::string>;

struct HttpResponse {
    int status_code = 0;
    std::map<std::string, std::string> headers;     // lowercase names
    std::string body;

    bool ok() const { return status_code >= 200 && status_code < 300; }

    std::optional<std::string> header(const std::string& name) const;

    /**
     * Parse the body as JSON.
     * @throws DataError If the body is not valid JSON
     */
    nlohmann::json json() const;
};

// HTTP status codes the driver reacts to
namespace HttpStatus {
    constexpr int OK = 200;
    constexpr int BAD_REQUEST = 400;
    constexpr int UNAUTHORIZED = 401;
    constexpr int FORBIDDEN = 403;
    constexpr int NOT_FOUND = 404;
    constexpr int INTERNAL_SERVER_ERROR = 500;
    constexpr int SERVICE_UNAVAILABLE = 503;
}

// Request channel to one HTTP endpoint; paths are relative to its base URL
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * Send one request and return whatever status the server answered with.
     * @throws HttpError With status 0 when no response was received
     */
    virtual HttpResponse request(const std::string& method,
                                 const std::string& path,
                                 const QueryParams& params = {},
                                 const std::string& body = "",
                                 const std::string& content_type = "text/plain;charset=UTF-8") = 0;

    virtual void close() = 0;
    virtual bool is_closed() const = 0;
};
