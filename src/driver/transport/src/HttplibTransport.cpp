#include "HttplibTransport.hpp"
#include "DriverErrors.hpp"
#include "LogUtils.hpp"
#include "StringUtils.hpp"

#include <httplib.h>

HttplibTransport::HttplibTransport(const std::string& base_url,
                                   std::shared_ptr<AuthProvider> auth,
                                   TransportOptions options)
    : base_(UrlUtils::parse(base_url)), auth_(std::move(auth)), options_(std::move(options)) {

    client_ = std::make_unique<httplib::Client>(base_.origin());
    client_->set_connection_timeout(options_.timeout_seconds, 0);
    client_->set_read_timeout(options_.timeout_seconds, 0);
    client_->set_write_timeout(options_.timeout_seconds, 0);
    client_->set_keep_alive(true);
}

HttplibTransport::~HttplibTransport() {
    close();
}

void HttplibTransport::close() {
    if (closed_.exchange(true)) {
        return;
    }
    if (client_) {
        client_->stop();
    }
}

HttpResponse HttplibTransport::request(const std::string& method,
                                       const std::string& path,
                                       const QueryParams& params,
                                       const std::string& body,
                                       const std::string& content_type) {
    if (closed_) {
        throw ConnectionClosedError("Transport to " + base_.origin() + " is closed.");
    }

    httplib::Params query(params.begin(), params.end());
    const std::string target = httplib::append_query_params(UrlUtils::join_path(base_.path, path), query);

    HttpResponse response = send_once(method, target, body, content_type);
    if (response.status_code == HttpStatus::UNAUTHORIZED && auth_) {
        LogUtils::debug("Received 401 from {}, refreshing access token", base_.origin());
        auth_->invalidate();
        response = send_once(method, target, body, content_type);
    }
    return response;
}

HttpResponse HttplibTransport::send_once(const std::string& method,
                                         const std::string& target,
                                         const std::string& body,
                                         const std::string& content_type) {
    httplib::Headers headers = {{"User-Agent", options_.user_agent}};
    if (auth_) {
        headers.emplace("Authorization", "Bearer " + auth_->token());
    }

    httplib::Result result = method == "GET"
        ? client_->Get(target, headers)
        : client_->Post(target, headers, body, content_type);

    if (!result) {
        const std::string reason = httplib::to_string(result.error());
        LogUtils::error("{} {}{} failed: {}", method, base_.origin(), target, reason);
        throw HttpError(0, reason);
    }

    HttpResponse response;
    response.status_code = result->status;
    response.body = result->body;
    for (const auto& [name, value] : result->headers) {
        response.headers[StringUtils::to_lower(name)] = value;
    }
    return response;
}
