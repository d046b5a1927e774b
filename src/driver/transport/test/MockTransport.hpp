#pragma once

#include "HttpTransport.hpp"
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

struct RecordedRequest {
    std::string method;
    std::string path;
    QueryParams params;
    std::string body;
    std::string content_type;

    bool has_param(const std::string& name) const { return params.count(name) > 0; }
    std::string param(const std::string& name) const {
        auto it = params.find(name);
        return it == params.end() ? std::string() : it->second;
    }
};

// In-process HttpTransport that answers from scripted routes and records every request.
// Routes registered later take precedence over earlier ones.
class MockTransport : public HttpTransport {
public:
    using Handler = std::function<HttpResponse(const RecordedRequest&)>;

    static HttpResponse respond(int status, std::string body = "") {
        HttpResponse response;
        response.status_code = status;
        response.body = std::move(body);
        response.headers["content-length"] = std::to_string(response.body.size());
        return response;
    }

    static HttpResponse respond_json(const nlohmann::json& body, int status = HttpStatus::OK) {
        HttpResponse response = respond(status, body.dump());
        response.headers["content-type"] = "application/json";
        return response;
    }

    // JSON_Compact result: meta as {name, type} pairs plus raw rows
    static HttpResponse respond_rows(const std::vector<std::pair<std::string, std::string>>& meta,
                                     const nlohmann::json& data) {
        nlohmann::json body;
        body["meta"] = nlohmann::json::array();
        for (const auto& [name, type] : meta) {
            body["meta"].push_back({{"name", name}, {"type", type}});
        }
        body["data"] = data;
        body["rows"] = data.size();
        body["statistics"] = {{"elapsed", 0.001}, {"rows_read", data.size()}, {"bytes_read", 8},
                              {"time_before_execution", 0.0001}, {"time_to_execute", 0.0009}};
        return respond_json(body);
    }

    // Any request to `path` whose body contains `body_contains`
    void on(const std::string& path, const std::string& body_contains, Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        routes_.push_back(Route{path, body_contains, std::move(handler)});
    }

    void on(const std::string& path, const std::string& body_contains, HttpResponse response) {
        on(path, body_contains, [response](const RecordedRequest&) { return response; });
    }

    // Query endpoint ("") keyed by SQL text
    void on_query(const std::string& sql_contains, HttpResponse response) {
        on("", sql_contains, std::move(response));
    }

    void on_query(const std::string& sql_contains, Handler handler) {
        on("", sql_contains, std::move(handler));
    }

    HttpResponse request(const std::string& method,
                         const std::string& path,
                         const QueryParams& params = {},
                         const std::string& body = "",
                         const std::string& content_type = "text/plain;charset=UTF-8") override {
        RecordedRequest recorded{method, path, params, body, content_type};
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                throw std::runtime_error("request on closed MockTransport");
            }
            requests_.push_back(recorded);
            for (auto it = routes_.rbegin(); it != routes_.rend(); ++it) {
                if (it->path == path && body.find(it->body_contains) != std::string::npos) {
                    handler = it->handler;
                    break;
                }
            }
        }
        if (!handler) {
            return respond(HttpStatus::NOT_FOUND, "no route for " + path + ": " + body);
        }
        return handler(recorded);
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }

    bool is_closed() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::vector<RecordedRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    size_t count(const std::string& path, const std::string& body_contains = "") const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& r : requests_) {
            if (r.path == path && r.body.find(body_contains) != std::string::npos) ++n;
        }
        return n;
    }

    RecordedRequest last_request() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.empty() ? RecordedRequest{} : requests_.back();
    }

    void clear_requests() {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.clear();
    }

private:
    struct Route {
        std::string path;
        std::string body_contains;
        Handler handler;
    };

    mutable std::mutex mutex_;
    std::vector<Route> routes_;
    std::vector<RecordedRequest> requests_;
    bool closed_ = false;
};
