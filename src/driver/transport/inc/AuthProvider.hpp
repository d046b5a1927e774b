#pragma once

#include "HttpTransport.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

// Supplies the bearer credential used by transports
class AuthProvider {
public:
    virtual ~AuthProvider() = default;

    virtual std::string token() = 0;

    // Drop any cached credential; the next token() call acquires a fresh one
    virtual void invalidate() = 0;
};

class StaticTokenAuth : public AuthProvider {
public:
    explicit StaticTokenAuth(std::string token) : token_(std::move(token)) {}

    std::string token() override { return token_; }
    void invalidate() override {}

private:
    std::string token_;
};

/**
 * OAuth client-credentials grant against the identity host of the API
 * endpoint ("api.app.x.io" -> "id.app.x.io"). The token is cached until
 * shortly before it expires.
 */
class ClientCredentialsAuth : public AuthProvider {
public:
    static constexpr const char* AUDIENCE = "https://api.firebolt.io";
    static constexpr const char* TOKEN_PATH = "/oauth/token";

    ClientCredentialsAuth(std::string client_id,
                          std::string client_secret,
                          const std::string& api_endpoint,
                          int timeout_seconds = 60);

    // Uses the given transport to reach the identity host
    ClientCredentialsAuth(std::string client_id,
                          std::string client_secret,
                          std::unique_ptr<HttpTransport> identity_transport);

    std::string token() override;
    void invalidate() override;

private:
    void fetch_token();

    std::string client_id_;
    std::string client_secret_;
    std::unique_ptr<HttpTransport> transport_;

    std::mutex mutex_;
    std::string token_;
    std::chrono::steady_clock::time_point expires_at_;
};
