#include "AuthProvider.hpp"
#include "HttplibTransport.hpp"
#include "DriverErrors.hpp"
#include "LogUtils.hpp"
#include "UrlUtils.hpp"

namespace {

// Refresh a little before the server-side expiry
constexpr std::chrono::seconds EXPIRY_MARGIN{30};

}

ClientCredentialsAuth::ClientCredentialsAuth(std::string client_id,
                                             std::string client_secret,
                                             const std::string& api_endpoint,
                                             int timeout_seconds)
    : ClientCredentialsAuth(std::move(client_id), std::move(client_secret),
                            std::make_unique<HttplibTransport>(
                                UrlUtils::auth_endpoint(api_endpoint), nullptr,
                                TransportOptions{timeout_seconds, "boltsql"})) {}

ClientCredentialsAuth::ClientCredentialsAuth(std::string client_id,
                                             std::string client_secret,
                                             std::unique_ptr<HttpTransport> identity_transport)
    : client_id_(std::move(client_id)),
      client_secret_(std::move(client_secret)),
      transport_(std::move(identity_transport)) {
    if (!transport_) {
        throw std::invalid_argument("ClientCredentialsAuth requires an identity transport");
    }
}

std::string ClientCredentialsAuth::token() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (token_.empty() || std::chrono::steady_clock::now() >= expires_at_) {
        fetch_token();
    }
    return token_;
}

void ClientCredentialsAuth::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    token_.clear();
}

void ClientCredentialsAuth::fetch_token() {
    const std::string body =
        "client_id=" + UrlUtils::url_encode(client_id_) +
        "&client_secret=" + UrlUtils::url_encode(client_secret_) +
        "&grant_type=client_credentials" +
        "&audience=" + UrlUtils::url_encode(AUDIENCE);

    HttpResponse response = transport_->request("POST", TOKEN_PATH, {}, body,
                                                "application/x-www-form-urlencoded");
    if (!response.ok()) {
        LogUtils::error("Authentication failed with status {}", response.status_code);
        throw InterfaceError("Failed to authenticate: " + response.body);
    }

    const nlohmann::json payload = response.json();
    auto token_it = payload.find("access_token");
    if (token_it == payload.end() || !token_it->is_string() || token_it->get<std::string>().empty()) {
        throw InterfaceError("Failed to authenticate: response has no access_token");
    }

    int64_t expires_in = 3600;
    auto expires_it = payload.find("expires_in");
    if (expires_it != payload.end() && expires_it->is_number()) {
        expires_in = expires_it->get<int64_t>();
    }

    token_ = token_it->get<std::string>();
    expires_at_ = std::chrono::steady_clock::now() + std::chrono::seconds(expires_in) - EXPIRY_MARGIN;
    LogUtils::debug("Acquired access token valid for {} seconds", expires_in);
}
