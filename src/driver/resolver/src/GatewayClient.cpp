#include "GatewayClient.hpp"
#include "DriverErrors.hpp"
#include "LogUtils.hpp"
#include "UrlUtils.hpp"

std::string GatewayClient::engine_url_path(const std::string& account_name) {
    return "/web/v3/account/" + UrlUtils::url_encode(account_name) + "/engineUrl";
}

std::string GatewayClient::resolve_path(const std::string& account_name) {
    return "/web/v3/account/" + UrlUtils::url_encode(account_name) + "/resolve";
}

std::string GatewayClient::get_field(const std::string& account_name, const std::string& path,
                                      const std::string& field, const char* what) {
    HttpResponse response = transport_.request("GET", path);
    if (response.status_code == HttpStatus::NOT_FOUND) {
        throw AccountNotFoundError(account_name);
    }
    if (response.status_code != HttpStatus::OK) {
        throw InterfaceError(fmt::format("Unable to retrieve {} {}: {} {}",
                                         what, path, response.status_code, response.body));
    }

    const nlohmann::json payload = nlohmann::json::parse(response.body, nullptr, false);
    if (!payload.is_object() || !payload.contains(field) || !payload[field].is_string()) {
        throw InterfaceError(fmt::format("Unable to retrieve {} {}: no \"{}\" in response",
                                         what, path, field));
    }
    return payload[field].get<std::string>();
}

std::string GatewayClient::system_engine_url(const std::string& account_name) {
    std::string url = get_field(account_name, engine_url_path(account_name), "engineUrl",
                                "system engine endpoint");
    LogUtils::debug("System engine of account {} is {}", account_name, url);
    return url + DYNAMIC_QUERY;
}

std::string GatewayClient::resolve_account(const std::string& account_name) {
    return get_field(account_name, resolve_path(account_name), "id", "account id");
}
