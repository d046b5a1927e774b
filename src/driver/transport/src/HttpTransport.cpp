#include "HttpTransport.hpp"
#include "DriverErrors.hpp"
#include "StringUtils.hpp"

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    auto it = headers.find(StringUtils::to_lower(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

nlohmann::json HttpResponse::json() const {
    nlohmann::json parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        throw DataError("Invalid JSON in response body: " + body.substr(0, 256));
    }
    return parsed;
}
