#pragma once

#include "HttpTransport.hpp"
#include <string>

// Account lookups on the API gateway, before any engine is known
class GatewayClient {
public:
    static constexpr const char* DYNAMIC_QUERY = "/dynamic/query";

    explicit GatewayClient(HttpTransport& transport) : transport_(transport) {}

    /**
     * Query endpoint of the account's system engine.
     * @throws AccountNotFoundError On 404
     * @throws InterfaceError On any other non-200 response
     */
    std::string system_engine_url(const std::string& account_name);

    /**
     * Resolve an account name to its id.
     * @throws AccountNotFoundError On 404
     * @throws InterfaceError On any other non-200 response
     */
    std::string resolve_account(const std::string& account_name);

    static std::string engine_url_path(const std::string& account_name);
    static std::string resolve_path(const std::string& account_name);

private:
    std::string get_field(const std::string& account_name, const std::string& path,
                          const std::string& field, const char* what);

    HttpTransport& transport_;
};
