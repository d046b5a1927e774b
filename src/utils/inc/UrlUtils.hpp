#pragma once

#include <string>

struct UrlParts {
    std::string scheme;     // "https" when the input has none
    std::string host;
    int port = 0;           // 0 when not given explicitly
    std::string path;       // always starts with '/' or is empty

    // "scheme://host[:port]", the form cpp-httplib expects
    std::string origin() const;
};

namespace UrlUtils {

    // Add schema to URL if it's missing
    std::string fix_url_schema(const std::string& url);

    /**
     * Split a URL into scheme, host, port and path.
     * @throws std::runtime_error If the host is empty or the port is invalid
     */
    UrlParts parse(const std::string& url);

    // "api.app.example.io" -> "https://id.app.example.io"
    std::string auth_endpoint(const std::string& api_endpoint);

    // Catalog key of an engine: first host label, '-' replaced by '_'
    std::string engine_name_from_url(const std::string& engine_url);

    std::string join_path(const std::string& base, const std::string& path);

    // Percent-encode everything except unreserved characters (RFC 3986)
    std::string url_encode(const std::string& value);
}
