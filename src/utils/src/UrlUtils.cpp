#include "UrlUtils.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

std::string UrlParts::origin() const {
    std::string out = scheme + "://" + host;
    if (port != 0) {
        out += ":" + std::to_string(port);
    }
    return out;
}

namespace UrlUtils {

std::string fix_url_schema(const std::string& url) {
    return url.rfind("http", 0) == 0 ? url : "https://" + url;
}

UrlParts parse(const std::string& url) {
    UrlParts parts;
    const std::string full = fix_url_schema(url);

    const size_t scheme_end = full.find("://");
    if (scheme_end == std::string::npos) {
        throw std::runtime_error("URL invalid: missing '://' in " + url);
    }
    parts.scheme = full.substr(0, scheme_end);

    const std::string rest = full.substr(scheme_end + 3);
    const size_t path_start = rest.find('/');
    const std::string host_port = rest.substr(0, path_start);
    if (path_start != std::string::npos) {
        parts.path = rest.substr(path_start);
        while (parts.path.size() > 1 && parts.path.back() == '/') {
            parts.path.pop_back();
        }
        if (parts.path == "/") parts.path.clear();
    }

    const size_t colon_pos = host_port.find(':');
    parts.host = host_port.substr(0, colon_pos);
    if (parts.host.empty()) {
        throw std::runtime_error("URL invalid: empty host in " + url);
    }

    if (colon_pos != std::string::npos) {
        const std::string port_str = host_port.substr(colon_pos + 1);
        try {
            parts.port = std::stoi(port_str);
        } catch (const std::exception& e) {
            throw std::runtime_error("Port parse error: " + std::string(e.what()));
        }
        if (parts.port <= 0 || parts.port > 65535) {
            throw std::runtime_error("Invalid port number: " + port_str);
        }
    }

    return parts;
}

std::string auth_endpoint(const std::string& api_endpoint) {
    UrlParts parts = parse(api_endpoint);
    const size_t dot = parts.host.find('.');
    const std::string domain = dot == std::string::npos ? parts.host : parts.host.substr(dot + 1);
    parts.host = "id." + domain;
    parts.path.clear();
    return parts.origin();
}

std::string engine_name_from_url(const std::string& engine_url) {
    const UrlParts parts = parse(engine_url);
    std::string name = parts.host.substr(0, parts.host.find('.'));
    std::replace(name.begin(), name.end(), '-', '_');
    return name;
}

std::string join_path(const std::string& base, const std::string& path) {
    if (path.empty()) {
        return base.empty() ? "/" : base;
    }
    if (path.front() == '/') {
        return base + path;
    }
    return base + "/" + path;
}

std::string url_encode(const std::string& value) {
    static const char* HEX = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += HEX[c >> 4];
            out += HEX[c & 0x0f];
        }
    }
    return out;
}

}
