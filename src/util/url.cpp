#include <penv/url.hpp>
#include <cctype>

namespace penv {

Result<Url> Url::parse(const std::string& s) {
    auto sep = s.find("://");
    if (sep == std::string::npos || sep == 0) {
        return PenvError{PenvError::InvalidArg,
            "invalid URL '" + s + "'", "expected scheme://host[:port]"};
    }

    Url url;
    url.scheme = s.substr(0, sep);
    for (char c : url.scheme) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            return PenvError{PenvError::InvalidArg,
                "invalid URL scheme in '" + s + "'"};
        }
    }

    std::string rest = s.substr(sep + 3);
    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) url.path = rest.substr(slash);

    auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        std::string port_str = authority.substr(colon + 1);
        if (port_str.empty() || port_str.size() > 5) {
            return PenvError{PenvError::InvalidArg, "invalid port in URL '" + s + "'"};
        }
        for (char c : port_str) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return PenvError{PenvError::InvalidArg, "invalid port in URL '" + s + "'"};
            }
        }
        url.port = std::stoi(port_str);
        if (url.port > 65535) {
            return PenvError{PenvError::InvalidArg, "port out of range in URL '" + s + "'"};
        }
        authority = authority.substr(0, colon);
    }

    if (authority.empty()) {
        return PenvError{PenvError::InvalidArg, "URL '" + s + "' has no host"};
    }
    url.host = authority;
    return Result<Url>::ok(std::move(url));
}

std::string Url::to_string() const {
    std::string s = scheme + "://" + host;
    if (port >= 0) s += ":" + std::to_string(port);
    s += path;
    return s;
}

Url Url::with_scheme(const std::string& s) const {
    Url u = *this;
    u.scheme = s;
    return u;
}

Url Url::with_port(int p) const {
    Url u = *this;
    u.port = p;
    return u;
}

} // namespace penv
