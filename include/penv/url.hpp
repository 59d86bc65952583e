#pragma once

#include <penv/result.hpp>
#include <string>

namespace penv {

// Minimal absolute URL: scheme://host[:port][/path]
struct Url {
    std::string scheme;
    std::string host;
    int port = -1;      // -1 when absent
    std::string path;   // includes the leading '/', may be empty

    static Result<Url> parse(const std::string& s);
    std::string to_string() const;

    Url with_scheme(const std::string& s) const;
    Url with_port(int p) const;
};

} // namespace penv
