#pragma once

#include "upsync/core/result.hpp"

#include <cstdint>
#include <string>

namespace upsync {
namespace network {

struct Url {
    std::string scheme;   // "http" or "https"
    std::string host;
    uint16_t port = 0;
    std::string target;   // path + query, always starts with '/'

    bool is_tls() const { return scheme == "https"; }

    /// Host header value; the port is omitted when it is the scheme default
    std::string authority() const;

    /// Same origin, target with @p suffix appended to its path
    Url with_path_suffix(const std::string& suffix) const;

    std::string to_string() const;
};

/// ErrorKind::Config for anything that is not an absolute http(s) URL
Result<Url> parse_url(const std::string& text);

} // namespace network
} // namespace upsync
