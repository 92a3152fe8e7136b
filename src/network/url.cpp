#include "upsync/network/url.hpp"

#include <algorithm>
#include <cctype>

namespace upsync {
namespace network {
namespace {

uint16_t default_port(const std::string& scheme) {
    return scheme == "https" ? 443 : 80;
}

} // namespace

std::string Url::authority() const {
    const bool bracket = host.find(':') != std::string::npos;
    std::string out = bracket ? "[" + host + "]" : host;
    if (port != default_port(scheme)) {
        out += ":" + std::to_string(port);
    }
    return out;
}

Url Url::with_path_suffix(const std::string& suffix) const {
    Url out = *this;
    const auto query = target.find('?');
    std::string path = target.substr(0, query);
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    if (path == "/") {
        path.clear();
    }
    out.target = path + suffix + (query == std::string::npos ? "" : target.substr(query));
    return out;
}

std::string Url::to_string() const {
    return scheme + "://" + authority() + target;
}

Result<Url> parse_url(const std::string& text) {
    const auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos) {
        return Err<Url>(ErrorKind::Config, "Endpoint is not an absolute URL: '" + text + "'");
    }

    Url url;
    url.scheme = text.substr(0, scheme_end);
    std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (url.scheme != "http" && url.scheme != "https") {
        return Err<Url>(ErrorKind::Config, "Unsupported endpoint scheme: " + url.scheme);
    }

    const auto authority_begin = scheme_end + 3;
    const auto path_begin = text.find_first_of("/?#", authority_begin);
    std::string authority = text.substr(authority_begin, path_begin == std::string::npos
                                                             ? std::string::npos
                                                             : path_begin - authority_begin);
    if (authority.find('@') != std::string::npos) {
        return Err<Url>(ErrorKind::Config, "Credentials in the endpoint URL are not supported");
    }

    std::string port_text;
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string::npos) {
            return Err<Url>(ErrorKind::Config, "Malformed IPv6 host in endpoint: " + text);
        }
        url.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return Err<Url>(ErrorKind::Config, "Malformed endpoint authority: " + authority);
            }
            port_text = authority.substr(close + 2);
        }
    } else {
        const auto colon = authority.rfind(':');
        url.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port_text = authority.substr(colon + 1);
        }
    }

    if (url.host.empty()) {
        return Err<Url>(ErrorKind::Config, "Endpoint has no host: " + text);
    }

    url.port = default_port(url.scheme);
    if (!port_text.empty()) {
        if (port_text.size() > 5 ||
            !std::all_of(port_text.begin(), port_text.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            return Err<Url>(ErrorKind::Config, "Invalid port in endpoint: " + port_text);
        }
        const int port = std::stoi(port_text);
        if (port <= 0 || port > 65535) {
            return Err<Url>(ErrorKind::Config, "Invalid port in endpoint: " + port_text);
        }
        url.port = static_cast<uint16_t>(port);
    }

    if (path_begin == std::string::npos) {
        url.target = "/";
    } else {
        url.target = text.substr(path_begin, text.find('#', path_begin) - path_begin);
        if (url.target.empty() || url.target.front() != '/') {
            url.target = "/" + url.target;
        }
    }
    return Ok(std::move(url));
}

} // namespace network
} // namespace upsync
