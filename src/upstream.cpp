#include "upstream.hpp"

#include <algorithm>
#include <cctype>

namespace upstream_mux {

namespace {

std::string to_lower(std::string_view value) {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percent_decode(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size()) {
            int hi = hex_value(value[i + 1]);
            int lo = hex_value(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += value[i];
    }
    return out;
}

bool parse_port(std::string_view text, uint16_t& port) {
    if (text.empty() || text.size() > 5) return false;
    unsigned value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
        value = value * 10 + static_cast<unsigned>(c - '0');
    }
    if (value == 0 || value > 65535) return false;
    port = static_cast<uint16_t>(value);
    return true;
}

} // namespace

uint16_t default_port_for_scheme(std::string_view scheme) {
    if (scheme == "http") return 80;
    if (scheme == "https") return 443;
    if (scheme == "socks5") return 1080;
    return 0;
}

bool is_tunnel_scheme(std::string_view scheme) {
    return scheme == "socks5";
}

bool parse_host_port(std::string_view text, uint16_t default_port, std::string& host, uint16_t& port) {
    std::string_view host_text = text;
    std::string_view port_text;
    if (!text.empty() && text.front() == '[') {
        auto close = text.find(']');
        if (close == std::string_view::npos) return false;
        host_text = text.substr(1, close - 1);
        auto tail = text.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') return false;
            port_text = tail.substr(1);
            if (port_text.empty()) return false;
        }
    } else {
        auto colon = text.find(':');
        if (colon != std::string_view::npos && colon == text.rfind(':')) {
            host_text = text.substr(0, colon);
            port_text = text.substr(colon + 1);
            if (port_text.empty()) return false;
        }
    }
    if (host_text.empty()) return false;

    uint16_t parsed = default_port;
    if (!port_text.empty() && !parse_port(port_text, parsed)) return false;
    host = std::string(host_text);
    port = parsed;
    return true;
}

std::optional<UpstreamUrl> parse_upstream_url(std::string_view url) {
    const auto sep = url.find("://");
    if (sep == std::string_view::npos || sep == 0) return std::nullopt;

    UpstreamUrl out;
    out.scheme = to_lower(url.substr(0, sep));
    const uint16_t fallback_port = default_port_for_scheme(out.scheme);
    if (fallback_port == 0) return std::nullopt;

    auto rest = url.substr(sep + 3);
    auto authority = rest.substr(0, rest.find_first_of("/?#"));

    auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        auto userinfo = authority.substr(0, at);
        authority = authority.substr(at + 1);
        auto colon = userinfo.find(':');
        out.username = percent_decode(userinfo.substr(0, colon));
        if (colon != std::string_view::npos) {
            out.password = percent_decode(userinfo.substr(colon + 1));
        }
    }

    std::string_view port_text;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) return std::nullopt;
        out.host = std::string(authority.substr(1, close - 1));
        auto tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') return std::nullopt;
            port_text = tail.substr(1);
            if (port_text.empty()) return std::nullopt;
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            port_text = authority.substr(colon + 1);
            if (port_text.empty()) return std::nullopt;
            authority = authority.substr(0, colon);
        }
        out.host = to_lower(authority);
    }
    if (out.host.empty()) return std::nullopt;

    if (port_text.empty()) {
        out.port = fallback_port;
    } else if (!parse_port(port_text, out.port)) {
        return std::nullopt;
    }
    return out;
}

std::optional<UpstreamAddress> resolve_upstream_address(const UpstreamProxy& proxy) {
    auto parsed = parse_upstream_url(proxy.url);
    if (!parsed) return std::nullopt;
    return UpstreamAddress{parsed->scheme, parsed->host, parsed->port};
}

bool proxy_matches(const UpstreamProxy& proxy, const FlowView& flow) {
    return std::any_of(proxy.rules.begin(), proxy.rules.end(),
                       [&flow](const Rule& rule) { return rule_matches(rule, flow); });
}

bool is_default_proxy(const UpstreamProxy& proxy) {
    return std::any_of(proxy.rules.begin(), proxy.rules.end(), is_default_rule);
}

} // namespace upstream_mux
