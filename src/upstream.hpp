#pragma once

#include "flow.hpp"
#include "rule.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace upstream_mux {

struct UpstreamUrl {
    std::string scheme;
    std::string host;
    uint16_t port = 0;
    std::string username;
    std::string password;
};

// Where a flow is sent: scheme selects the upper layer, (host, port) the next hop.
struct UpstreamAddress {
    std::string scheme;
    std::string host;
    uint16_t port = 0;
};

struct UpstreamProxy {
    std::string name;
    std::string url;
    unsigned weight = 1;
    std::vector<Rule> rules;
    std::optional<std::string> username;
    std::optional<std::string> password;
};

using UpstreamPtr = std::shared_ptr<const UpstreamProxy>;

// Returns the port used when the URL carries none, 0 for unsupported schemes.
uint16_t default_port_for_scheme(std::string_view scheme);

bool is_tunnel_scheme(std::string_view scheme);

// "host", "host:port" or "[v6]:port". A bare address with several colons is
// taken as a host. The port, when given, must be all digits in 1..65535.
bool parse_host_port(std::string_view text, uint16_t default_port, std::string& host, uint16_t& port);

std::optional<UpstreamUrl> parse_upstream_url(std::string_view url);

std::optional<UpstreamAddress> resolve_upstream_address(const UpstreamProxy& proxy);

// True when at least one of the proxy's rules matches. No rules, no match.
bool proxy_matches(const UpstreamProxy& proxy, const FlowView& flow);

bool is_default_proxy(const UpstreamProxy& proxy);

} // namespace upstream_mux
