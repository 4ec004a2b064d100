#pragma once

#include "config.hpp"
#include "credentials.hpp"
#include "flow.hpp"
#include "selector.hpp"
#include "upstream.hpp"

#include <iostream>
#include <optional>
#include <ostream>
#include <string>

namespace upstream_mux {

struct RoutingDecision {
    UpstreamPtr proxy;
    UpstreamAddress via;
    // Set for http/https upstreams with credentials.
    std::optional<std::string> proxy_authorization;
    // Set for socks5 upstreams with credentials.
    std::optional<Credentials> tunnel_credentials;
};

// Per-flow entry points called by the surrounding proxy.
class MultiUpstream {
public:
    explicit MultiUpstream(std::ostream& log = std::cerr);
    MultiUpstream(std::uint64_t seed, std::ostream& log);

    LoadStatus configure(const std::string& config_dir);

    std::optional<RoutingDecision> request(const FlowView& flow);
    std::optional<RoutingDecision> tunnel_connect(const FlowView& flow);
    std::optional<RoutingDecision> websocket_start(const FlowView& flow);
    void websocket_end(const FlowView& flow);
    std::size_t client_disconnected(const std::string& client_address);

    Selector& selector() { return selector_; }
    const Selector& selector() const { return selector_; }

private:
    std::optional<RoutingDecision> route(const FlowView& flow, IdentityScope scope);

    std::ostream& log_;
    Selector selector_;
};

} // namespace upstream_mux
