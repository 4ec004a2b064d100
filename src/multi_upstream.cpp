#include "multi_upstream.hpp"

namespace upstream_mux {

MultiUpstream::MultiUpstream(std::ostream& log)
    : log_(log) {}

MultiUpstream::MultiUpstream(std::uint64_t seed, std::ostream& log)
    : log_(log),
      selector_(seed) {}

LoadStatus MultiUpstream::configure(const std::string& config_dir) {
    log_ << "[config] Loading configuration from directory: " << config_dir << "\n";
    auto result = load_registry(config_dir, log_);
    switch (result.status) {
        case LoadStatus::Loaded:
            selector_.reload(std::move(result.registry));
            break;
        case LoadStatus::Failed:
            if (selector_.loaded()) {
                log_ << "[config] Previous configuration discarded; routing disabled until the next successful load\n";
            }
            selector_.reload(nullptr);
            break;
        case LoadStatus::NoConfig:
            break;
    }
    return result.status;
}

std::optional<RoutingDecision> MultiUpstream::request(const FlowView& flow) {
    return route(flow, default_scope(flow));
}

std::optional<RoutingDecision> MultiUpstream::tunnel_connect(const FlowView& flow) {
    return route(flow, IdentityScope::Tunnel);
}

std::optional<RoutingDecision> MultiUpstream::websocket_start(const FlowView& flow) {
    return route(flow, IdentityScope::Tunnel);
}

void MultiUpstream::websocket_end(const FlowView& flow) {
    selector_.forget(flow, IdentityScope::Tunnel);
}

std::size_t MultiUpstream::client_disconnected(const std::string& client_address) {
    return selector_.forget_client(client_address);
}

std::optional<RoutingDecision> MultiUpstream::route(const FlowView& flow, IdentityScope scope) {
    auto proxy = selector_.select(flow, scope);
    if (!proxy) return std::nullopt;

    auto address = resolve_upstream_address(*proxy);
    if (!address) {
        log_ << "[upstream] Error parsing proxy URL " << proxy->url << " of '" << proxy->name << "'\n";
        return std::nullopt;
    }

    RoutingDecision decision;
    decision.proxy = proxy;
    decision.via = std::move(*address);
    if (auto creds = resolve_credentials(*proxy)) {
        if (is_tunnel_scheme(decision.via.scheme)) {
            decision.tunnel_credentials = std::move(creds);
        } else {
            decision.proxy_authorization = basic_proxy_authorization(*creds);
        }
    }
    return decision;
}

} // namespace upstream_mux
