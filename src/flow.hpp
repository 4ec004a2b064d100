#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace upstream_mux {

// Read-only view of the flow attributes the selector is allowed to see.
// A missing host or port means the surrounding proxy could not provide one.
struct FlowView {
    std::optional<std::string> target_host;
    std::optional<uint16_t> target_port;
    bool is_websocket = false;
    std::string client_address;
};

// Tunnel-oriented sessions (CONNECT, WebSocket) are keyed without the port.
enum class IdentityScope {
    Exchange,
    Tunnel
};

struct ConnectionIdentity {
    IdentityScope scope = IdentityScope::Exchange;
    std::string client_address;
    std::string target_host;
    std::optional<uint16_t> target_port;

    bool operator==(const ConnectionIdentity& other) const noexcept {
        return scope == other.scope &&
               client_address == other.client_address &&
               target_host == other.target_host &&
               target_port == other.target_port;
    }
};

struct ConnectionIdentityHash {
    std::size_t operator()(const ConnectionIdentity& id) const noexcept {
        std::size_t h = std::hash<std::string>{}(id.client_address);
        auto mix = [&h](std::size_t v) {
            h ^= v + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        };
        mix(std::hash<std::string>{}(id.target_host));
        mix(id.target_port ? static_cast<std::size_t>(*id.target_port) + 1 : 0);
        mix(static_cast<std::size_t>(id.scope));
        return h;
    }
};

inline IdentityScope default_scope(const FlowView& flow) {
    return flow.is_websocket ? IdentityScope::Tunnel : IdentityScope::Exchange;
}

inline ConnectionIdentity make_identity(const FlowView& flow, IdentityScope scope) {
    ConnectionIdentity id;
    id.scope = scope;
    id.client_address = flow.client_address;
    id.target_host = flow.target_host.value_or(std::string{});
    if (scope == IdentityScope::Exchange) {
        id.target_port = flow.target_port;
    }
    return id;
}

} // namespace upstream_mux
