#pragma once

#include "affinity_cache.hpp"
#include "flow.hpp"
#include "registry.hpp"

#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace upstream_mux {

class Selector {
public:
    Selector();
    explicit Selector(std::uint64_t seed);

    // nullptr leaves the selector unloaded. The affinity cache is cleared
    // because cached upstreams belong to the replaced registry.
    void reload(RegistryPtr registry);
    RegistryPtr registry() const;
    bool loaded() const;

    // Sticky, rule-driven, weighted choice. Returns nullptr when unloaded or
    // when nothing matches and no default is configured.
    UpstreamPtr select(const FlowView& flow);
    UpstreamPtr select(const FlowView& flow, IdentityScope scope);

    bool forget(const FlowView& flow, IdentityScope scope);
    std::size_t forget_client(const std::string& client_address);

    const AffinityCache& affinity() const { return affinity_; }

private:
    UpstreamPtr pick_weighted(const std::vector<UpstreamPtr>& matching);

    mutable std::mutex registry_mu_;
    RegistryPtr registry_;
    AffinityCache affinity_;
    std::mutex rng_mu_;
    std::mt19937_64 rng_;
};

} // namespace upstream_mux
