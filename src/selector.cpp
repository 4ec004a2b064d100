#include "selector.hpp"

namespace upstream_mux {

Selector::Selector()
    : rng_(std::random_device{}()) {}

Selector::Selector(std::uint64_t seed)
    : rng_(seed) {}

void Selector::reload(RegistryPtr registry) {
    {
        std::lock_guard<std::mutex> lk(registry_mu_);
        registry_ = std::move(registry);
    }
    affinity_.clear();
}

RegistryPtr Selector::registry() const {
    std::lock_guard<std::mutex> lk(registry_mu_);
    return registry_;
}

bool Selector::loaded() const {
    return registry() != nullptr;
}

UpstreamPtr Selector::select(const FlowView& flow) {
    return select(flow, default_scope(flow));
}

UpstreamPtr Selector::select(const FlowView& flow, IdentityScope scope) {
    const auto registry = this->registry();
    if (!registry) return nullptr;

    const auto id = make_identity(flow, scope);
    if (auto cached = affinity_.find(id)) {
        // An entry stored by a select that raced a reload may point into the
        // replaced registry.
        if (registry->find(cached->name) == cached && proxy_matches(*cached, flow)) return cached;
        affinity_.erase(id);
    }

    std::vector<UpstreamPtr> matching;
    for (const auto& candidate : registry->candidates) {
        if (proxy_matches(*candidate, flow)) matching.push_back(candidate);
    }

    UpstreamPtr selection;
    if (matching.empty()) {
        if (!registry->default_proxy) return nullptr;
        selection = registry->default_proxy;
    } else if (matching.size() == 1) {
        selection = matching.front();
    } else {
        selection = pick_weighted(matching);
    }

    affinity_.store(id, selection);
    return selection;
}

bool Selector::forget(const FlowView& flow, IdentityScope scope) {
    return affinity_.erase(make_identity(flow, scope));
}

std::size_t Selector::forget_client(const std::string& client_address) {
    return affinity_.erase_client(client_address);
}

UpstreamPtr Selector::pick_weighted(const std::vector<UpstreamPtr>& matching) {
    std::uint64_t total = 0;
    for (const auto& proxy : matching) total += proxy->weight;

    std::uint64_t roll = 0;
    {
        std::lock_guard<std::mutex> lk(rng_mu_);
        roll = std::uniform_int_distribution<std::uint64_t>(0, total - 1)(rng_);
    }
    for (const auto& proxy : matching) {
        if (roll < proxy->weight) return proxy;
        roll -= proxy->weight;
    }
    return matching.back();
}

} // namespace upstream_mux
