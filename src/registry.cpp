#include "registry.hpp"

#include <unordered_set>

namespace upstream_mux {

UpstreamPtr Registry::find(std::string_view name) const {
    for (const auto& proxy : candidates) {
        if (proxy->name == name) return proxy;
    }
    if (default_proxy && default_proxy->name == name) return default_proxy;
    return nullptr;
}

RegistryPtr build_registry(std::vector<UpstreamProxy> proxies, std::string source, std::ostream& log) {
    auto registry = std::make_shared<Registry>();
    registry->source = std::move(source);
    registry->candidates.reserve(proxies.size());

    std::unordered_set<std::string> seen;
    for (auto& proxy : proxies) {
        if (!seen.insert(proxy.name).second) {
            log << "[registry] Skip proxy '" << proxy.name << "': duplicate name.\n";
            continue;
        }
        auto shared = std::make_shared<const UpstreamProxy>(std::move(proxy));
        if (is_default_proxy(*shared)) {
            if (registry->default_proxy) {
                log << "[registry] Default proxy '" << registry->default_proxy->name
                    << "' replaced by '" << shared->name << "' (last one wins).\n";
            }
            registry->default_proxy = std::move(shared);
        } else {
            registry->candidates.push_back(std::move(shared));
        }
    }
    return registry;
}

} // namespace upstream_mux
