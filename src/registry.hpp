#pragma once

#include "upstream.hpp"

#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace upstream_mux {

// Immutable once built. A reload builds a new Registry and swaps the pointer.
struct Registry {
    std::vector<UpstreamPtr> candidates;
    UpstreamPtr default_proxy;
    std::string source;

    UpstreamPtr find(std::string_view name) const;
    std::size_t size() const { return candidates.size() + (default_proxy ? 1 : 0); }
};

using RegistryPtr = std::shared_ptr<const Registry>;

// Splits proxies into the candidate pool and the default. Any proxy carrying
// a default rule becomes the default; with several, the last one wins.
// Entries whose name repeats an earlier one are dropped.
RegistryPtr build_registry(std::vector<UpstreamProxy> proxies, std::string source, std::ostream& log);

} // namespace upstream_mux
