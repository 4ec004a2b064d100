#pragma once

#include "flow.hpp"
#include "upstream.hpp"

#include <array>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace upstream_mux {

// Connection identity -> previously chosen upstream. Entries are sharded by
// client address so that a client disconnect only locks one bucket.
class AffinityCache {
public:
    UpstreamPtr find(const ConnectionIdentity& id) const;
    void store(const ConnectionIdentity& id, UpstreamPtr proxy);
    bool erase(const ConnectionIdentity& id);
    std::size_t erase_client(const std::string& client_address);
    void clear();
    std::size_t size() const;

private:
    struct Bucket {
        mutable std::mutex mu;
        std::unordered_map<ConnectionIdentity, UpstreamPtr, ConnectionIdentityHash> entries;
    };

    static std::size_t bucket_index(const std::string& client_address);

    static constexpr std::size_t kBucketCount = 32;

    std::array<Bucket, kBucketCount> buckets_;
};

} // namespace upstream_mux
