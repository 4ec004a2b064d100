#include "affinity_cache.hpp"

#include <functional>

namespace upstream_mux {

std::size_t AffinityCache::bucket_index(const std::string& client_address) {
    return std::hash<std::string>{}(client_address) % kBucketCount;
}

UpstreamPtr AffinityCache::find(const ConnectionIdentity& id) const {
    const auto& bucket = buckets_[bucket_index(id.client_address)];
    std::lock_guard<std::mutex> lk(bucket.mu);
    auto it = bucket.entries.find(id);
    return it == bucket.entries.end() ? nullptr : it->second;
}

void AffinityCache::store(const ConnectionIdentity& id, UpstreamPtr proxy) {
    auto& bucket = buckets_[bucket_index(id.client_address)];
    std::lock_guard<std::mutex> lk(bucket.mu);
    bucket.entries[id] = std::move(proxy);
}

bool AffinityCache::erase(const ConnectionIdentity& id) {
    auto& bucket = buckets_[bucket_index(id.client_address)];
    std::lock_guard<std::mutex> lk(bucket.mu);
    return bucket.entries.erase(id) > 0;
}

std::size_t AffinityCache::erase_client(const std::string& client_address) {
    auto& bucket = buckets_[bucket_index(client_address)];
    std::lock_guard<std::mutex> lk(bucket.mu);
    std::size_t removed = 0;
    for (auto it = bucket.entries.begin(); it != bucket.entries.end();) {
        if (it->first.client_address == client_address) {
            it = bucket.entries.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void AffinityCache::clear() {
    for (auto& bucket : buckets_) {
        std::lock_guard<std::mutex> lk(bucket.mu);
        bucket.entries.clear();
    }
}

std::size_t AffinityCache::size() const {
    std::size_t total = 0;
    for (const auto& bucket : buckets_) {
        std::lock_guard<std::mutex> lk(bucket.mu);
        total += bucket.entries.size();
    }
    return total;
}

} // namespace upstream_mux
