#include "auth/nonce_store.hpp"
#include "core/utils.hpp"

#include <limits>
#include <mutex>

namespace authguard {

void InMemoryNonceStore::seed(const std::string& api_key, const uint64_t next_nonce) {
    std::unique_lock lock(mutex_);
    next_nonce_[api_key] = next_nonce;
}

std::optional<uint64_t> InMemoryNonceStore::lookup(const std::string& api_key) const {
    std::shared_lock lock(mutex_);
    const auto it = next_nonce_.find(api_key);
    if (it == next_nonce_.end()) return std::nullopt;
    return it->second;
}

bool InMemoryNonceStore::consume(const std::string& api_key, const uint64_t nonce) {
    std::unique_lock lock(mutex_);
    const auto it = next_nonce_.find(api_key);
    if (it == next_nonce_.end() || it->second != nonce) return false;

    // Nonce space exhausted: drop the key so it has to be re-seeded
    if (it->second == std::numeric_limits<uint64_t>::max()) {
        next_nonce_.erase(it);
        return true;
    }
    ++it->second;
    return true;
}

bool InMemoryNonceStore::revoke(const std::string& api_key) {
    std::unique_lock lock(mutex_);
    return next_nonce_.erase(api_key) > 0;
}

size_t InMemoryNonceStore::size() const {
    std::shared_lock lock(mutex_);
    return next_nonce_.size();
}

NonceLookup lookup_from(std::shared_ptr<const InMemoryNonceStore> store) {
    return [store = std::move(store)](const std::string& api_key) {
        return store->lookup(api_key);
    };
}

NonceCommit commit_to(std::shared_ptr<InMemoryNonceStore> store) {
    return [store = std::move(store)](const std::string& api_key, const uint64_t nonce) {
        if (!store->consume(api_key, nonce)) {
            utils::log::warn("Nonce store: verified nonce was already consumed or revoked");
        }
    };
}

} // namespace authguard
