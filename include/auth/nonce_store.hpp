#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace authguard {

// Returns the nonce the key must sign next, or nullopt for an unknown key
using NonceLookup = std::function<std::optional<uint64_t>(const std::string& api_key)>;

// Told which (key, nonce) pair just verified, so the store can move on
using NonceCommit = std::function<void(const std::string& api_key, uint64_t nonce)>;

/**
 * @brief Thread-safe in-process nonce store
 *
 * Holds the nonce each API key is expected to sign next. consume() advances
 * it by one only while the stored value still equals the verified nonce, so
 * an accepted frame cannot be replayed and two racing validations of the same
 * frame advance the key at most once.
 */
class InMemoryNonceStore {
public:
    void seed(const std::string& api_key, uint64_t next_nonce);

    [[nodiscard]] std::optional<uint64_t> lookup(const std::string& api_key) const;

    /// @return true if the stored nonce matched and was advanced
    bool consume(const std::string& api_key, uint64_t nonce);

    bool revoke(const std::string& api_key);

    [[nodiscard]] size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, uint64_t> next_nonce_;
};

[[nodiscard]] NonceLookup lookup_from(std::shared_ptr<const InMemoryNonceStore> store);
[[nodiscard]] NonceCommit commit_to(std::shared_ptr<InMemoryNonceStore> store);

} // namespace authguard
