#ifndef HOOKGATE_REGISTRY_HPP
#define HOOKGATE_REGISTRY_HPP

#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "hooks.hpp"
#include "types.hpp"

namespace hookgate {

// =============================================================================
// ExtensionRegistry - pool -> extension identifier, bound once
//
// Bindings made inside a sequence are journaled so an aborted operation can
// drop them. Once committed a binding never changes.
// =============================================================================

class ExtensionRegistry {
public:
    explicit ExtensionRegistry(const HookDirectory& directory);

    ExtensionRegistry(const ExtensionRegistry&) = delete;
    ExtensionRegistry& operator=(const ExtensionRegistry&) = delete;

    // Throws ProtocolError with:
    // - ALREADY_BOUND if `pool_id` already has a binding
    // - INVALID_EXTENSION if the identifier is malformed or not deployed
    // - INVALID_PERMISSIONS if the deployed object declares other permissions
    void bind(const PoolId& pool_id, const Address& identifier);

    // Throws ProtocolError(POOL_NOT_INITIALIZED) before bind
    Address lookup(const PoolId& pool_id) const;

    bool is_bound(const PoolId& pool_id) const;
    size_t size() const;

    size_t checkpoint() const;
    void rollback(size_t checkpoint);
    void commit();

private:
    const HookDirectory& directory_;

    std::unordered_map<PoolId, Address> bindings_;
    std::vector<PoolId> journal_;  // Uncommitted binds in order
    mutable std::shared_mutex mutex_;
};

} // namespace hookgate

#endif // HOOKGATE_REGISTRY_HPP
