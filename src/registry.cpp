// =============================================================================
// registry.cpp - Write-once pool to extension bindings
// =============================================================================

#include "hookgate/registry.hpp"

#include <mutex>

#include "hookgate/log.hpp"
#include "hookgate/permissions.hpp"

namespace hookgate {

ExtensionRegistry::ExtensionRegistry(const HookDirectory& directory)
    : directory_(directory) {}

void ExtensionRegistry::bind(const PoolId& pool_id, const Address& identifier) {
    std::unique_lock lock(mutex_);

    if (bindings_.find(pool_id) != bindings_.end()) {
        throw ProtocolError(errors::ALREADY_BOUND, "pool " + pool_id.to_hex() + " already bound");
    }

    if (!permission_codec::is_valid_extension_id(identifier)) {
        throw ProtocolError(errors::INVALID_EXTENSION,
                            "malformed extension identifier " + addresses::to_hex(identifier));
    }

    if (!addresses::is_zero(identifier)) {
        IHooks* hooks = directory_.find(identifier);
        if (hooks == nullptr) {
            throw ProtocolError(errors::INVALID_EXTENSION,
                                "no extension deployed at " + addresses::to_hex(identifier));
        }
        // Re-validated on every bind, however the identifier was produced
        permission_codec::validate(identifier, hooks->declared_permissions());
    }

    bindings_.emplace(pool_id, identifier);
    journal_.push_back(pool_id);

    HG_LOG_INFO("bound pool %s to extension %s (%s)",
                pool_id.to_hex().c_str(), addresses::to_hex(identifier).c_str(),
                permission_codec::decode(identifier).to_string().c_str());
}

Address ExtensionRegistry::lookup(const PoolId& pool_id) const {
    std::shared_lock lock(mutex_);
    auto it = bindings_.find(pool_id);
    if (it == bindings_.end()) {
        throw ProtocolError(errors::POOL_NOT_INITIALIZED, "pool " + pool_id.to_hex() + " is not bound");
    }
    return it->second;
}

bool ExtensionRegistry::is_bound(const PoolId& pool_id) const {
    std::shared_lock lock(mutex_);
    return bindings_.find(pool_id) != bindings_.end();
}

size_t ExtensionRegistry::size() const {
    std::shared_lock lock(mutex_);
    return bindings_.size();
}

size_t ExtensionRegistry::checkpoint() const {
    std::shared_lock lock(mutex_);
    return journal_.size();
}

void ExtensionRegistry::rollback(size_t checkpoint) {
    std::unique_lock lock(mutex_);
    while (journal_.size() > checkpoint) {
        bindings_.erase(journal_.back());
        journal_.pop_back();
    }
}

void ExtensionRegistry::commit() {
    std::unique_lock lock(mutex_);
    journal_.clear();
}

} // namespace hookgate
