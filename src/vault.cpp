// =============================================================================
// vault.cpp - TokenVault custody and settlement batches
// =============================================================================

#include "hookgate/vault.hpp"

#include <mutex>

namespace hookgate {

// =============================================================================
// Deposit/Withdraw
// =============================================================================

int32_t TokenVault::deposit(const Address& account, const Currency& token, I128 amount) {
    if (amount <= 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(accounts_mutex_);
    accounts_[account][token] += amount;
    return errors::OK;
}

int32_t TokenVault::withdraw(const Address& account, const Currency& token, I128 amount) {
    if (amount <= 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(accounts_mutex_);
    if (balance_locked(account, token) < amount) {
        return errors::INSUFFICIENT_BALANCE;
    }
    accounts_[account][token] -= amount;
    return errors::OK;
}

int32_t TokenVault::transfer(const Address& from, const Address& to,
                             const Currency& token, I128 amount) {
    if (amount <= 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(accounts_mutex_);
    if (balance_locked(from, token) < amount) {
        return errors::INSUFFICIENT_BALANCE;
    }
    accounts_[from][token] -= amount;
    accounts_[to][token] += amount;
    return errors::OK;
}

I128 TokenVault::balance_of(const Address& account, const Currency& token) const {
    std::shared_lock lock(accounts_mutex_);
    return balance_locked(account, token);
}

I128 TokenVault::balance_locked(const Address& account, const Currency& token) const {
    auto it = accounts_.find(account);
    if (it == accounts_.end()) return 0;
    auto bal = it->second.find(token);
    return bal != it->second.end() ? bal->second : 0;
}

// =============================================================================
// Settlement Batches
// =============================================================================

int32_t TokenVault::check_batch(const Address& reserve, const std::vector<Transfer>& transfers) const {
    // Net the whole batch first so ordering inside it does not matter
    std::map<std::pair<Address, Currency>, I128> net;
    for (const auto& t : transfers) {
        net[{t.account, t.currency}] -= t.amount;
        net[{reserve, t.currency}] += t.amount;
    }

    for (const auto& [key, change] : net) {
        if (balance_locked(key.first, key.second) + change < 0) {
            return errors::INSUFFICIENT_BALANCE;
        }
    }
    return errors::OK;
}

int32_t TokenVault::pre_check_transfers(const Address& reserve,
                                        const std::vector<Transfer>& transfers) const {
    std::shared_lock lock(accounts_mutex_);
    return check_batch(reserve, transfers);
}

int32_t TokenVault::apply_transfers(const Address& reserve, const std::vector<Transfer>& transfers) {
    std::unique_lock lock(accounts_mutex_);

    // First pass: validate the batch under the write lock
    int32_t rc = check_batch(reserve, transfers);
    if (rc != errors::OK) {
        return rc;
    }

    // Second pass: apply
    for (const auto& t : transfers) {
        accounts_[t.account][t.currency] -= t.amount;
        accounts_[reserve][t.currency] += t.amount;
    }

    batches_applied_.fetch_add(1, std::memory_order_relaxed);
    transfers_applied_.fetch_add(transfers.size(), std::memory_order_relaxed);
    return errors::OK;
}

// =============================================================================
// Statistics
// =============================================================================

TokenVault::Stats TokenVault::get_stats() const {
    std::shared_lock lock(accounts_mutex_);
    return Stats{
        static_cast<uint64_t>(accounts_.size()),
        batches_applied_.load(std::memory_order_relaxed),
        transfers_applied_.load(std::memory_order_relaxed),
    };
}

} // namespace hookgate
