#ifndef HOOKGATE_VAULT_HPP
#define HOOKGATE_VAULT_HPP

#include <atomic>
#include <map>
#include <shared_mutex>
#include <vector>

#include "ledger.hpp"
#include "types.hpp"

namespace hookgate {

// =============================================================================
// TokenVault - custody of account balances and the manager's reserve
// =============================================================================

class TokenVault {
public:
    TokenVault() = default;
    ~TokenVault() = default;

    // Non-copyable
    TokenVault(const TokenVault&) = delete;
    TokenVault& operator=(const TokenVault&) = delete;

    // =========================================================================
    // Deposit/Withdraw (Custody)
    // =========================================================================

    int32_t deposit(const Address& account, const Currency& token, I128 amount);
    int32_t withdraw(const Address& account, const Currency& token, I128 amount);
    int32_t transfer(const Address& from, const Address& to, const Currency& token, I128 amount);

    I128 balance_of(const Address& account, const Currency& token) const;

    // =========================================================================
    // Settlement Batches
    //
    // Positive amounts move from the account to `reserve`, negative amounts
    // from `reserve` to the account. A batch applies completely or not at all.
    // =========================================================================

    // Returns INSUFFICIENT_BALANCE if any balance would end negative
    int32_t pre_check_transfers(const Address& reserve, const std::vector<Transfer>& transfers) const;

    int32_t apply_transfers(const Address& reserve, const std::vector<Transfer>& transfers);

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_accounts;
        uint64_t batches_applied;
        uint64_t transfers_applied;
    };
    Stats get_stats() const;

private:
    using Balances = std::map<Currency, I128>;

    std::map<Address, Balances> accounts_;
    mutable std::shared_mutex accounts_mutex_;

    std::atomic<uint64_t> batches_applied_{0};
    std::atomic<uint64_t> transfers_applied_{0};

    // Caller holds accounts_mutex_
    int32_t check_batch(const Address& reserve, const std::vector<Transfer>& transfers) const;
    I128 balance_locked(const Address& account, const Currency& token) const;
};

} // namespace hookgate

#endif // HOOKGATE_VAULT_HPP
