#ifndef HOOKGATE_MANAGER_HPP
#define HOOKGATE_MANAGER_HPP

#include <atomic>
#include <functional>
#include <memory>
#include <optional>

#include "config.hpp"
#include "gate.hpp"
#include "hooks.hpp"
#include "ledger.hpp"
#include "pipeline.hpp"
#include "pool.hpp"
#include "registry.hpp"
#include "vault.hpp"

namespace hookgate {

// =============================================================================
// PoolManager - singleton manager for every pool
//
// All state changes happen inside a sequence: unlock() opens one and runs the
// callback, the operations below join it. Called outside a sequence, an
// operation opens and settles a sequence of its own.
// =============================================================================

class PoolManager {
public:
    explicit PoolManager(ManagerConfig config = {}, std::shared_ptr<ICoreEngine> engine = nullptr);
    ~PoolManager() = default;

    // Non-copyable
    PoolManager(const PoolManager&) = delete;
    PoolManager& operator=(const PoolManager&) = delete;

    // =========================================================================
    // Sequences
    // =========================================================================

    // Runs `callback` inside a sequence held by `caller` and settles it through
    // the vault. A nested call from the running sequence runs inline and
    // returns an empty settlement. Any failure rolls the sequence back.
    Settlement unlock(const Address& caller, const std::function<void()>& callback);

    // =========================================================================
    // Pool Operations
    // =========================================================================

    InitializeResult initialize(const Address& caller, const PoolKey& key, I128 sqrt_price_x96,
                                const Bytes& hook_data = {});

    OperationResult modify_liquidity(const Address& caller, const PoolKey& key,
                                     const ModifyLiquidityParams& params,
                                     const Bytes& hook_data = {});

    OperationResult swap(const Address& caller, const PoolKey& key, const SwapParams& params,
                         const Bytes& hook_data = {});

    OperationResult donate(const Address& caller, const PoolKey& key, I128 amount0, I128 amount1,
                           const Bytes& hook_data = {});

    // =========================================================================
    // Payments (inside a sequence only)
    // =========================================================================

    // Manager pays `amount` to the caller; caller's delta += amount
    void take(const Address& caller, const Currency& currency, I128 amount);

    // Caller pays `amount` in; caller's delta -= amount
    void settle(const Address& caller, const Currency& currency, I128 amount);

    // =========================================================================
    // Queries
    // =========================================================================

    std::optional<Slot0> get_slot0(const PoolId& pool_id) const;
    I128 get_liquidity(const PoolId& pool_id) const;
    std::optional<PositionInfo> get_position(const PoolId& pool_id, const Address& owner,
                                             int32_t tick_lower, int32_t tick_upper,
                                             uint64_t salt = 0) const;
    bool pool_exists(const PoolId& pool_id) const;

    // Throws ProtocolError(POOL_NOT_INITIALIZED) for an unknown pool
    Address extension_of(const PoolId& pool_id) const;

    I128 currency_delta(const Address& account, const Currency& currency) const;
    bool is_unlocked() const;

    struct Stats {
        uint64_t total_pools;
        uint64_t total_swaps;
        uint64_t total_liquidity_ops;
        uint64_t total_donations;
        uint64_t aborted_ops;
        uint64_t sequences_settled;
    };
    Stats get_stats() const;

    HookDirectory& directory() { return directory_; }
    TokenVault& vault() { return vault_; }
    const TokenVault& vault() const { return vault_; }
    const ManagerConfig& config() const { return config_; }

private:
    struct SequenceCheckpoint {
        size_t pools;
        size_t bindings;
    };

    SequenceCheckpoint open_sequence(SequenceId sequence, const Address& locker);
    Settlement close_sequence(SequenceId sequence);
    void abort_sequence(const SequenceCheckpoint& checkpoint);

    // Joins the running sequence or wraps `op` in a one-shot sequence
    template <typename Result, typename Op>
    Result run_operation(const Address& caller, Op&& op);

    // Entered guard for a payment; throws NOT_LOCKED outside a sequence
    ReentrancyGate::Guard enter_payment(const Address& caller);

    ManagerConfig config_;
    std::shared_ptr<ICoreEngine> engine_;

    HookDirectory directory_;
    ExtensionRegistry registry_;
    PoolStore pools_;
    ReentrancyGate gate_;
    DeltaLedger ledger_;
    TokenVault vault_;
    OperationPipeline pipeline_;

    std::atomic<uint64_t> sequences_settled_{0};
};

} // namespace hookgate

#endif // HOOKGATE_MANAGER_HPP
