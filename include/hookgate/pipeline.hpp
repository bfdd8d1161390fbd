#ifndef HOOKGATE_PIPELINE_HPP
#define HOOKGATE_PIPELINE_HPP

#include <atomic>
#include <utility>

#include "config.hpp"
#include "gate.hpp"
#include "hooks.hpp"
#include "ledger.hpp"
#include "pool.hpp"
#include "registry.hpp"
#include "types.hpp"

namespace hookgate {

// =============================================================================
// Operation Stages
// =============================================================================

enum class OperationStage : uint8_t {
    Pending = 0,
    BeforeCalled = 1,
    CoreApplied = 2,
    AfterCalled = 3,
    Settled = 4,
    Aborted = 5
};

const char* stage_name(OperationStage stage);

// =============================================================================
// Operation Results
// =============================================================================

struct OperationResult {
    BalanceDelta delta;          // Caller side: core + extension adjustments
    BalanceDelta core_delta;     // As realized by the core engine
    BalanceDelta hook_delta;     // Extension adjustments charged to the caller
    BalanceDelta fees_accrued;   // Position fees (modify_liquidity only)
    uint32_t fee_applied = 0;    // Swap fee actually charged
    OperationStage stage = OperationStage::Pending;
    Settlement settlement;       // Filled for one-shot calls only
};

struct InitializeResult {
    PoolId pool_id;
    int32_t tick = 0;
    OperationStage stage = OperationStage::Pending;
    Settlement settlement;
};

// =============================================================================
// OperationPipeline - before -> core -> after -> fold, per operation
//
// Runs inside a sequence the caller already holds. A failure at any stage
// rolls back the pools, bindings and ledger to the state at Pending, marks
// the sequence as failed and rethrows. A failed sequence never settles, even
// when the caller catches the error.
// =============================================================================

class OperationPipeline {
public:
    OperationPipeline(const ManagerConfig& config, ICoreEngine& engine, PoolStore& pools,
                      ExtensionRegistry& registry, const HookDirectory& directory,
                      ReentrancyGate& gate, DeltaLedger& ledger);

    InitializeResult initialize(SequenceId sequence, const Address& caller, const PoolKey& key,
                                I128 sqrt_price_x96, const Bytes& hook_data);

    OperationResult modify_liquidity(SequenceId sequence, const Address& caller, const PoolKey& key,
                                     const ModifyLiquidityParams& params, const Bytes& hook_data);

    OperationResult swap(SequenceId sequence, const Address& caller, const PoolKey& key,
                         const SwapParams& params, const Bytes& hook_data);

    OperationResult donate(SequenceId sequence, const Address& caller, const PoolKey& key,
                           I128 amount0, I128 amount1, const Bytes& hook_data);

    struct Stats {
        uint64_t pools_initialized;
        uint64_t liquidity_ops;
        uint64_t swaps;
        uint64_t donations;
        uint64_t aborted_ops;
    };
    Stats get_stats() const;

private:
    struct OpCheckpoint {
        DeltaLedger::Checkpoint ledger;
        size_t pools;
        size_t bindings;
    };

    OpCheckpoint checkpoint() const;
    void rollback(const OpCheckpoint& checkpoint);

    // Runs `body(stage)` and unwinds to the Pending checkpoint on failure
    template <typename Body>
    auto guarded(SequenceId sequence, OperationKind kind, const PoolId& pool_id, Body&& body)
        -> decltype(body(std::declval<OperationStage&>()));

    // Invokes one extension callback inside a callback frame
    template <typename Fn>
    auto invoke(const Address& extension, IHooks& hooks, HookSelector selector, Fn&& fn)
        -> decltype(fn(hooks));

    IHooks* resolve(const Address& extension) const;
    Slot0 require_pool(const PoolId& pool_id) const;

    void fold(SequenceId sequence, const Address& caller, const Address& extension,
              const PoolKey& key, const BalanceDelta& core, const BalanceDelta& adjustment);

    const ManagerConfig& config_;
    ICoreEngine& engine_;
    PoolStore& pools_;
    ExtensionRegistry& registry_;
    const HookDirectory& directory_;
    ReentrancyGate& gate_;
    DeltaLedger& ledger_;

    std::atomic<uint64_t> pools_initialized_{0};
    std::atomic<uint64_t> liquidity_ops_{0};
    std::atomic<uint64_t> swaps_{0};
    std::atomic<uint64_t> donations_{0};
    std::atomic<uint64_t> aborted_ops_{0};
};

} // namespace hookgate

#endif // HOOKGATE_PIPELINE_HPP
