// =============================================================================
// pipeline.cpp - Hook-gated operation pipeline
// =============================================================================

#include "hookgate/pipeline.hpp"

#include "hookgate/log.hpp"
#include "hookgate/permissions.hpp"

namespace hookgate {

const char* stage_name(OperationStage stage) {
    switch (stage) {
    case OperationStage::Pending: return "Pending";
    case OperationStage::BeforeCalled: return "BeforeCalled";
    case OperationStage::CoreApplied: return "CoreApplied";
    case OperationStage::AfterCalled: return "AfterCalled";
    case OperationStage::Settled: return "Settled";
    case OperationStage::Aborted: return "Aborted";
    }
    return "Unknown";
}

namespace {

void expect_selector(HookSelector returned, HookSelector expected) {
    if (returned != expected) {
        throw ProtocolError(errors::INVALID_HOOK_RESPONSE,
                            std::string("expected ") + selector_name(expected) +
                            ", extension answered " + selector_name(returned));
    }
}

[[noreturn]] void reject_adjustment(const std::string& reason) {
    HG_LOG_WARN("rejected extension adjustment: %s", reason.c_str());
    throw ProtocolError(errors::UNAUTHORIZED_ADJUSTMENT, reason);
}

void require_permission(Permissions perms, uint16_t flag, const char* what) {
    if (!perms.has(flag)) {
        reject_adjustment(std::string(what) + " returned without permission");
    }
}

// |adjustment| must stay within |core| on the same currency
void check_cap(I128 adjustment, I128 core, int currency_index) {
    if (abs128(adjustment) > abs128(core)) {
        reject_adjustment("adjustment " + to_string(adjustment) + " on currency" +
                          std::to_string(currency_index) + " exceeds core delta " + to_string(core));
    }
}

bool same_sign(I128 a, I128 b) {
    return (a > 0 && b > 0) || (a < 0 && b < 0);
}

} // anonymous namespace

// =============================================================================
// Construction / Checkpoints
// =============================================================================

OperationPipeline::OperationPipeline(const ManagerConfig& config, ICoreEngine& engine,
                                     PoolStore& pools, ExtensionRegistry& registry,
                                     const HookDirectory& directory, ReentrancyGate& gate,
                                     DeltaLedger& ledger)
    : config_(config), engine_(engine), pools_(pools), registry_(registry),
      directory_(directory), gate_(gate), ledger_(ledger) {}

OperationPipeline::OpCheckpoint OperationPipeline::checkpoint() const {
    return OpCheckpoint{ledger_.checkpoint(), pools_.checkpoint(), registry_.checkpoint()};
}

void OperationPipeline::rollback(const OpCheckpoint& checkpoint) {
    ledger_.rollback(checkpoint.ledger);
    pools_.rollback(checkpoint.pools);
    registry_.rollback(checkpoint.bindings);
}

template <typename Body>
auto OperationPipeline::guarded(SequenceId sequence, OperationKind kind, const PoolId& pool_id,
                                Body&& body) -> decltype(body(std::declval<OperationStage&>())) {
    OpCheckpoint cp = checkpoint();
    OperationStage stage = OperationStage::Pending;
    try {
        return body(stage);
    } catch (const ProtocolError& e) {
        rollback(cp);
        ledger_.fail(sequence, std::current_exception());
        aborted_ops_.fetch_add(1, std::memory_order_relaxed);
        HG_LOG_WARN("%s on pool %s aborted at %s: %s", operation_name(kind),
                    pool_id.to_hex().c_str(), stage_name(stage), e.what());
        throw;
    } catch (...) {
        rollback(cp);
        ledger_.fail(sequence, std::current_exception());
        aborted_ops_.fetch_add(1, std::memory_order_relaxed);
        HG_LOG_WARN("%s on pool %s aborted at %s", operation_name(kind),
                    pool_id.to_hex().c_str(), stage_name(stage));
        throw;
    }
}

template <typename Fn>
auto OperationPipeline::invoke(const Address& extension, IHooks& hooks, HookSelector selector, Fn&& fn)
    -> decltype(fn(hooks)) {
    auto frame = gate_.open_callback(extension);
    try {
        return fn(hooks);
    } catch (const ProtocolError&) {
        throw;
    } catch (const std::exception& e) {
        throw ProtocolError(errors::HOOK_CALL_FAILED,
                            std::string(selector_name(selector)) + " failed: " + e.what());
    } catch (...) {
        throw ProtocolError(errors::HOOK_CALL_FAILED,
                            std::string(selector_name(selector)) + " threw a non-standard exception");
    }
}

IHooks* OperationPipeline::resolve(const Address& extension) const {
    if (addresses::is_zero(extension)) return nullptr;
    IHooks* hooks = directory_.find(extension);
    if (hooks == nullptr) {
        throw ProtocolError(errors::INVALID_EXTENSION,
                            "no extension deployed at " + addresses::to_hex(extension));
    }
    return hooks;
}

Slot0 OperationPipeline::require_pool(const PoolId& pool_id) const {
    auto state = pools_.snapshot(pool_id);
    if (!state) {
        throw ProtocolError(errors::POOL_NOT_INITIALIZED, "pool " + pool_id.to_hex() + " is not initialized");
    }
    return state->slot0;
}

// Caller takes core + adjustment; the extension takes the opposite adjustment
void OperationPipeline::fold(SequenceId sequence, const Address& caller, const Address& extension,
                             const PoolKey& key, const BalanceDelta& core,
                             const BalanceDelta& adjustment) {
    ledger_.accumulate(sequence, EntryKind::Core, caller, key.currency0, core.amount0);
    ledger_.accumulate(sequence, EntryKind::Core, caller, key.currency1, core.amount1);

    if (!adjustment.is_zero()) {
        ledger_.accumulate(sequence, EntryKind::HookAdjustment, caller, key.currency0, adjustment.amount0);
        ledger_.accumulate(sequence, EntryKind::HookAdjustment, caller, key.currency1, adjustment.amount1);
        ledger_.accumulate(sequence, EntryKind::HookAdjustment, extension, key.currency0, -adjustment.amount0);
        ledger_.accumulate(sequence, EntryKind::HookAdjustment, extension, key.currency1, -adjustment.amount1);
    }
}

// =============================================================================
// Initialize
// =============================================================================

InitializeResult OperationPipeline::initialize(SequenceId sequence, const Address& caller,
                                               const PoolKey& key, I128 sqrt_price_x96,
                                               const Bytes& hook_data) {
    PoolId pool_id = PoolId::from_key(key);

    return guarded(sequence, OperationKind::INITIALIZE, pool_id, [&](OperationStage& stage) {
        if (!(key.currency0 < key.currency1)) {
            throw ProtocolError(errors::CURRENCIES_NOT_SORTED, "currency0 must sort below currency1");
        }
        if (key.tick_spacing < tick_spacings::MIN_TICK_SPACING ||
            key.tick_spacing > tick_spacings::MAX_TICK_SPACING) {
            throw ProtocolError(errors::INVALID_TICK_SPACING,
                                "tick spacing " + std::to_string(key.tick_spacing) + " out of range");
        }
        if (key.fee > config_.max_fee_pips) {
            throw ProtocolError(errors::INVALID_FEE,
                                "fee " + std::to_string(key.fee) + " above " +
                                std::to_string(config_.max_fee_pips));
        }

        registry_.bind(pool_id, key.hooks);

        Permissions perms = permission_codec::decode(key.hooks);
        bool callbacks = caller != key.hooks;
        IHooks* hooks = resolve(key.hooks);
        CallbackContext ctx{caller, key, pool_id, Slot0{}, hook_data};

        if (callbacks && perms.has(permissions::BEFORE_INITIALIZE)) {
            HookSelector sel = invoke(key.hooks, *hooks, HookSelector::BEFORE_INITIALIZE,
                [&](IHooks& h) { return h.before_initialize(ctx, sqrt_price_x96); });
            expect_selector(sel, HookSelector::BEFORE_INITIALIZE);
        }
        stage = OperationStage::BeforeCalled;

        PoolState state;
        int32_t tick = engine_.initialize(state, key, sqrt_price_x96);
        pools_.insert(pool_id, std::move(state));
        stage = OperationStage::CoreApplied;

        if (callbacks && perms.has(permissions::AFTER_INITIALIZE)) {
            HookSelector sel = invoke(key.hooks, *hooks, HookSelector::AFTER_INITIALIZE,
                [&](IHooks& h) { return h.after_initialize(ctx, sqrt_price_x96, tick); });
            expect_selector(sel, HookSelector::AFTER_INITIALIZE);
        }
        stage = OperationStage::AfterCalled;

        pools_initialized_.fetch_add(1, std::memory_order_relaxed);
        HG_LOG_INFO("initialized pool %s at tick %d", pool_id.to_hex().c_str(), tick);

        stage = OperationStage::Settled;
        InitializeResult result;
        result.pool_id = pool_id;
        result.tick = tick;
        result.stage = stage;
        return result;
    });
}

// =============================================================================
// Modify Liquidity
// =============================================================================

OperationResult OperationPipeline::modify_liquidity(SequenceId sequence, const Address& caller,
                                                    const PoolKey& key,
                                                    const ModifyLiquidityParams& params,
                                                    const Bytes& hook_data) {
    PoolId pool_id = PoolId::from_key(key);

    return guarded(sequence, OperationKind::MODIFY_LIQUIDITY, pool_id, [&](OperationStage& stage) {
        Slot0 pre_state = require_pool(pool_id);
        Address extension = registry_.lookup(pool_id);
        Permissions perms = permission_codec::decode(extension);
        bool callbacks = caller != extension;
        IHooks* hooks = resolve(extension);
        CallbackContext ctx{caller, key, pool_id, pre_state, hook_data};

        if (callbacks && perms.has(permissions::BEFORE_MODIFY_LIQUIDITY)) {
            HookSelector sel = invoke(extension, *hooks, HookSelector::BEFORE_MODIFY_LIQUIDITY,
                [&](IHooks& h) { return h.before_modify_liquidity(ctx, params); });
            expect_selector(sel, HookSelector::BEFORE_MODIFY_LIQUIDITY);
        }
        stage = OperationStage::BeforeCalled;

        CoreResult core = pools_.update(pool_id, [&](PoolState& state) {
            return engine_.modify_liquidity(state, key, caller, params);
        });
        stage = OperationStage::CoreApplied;

        BalanceDelta adjustment{};
        if (callbacks && perms.has(permissions::AFTER_MODIFY_LIQUIDITY)) {
            AfterHookResult after = invoke(extension, *hooks, HookSelector::AFTER_MODIFY_LIQUIDITY,
                [&](IHooks& h) {
                    return h.after_modify_liquidity(ctx, params, core.delta, core.fees_accrued);
                });
            expect_selector(after.selector, HookSelector::AFTER_MODIFY_LIQUIDITY);
            if (after.delta) {
                require_permission(perms, permissions::RETURNS_DELTA, "afterModifyLiquidity delta");
                check_cap(after.delta->amount0, core.delta.amount0, 0);
                check_cap(after.delta->amount1, core.delta.amount1, 1);
                adjustment = *after.delta;
            }
        }
        stage = OperationStage::AfterCalled;

        fold(sequence, caller, extension, key, core.delta, adjustment);
        liquidity_ops_.fetch_add(1, std::memory_order_relaxed);

        stage = OperationStage::Settled;
        OperationResult result;
        result.core_delta = core.delta;
        result.hook_delta = adjustment;
        result.delta = core.delta + adjustment;
        result.fees_accrued = core.fees_accrued;
        result.stage = stage;
        return result;
    });
}

// =============================================================================
// Swap
// =============================================================================

OperationResult OperationPipeline::swap(SequenceId sequence, const Address& caller,
                                        const PoolKey& key, const SwapParams& params,
                                        const Bytes& hook_data) {
    PoolId pool_id = PoolId::from_key(key);

    return guarded(sequence, OperationKind::SWAP, pool_id, [&](OperationStage& stage) {
        Slot0 pre_state = require_pool(pool_id);
        if (params.amount_specified == 0) {
            throw ProtocolError(errors::INVALID_AMOUNT, "swap amount cannot be zero");
        }

        Address extension = registry_.lookup(pool_id);
        Permissions perms = permission_codec::decode(extension);
        bool callbacks = caller != extension;
        IHooks* hooks = resolve(extension);
        CallbackContext ctx{caller, key, pool_id, pre_state, hook_data};

        // The specified currency is the input for exact-in, the output for exact-out
        const bool specified_is_0 = (params.amount_specified > 0) == params.zero_for_one;

        uint32_t fee = pre_state.lp_fee;
        BalanceDelta before_adjustment{};
        if (callbacks && perms.has(permissions::BEFORE_SWAP)) {
            BeforeSwapResult before = invoke(extension, *hooks, HookSelector::BEFORE_SWAP,
                [&](IHooks& h) { return h.before_swap(ctx, params); });
            expect_selector(before.selector, HookSelector::BEFORE_SWAP);

            if (before.fee_override) {
                require_permission(perms, permissions::OVERRIDE_FEE, "beforeSwap fee override");
                if (*before.fee_override > config_.max_fee_pips) {
                    reject_adjustment("fee override " + std::to_string(*before.fee_override) +
                                      " above " + std::to_string(config_.max_fee_pips));
                }
                fee = *before.fee_override;
            }
            if (before.delta) {
                require_permission(perms, permissions::RETURNS_DELTA, "beforeSwap delta");
                before_adjustment = *before.delta;
            }
        }
        stage = OperationStage::BeforeCalled;

        // Part of the specified amount must always reach the core
        I128 specified_adjustment = specified_is_0 ? before_adjustment.amount0 : before_adjustment.amount1;
        if (specified_adjustment != 0 &&
            (!same_sign(specified_adjustment, params.amount_specified) ||
             abs128(specified_adjustment) >= abs128(params.amount_specified))) {
            reject_adjustment("beforeSwap delta " + to_string(specified_adjustment) +
                              " not covered by amount specified " + to_string(params.amount_specified));
        }

        SwapParams core_params = params;
        core_params.amount_specified = params.amount_specified - specified_adjustment;

        CoreResult core = pools_.update(pool_id, [&](PoolState& state) {
            return engine_.swap(state, key, core_params, fee);
        });
        stage = OperationStage::CoreApplied;

        BalanceDelta after_adjustment{};
        if (callbacks && perms.has(permissions::AFTER_SWAP)) {
            AfterHookResult after = invoke(extension, *hooks, HookSelector::AFTER_SWAP,
                [&](IHooks& h) { return h.after_swap(ctx, params, core.delta, fee); });
            expect_selector(after.selector, HookSelector::AFTER_SWAP);
            if (after.delta) {
                require_permission(perms, permissions::RETURNS_DELTA, "afterSwap delta");
                check_cap(after.delta->amount0, core.delta.amount0, 0);
                check_cap(after.delta->amount1, core.delta.amount1, 1);
                after_adjustment = *after.delta;
            }
        }

        // Both callbacks together stay within the realized core delta
        check_cap(before_adjustment.amount0 + after_adjustment.amount0, core.delta.amount0, 0);
        check_cap(before_adjustment.amount1 + after_adjustment.amount1, core.delta.amount1, 1);
        stage = OperationStage::AfterCalled;

        BalanceDelta adjustment = before_adjustment + after_adjustment;
        fold(sequence, caller, extension, key, core.delta, adjustment);
        swaps_.fetch_add(1, std::memory_order_relaxed);

        HG_LOG_DEBUG("swap on pool %s: core (%s, %s) adjustment (%s, %s) fee %u",
                     pool_id.to_hex().c_str(),
                     to_string(core.delta.amount0).c_str(), to_string(core.delta.amount1).c_str(),
                     to_string(adjustment.amount0).c_str(), to_string(adjustment.amount1).c_str(), fee);

        stage = OperationStage::Settled;
        OperationResult result;
        result.core_delta = core.delta;
        result.hook_delta = adjustment;
        result.delta = core.delta + adjustment;
        result.fee_applied = fee;
        result.stage = stage;
        return result;
    });
}

// =============================================================================
// Donate
// =============================================================================

OperationResult OperationPipeline::donate(SequenceId sequence, const Address& caller,
                                          const PoolKey& key, I128 amount0, I128 amount1,
                                          const Bytes& hook_data) {
    PoolId pool_id = PoolId::from_key(key);

    return guarded(sequence, OperationKind::DONATE, pool_id, [&](OperationStage& stage) {
        Slot0 pre_state = require_pool(pool_id);
        Address extension = registry_.lookup(pool_id);
        Permissions perms = permission_codec::decode(extension);
        bool callbacks = caller != extension;
        IHooks* hooks = resolve(extension);
        CallbackContext ctx{caller, key, pool_id, pre_state, hook_data};

        if (callbacks && perms.has(permissions::BEFORE_DONATE)) {
            HookSelector sel = invoke(extension, *hooks, HookSelector::BEFORE_DONATE,
                [&](IHooks& h) { return h.before_donate(ctx, amount0, amount1); });
            expect_selector(sel, HookSelector::BEFORE_DONATE);
        }
        stage = OperationStage::BeforeCalled;

        CoreResult core = pools_.update(pool_id, [&](PoolState& state) {
            return engine_.donate(state, key, amount0, amount1);
        });
        stage = OperationStage::CoreApplied;

        if (callbacks && perms.has(permissions::AFTER_DONATE)) {
            HookSelector sel = invoke(extension, *hooks, HookSelector::AFTER_DONATE,
                [&](IHooks& h) { return h.after_donate(ctx, amount0, amount1); });
            expect_selector(sel, HookSelector::AFTER_DONATE);
        }
        stage = OperationStage::AfterCalled;

        fold(sequence, caller, extension, key, core.delta, BalanceDelta{});
        donations_.fetch_add(1, std::memory_order_relaxed);

        stage = OperationStage::Settled;
        OperationResult result;
        result.core_delta = core.delta;
        result.delta = core.delta;
        result.stage = stage;
        return result;
    });
}

// =============================================================================
// Statistics
// =============================================================================

OperationPipeline::Stats OperationPipeline::get_stats() const {
    return Stats{
        pools_initialized_.load(std::memory_order_relaxed),
        liquidity_ops_.load(std::memory_order_relaxed),
        swaps_.load(std::memory_order_relaxed),
        donations_.load(std::memory_order_relaxed),
        aborted_ops_.load(std::memory_order_relaxed),
    };
}

} // namespace hookgate
