// =============================================================================
// manager.cpp - PoolManager sequences, operations and payments
// =============================================================================

#include "hookgate/manager.hpp"

#include "hookgate/log.hpp"

namespace hookgate {

namespace {

std::shared_ptr<ICoreEngine> default_engine(std::shared_ptr<ICoreEngine> engine, uint32_t max_swap_steps) {
    if (engine) return engine;
    return std::make_shared<ConcentratedLiquidityEngine>(max_swap_steps);
}

} // anonymous namespace

// =============================================================================
// Constructor
// =============================================================================

PoolManager::PoolManager(ManagerConfig config, std::shared_ptr<ICoreEngine> engine)
    : config_(std::move(config)),
      engine_(default_engine(std::move(engine), config_.max_swap_steps)),
      registry_(directory_),
      pipeline_(config_, *engine_, pools_, registry_, directory_, gate_, ledger_) {
    config_.validate();
    log::set_level(log::parse_level(config_.log_level));
}

// =============================================================================
// Sequence Lifecycle
// =============================================================================

PoolManager::SequenceCheckpoint PoolManager::open_sequence(SequenceId sequence, const Address& locker) {
    ledger_.begin(sequence, locker);
    return SequenceCheckpoint{pools_.checkpoint(), registry_.checkpoint()};
}

Settlement PoolManager::close_sequence(SequenceId sequence) {
    Settlement settlement = ledger_.settle(sequence);

    int32_t rc = vault_.pre_check_transfers(config_.manager_address, settlement.transfers);
    if (rc != errors::OK) {
        throw ProtocolError(errors::UNBALANCED,
                            std::string("settlement cannot be funded: ") + error_name(rc));
    }
    rc = vault_.apply_transfers(config_.manager_address, settlement.transfers);
    if (rc != errors::OK) {
        throw ProtocolError(errors::UNBALANCED,
                            std::string("settlement rejected by vault: ") + error_name(rc));
    }

    pools_.commit();
    registry_.commit();
    sequences_settled_.fetch_add(1, std::memory_order_relaxed);
    return settlement;
}

void PoolManager::abort_sequence(const SequenceCheckpoint& checkpoint) {
    ledger_.discard();
    pools_.rollback(checkpoint.pools);
    registry_.rollback(checkpoint.bindings);
    HG_LOG_WARN("sequence aborted, state rolled back");
}

Settlement PoolManager::unlock(const Address& caller, const std::function<void()>& callback) {
    ReentrancyGate::Guard guard = gate_.enter(caller);
    if (!guard.outermost()) {
        callback();
        return Settlement{};
    }

    SequenceCheckpoint checkpoint = open_sequence(guard.sequence(), caller);
    try {
        callback();
        return close_sequence(guard.sequence());
    } catch (...) {
        abort_sequence(checkpoint);
        throw;
    }
}

template <typename Result, typename Op>
Result PoolManager::run_operation(const Address& caller, Op&& op) {
    ReentrancyGate::Guard guard = gate_.enter(caller);
    if (!guard.outermost()) {
        return op(guard.sequence());
    }

    SequenceCheckpoint checkpoint = open_sequence(guard.sequence(), caller);
    try {
        Result result = op(guard.sequence());
        result.settlement = close_sequence(guard.sequence());
        return result;
    } catch (...) {
        abort_sequence(checkpoint);
        throw;
    }
}

// =============================================================================
// Pool Operations
// =============================================================================

InitializeResult PoolManager::initialize(const Address& caller, const PoolKey& key,
                                         I128 sqrt_price_x96, const Bytes& hook_data) {
    return run_operation<InitializeResult>(caller, [&](SequenceId sequence) {
        return pipeline_.initialize(sequence, caller, key, sqrt_price_x96, hook_data);
    });
}

OperationResult PoolManager::modify_liquidity(const Address& caller, const PoolKey& key,
                                              const ModifyLiquidityParams& params,
                                              const Bytes& hook_data) {
    return run_operation<OperationResult>(caller, [&](SequenceId sequence) {
        return pipeline_.modify_liquidity(sequence, caller, key, params, hook_data);
    });
}

OperationResult PoolManager::swap(const Address& caller, const PoolKey& key,
                                  const SwapParams& params, const Bytes& hook_data) {
    return run_operation<OperationResult>(caller, [&](SequenceId sequence) {
        return pipeline_.swap(sequence, caller, key, params, hook_data);
    });
}

OperationResult PoolManager::donate(const Address& caller, const PoolKey& key,
                                    I128 amount0, I128 amount1, const Bytes& hook_data) {
    return run_operation<OperationResult>(caller, [&](SequenceId sequence) {
        return pipeline_.donate(sequence, caller, key, amount0, amount1, hook_data);
    });
}

// =============================================================================
// Payments
// =============================================================================

ReentrancyGate::Guard PoolManager::enter_payment(const Address& caller) {
    if (!gate_.is_locked()) {
        throw ProtocolError(errors::NOT_LOCKED, "payments require an active sequence");
    }
    ReentrancyGate::Guard guard = gate_.enter(caller);
    if (guard.outermost()) {
        // The sequence ended between the check and enter
        throw ProtocolError(errors::NOT_LOCKED, "payments require an active sequence");
    }
    return guard;
}

void PoolManager::take(const Address& caller, const Currency& currency, I128 amount) {
    if (amount <= 0) {
        throw ProtocolError(errors::INVALID_AMOUNT, "take amount must be positive");
    }
    ReentrancyGate::Guard guard = enter_payment(caller);
    ledger_.accumulate(guard.sequence(), EntryKind::Payment, caller, currency, amount);
    ledger_.record_transfer(guard.sequence(), Transfer{caller, currency, -amount});
}

void PoolManager::settle(const Address& caller, const Currency& currency, I128 amount) {
    if (amount <= 0) {
        throw ProtocolError(errors::INVALID_AMOUNT, "settle amount must be positive");
    }
    ReentrancyGate::Guard guard = enter_payment(caller);
    ledger_.accumulate(guard.sequence(), EntryKind::Payment, caller, currency, -amount);
    ledger_.record_transfer(guard.sequence(), Transfer{caller, currency, amount});
}

// =============================================================================
// Queries
// =============================================================================

std::optional<Slot0> PoolManager::get_slot0(const PoolId& pool_id) const {
    auto state = pools_.snapshot(pool_id);
    if (!state) return std::nullopt;
    return state->slot0;
}

I128 PoolManager::get_liquidity(const PoolId& pool_id) const {
    auto state = pools_.snapshot(pool_id);
    return state ? state->liquidity : 0;
}

std::optional<PositionInfo> PoolManager::get_position(const PoolId& pool_id, const Address& owner,
                                                      int32_t tick_lower, int32_t tick_upper,
                                                      uint64_t salt) const {
    auto state = pools_.snapshot(pool_id);
    if (!state) return std::nullopt;
    auto it = state->positions.find(PositionKey{owner, tick_lower, tick_upper, salt});
    if (it == state->positions.end()) return std::nullopt;
    return it->second;
}

bool PoolManager::pool_exists(const PoolId& pool_id) const {
    return pools_.exists(pool_id);
}

Address PoolManager::extension_of(const PoolId& pool_id) const {
    return registry_.lookup(pool_id);
}

I128 PoolManager::currency_delta(const Address& account, const Currency& currency) const {
    return ledger_.delta(account, currency);
}

bool PoolManager::is_unlocked() const {
    return gate_.is_locked();
}

PoolManager::Stats PoolManager::get_stats() const {
    auto pipeline = pipeline_.get_stats();
    return Stats{
        static_cast<uint64_t>(pools_.size()),
        pipeline.swaps,
        pipeline.liquidity_ops,
        pipeline.donations,
        pipeline.aborted_ops,
        sequences_settled_.load(std::memory_order_relaxed),
    };
}

} // namespace hookgate
