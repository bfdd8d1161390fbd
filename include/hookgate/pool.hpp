#ifndef HOOKGATE_POOL_HPP
#define HOOKGATE_POOL_HPP

#include <cmath>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <tuple>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace hookgate {

// =============================================================================
// Pool Slot0 State
// =============================================================================

struct Slot0 {
    I128 sqrt_price_x96 = 0;  // Current sqrt(price) as Q64.96
    int32_t tick = 0;         // Current tick
    uint32_t lp_fee = 0;      // LP fee (hundredths of bip)
};

// =============================================================================
// Tick Info
// =============================================================================

struct TickInfo {
    I128 liquidity_gross = 0;    // Total liquidity referencing the tick
    I128 liquidity_net = 0;      // Net liquidity change when crossing left to right
    U128 fee_growth_outside0_x64 = 0;
    U128 fee_growth_outside1_x64 = 0;
};

// =============================================================================
// Position Info
// =============================================================================

struct PositionKey {
    Address owner;
    int32_t tick_lower;
    int32_t tick_upper;
    uint64_t salt;

    bool operator<(const PositionKey& other) const {
        return std::tie(owner, tick_lower, tick_upper, salt) <
               std::tie(other.owner, other.tick_lower, other.tick_upper, other.salt);
    }
};

struct PositionInfo {
    I128 liquidity = 0;
    U128 fee_growth_inside0_last_x64 = 0;
    U128 fee_growth_inside1_last_x64 = 0;
};

// =============================================================================
// Pool State (single pool)
// =============================================================================

struct PoolState {
    Slot0 slot0;
    U128 fee_growth_global0_x64 = 0;  // Wrapping accumulators
    U128 fee_growth_global1_x64 = 0;
    I128 liquidity = 0;               // Current active liquidity
    std::map<int32_t, TickInfo> ticks;
    std::map<PositionKey, PositionInfo> positions;
};

// =============================================================================
// Core Engine Interface
//
// The math behind each operation. The pipeline treats its results as
// authoritative; failures are thrown as ProtocolError(CORE_TRANSITION_FAILED).
// =============================================================================

struct CoreResult {
    BalanceDelta delta;          // Caller side, includes credited fees
    BalanceDelta fees_accrued;   // Position fees credited by modify_liquidity
};

class ICoreEngine {
public:
    virtual ~ICoreEngine() = default;

    // Returns the initial tick
    virtual int32_t initialize(PoolState& pool, const PoolKey& key, I128 sqrt_price_x96) = 0;

    virtual CoreResult modify_liquidity(PoolState& pool, const PoolKey& key, const Address& owner,
                                        const ModifyLiquidityParams& params) = 0;

    virtual CoreResult swap(PoolState& pool, const PoolKey& key, const SwapParams& params,
                            uint32_t fee_pips) = 0;

    virtual CoreResult donate(PoolState& pool, const PoolKey& key, I128 amount0, I128 amount1) = 0;
};

// =============================================================================
// ConcentratedLiquidityEngine - tick-based concentrated liquidity
// =============================================================================

class ConcentratedLiquidityEngine : public ICoreEngine {
public:
    explicit ConcentratedLiquidityEngine(uint32_t max_swap_steps = 1000)
        : max_swap_steps_(max_swap_steps) {}

    int32_t initialize(PoolState& pool, const PoolKey& key, I128 sqrt_price_x96) override;

    CoreResult modify_liquidity(PoolState& pool, const PoolKey& key, const Address& owner,
                                const ModifyLiquidityParams& params) override;

    CoreResult swap(PoolState& pool, const PoolKey& key, const SwapParams& params,
                    uint32_t fee_pips) override;

    CoreResult donate(PoolState& pool, const PoolKey& key, I128 amount0, I128 amount1) override;

    // Single step of a swap within one tick range
    struct SwapStep {
        I128 sqrt_price_next_x96;
        I128 amount_in;
        I128 amount_out;
        I128 fee_amount;
    };
    static SwapStep compute_swap_step(I128 sqrt_price_current_x96, I128 sqrt_price_target_x96,
                                      I128 liquidity, I128 amount_remaining, uint32_t fee_pips);

private:
    uint32_t max_swap_steps_;

    static void update_tick(PoolState& pool, int32_t tick, int32_t tick_current,
                            I128 liquidity_delta, bool upper);
    static std::pair<U128, U128> fee_growth_inside(const PoolState& pool, int32_t tick_lower,
                                                   int32_t tick_upper);
};

// =============================================================================
// Tick Math
// =============================================================================

namespace tick_math {

// Narrower than the full 160-bit range so every sqrt price fits in I128
constexpr int32_t MIN_TICK = -400000;
constexpr int32_t MAX_TICK = 400000;

inline I128 sqrt_ratio_at_tick_unchecked(int32_t tick) {
    // sqrt_price = sqrt(1.0001^tick), scaled to Q64.96
    double sqrt_price = std::pow(1.0001, tick / 2.0);
    double scaled = sqrt_price * static_cast<double>(1ULL << 48) * static_cast<double>(1ULL << 48);
    return static_cast<I128>(scaled);
}

inline const I128 MIN_SQRT_RATIO = sqrt_ratio_at_tick_unchecked(MIN_TICK);
inline const I128 MAX_SQRT_RATIO = sqrt_ratio_at_tick_unchecked(MAX_TICK);

// Returns 0 outside [MIN_TICK, MAX_TICK]
inline I128 get_sqrt_ratio_at_tick(int32_t tick) {
    if (tick < MIN_TICK || tick > MAX_TICK) return 0;
    return sqrt_ratio_at_tick_unchecked(tick);
}

// Greatest tick whose sqrt ratio is <= sqrt_price_x96
inline int32_t get_tick_at_sqrt_ratio(I128 sqrt_price_x96) {
    if (sqrt_price_x96 <= MIN_SQRT_RATIO) return MIN_TICK;
    if (sqrt_price_x96 >= MAX_SQRT_RATIO) return MAX_TICK;

    double sqrt_price = static_cast<double>(sqrt_price_x96) / static_cast<double>(1ULL << 48);
    sqrt_price /= static_cast<double>(1ULL << 48);
    double tick_d = 2.0 * std::log(sqrt_price) / std::log(1.0001);
    int32_t tick = static_cast<int32_t>(std::floor(tick_d));

    // Floating point can land one tick off near boundaries
    if (tick < MIN_TICK) tick = MIN_TICK;
    if (tick > MAX_TICK) tick = MAX_TICK;
    while (tick > MIN_TICK && get_sqrt_ratio_at_tick(tick) > sqrt_price_x96) --tick;
    while (tick < MAX_TICK && get_sqrt_ratio_at_tick(tick + 1) <= sqrt_price_x96) ++tick;
    return tick;
}

} // namespace tick_math

// =============================================================================
// PoolStore - journaled pool storage
//
// Every write goes through update()/insert(), which record the pre-image so a
// failed operation or sequence can be rolled back to a checkpoint.
// =============================================================================

class PoolStore {
public:
    PoolStore() = default;

    PoolStore(const PoolStore&) = delete;
    PoolStore& operator=(const PoolStore&) = delete;

    bool exists(const PoolId& id) const;
    std::optional<PoolState> snapshot(const PoolId& id) const;
    size_t size() const;

    // Runs fn(PoolState&) under the write lock after journaling the pre-image.
    // Throws ProtocolError(POOL_NOT_INITIALIZED) when the pool is missing.
    template <typename Fn>
    auto update(const PoolId& id, Fn&& fn) {
        std::unique_lock lock(mutex_);
        auto it = pools_.find(id);
        if (it == pools_.end()) {
            throw_not_initialized(id);
        }
        journal_.push_back(JournalEntry{id, it->second});
        return fn(it->second);
    }

    // Throws ProtocolError(CORE_TRANSITION_FAILED) if the pool already exists
    void insert(const PoolId& id, PoolState state);

    size_t checkpoint() const;
    void rollback(size_t checkpoint);
    void commit();

private:
    std::unordered_map<PoolId, PoolState> pools_;
    mutable std::shared_mutex mutex_;

    struct JournalEntry {
        PoolId id;
        std::optional<PoolState> before;  // nullopt = pool did not exist
    };
    std::vector<JournalEntry> journal_;

    [[noreturn]] static void throw_not_initialized(const PoolId& id);
};

} // namespace hookgate

#endif // HOOKGATE_POOL_HPP
