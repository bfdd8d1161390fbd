// =============================================================================
// pool.cpp - Concentrated liquidity core engine and journaled pool storage
// =============================================================================

#include "hookgate/pool.hpp"

#include <algorithm>

namespace hookgate {

// =============================================================================
// Internal Constants
// =============================================================================

namespace {

// Q64.96 scaling factor
constexpr I128 Q96 = I128(1) << 96;
// Fee growth is stored as Q64.64
constexpr U128 Q64 = U128(1) << 64;

constexpr U128 I128_MAX_U = ~U128(0) >> 1;

[[noreturn]] void core_failure(const std::string& msg) {
    throw ProtocolError(errors::CORE_TRANSITION_FAILED, msg);
}

// =============================================================================
// 256-bit Arithmetic (U256 via two U128 limbs)
// =============================================================================

struct U256 {
    U128 lo = 0;  // Low 128 bits
    U128 hi = 0;  // High 128 bits
};

// Multiply two U128 values to produce U256
inline U256 mul_u128(U128 a, U128 b) {
    // Split into 64-bit halves to avoid overflow
    constexpr U128 MASK64 = (U128(1) << 64) - 1;
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    // Accumulate with carry
    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
    return result;
}

// Shift-subtract long division. The quotient must fit in 128 bits.
inline U128 div_u256_u128(const U256& num, U128 denom, U128& remainder) {
    if (denom == 0) core_failure("division by zero");
    if (num.hi >= denom) core_failure("mul_div overflow");

    U128 rem = num.hi;
    U128 quot = 0;
    for (int i = 127; i >= 0; --i) {
        bool carry = (rem >> 127) != 0;
        rem = (rem << 1) | ((num.lo >> i) & 1);
        quot <<= 1;
        if (carry || rem >= denom) {
            rem -= denom;
            quot |= 1;
        }
    }
    remainder = rem;
    return quot;
}

inline U128 mul_div_u(U128 a, U128 b, U128 denom, bool round_up = false) {
    U128 rem = 0;
    U128 quot = div_u256_u128(mul_u128(a, b), denom, rem);
    if (round_up && rem != 0) {
        if (quot == ~U128(0)) core_failure("mul_div overflow");
        ++quot;
    }
    return quot;
}

inline U128 magnitude(I128 x) {
    return x < 0 ? static_cast<U128>(0) - static_cast<U128>(x) : static_cast<U128>(x);
}

// Signed a * b / denom with a 256-bit intermediate; rounds the magnitude
inline I128 mul_div(I128 a, I128 b, I128 denom, bool round_up = false) {
    bool neg = (a < 0) ^ (b < 0) ^ (denom < 0);
    U128 result = mul_div_u(magnitude(a), magnitude(b), magnitude(denom), round_up);
    if (result > I128_MAX_U) core_failure("mul_div result exceeds 128 bits");
    return neg ? -static_cast<I128>(result) : static_cast<I128>(result);
}

inline I128 mul_div_up(I128 a, I128 b, I128 denom) {
    return mul_div(a, b, denom, true);
}

inline I128 to_i128(U128 v) {
    if (v > I128_MAX_U) core_failure("amount exceeds 128 bits");
    return static_cast<I128>(v);
}

// =============================================================================
// Sqrt Price Math
// =============================================================================

// Token0 between two prices: L * (sb - sa) / (sa * sb), Q96 scaled
I128 amount0_delta(I128 sqrt_a, I128 sqrt_b, I128 liquidity, bool round_up) {
    if (sqrt_a > sqrt_b) std::swap(sqrt_a, sqrt_b);
    if (sqrt_a <= 0) core_failure("sqrt price must be positive");
    if (liquidity == 0 || sqrt_a == sqrt_b) return 0;
    if (round_up) {
        return mul_div_up(mul_div_up(liquidity, sqrt_b - sqrt_a, sqrt_b), Q96, sqrt_a);
    }
    return mul_div(mul_div(liquidity, sqrt_b - sqrt_a, sqrt_b), Q96, sqrt_a);
}

// Token1 between two prices: L * (sb - sa)
I128 amount1_delta(I128 sqrt_a, I128 sqrt_b, I128 liquidity, bool round_up) {
    if (sqrt_a > sqrt_b) std::swap(sqrt_a, sqrt_b);
    if (liquidity == 0 || sqrt_a == sqrt_b) return 0;
    return mul_div(liquidity, sqrt_b - sqrt_a, Q96, round_up);
}

I128 next_sqrt_price_from_amount0(I128 sqrt_price, I128 liquidity, I128 amount, bool add) {
    if (amount == 0) return sqrt_price;
    if (add) {
        I128 denominator = liquidity + mul_div(amount, sqrt_price, Q96);
        return mul_div_up(liquidity, sqrt_price, denominator);
    }
    I128 product = mul_div_up(amount, sqrt_price, Q96);
    if (product >= liquidity) core_failure("insufficient liquidity for output amount");
    return mul_div_up(liquidity, sqrt_price, liquidity - product);
}

I128 next_sqrt_price_from_amount1(I128 sqrt_price, I128 liquidity, I128 amount, bool add) {
    if (add) {
        return sqrt_price + mul_div(amount, Q96, liquidity);
    }
    I128 quotient = mul_div_up(amount, Q96, liquidity);
    if (quotient >= sqrt_price) core_failure("insufficient liquidity for output amount");
    return sqrt_price - quotient;
}

I128 next_sqrt_price_from_input(I128 sqrt_price, I128 liquidity, I128 amount_in, bool zero_for_one) {
    return zero_for_one
        ? next_sqrt_price_from_amount0(sqrt_price, liquidity, amount_in, true)
        : next_sqrt_price_from_amount1(sqrt_price, liquidity, amount_in, true);
}

I128 next_sqrt_price_from_output(I128 sqrt_price, I128 liquidity, I128 amount_out, bool zero_for_one) {
    return zero_for_one
        ? next_sqrt_price_from_amount1(sqrt_price, liquidity, amount_out, false)
        : next_sqrt_price_from_amount0(sqrt_price, liquidity, amount_out, false);
}

U128 outside0(const PoolState& pool, int32_t tick) {
    auto it = pool.ticks.find(tick);
    return it != pool.ticks.end() ? it->second.fee_growth_outside0_x64 : 0;
}

U128 outside1(const PoolState& pool, int32_t tick) {
    auto it = pool.ticks.find(tick);
    return it != pool.ticks.end() ? it->second.fee_growth_outside1_x64 : 0;
}

} // anonymous namespace

// =============================================================================
// Initialize
// =============================================================================

int32_t ConcentratedLiquidityEngine::initialize(PoolState& pool, const PoolKey& key, I128 sqrt_price_x96) {
    if (pool.slot0.sqrt_price_x96 != 0) {
        core_failure("pool already initialized");
    }
    if (sqrt_price_x96 < tick_math::MIN_SQRT_RATIO || sqrt_price_x96 >= tick_math::MAX_SQRT_RATIO) {
        core_failure("sqrt price out of range: " + to_string(sqrt_price_x96));
    }

    int32_t tick = tick_math::get_tick_at_sqrt_ratio(sqrt_price_x96);
    pool.slot0.sqrt_price_x96 = sqrt_price_x96;
    pool.slot0.tick = tick;
    pool.slot0.lp_fee = key.fee;
    return tick;
}

// =============================================================================
// Tick Bookkeeping
// =============================================================================

void ConcentratedLiquidityEngine::update_tick(PoolState& pool, int32_t tick, int32_t tick_current,
                                              I128 liquidity_delta, bool upper) {
    TickInfo& info = pool.ticks[tick];
    I128 gross_before = info.liquidity_gross;
    I128 gross_after = gross_before + liquidity_delta;
    if (gross_after < 0) core_failure("tick liquidity underflow");

    // Fee growth below a freshly initialized tick is attributed to the outside
    if (gross_before == 0 && tick <= tick_current) {
        info.fee_growth_outside0_x64 = pool.fee_growth_global0_x64;
        info.fee_growth_outside1_x64 = pool.fee_growth_global1_x64;
    }

    info.liquidity_gross = gross_after;
    info.liquidity_net = upper ? info.liquidity_net - liquidity_delta
                               : info.liquidity_net + liquidity_delta;
}

std::pair<U128, U128> ConcentratedLiquidityEngine::fee_growth_inside(const PoolState& pool,
                                                                    int32_t tick_lower,
                                                                    int32_t tick_upper) {
    int32_t tick_current = pool.slot0.tick;
    U128 g0 = pool.fee_growth_global0_x64;
    U128 g1 = pool.fee_growth_global1_x64;

    U128 below0, below1;
    if (tick_current >= tick_lower) {
        below0 = outside0(pool, tick_lower);
        below1 = outside1(pool, tick_lower);
    } else {
        below0 = g0 - outside0(pool, tick_lower);
        below1 = g1 - outside1(pool, tick_lower);
    }

    U128 above0, above1;
    if (tick_current < tick_upper) {
        above0 = outside0(pool, tick_upper);
        above1 = outside1(pool, tick_upper);
    } else {
        above0 = g0 - outside0(pool, tick_upper);
        above1 = g1 - outside1(pool, tick_upper);
    }

    return {g0 - below0 - above0, g1 - below1 - above1};
}

// =============================================================================
// Modify Liquidity
// =============================================================================

CoreResult ConcentratedLiquidityEngine::modify_liquidity(PoolState& pool, const PoolKey& key,
                                                         const Address& owner,
                                                         const ModifyLiquidityParams& params) {
    if (params.tick_lower >= params.tick_upper ||
        params.tick_lower < tick_math::MIN_TICK ||
        params.tick_upper > tick_math::MAX_TICK) {
        core_failure("invalid tick range");
    }
    if (params.tick_lower % key.tick_spacing != 0 || params.tick_upper % key.tick_spacing != 0) {
        core_failure("ticks not aligned to spacing");
    }

    PositionKey pos_key{owner, params.tick_lower, params.tick_upper, params.salt};
    auto pos_it = pool.positions.find(pos_key);
    I128 position_liquidity = pos_it != pool.positions.end() ? pos_it->second.liquidity : 0;

    I128 liquidity_delta = params.liquidity_delta;
    if (liquidity_delta < 0 && position_liquidity < -liquidity_delta) {
        core_failure("insufficient position liquidity");
    }
    if (liquidity_delta == 0 && position_liquidity == 0) {
        core_failure("cannot poke an empty position");
    }

    int32_t tick_current = pool.slot0.tick;
    if (liquidity_delta != 0) {
        update_tick(pool, params.tick_lower, tick_current, liquidity_delta, false);
        update_tick(pool, params.tick_upper, tick_current, liquidity_delta, true);
    }

    auto [inside0, inside1] = fee_growth_inside(pool, params.tick_lower, params.tick_upper);

    PositionInfo& pos = pool.positions[pos_key];
    BalanceDelta fees_accrued{};
    if (pos.liquidity > 0) {
        fees_accrued.amount0 = to_i128(mul_div_u(inside0 - pos.fee_growth_inside0_last_x64,
                                                 static_cast<U128>(pos.liquidity), Q64));
        fees_accrued.amount1 = to_i128(mul_div_u(inside1 - pos.fee_growth_inside1_last_x64,
                                                 static_cast<U128>(pos.liquidity), Q64));
    }
    pos.liquidity += liquidity_delta;
    pos.fee_growth_inside0_last_x64 = inside0;
    pos.fee_growth_inside1_last_x64 = inside1;

    if (pos.liquidity == 0) {
        pool.positions.erase(pos_key);
    }

    // Cleared ticks no longer track fee growth
    if (liquidity_delta < 0) {
        for (int32_t t : {params.tick_lower, params.tick_upper}) {
            auto it = pool.ticks.find(t);
            if (it != pool.ticks.end() && it->second.liquidity_gross == 0) {
                pool.ticks.erase(it);
            }
        }
    }

    // Principal amounts
    I128 sqrt_lower = tick_math::get_sqrt_ratio_at_tick(params.tick_lower);
    I128 sqrt_upper = tick_math::get_sqrt_ratio_at_tick(params.tick_upper);
    I128 sqrt_price = pool.slot0.sqrt_price_x96;
    I128 liquidity_abs = abs128(liquidity_delta);
    bool round_up = liquidity_delta > 0;

    I128 amount0 = 0;
    I128 amount1 = 0;
    if (tick_current < params.tick_lower) {
        amount0 = amount0_delta(sqrt_lower, sqrt_upper, liquidity_abs, round_up);
    } else if (tick_current < params.tick_upper) {
        amount0 = amount0_delta(sqrt_price, sqrt_upper, liquidity_abs, round_up);
        amount1 = amount1_delta(sqrt_lower, sqrt_price, liquidity_abs, round_up);
        pool.liquidity += liquidity_delta;
    } else {
        amount1 = amount1_delta(sqrt_lower, sqrt_upper, liquidity_abs, round_up);
    }

    // Adding liquidity = pay in (positive), removing = receive (negative)
    BalanceDelta principal = liquidity_delta > 0 ? BalanceDelta{amount0, amount1}
                                                 : BalanceDelta{-amount0, -amount1};

    CoreResult result;
    result.fees_accrued = fees_accrued;
    result.delta = principal - fees_accrued;
    return result;
}

// =============================================================================
// Swap Step Computation
// =============================================================================

ConcentratedLiquidityEngine::SwapStep ConcentratedLiquidityEngine::compute_swap_step(
    I128 sqrt_price_current_x96, I128 sqrt_price_target_x96, I128 liquidity,
    I128 amount_remaining, uint32_t fee_pips) {

    bool zero_for_one = sqrt_price_current_x96 >= sqrt_price_target_x96;
    bool exact_in = amount_remaining > 0;
    const I128 fee_den = fees::FEE_DENOMINATOR;

    SwapStep step{};
    if (exact_in) {
        I128 remaining_less_fee = mul_div(amount_remaining, fee_den - fee_pips, fee_den);
        step.amount_in = zero_for_one
            ? amount0_delta(sqrt_price_target_x96, sqrt_price_current_x96, liquidity, true)
            : amount1_delta(sqrt_price_current_x96, sqrt_price_target_x96, liquidity, true);
        if (remaining_less_fee >= step.amount_in) {
            step.sqrt_price_next_x96 = sqrt_price_target_x96;
        } else {
            step.sqrt_price_next_x96 = next_sqrt_price_from_input(
                sqrt_price_current_x96, liquidity, remaining_less_fee, zero_for_one);
        }
    } else {
        step.amount_out = zero_for_one
            ? amount1_delta(sqrt_price_target_x96, sqrt_price_current_x96, liquidity, false)
            : amount0_delta(sqrt_price_current_x96, sqrt_price_target_x96, liquidity, false);
        if (-amount_remaining >= step.amount_out) {
            step.sqrt_price_next_x96 = sqrt_price_target_x96;
        } else {
            step.sqrt_price_next_x96 = next_sqrt_price_from_output(
                sqrt_price_current_x96, liquidity, -amount_remaining, zero_for_one);
        }
    }

    bool reached_target = step.sqrt_price_next_x96 == sqrt_price_target_x96;

    // Recompute amounts for the range actually traversed
    if (zero_for_one) {
        if (!(reached_target && exact_in)) {
            step.amount_in = amount0_delta(step.sqrt_price_next_x96, sqrt_price_current_x96, liquidity, true);
        }
        if (!(reached_target && !exact_in)) {
            step.amount_out = amount1_delta(step.sqrt_price_next_x96, sqrt_price_current_x96, liquidity, false);
        }
    } else {
        if (!(reached_target && exact_in)) {
            step.amount_in = amount1_delta(sqrt_price_current_x96, step.sqrt_price_next_x96, liquidity, true);
        }
        if (!(reached_target && !exact_in)) {
            step.amount_out = amount0_delta(sqrt_price_current_x96, step.sqrt_price_next_x96, liquidity, false);
        }
    }

    // Never hand out more than requested
    if (!exact_in && step.amount_out > -amount_remaining) {
        step.amount_out = -amount_remaining;
    }

    if (exact_in && !reached_target) {
        // Whatever input is left after the price move is kept as fee
        step.fee_amount = amount_remaining - step.amount_in;
    } else {
        step.fee_amount = mul_div_up(step.amount_in, fee_pips, fee_den - fee_pips);
    }
    return step;
}

// =============================================================================
// Swap
// =============================================================================

CoreResult ConcentratedLiquidityEngine::swap(PoolState& pool, const PoolKey& key,
                                             const SwapParams& params, uint32_t fee_pips) {
    (void)key;
    if (params.amount_specified == 0) {
        core_failure("swap amount cannot be zero");
    }
    if (fee_pips >= fees::FEE_DENOMINATOR) {
        core_failure("swap fee must be below 100%");
    }

    const bool zero_for_one = params.zero_for_one;
    const bool exact_in = params.amount_specified > 0;

    // Determine price limit
    I128 sqrt_price_limit = params.sqrt_price_limit;
    if (sqrt_price_limit == 0) {
        sqrt_price_limit = zero_for_one ? tick_math::MIN_SQRT_RATIO + 1
                                        : tick_math::MAX_SQRT_RATIO - 1;
    }
    if (zero_for_one) {
        if (sqrt_price_limit >= pool.slot0.sqrt_price_x96 || sqrt_price_limit <= tick_math::MIN_SQRT_RATIO) {
            core_failure("price limit already exceeded or out of bounds");
        }
    } else {
        if (sqrt_price_limit <= pool.slot0.sqrt_price_x96 || sqrt_price_limit >= tick_math::MAX_SQRT_RATIO) {
            core_failure("price limit already exceeded or out of bounds");
        }
    }

    I128 amount_remaining = params.amount_specified;
    I128 amount_calculated = 0;
    I128 sqrt_price = pool.slot0.sqrt_price_x96;
    int32_t tick = pool.slot0.tick;
    I128 liquidity = pool.liquidity;

    uint32_t steps = 0;
    while (amount_remaining != 0 && sqrt_price != sqrt_price_limit) {
        if (++steps > max_swap_steps_) {
            core_failure("swap exceeded the step limit");
        }

        // Next initialized tick in the swap direction
        int32_t tick_next;
        bool initialized = false;
        auto it = pool.ticks.upper_bound(tick);
        if (zero_for_one) {
            if (it == pool.ticks.begin()) {
                tick_next = tick_math::MIN_TICK;
            } else {
                --it;
                tick_next = it->first;
                initialized = true;
            }
        } else {
            if (it == pool.ticks.end()) {
                tick_next = tick_math::MAX_TICK;
            } else {
                tick_next = it->first;
                initialized = true;
            }
        }

        I128 sqrt_price_next = tick_math::get_sqrt_ratio_at_tick(tick_next);
        I128 sqrt_price_target;
        if (zero_for_one) {
            sqrt_price_target = sqrt_price_next < sqrt_price_limit ? sqrt_price_limit : sqrt_price_next;
        } else {
            sqrt_price_target = sqrt_price_next > sqrt_price_limit ? sqrt_price_limit : sqrt_price_next;
        }

        I128 sqrt_price_start = sqrt_price;
        SwapStep step = compute_swap_step(sqrt_price, sqrt_price_target, liquidity,
                                          amount_remaining, fee_pips);
        sqrt_price = step.sqrt_price_next_x96;

        if (exact_in) {
            amount_remaining -= step.amount_in + step.fee_amount;
            amount_calculated -= step.amount_out;
        } else {
            amount_remaining += step.amount_out;
            amount_calculated += step.amount_in + step.fee_amount;
        }

        // Fees accrue to in-range liquidity in the input token
        if (liquidity > 0 && step.fee_amount > 0) {
            U128 growth = mul_div_u(static_cast<U128>(step.fee_amount), Q64, static_cast<U128>(liquidity));
            if (zero_for_one) {
                pool.fee_growth_global0_x64 += growth;
            } else {
                pool.fee_growth_global1_x64 += growth;
            }
        }

        if (sqrt_price == sqrt_price_next) {
            if (initialized) {
                TickInfo& info = pool.ticks[tick_next];
                info.fee_growth_outside0_x64 = pool.fee_growth_global0_x64 - info.fee_growth_outside0_x64;
                info.fee_growth_outside1_x64 = pool.fee_growth_global1_x64 - info.fee_growth_outside1_x64;
                I128 liquidity_net = zero_for_one ? -info.liquidity_net : info.liquidity_net;
                liquidity += liquidity_net;
                if (liquidity < 0) core_failure("liquidity underflow while crossing tick");
            }
            tick = zero_for_one ? tick_next - 1 : tick_next;
        } else if (sqrt_price != sqrt_price_start) {
            tick = tick_math::get_tick_at_sqrt_ratio(sqrt_price);
        }
    }

    pool.slot0.sqrt_price_x96 = sqrt_price;
    pool.slot0.tick = tick;
    pool.liquidity = liquidity;

    I128 specified_used = params.amount_specified - amount_remaining;
    CoreResult result;
    if (zero_for_one == exact_in) {
        result.delta = {specified_used, amount_calculated};
    } else {
        result.delta = {amount_calculated, specified_used};
    }
    return result;
}

// =============================================================================
// Donate
// =============================================================================

CoreResult ConcentratedLiquidityEngine::donate(PoolState& pool, const PoolKey& key,
                                               I128 amount0, I128 amount1) {
    (void)key;
    if (amount0 < 0 || amount1 < 0) {
        core_failure("donation amounts must be non-negative");
    }
    if (pool.liquidity <= 0) {
        core_failure("no in-range liquidity to receive the donation");
    }

    if (amount0 > 0) {
        pool.fee_growth_global0_x64 += mul_div_u(static_cast<U128>(amount0), Q64, static_cast<U128>(pool.liquidity));
    }
    if (amount1 > 0) {
        pool.fee_growth_global1_x64 += mul_div_u(static_cast<U128>(amount1), Q64, static_cast<U128>(pool.liquidity));
    }

    CoreResult result;
    result.delta = {amount0, amount1};
    return result;
}

// =============================================================================
// PoolStore
// =============================================================================

bool PoolStore::exists(const PoolId& id) const {
    std::shared_lock lock(mutex_);
    return pools_.find(id) != pools_.end();
}

std::optional<PoolState> PoolStore::snapshot(const PoolId& id) const {
    std::shared_lock lock(mutex_);
    auto it = pools_.find(id);
    if (it == pools_.end()) return std::nullopt;
    return it->second;
}

size_t PoolStore::size() const {
    std::shared_lock lock(mutex_);
    return pools_.size();
}

void PoolStore::insert(const PoolId& id, PoolState state) {
    std::unique_lock lock(mutex_);
    if (pools_.find(id) != pools_.end()) {
        core_failure("pool already initialized");
    }
    journal_.push_back(JournalEntry{id, std::nullopt});
    pools_.emplace(id, std::move(state));
}

size_t PoolStore::checkpoint() const {
    std::shared_lock lock(mutex_);
    return journal_.size();
}

void PoolStore::rollback(size_t checkpoint) {
    std::unique_lock lock(mutex_);
    while (journal_.size() > checkpoint) {
        JournalEntry& entry = journal_.back();
        if (entry.before) {
            pools_[entry.id] = std::move(*entry.before);
        } else {
            pools_.erase(entry.id);
        }
        journal_.pop_back();
    }
}

void PoolStore::commit() {
    std::unique_lock lock(mutex_);
    journal_.clear();
}

void PoolStore::throw_not_initialized(const PoolId& id) {
    throw ProtocolError(errors::POOL_NOT_INITIALIZED, "pool " + id.to_hex() + " is not initialized");
}

} // namespace hookgate
