// hookgate - Concentrated liquidity engine tests

#include <catch2/catch.hpp>
#include <hookgate/pool.hpp>

#include "test_support.hpp"

using namespace hookgate;
using hookgate::testing::Q96;
using hookgate::testing::error_code_of;
using hookgate::testing::ll;

namespace {

constexpr I128 E18 = 1000000000000000000LL;

PoolKey test_key() {
    return PoolKey{Currency(addresses::from_u64(0x1000)), Currency(addresses::from_u64(0x2000)),
                   fees::FEE_030, 60, Address{}};
}

const Address LP = addresses::from_u64(0x11);

ModifyLiquidityParams range(int32_t lower, int32_t upper, I128 liquidity) {
    return ModifyLiquidityParams{lower, upper, liquidity, 0};
}

} // namespace

TEST_CASE("Tick math round-trips on tick boundaries", "[engine]") {
    for (int32_t tick : {-100000, -1000, -61, -1, 0, 1, 60, 12345, 250000}) {
        I128 ratio = tick_math::get_sqrt_ratio_at_tick(tick);
        REQUIRE(tick_math::get_tick_at_sqrt_ratio(ratio) == tick);
        REQUIRE(tick_math::get_tick_at_sqrt_ratio(ratio + 1) == tick);
    }
    REQUIRE(tick_math::get_sqrt_ratio_at_tick(0) == Q96);
    REQUIRE(tick_math::get_sqrt_ratio_at_tick(tick_math::MAX_TICK + 1) == 0);
}

TEST_CASE("Engine initialize", "[engine]") {
    ConcentratedLiquidityEngine engine;
    PoolState pool;

    REQUIRE(engine.initialize(pool, test_key(), Q96) == 0);
    REQUIRE(pool.slot0.sqrt_price_x96 == Q96);
    REQUIRE(pool.slot0.lp_fee == fees::FEE_030);

    REQUIRE(error_code_of([&] { engine.initialize(pool, test_key(), Q96); }) ==
            errors::CORE_TRANSITION_FAILED);

    PoolState other;
    REQUIRE(error_code_of([&] { engine.initialize(other, test_key(), tick_math::MAX_SQRT_RATIO); }) ==
            errors::CORE_TRANSITION_FAILED);
    REQUIRE(error_code_of([&] { engine.initialize(other, test_key(), 0); }) ==
            errors::CORE_TRANSITION_FAILED);
}

TEST_CASE("Engine modify liquidity", "[engine]") {
    ConcentratedLiquidityEngine engine;
    PoolState pool;
    engine.initialize(pool, test_key(), Q96);

    SECTION("In range position pays both tokens") {
        auto r = engine.modify_liquidity(pool, test_key(), LP, range(-60, 60, E18));
        REQUIRE(r.delta.amount0 > 0);
        REQUIRE(r.delta.amount1 > 0);
        // Symmetric range around price 1
        I128 diff = abs128(r.delta.amount0 - r.delta.amount1);
        REQUIRE(diff < r.delta.amount0 / 100);

        REQUIRE(pool.liquidity == E18);
        REQUIRE(pool.ticks.at(-60).liquidity_net == E18);
        REQUIRE(pool.ticks.at(60).liquidity_net == -E18);
        REQUIRE(pool.positions.size() == 1);
    }

    SECTION("Range above the price pays token0 only") {
        auto r = engine.modify_liquidity(pool, test_key(), LP, range(60, 120, E18));
        REQUIRE(r.delta.amount0 > 0);
        REQUIRE(r.delta.amount1 == 0);
        REQUIRE(pool.liquidity == 0);
    }

    SECTION("Removing returns tokens and clears ticks") {
        auto add = engine.modify_liquidity(pool, test_key(), LP, range(-60, 60, E18));
        auto remove = engine.modify_liquidity(pool, test_key(), LP, range(-60, 60, -E18));
        REQUIRE(remove.delta.amount0 < 0);
        REQUIRE(remove.delta.amount1 < 0);
        // Rounding always favours the pool
        REQUIRE(-remove.delta.amount0 <= add.delta.amount0);
        REQUIRE(pool.positions.empty());
        REQUIRE(pool.ticks.empty());
        REQUIRE(pool.liquidity == 0);
    }

    SECTION("Invalid ranges") {
        REQUIRE(error_code_of([&] { engine.modify_liquidity(pool, test_key(), LP, range(60, -60, E18)); }) ==
                errors::CORE_TRANSITION_FAILED);
        REQUIRE(error_code_of([&] { engine.modify_liquidity(pool, test_key(), LP, range(-50, 60, E18)); }) ==
                errors::CORE_TRANSITION_FAILED);
        REQUIRE(error_code_of([&] {
                    engine.modify_liquidity(pool, test_key(), LP,
                                            range(tick_math::MIN_TICK - 60, 60, E18));
                }) == errors::CORE_TRANSITION_FAILED);
    }

    SECTION("Cannot remove more than the position holds") {
        engine.modify_liquidity(pool, test_key(), LP, range(-60, 60, E18));
        REQUIRE(error_code_of([&] {
                    engine.modify_liquidity(pool, test_key(), LP, range(-60, 60, -E18 - 1));
                }) == errors::CORE_TRANSITION_FAILED);
    }
}

TEST_CASE("Swap step math", "[engine]") {
    I128 target = tick_math::get_sqrt_ratio_at_tick(-60);

    SECTION("Exact input inside the range") {
        auto step = ConcentratedLiquidityEngine::compute_swap_step(Q96, target, E18, 1000000000000LL,
                                                                   fees::FEE_030);
        REQUIRE(step.sqrt_price_next_x96 < Q96);
        REQUIRE(step.sqrt_price_next_x96 > target);
        REQUIRE(ll(step.amount_in + step.fee_amount) == 1000000000000LL);
        REQUIRE(step.amount_out > 0);
        REQUIRE(step.amount_out < step.amount_in);
    }

    SECTION("Exact input that reaches the target") {
        auto step = ConcentratedLiquidityEngine::compute_swap_step(Q96, target, 1000000, E18,
                                                                   fees::FEE_030);
        REQUIRE(step.sqrt_price_next_x96 == target);
        REQUIRE(step.amount_in + step.fee_amount <= E18);
    }

    SECTION("Exact output never overshoots") {
        auto step = ConcentratedLiquidityEngine::compute_swap_step(Q96, target, E18, -1000000,
                                                                   fees::FEE_030);
        REQUIRE(ll(step.amount_out) == 1000000);
        REQUIRE(step.amount_in > step.amount_out);
    }
}

TEST_CASE("Engine swap", "[engine]") {
    ConcentratedLiquidityEngine engine;
    PoolState pool;
    engine.initialize(pool, test_key(), Q96);
    engine.modify_liquidity(pool, test_key(), LP, range(-600, 600, E18));

    const I128 amount = 1000000000000000LL;  // 1e15

    SECTION("Exact input zero for one") {
        auto r = engine.swap(pool, test_key(), SwapParams{true, amount, 0}, fees::FEE_030);
        REQUIRE(r.delta.amount0 == amount);
        REQUIRE(r.delta.amount1 < 0);
        REQUIRE(-r.delta.amount1 < amount);
        REQUIRE(-r.delta.amount1 > amount / 100 * 99);

        REQUIRE(pool.slot0.sqrt_price_x96 < Q96);
        REQUIRE(pool.slot0.tick < 0);
        REQUIRE(pool.slot0.tick >= -600);
        REQUIRE(pool.fee_growth_global0_x64 > 0);
        REQUIRE(pool.fee_growth_global1_x64 == 0);
    }

    SECTION("Exact output one for zero") {
        auto r = engine.swap(pool, test_key(), SwapParams{false, -amount, 0}, fees::FEE_030);
        REQUIRE(r.delta.amount0 == -amount);
        REQUIRE(r.delta.amount1 > amount);
        REQUIRE(pool.slot0.sqrt_price_x96 > Q96);
        REQUIRE(pool.fee_growth_global1_x64 > 0);
    }

    SECTION("Rejected inputs") {
        REQUIRE(error_code_of([&] { engine.swap(pool, test_key(), SwapParams{true, 0, 0}, 3000); }) ==
                errors::CORE_TRANSITION_FAILED);
        // Limit on the wrong side of the current price
        I128 above = tick_math::get_sqrt_ratio_at_tick(60);
        REQUIRE(error_code_of([&] { engine.swap(pool, test_key(), SwapParams{true, amount, above}, 3000); }) ==
                errors::CORE_TRANSITION_FAILED);
        REQUIRE(error_code_of([&] {
                    engine.swap(pool, test_key(), SwapParams{true, amount, 0}, fees::FEE_DENOMINATOR);
                }) == errors::CORE_TRANSITION_FAILED);
    }
}

TEST_CASE("Engine swap crosses initialized ticks", "[engine]") {
    PoolState pool;
    ConcentratedLiquidityEngine setup;
    setup.initialize(pool, test_key(), Q96);
    setup.modify_liquidity(pool, test_key(), LP, range(-60, 60, E18));

    I128 limit = tick_math::get_sqrt_ratio_at_tick(-120);
    const I128 huge = E18 * 100;

    SECTION("Liquidity leaves the range at the lower tick") {
        ConcentratedLiquidityEngine engine;
        auto r = engine.swap(pool, test_key(), SwapParams{true, huge, limit}, fees::FEE_030);
        REQUIRE(r.delta.amount0 > 0);
        REQUIRE(r.delta.amount0 < huge);
        REQUIRE(r.delta.amount1 < 0);
        REQUIRE(pool.liquidity == 0);
        REQUIRE(pool.slot0.sqrt_price_x96 == limit);
        REQUIRE(pool.slot0.tick == -120);
    }

    SECTION("Step limit") {
        ConcentratedLiquidityEngine engine(1);
        REQUIRE(error_code_of([&] {
                    engine.swap(pool, test_key(), SwapParams{true, huge, limit}, fees::FEE_030);
                }) == errors::CORE_TRANSITION_FAILED);
    }
}

TEST_CASE("Engine donate credits in-range positions", "[engine]") {
    ConcentratedLiquidityEngine engine;
    PoolState pool;
    engine.initialize(pool, test_key(), Q96);

    REQUIRE(error_code_of([&] { engine.donate(pool, test_key(), 100, 0); }) ==
            errors::CORE_TRANSITION_FAILED);

    engine.modify_liquidity(pool, test_key(), LP, range(-60, 60, E18));
    auto r = engine.donate(pool, test_key(), 1000000, 0);
    REQUIRE(ll(r.delta.amount0) == 1000000);
    REQUIRE(r.delta.amount1 == 0);

    REQUIRE(error_code_of([&] { engine.donate(pool, test_key(), -1, 0); }) ==
            errors::CORE_TRANSITION_FAILED);

    // Poke the position to collect
    auto poke = engine.modify_liquidity(pool, test_key(), LP, range(-60, 60, 0));
    REQUIRE(poke.fees_accrued.amount0 >= 999999);
    REQUIRE(poke.fees_accrued.amount0 <= 1000000);
    REQUIRE(poke.fees_accrued.amount1 == 0);
    REQUIRE(poke.delta.amount0 == -poke.fees_accrued.amount0);
}
