// Shared fixtures for the hookgate tests

#ifndef HOOKGATE_TEST_SUPPORT_HPP
#define HOOKGATE_TEST_SUPPORT_HPP

#include <hookgate/manager.hpp>
#include <hookgate/permissions.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

namespace hookgate::testing {

// Catch2 cannot print __int128
inline long long ll(I128 value) { return static_cast<long long>(value); }

// Runs fn and returns the ProtocolError code it threw, or OK
template <typename Fn>
int32_t error_code_of(Fn&& fn) {
    try {
        fn();
    } catch (const ProtocolError& e) {
        return e.code();
    }
    return errors::OK;
}

// =============================================================================
// ScriptedEngine - core engine returning preset deltas
// =============================================================================

class ScriptedEngine : public ICoreEngine {
public:
    BalanceDelta swap_delta{100, -90};
    BalanceDelta modify_delta{1000, 1000};
    BalanceDelta modify_fees{};
    bool fail_swap = false;

    int swap_calls = 0;
    SwapParams last_swap{};
    uint32_t last_fee = 0;

    int32_t initialize(PoolState& pool, const PoolKey& key, I128 sqrt_price_x96) override {
        pool.slot0.sqrt_price_x96 = sqrt_price_x96;
        pool.slot0.tick = 0;
        pool.slot0.lp_fee = key.fee;
        return 0;
    }

    CoreResult modify_liquidity(PoolState& pool, const PoolKey&, const Address&,
                                const ModifyLiquidityParams& params) override {
        pool.liquidity += params.liquidity_delta;
        return CoreResult{modify_delta, modify_fees};
    }

    CoreResult swap(PoolState& pool, const PoolKey&, const SwapParams& params,
                    uint32_t fee_pips) override {
        if (fail_swap) {
            throw ProtocolError(errors::CORE_TRANSITION_FAILED, "scripted failure");
        }
        ++swap_calls;
        last_swap = params;
        last_fee = fee_pips;
        pool.slot0.tick -= 1;
        return CoreResult{swap_delta, BalanceDelta{}};
    }

    CoreResult donate(PoolState&, const PoolKey&, I128 amount0, I128 amount1) override {
        return CoreResult{BalanceDelta{amount0, amount1}, BalanceDelta{}};
    }
};

// =============================================================================
// ScriptedHooks - extension with configurable answers
// =============================================================================

class ScriptedHooks : public IHooks {
public:
    explicit ScriptedHooks(Permissions perms) : perms_(perms) {}

    Permissions declared_permissions() const override { return perms_; }

    std::optional<BalanceDelta> before_swap_delta;
    std::optional<uint32_t> fee_override;
    std::optional<BalanceDelta> after_swap_delta;
    std::optional<BalanceDelta> after_modify_delta;
    std::optional<HookSelector> answer_with;   // Forces a wrong selector
    bool throw_runtime = false;
    bool throw_foreign = false;                // Throws a non-std::exception value
    std::function<void(HookSelector)> on_call;

    std::vector<HookSelector> calls;

    HookSelector before_initialize(const CallbackContext&, I128) override {
        return hit(HookSelector::BEFORE_INITIALIZE);
    }

    HookSelector after_initialize(const CallbackContext&, I128, int32_t) override {
        return hit(HookSelector::AFTER_INITIALIZE);
    }

    HookSelector before_modify_liquidity(const CallbackContext&, const ModifyLiquidityParams&) override {
        return hit(HookSelector::BEFORE_MODIFY_LIQUIDITY);
    }

    AfterHookResult after_modify_liquidity(const CallbackContext&, const ModifyLiquidityParams&,
                                           const BalanceDelta&, const BalanceDelta&) override {
        return AfterHookResult{hit(HookSelector::AFTER_MODIFY_LIQUIDITY), after_modify_delta};
    }

    BeforeSwapResult before_swap(const CallbackContext&, const SwapParams&) override {
        return BeforeSwapResult{hit(HookSelector::BEFORE_SWAP), before_swap_delta, fee_override};
    }

    AfterHookResult after_swap(const CallbackContext&, const SwapParams&, const BalanceDelta&,
                               uint32_t) override {
        return AfterHookResult{hit(HookSelector::AFTER_SWAP), after_swap_delta};
    }

    HookSelector before_donate(const CallbackContext&, I128, I128) override {
        return hit(HookSelector::BEFORE_DONATE);
    }

    HookSelector after_donate(const CallbackContext&, I128, I128) override {
        return hit(HookSelector::AFTER_DONATE);
    }

private:
    HookSelector hit(HookSelector selector) {
        calls.push_back(selector);
        if (throw_runtime) {
            throw std::runtime_error("hook exploded");
        }
        if (throw_foreign) {
            throw 7;
        }
        if (on_call) on_call(selector);
        return answer_with.value_or(selector);
    }

    Permissions perms_;
};

// =============================================================================
// Harness - manager over the scripted engine with funded accounts
// =============================================================================

constexpr I128 Q96 = I128(1) << 96;

struct Harness {
    std::shared_ptr<ScriptedEngine> engine = std::make_shared<ScriptedEngine>();
    PoolManager manager{ManagerConfig{}.with_log_level("off"), engine};

    Address alice = addresses::from_u64(0xA11CE);
    Address bob = addresses::from_u64(0xB0B);
    Currency c0{addresses::from_u64(0x1000)};
    Currency c1{addresses::from_u64(0x2000)};
    Currency c2{addresses::from_u64(0x3000)};

    Harness() {
        fund(manager.config().manager_address, 1000000);
        fund(alice, 1000000);
        fund(bob, 1000000);
    }

    void fund(const Address& account, I128 amount) {
        manager.vault().deposit(account, c0, amount);
        manager.vault().deposit(account, c1, amount);
        manager.vault().deposit(account, c2, amount);
    }

    Address deploy(const std::shared_ptr<IHooks>& hooks, uint64_t handle) {
        Address id = permission_codec::make_extension_id(hooks->declared_permissions(), handle);
        manager.directory().deploy(id, hooks);
        return id;
    }

    PoolKey key_for(const Address& hooks) const {
        return PoolKey{c0, c1, fees::FEE_030, tick_spacings::TICK_SPACING_030, hooks};
    }

    PoolKey init_pool(const Address& hooks) {
        PoolKey key = key_for(hooks);
        manager.initialize(alice, key, Q96);
        return key;
    }

    I128 balance(const Address& account, const Currency& currency) const {
        return manager.vault().balance_of(account, currency);
    }
};

// Exact-input swap of 100 token0
inline SwapParams sell_token0(I128 amount = 100) {
    return SwapParams{true, amount, 0};
}

} // namespace hookgate::testing

#endif // HOOKGATE_TEST_SUPPORT_HPP
