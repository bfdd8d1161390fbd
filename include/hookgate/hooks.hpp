#ifndef HOOKGATE_HOOKS_HPP
#define HOOKGATE_HOOKS_HPP

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>

#include "permissions.hpp"
#include "pool.hpp"
#include "types.hpp"

namespace hookgate {

// =============================================================================
// Callback Selectors
//
// Every callback acknowledges with the selector of the callback point it
// implements. Anything else is rejected as InvalidHookResponse.
// =============================================================================

enum class HookSelector : uint8_t {
    BEFORE_INITIALIZE = 0,
    AFTER_INITIALIZE = 1,
    BEFORE_MODIFY_LIQUIDITY = 2,
    AFTER_MODIFY_LIQUIDITY = 3,
    BEFORE_SWAP = 4,
    AFTER_SWAP = 5,
    BEFORE_DONATE = 6,
    AFTER_DONATE = 7
};

const char* selector_name(HookSelector selector);

// Permission bit that enables a callback point
uint16_t permission_for(HookSelector selector);

// =============================================================================
// Callback Inputs and Results
// =============================================================================

struct CallbackContext {
    Address caller;      // Account that invoked the operation
    PoolKey key;
    PoolId pool_id;
    Slot0 pre_state;     // Pool state before the core transition
    const Bytes& hook_data;
};

struct BeforeSwapResult {
    HookSelector selector = HookSelector::BEFORE_SWAP;
    std::optional<BalanceDelta> delta;          // Requires RETURNS_DELTA
    std::optional<uint32_t> fee_override;       // Requires OVERRIDE_FEE
};

struct AfterHookResult {
    HookSelector selector;
    std::optional<BalanceDelta> delta;          // Requires RETURNS_DELTA
};

// =============================================================================
// IHooks - extension callback surface
//
// Implementations override the callbacks their identifier enables. The
// defaults throw ProtocolError(HOOK_NOT_IMPLEMENTED).
// =============================================================================

class IHooks {
public:
    virtual ~IHooks() = default;

    // Must equal the permission bits of the identifier the object is deployed at
    virtual Permissions declared_permissions() const = 0;

    virtual HookSelector before_initialize(const CallbackContext& ctx, I128 sqrt_price_x96);
    virtual HookSelector after_initialize(const CallbackContext& ctx, I128 sqrt_price_x96, int32_t tick);

    virtual HookSelector before_modify_liquidity(const CallbackContext& ctx,
                                                 const ModifyLiquidityParams& params);
    virtual AfterHookResult after_modify_liquidity(const CallbackContext& ctx,
                                                   const ModifyLiquidityParams& params,
                                                   const BalanceDelta& delta,
                                                   const BalanceDelta& fees_accrued);

    virtual BeforeSwapResult before_swap(const CallbackContext& ctx, const SwapParams& params);
    virtual AfterHookResult after_swap(const CallbackContext& ctx, const SwapParams& params,
                                       const BalanceDelta& delta, uint32_t fee_applied);

    virtual HookSelector before_donate(const CallbackContext& ctx, I128 amount0, I128 amount1);
    virtual HookSelector after_donate(const CallbackContext& ctx, I128 amount0, I128 amount1);
};

// =============================================================================
// HookDirectory - identifier -> deployed extension object
//
// Deployment is write-once; there is no upgrade path for an identifier.
// =============================================================================

class HookDirectory {
public:
    HookDirectory() = default;

    HookDirectory(const HookDirectory&) = delete;
    HookDirectory& operator=(const HookDirectory&) = delete;

    // Throws ProtocolError(INVALID_EXTENSION) for the zero identifier, a null
    // object or an identifier that is already deployed
    void deploy(const Address& identifier, std::shared_ptr<IHooks> hooks);

    // nullptr when nothing is deployed at `identifier`
    IHooks* find(const Address& identifier) const;

    bool contains(const Address& identifier) const;
    size_t size() const;

private:
    std::map<Address, std::shared_ptr<IHooks>> hooks_;
    mutable std::shared_mutex mutex_;
};

} // namespace hookgate

#endif // HOOKGATE_HOOKS_HPP
