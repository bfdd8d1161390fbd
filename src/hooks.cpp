// =============================================================================
// hooks.cpp - Extension callback defaults and the deployment directory
// =============================================================================

#include "hookgate/hooks.hpp"

#include <mutex>

namespace hookgate {

const char* selector_name(HookSelector selector) {
    switch (selector) {
    case HookSelector::BEFORE_INITIALIZE: return "beforeInitialize";
    case HookSelector::AFTER_INITIALIZE: return "afterInitialize";
    case HookSelector::BEFORE_MODIFY_LIQUIDITY: return "beforeModifyLiquidity";
    case HookSelector::AFTER_MODIFY_LIQUIDITY: return "afterModifyLiquidity";
    case HookSelector::BEFORE_SWAP: return "beforeSwap";
    case HookSelector::AFTER_SWAP: return "afterSwap";
    case HookSelector::BEFORE_DONATE: return "beforeDonate";
    case HookSelector::AFTER_DONATE: return "afterDonate";
    }
    return "unknown";
}

uint16_t permission_for(HookSelector selector) {
    switch (selector) {
    case HookSelector::BEFORE_INITIALIZE: return permissions::BEFORE_INITIALIZE;
    case HookSelector::AFTER_INITIALIZE: return permissions::AFTER_INITIALIZE;
    case HookSelector::BEFORE_MODIFY_LIQUIDITY: return permissions::BEFORE_MODIFY_LIQUIDITY;
    case HookSelector::AFTER_MODIFY_LIQUIDITY: return permissions::AFTER_MODIFY_LIQUIDITY;
    case HookSelector::BEFORE_SWAP: return permissions::BEFORE_SWAP;
    case HookSelector::AFTER_SWAP: return permissions::AFTER_SWAP;
    case HookSelector::BEFORE_DONATE: return permissions::BEFORE_DONATE;
    case HookSelector::AFTER_DONATE: return permissions::AFTER_DONATE;
    }
    return 0;
}

// =============================================================================
// IHooks defaults
// =============================================================================

namespace {

[[noreturn]] void not_implemented(HookSelector selector) {
    throw ProtocolError(errors::HOOK_NOT_IMPLEMENTED,
                        std::string(selector_name(selector)) + " is not implemented");
}

} // anonymous namespace

HookSelector IHooks::before_initialize(const CallbackContext&, I128) {
    not_implemented(HookSelector::BEFORE_INITIALIZE);
}

HookSelector IHooks::after_initialize(const CallbackContext&, I128, int32_t) {
    not_implemented(HookSelector::AFTER_INITIALIZE);
}

HookSelector IHooks::before_modify_liquidity(const CallbackContext&, const ModifyLiquidityParams&) {
    not_implemented(HookSelector::BEFORE_MODIFY_LIQUIDITY);
}

AfterHookResult IHooks::after_modify_liquidity(const CallbackContext&, const ModifyLiquidityParams&,
                                               const BalanceDelta&, const BalanceDelta&) {
    not_implemented(HookSelector::AFTER_MODIFY_LIQUIDITY);
}

BeforeSwapResult IHooks::before_swap(const CallbackContext&, const SwapParams&) {
    not_implemented(HookSelector::BEFORE_SWAP);
}

AfterHookResult IHooks::after_swap(const CallbackContext&, const SwapParams&,
                                   const BalanceDelta&, uint32_t) {
    not_implemented(HookSelector::AFTER_SWAP);
}

HookSelector IHooks::before_donate(const CallbackContext&, I128, I128) {
    not_implemented(HookSelector::BEFORE_DONATE);
}

HookSelector IHooks::after_donate(const CallbackContext&, I128, I128) {
    not_implemented(HookSelector::AFTER_DONATE);
}

// =============================================================================
// HookDirectory
// =============================================================================

void HookDirectory::deploy(const Address& identifier, std::shared_ptr<IHooks> hooks) {
    if (addresses::is_zero(identifier)) {
        throw ProtocolError(errors::INVALID_EXTENSION, "cannot deploy at the zero identifier");
    }
    if (!hooks) {
        throw ProtocolError(errors::INVALID_EXTENSION, "null extension object");
    }

    std::unique_lock lock(mutex_);
    auto [it, inserted] = hooks_.emplace(identifier, std::move(hooks));
    if (!inserted) {
        throw ProtocolError(errors::INVALID_EXTENSION,
                            "identifier " + addresses::to_hex(identifier) + " already deployed");
    }
}

IHooks* HookDirectory::find(const Address& identifier) const {
    std::shared_lock lock(mutex_);
    auto it = hooks_.find(identifier);
    return it != hooks_.end() ? it->second.get() : nullptr;
}

bool HookDirectory::contains(const Address& identifier) const {
    std::shared_lock lock(mutex_);
    return hooks_.find(identifier) != hooks_.end();
}

size_t HookDirectory::size() const {
    std::shared_lock lock(mutex_);
    return hooks_.size();
}

} // namespace hookgate
