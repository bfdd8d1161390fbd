// =============================================================================
// types.cpp - Address, PoolId and error helpers
// =============================================================================

#include "hookgate/types.hpp"

#include <algorithm>

namespace hookgate {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

template <size_t N>
std::string bytes_to_hex(const std::array<uint8_t, N>& bytes) {
    std::string out = "0x";
    out.reserve(2 + N * 2);
    for (uint8_t b : bytes) {
        out.push_back(HEX_DIGITS[b >> 4]);
        out.push_back(HEX_DIGITS[b & 0x0F]);
    }
    return out;
}

void put_u32_be(uint8_t* out, uint32_t v) {
    out[0] = static_cast<uint8_t>((v >> 24) & 0xFF);
    out[1] = static_cast<uint8_t>((v >> 16) & 0xFF);
    out[2] = static_cast<uint8_t>((v >> 8) & 0xFF);
    out[3] = static_cast<uint8_t>(v & 0xFF);
}

} // anonymous namespace

// =============================================================================
// Addresses
// =============================================================================

namespace addresses {

std::string to_hex(const Address& addr) {
    return bytes_to_hex(addr);
}

Address from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    Address addr{};
    if (hex.size() != addr.size() * 2) {
        throw std::invalid_argument("address must have 40 hex digits: " + std::string(hex));
    }
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid hex digit in address: " + std::string(hex));
        }
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

} // namespace addresses

std::string to_string(I128 value) {
    if (value == 0) return "0";
    bool neg = value < 0;
    // Work in unsigned space so the minimum value does not overflow on negation
    U128 mag = neg ? static_cast<U128>(0) - static_cast<U128>(value) : static_cast<U128>(value);
    std::string out;
    while (mag != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(mag % 10)));
        mag /= 10;
    }
    if (neg) out.push_back('-');
    std::reverse(out.begin(), out.end());
    return out;
}

// =============================================================================
// Pool Identity
// =============================================================================

PoolId PoolId::from_key(const PoolKey& key) {
    PoolId id;
    uint8_t* out = id.bytes.data();
    std::copy(key.currency0.addr.begin(), key.currency0.addr.end(), out);
    out += 20;
    std::copy(key.currency1.addr.begin(), key.currency1.addr.end(), out);
    out += 20;
    put_u32_be(out, key.fee);
    out += 4;
    put_u32_be(out, static_cast<uint32_t>(key.tick_spacing));
    out += 4;
    std::copy(key.hooks.begin(), key.hooks.end(), out);
    return id;
}

std::string PoolId::to_hex() const {
    return bytes_to_hex(bytes);
}

const char* operation_name(OperationKind kind) {
    switch (kind) {
    case OperationKind::INITIALIZE: return "initialize";
    case OperationKind::MODIFY_LIQUIDITY: return "modify_liquidity";
    case OperationKind::SWAP: return "swap";
    case OperationKind::DONATE: return "donate";
    }
    return "unknown";
}

// =============================================================================
// Error Codes
// =============================================================================

const char* error_name(int32_t code) {
    switch (code) {
    case errors::OK: return "OK";
    case errors::POOL_NOT_INITIALIZED: return "PoolNotInitialized";
    case errors::INVALID_TICK_SPACING: return "InvalidTickSpacing";
    case errors::CURRENCIES_NOT_SORTED: return "CurrenciesNotSorted";
    case errors::INVALID_FEE: return "InvalidFee";
    case errors::INVALID_AMOUNT: return "InvalidAmount";
    case errors::INSUFFICIENT_BALANCE: return "InsufficientBalance";
    case errors::ALREADY_LOCKED: return "AlreadyLocked";
    case errors::HOOK_CALL_FAILED: return "HookCallFailed";
    case errors::NOT_LOCKED: return "NotLocked";
    case errors::UNAUTHORIZED_ADJUSTMENT: return "UnauthorizedAdjustment";
    case errors::INVALID_PERMISSIONS: return "InvalidPermissions";
    case errors::ALREADY_BOUND: return "AlreadyBound";
    case errors::INVALID_EXTENSION: return "InvalidExtension";
    case errors::INVALID_HOOK_RESPONSE: return "InvalidHookResponse";
    case errors::HOOK_NOT_IMPLEMENTED: return "HookNotImplemented";
    case errors::UNBALANCED: return "Unbalanced";
    case errors::CORE_TRANSITION_FAILED: return "CoreTransitionFailed";
    }
    return "Unknown";
}

} // namespace hookgate
