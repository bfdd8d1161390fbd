#ifndef HOOKGATE_TYPES_HPP
#define HOOKGATE_TYPES_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace hookgate {

// =============================================================================
// Addresses (EVM-style 20-byte identifiers, big-endian)
// =============================================================================

using Address = std::array<uint8_t, 20>;
using Bytes = std::vector<uint8_t>;

namespace addresses {

// Default custody account of the manager inside the vault
constexpr Address POOL_MANAGER = {0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0x90,0x10};

constexpr bool is_zero(const Address& addr) {
    for (size_t i = 0; i < addr.size(); ++i) {
        if (addr[i] != 0) return false;
    }
    return true;
}

// Address whose low 8 bytes hold `value` (test accounts, token ids)
constexpr Address from_u64(uint64_t value) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
    }
    return addr;
}

struct AddressHash {
    size_t operator()(const Address& addr) const noexcept {
        uint64_t h = 0;
        for (uint8_t b : addr) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

// "0x" prefixed lowercase hex
std::string to_hex(const Address& addr);

// Accepts 40 hex digits with or without "0x"; throws std::invalid_argument
Address from_hex(std::string_view hex);

} // namespace addresses

// =============================================================================
// Integer Types
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

std::string to_string(I128 value);

inline I128 abs128(I128 x) { return x < 0 ? -x : x; }

// =============================================================================
// Currency Type (Token Address)
// =============================================================================

struct Currency {
    Address addr;

    Currency() : addr{} {}
    explicit Currency(const Address& a) : addr(a) {}

    bool is_native() const { return addresses::is_zero(addr); }

    bool operator==(const Currency& other) const { return addr == other.addr; }
    bool operator!=(const Currency& other) const { return addr != other.addr; }
    bool operator<(const Currency& other) const { return addr < other.addr; }
};

inline const Currency NATIVE{};

// =============================================================================
// Pool Key and Pool Identity
// =============================================================================

struct PoolKey {
    Currency currency0;      // Sorted: currency0 < currency1
    Currency currency1;
    uint32_t fee;            // Fee in hundredths of a bip (100 = 0.01%)
    int32_t tick_spacing;
    Address hooks;           // Extension identifier (0 = no extension)

    bool operator==(const PoolKey& other) const {
        return currency0 == other.currency0 &&
               currency1 == other.currency1 &&
               fee == other.fee &&
               tick_spacing == other.tick_spacing &&
               hooks == other.hooks;
    }
    bool operator!=(const PoolKey& other) const { return !(*this == other); }
};

// Canonical encoding of every PoolKey field, so equal ids imply equal keys.
// Layout: currency0 | currency1 | fee (BE) | tick_spacing (BE) | hooks
struct PoolId {
    static constexpr size_t SIZE = 20 + 20 + 4 + 4 + 20;
    std::array<uint8_t, SIZE> bytes{};

    static PoolId from_key(const PoolKey& key);

    bool operator==(const PoolId& other) const { return bytes == other.bytes; }
    bool operator!=(const PoolId& other) const { return bytes != other.bytes; }
    bool operator<(const PoolId& other) const { return bytes < other.bytes; }

    std::string to_hex() const;
};

// Standard fee tiers (in hundredths of a bip)
namespace fees {
constexpr uint32_t FEE_001 = 100;     // 0.01%
constexpr uint32_t FEE_005 = 500;     // 0.05%
constexpr uint32_t FEE_030 = 3000;    // 0.30%
constexpr uint32_t FEE_100 = 10000;   // 1.00%
constexpr uint32_t FEE_MAX = 100000;  // 10.00%
constexpr uint32_t FEE_DENOMINATOR = 1000000;
}

namespace tick_spacings {
constexpr int32_t TICK_SPACING_001 = 1;
constexpr int32_t TICK_SPACING_005 = 10;
constexpr int32_t TICK_SPACING_030 = 60;
constexpr int32_t TICK_SPACING_100 = 200;
constexpr int32_t MIN_TICK_SPACING = 1;
constexpr int32_t MAX_TICK_SPACING = 32767;
}

// =============================================================================
// Balance Delta (Signed Token Amounts)
// =============================================================================

// Seen from the account: positive = owed to the manager, negative = owed to
// the account.
struct BalanceDelta {
    I128 amount0 = 0;
    I128 amount1 = 0;

    BalanceDelta operator+(const BalanceDelta& other) const {
        return {amount0 + other.amount0, amount1 + other.amount1};
    }

    BalanceDelta operator-(const BalanceDelta& other) const {
        return {amount0 - other.amount0, amount1 - other.amount1};
    }

    BalanceDelta operator-() const {
        return {-amount0, -amount1};
    }

    bool operator==(const BalanceDelta& other) const {
        return amount0 == other.amount0 && amount1 == other.amount1;
    }
    bool operator!=(const BalanceDelta& other) const { return !(*this == other); }

    bool is_zero() const { return amount0 == 0 && amount1 == 0; }
};

// =============================================================================
// Operation Parameters
// =============================================================================

struct SwapParams {
    bool zero_for_one;       // true = sell token0 for token1
    I128 amount_specified;   // positive = exact input, negative = exact output
    I128 sqrt_price_limit;   // Q64.96 price limit (0 = no limit)
};

struct ModifyLiquidityParams {
    int32_t tick_lower;
    int32_t tick_upper;
    I128 liquidity_delta;    // positive = add, negative = remove
    uint64_t salt;           // For multiple positions at same range
};

enum class OperationKind : uint8_t {
    INITIALIZE = 0,
    MODIFY_LIQUIDITY = 1,
    SWAP = 2,
    DONATE = 3
};

const char* operation_name(OperationKind kind);

// Identity of one unlock span; 0 = none
using SequenceId = uint64_t;

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t POOL_NOT_INITIALIZED = -1;
constexpr int32_t INVALID_TICK_SPACING = -4;
constexpr int32_t CURRENCIES_NOT_SORTED = -7;
constexpr int32_t INVALID_FEE = -8;
constexpr int32_t INVALID_AMOUNT = -9;
constexpr int32_t INSUFFICIENT_BALANCE = -10;
constexpr int32_t ALREADY_LOCKED = -30;
constexpr int32_t HOOK_CALL_FAILED = -31;
constexpr int32_t NOT_LOCKED = -32;
constexpr int32_t UNAUTHORIZED_ADJUSTMENT = -40;
constexpr int32_t INVALID_PERMISSIONS = -50;
constexpr int32_t ALREADY_BOUND = -51;
constexpr int32_t INVALID_EXTENSION = -52;
constexpr int32_t INVALID_HOOK_RESPONSE = -53;
constexpr int32_t HOOK_NOT_IMPLEMENTED = -54;
constexpr int32_t UNBALANCED = -60;
constexpr int32_t CORE_TRANSITION_FAILED = -61;
}

const char* error_name(int32_t code);

// Every protocol failure surfaces as one of these; code() is an errors:: value
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(int32_t code, const std::string& msg)
        : std::runtime_error(std::string(error_name(code)) + ": " + msg), code_(code) {}

    int32_t code() const noexcept { return code_; }

private:
    int32_t code_;
};

} // namespace hookgate

namespace std {

template <>
struct hash<hookgate::PoolId> {
    size_t operator()(const hookgate::PoolId& id) const noexcept {
        // FNV-1a over the canonical encoding
        uint64_t h = 1469598103934665603ULL;
        for (uint8_t b : id.bytes) {
            h ^= b;
            h *= 1099511628211ULL;
        }
        return static_cast<size_t>(h);
    }
};

} // namespace std

#endif // HOOKGATE_TYPES_HPP
