#ifndef HOOKGATE_PERMISSIONS_HPP
#define HOOKGATE_PERMISSIONS_HPP

#include <cstdint>
#include <string>

#include "types.hpp"

namespace hookgate {

// =============================================================================
// Permission Flags
//
// The permission field is the top 10 bits of an extension identifier:
// identifier byte 0 holds one bit per callback point, the two high bits of
// byte 1 hold the adjustment capabilities. Everything below is the opaque
// handle of the extension.
// =============================================================================

namespace permissions {
constexpr uint16_t BEFORE_INITIALIZE       = 1u << 15;
constexpr uint16_t AFTER_INITIALIZE        = 1u << 14;
constexpr uint16_t BEFORE_MODIFY_LIQUIDITY = 1u << 13;
constexpr uint16_t AFTER_MODIFY_LIQUIDITY  = 1u << 12;
constexpr uint16_t BEFORE_SWAP             = 1u << 11;
constexpr uint16_t AFTER_SWAP              = 1u << 10;
constexpr uint16_t BEFORE_DONATE           = 1u << 9;
constexpr uint16_t AFTER_DONATE            = 1u << 8;
constexpr uint16_t OVERRIDE_FEE            = 1u << 7;
constexpr uint16_t RETURNS_DELTA           = 1u << 6;

constexpr uint16_t CALLBACK_MASK   = 0xFF00;
constexpr uint16_t ADJUSTMENT_MASK = OVERRIDE_FEE | RETURNS_DELTA;
constexpr uint16_t ALL             = CALLBACK_MASK | ADJUSTMENT_MASK;

// Callbacks whose results may carry a balance delta
constexpr uint16_t DELTA_CAPABLE = BEFORE_SWAP | AFTER_SWAP | AFTER_MODIFY_LIQUIDITY;
}

// Immutable capability set. Only ever derived from an identifier or built by
// the extension author to declare what it expects.
class Permissions {
public:
    constexpr Permissions() = default;
    constexpr explicit Permissions(uint16_t bits) : bits_(bits & permissions::ALL) {}

    constexpr uint16_t bits() const { return bits_; }
    constexpr bool has(uint16_t flag) const { return (bits_ & flag) == flag; }
    constexpr bool any(uint16_t mask) const { return (bits_ & mask) != 0; }

    // Identifier byte 0
    constexpr uint8_t callback_byte() const { return static_cast<uint8_t>(bits_ >> 8); }

    static constexpr Permissions from_callback_byte(uint8_t byte) {
        return Permissions(static_cast<uint16_t>(byte) << 8);
    }

    constexpr Permissions with(uint16_t flag) const { return Permissions(bits_ | flag); }

    constexpr bool operator==(const Permissions& other) const { return bits_ == other.bits_; }
    constexpr bool operator!=(const Permissions& other) const { return bits_ != other.bits_; }

    // e.g. "beforeSwap|afterSwap|overrideFee"
    std::string to_string() const;

private:
    uint16_t bits_ = 0;
};

// =============================================================================
// Permission Codec
// =============================================================================

namespace permission_codec {

// Pure extraction; total
Permissions decode(const Address& identifier);

uint16_t encode(Permissions perms);

// Throws ProtocolError(INVALID_PERMISSIONS) unless the identifier's bits equal
// `declared` exactly
void validate(const Address& identifier, Permissions declared);

// Structural shape check used when binding:
// - zero identifier: valid (pool without extension)
// - otherwise at least one callback bit
// - OVERRIDE_FEE requires BEFORE_SWAP
// - RETURNS_DELTA requires a delta-capable callback
bool is_valid_extension_id(const Address& identifier);

// Builds an identifier carrying `perms` with `handle` in the low 8 bytes.
// Identifier mining happens elsewhere; this is the minimal constructor.
Address make_extension_id(Permissions perms, uint64_t handle);

} // namespace permission_codec

} // namespace hookgate

#endif // HOOKGATE_PERMISSIONS_HPP
