// =============================================================================
// permissions.cpp - Capability encoding inside extension identifiers
// =============================================================================

#include "hookgate/permissions.hpp"

namespace hookgate {

namespace {

struct FlagName {
    uint16_t flag;
    const char* name;
};

constexpr FlagName FLAG_NAMES[] = {
    {permissions::BEFORE_INITIALIZE, "beforeInitialize"},
    {permissions::AFTER_INITIALIZE, "afterInitialize"},
    {permissions::BEFORE_MODIFY_LIQUIDITY, "beforeModifyLiquidity"},
    {permissions::AFTER_MODIFY_LIQUIDITY, "afterModifyLiquidity"},
    {permissions::BEFORE_SWAP, "beforeSwap"},
    {permissions::AFTER_SWAP, "afterSwap"},
    {permissions::BEFORE_DONATE, "beforeDonate"},
    {permissions::AFTER_DONATE, "afterDonate"},
    {permissions::OVERRIDE_FEE, "overrideFee"},
    {permissions::RETURNS_DELTA, "returnsDelta"},
};

} // anonymous namespace

std::string Permissions::to_string() const {
    std::string out;
    for (const auto& entry : FLAG_NAMES) {
        if (!has(entry.flag)) continue;
        if (!out.empty()) out += '|';
        out += entry.name;
    }
    return out.empty() ? "none" : out;
}

namespace permission_codec {

Permissions decode(const Address& identifier) {
    uint16_t field = static_cast<uint16_t>((static_cast<uint16_t>(identifier[0]) << 8) | identifier[1]);
    return Permissions(field);
}

uint16_t encode(Permissions perms) {
    return perms.bits();
}

void validate(const Address& identifier, Permissions declared) {
    Permissions actual = decode(identifier);
    if (actual != declared) {
        throw ProtocolError(errors::INVALID_PERMISSIONS,
            "identifier " + addresses::to_hex(identifier) + " encodes " + actual.to_string() +
            ", extension declares " + declared.to_string());
    }
}

bool is_valid_extension_id(const Address& identifier) {
    if (addresses::is_zero(identifier)) return true;

    Permissions perms = decode(identifier);
    if (!perms.any(permissions::CALLBACK_MASK)) return false;
    if (perms.has(permissions::OVERRIDE_FEE) && !perms.has(permissions::BEFORE_SWAP)) return false;
    if (perms.has(permissions::RETURNS_DELTA) && !perms.any(permissions::DELTA_CAPABLE)) return false;
    return true;
}

Address make_extension_id(Permissions perms, uint64_t handle) {
    Address id = addresses::from_u64(handle);
    uint16_t field = encode(perms);
    id[0] = static_cast<uint8_t>(field >> 8);
    // Byte 1 keeps its low six bits for the handle
    id[1] = static_cast<uint8_t>((id[1] & ~permissions::ADJUSTMENT_MASK) | (field & permissions::ADJUSTMENT_MASK));
    return id;
}

} // namespace permission_codec

} // namespace hookgate
