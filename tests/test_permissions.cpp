// hookgate - Permission codec tests

#include <catch2/catch.hpp>
#include <hookgate/permissions.hpp>

#include "test_support.hpp"

using namespace hookgate;
using hookgate::testing::error_code_of;

namespace {

constexpr uint16_t EVERY_CALLBACK =
    permissions::BEFORE_INITIALIZE | permissions::AFTER_INITIALIZE |
    permissions::BEFORE_MODIFY_LIQUIDITY | permissions::AFTER_MODIFY_LIQUIDITY |
    permissions::BEFORE_SWAP | permissions::AFTER_SWAP |
    permissions::BEFORE_DONATE | permissions::AFTER_DONATE;

} // namespace

TEST_CASE("Permission flags occupy the top ten identifier bits", "[permissions]") {
    REQUIRE(permissions::CALLBACK_MASK == EVERY_CALLBACK);
    REQUIRE(permissions::ALL == 0xFFC0);
    REQUIRE((permissions::ADJUSTMENT_MASK & permissions::CALLBACK_MASK) == 0);

    // Bits outside the field never survive construction
    Permissions p(0xFFFF);
    REQUIRE(p.bits() == permissions::ALL);
}

TEST_CASE("decode reads byte 0 and the high bits of byte 1", "[permissions]") {
    Address id{};
    id[0] = 0x08;   // BEFORE_SWAP
    id[1] = 0xBF;   // OVERRIDE_FEE plus handle bits
    id[19] = 0x42;

    Permissions p = permission_codec::decode(id);
    REQUIRE(p.has(permissions::BEFORE_SWAP));
    REQUIRE(p.has(permissions::OVERRIDE_FEE));
    REQUIRE_FALSE(p.has(permissions::RETURNS_DELTA));
    REQUIRE(p.bits() == (permissions::BEFORE_SWAP | permissions::OVERRIDE_FEE));
}

TEST_CASE("Callback byte round-trips for all 256 values", "[permissions]") {
    for (int byte = 0; byte < 256; ++byte) {
        Permissions p = Permissions::from_callback_byte(static_cast<uint8_t>(byte));
        Address id{};
        id[0] = static_cast<uint8_t>(byte);
        REQUIRE(permission_codec::decode(id) == p);
        REQUIRE((permission_codec::encode(p) >> 8) == byte);
        REQUIRE(p.callback_byte() == byte);
    }
}

TEST_CASE("validate requires an exact match", "[permissions]") {
    Permissions declared(permissions::BEFORE_SWAP | permissions::AFTER_SWAP | permissions::RETURNS_DELTA);
    Address id = permission_codec::make_extension_id(declared, 7);

    SECTION("Same set passes") {
        REQUIRE_NOTHROW(permission_codec::validate(id, declared));
    }

    SECTION("Any single flipped bit fails") {
        for (int bit = 6; bit < 16; ++bit) {
            Permissions other(static_cast<uint16_t>(declared.bits() ^ (1u << bit)));
            REQUIRE(error_code_of([&] { permission_codec::validate(id, other); }) ==
                    errors::INVALID_PERMISSIONS);
        }
    }
}

TEST_CASE("Scenario A: every callback bit set", "[permissions]") {
    Address id{};
    id[0] = 0xFF;

    REQUIRE_NOTHROW(permission_codec::validate(id, Permissions(EVERY_CALLBACK)));
    REQUIRE(error_code_of([&] { permission_codec::validate(id, Permissions()); }) ==
            errors::INVALID_PERMISSIONS);
}

TEST_CASE("make_extension_id keeps the handle out of the permission field", "[permissions]") {
    Permissions perms(permissions::AFTER_DONATE | permissions::RETURNS_DELTA);
    Address a = permission_codec::make_extension_id(perms, 1);
    Address b = permission_codec::make_extension_id(perms, 2);

    REQUIRE(a != b);
    REQUIRE(permission_codec::decode(a) == perms);
    REQUIRE(permission_codec::decode(b) == perms);
}

TEST_CASE("Structural identifier checks", "[permissions]") {
    using permission_codec::is_valid_extension_id;
    using permission_codec::make_extension_id;

    SECTION("Zero identifier means no extension") {
        REQUIRE(is_valid_extension_id(Address{}));
    }

    SECTION("At least one callback bit") {
        REQUIRE_FALSE(is_valid_extension_id(make_extension_id(Permissions(), 1)));
        REQUIRE(is_valid_extension_id(make_extension_id(Permissions(permissions::AFTER_DONATE), 1)));
    }

    SECTION("Fee override needs beforeSwap") {
        Permissions bad(permissions::AFTER_SWAP | permissions::OVERRIDE_FEE);
        Permissions good(permissions::BEFORE_SWAP | permissions::OVERRIDE_FEE);
        REQUIRE_FALSE(is_valid_extension_id(make_extension_id(bad, 1)));
        REQUIRE(is_valid_extension_id(make_extension_id(good, 1)));
    }

    SECTION("Delta return needs a delta capable callback") {
        Permissions bad(permissions::BEFORE_DONATE | permissions::RETURNS_DELTA);
        Permissions good(permissions::AFTER_MODIFY_LIQUIDITY | permissions::RETURNS_DELTA);
        REQUIRE_FALSE(is_valid_extension_id(make_extension_id(bad, 1)));
        REQUIRE(is_valid_extension_id(make_extension_id(good, 1)));
    }
}

TEST_CASE("Permission names", "[permissions]") {
    REQUIRE(Permissions().to_string() == "none");
    REQUIRE(Permissions(permissions::BEFORE_SWAP | permissions::OVERRIDE_FEE).to_string() ==
            "beforeSwap|overrideFee");
}
