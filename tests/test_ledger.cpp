// hookgate - Delta ledger tests

#include <catch2/catch.hpp>
#include <hookgate/ledger.hpp>

#include <exception>

#include "test_support.hpp"

using namespace hookgate;
using hookgate::testing::error_code_of;
using hookgate::testing::ll;

TEST_CASE("Ledger accumulates per account and currency", "[ledger]") {
    DeltaLedger ledger;
    Address locker = addresses::from_u64(1);
    Currency c0(addresses::from_u64(0x1000));
    Currency c1(addresses::from_u64(0x2000));

    ledger.begin(7, locker);
    ledger.accumulate(7, EntryKind::Core, locker, c0, 100);
    ledger.accumulate(7, EntryKind::Core, locker, c0, 50);
    ledger.accumulate(7, EntryKind::Core, locker, c1, -90);

    REQUIRE(ll(ledger.delta(locker, c0)) == 150);
    REQUIRE(ll(ledger.delta(locker, c1)) == -90);
    REQUIRE(ledger.nonzero_count() == 2);

    SECTION("Wrong sequence") {
        REQUIRE(error_code_of([&] { ledger.accumulate(8, EntryKind::Core, locker, c0, 1); }) ==
                errors::NOT_LOCKED);
    }

    SECTION("Rollback to checkpoint") {
        auto cp = ledger.checkpoint();
        ledger.accumulate(7, EntryKind::Core, locker, c0, -150);
        ledger.record_transfer(7, Transfer{locker, c0, 5});
        REQUIRE(ll(ledger.delta(locker, c0)) == 0);
        ledger.rollback(cp);
        REQUIRE(ll(ledger.delta(locker, c0)) == 150);
        REQUIRE(ledger.nonzero_count() == 2);
    }

    SECTION("Settle reports the locker's net and zeroes the ledger") {
        Settlement s = ledger.settle(7);
        REQUIRE(ll(s.owed.at(c0)) == 150);
        REQUIRE(ll(s.owed.at(c1)) == -90);
        REQUIRE(s.transfers.size() == 2);
        REQUIRE_FALSE(ledger.active());
        REQUIRE(ledger.nonzero_count() == 0);
    }
}

TEST_CASE("Ledger settlement balance checks", "[ledger]") {
    DeltaLedger ledger;
    Address locker = addresses::from_u64(1);
    Address hook = addresses::from_u64(0xE);
    Currency c1(addresses::from_u64(0x2000));

    ledger.begin(1, locker);
    ledger.accumulate(1, EntryKind::Core, locker, c1, -90);
    ledger.accumulate(1, EntryKind::HookAdjustment, locker, c1, 9);
    ledger.accumulate(1, EntryKind::HookAdjustment, hook, c1, -9);

    SECTION("Extension left with a balance") {
        REQUIRE(error_code_of([&] { ledger.settle(1); }) == errors::UNBALANCED);
    }

    SECTION("Extension clears its credit") {
        ledger.accumulate(1, EntryKind::Payment, hook, c1, 9);
        ledger.record_transfer(1, Transfer{hook, c1, -9});

        Settlement s = ledger.settle(1);
        REQUIRE(ll(s.owed.at(c1)) == -81);

        I128 moved = 0;
        for (const auto& t : s.transfers) moved += t.amount;
        REQUIRE(ll(moved) == -90);
    }
}

TEST_CASE("Ledger rejects one-sided adjustments", "[ledger]") {
    DeltaLedger ledger;
    Address locker = addresses::from_u64(1);
    Currency c0(addresses::from_u64(0x1000));

    ledger.begin(1, locker);
    ledger.accumulate(1, EntryKind::HookAdjustment, locker, c0, 5);
    REQUIRE(error_code_of([&] { ledger.settle(1); }) == errors::UNBALANCED);
}

TEST_CASE("Ledger lifecycle", "[ledger]") {
    DeltaLedger ledger;
    Address locker = addresses::from_u64(1);

    REQUIRE_FALSE(ledger.active());
    ledger.begin(3, locker);
    REQUIRE(error_code_of([&] { ledger.begin(4, locker); }) == errors::ALREADY_LOCKED);

    ledger.discard();
    REQUIRE_FALSE(ledger.active());
    REQUIRE(error_code_of([&] { ledger.settle(3); }) == errors::NOT_LOCKED);
}

TEST_CASE("Failed sequence refuses to settle", "[ledger]") {
    DeltaLedger ledger;
    Address locker = addresses::from_u64(1);
    Currency c0(addresses::from_u64(0x1000));

    ledger.begin(5, locker);
    ledger.accumulate(5, EntryKind::Core, locker, c0, 100);

    SECTION("First failure wins") {
        ledger.fail(5, std::make_exception_ptr(ProtocolError(errors::UNAUTHORIZED_ADJUSTMENT, "first")));
        ledger.fail(5, std::make_exception_ptr(ProtocolError(errors::HOOK_CALL_FAILED, "second")));
        REQUIRE(ledger.failed());
        REQUIRE(error_code_of([&] { ledger.settle(5); }) == errors::UNAUTHORIZED_ADJUSTMENT);
        // Still active until the owner discards it
        REQUIRE(ledger.active());
        ledger.discard();
        REQUIRE_FALSE(ledger.failed());
    }

    SECTION("Failure from another sequence is ignored") {
        ledger.fail(6, std::make_exception_ptr(ProtocolError(errors::UNBALANCED, "stale")));
        REQUIRE_FALSE(ledger.failed());
        REQUIRE(ll(ledger.settle(5).owed.at(c0)) == 100);
    }

    SECTION("Rollback does not clear the failure") {
        auto cp = ledger.checkpoint();
        ledger.accumulate(5, EntryKind::Core, locker, c0, 1);
        ledger.fail(5, std::make_exception_ptr(ProtocolError(errors::CORE_TRANSITION_FAILED, "core")));
        ledger.rollback(cp);
        REQUIRE(ledger.failed());
        REQUIRE(error_code_of([&] { ledger.settle(5); }) == errors::CORE_TRANSITION_FAILED);
    }
}
