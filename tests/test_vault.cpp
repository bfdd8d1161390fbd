// hookgate - Token vault tests

#include <catch2/catch.hpp>
#include <hookgate/vault.hpp>

#include "test_support.hpp"

using namespace hookgate;
using hookgate::testing::ll;

TEST_CASE("Vault deposit, withdraw and transfer", "[vault]") {
    TokenVault vault;
    Address alice = addresses::from_u64(1);
    Address bob = addresses::from_u64(2);
    Currency usd(addresses::from_u64(0x1000));

    REQUIRE(vault.deposit(alice, usd, 1000) == errors::OK);
    REQUIRE(ll(vault.balance_of(alice, usd)) == 1000);

    SECTION("Non-positive amounts") {
        REQUIRE(vault.deposit(alice, usd, 0) == errors::INVALID_AMOUNT);
        REQUIRE(vault.withdraw(alice, usd, -5) == errors::INVALID_AMOUNT);
        REQUIRE(vault.transfer(alice, bob, usd, 0) == errors::INVALID_AMOUNT);
    }

    SECTION("Withdraw within balance") {
        REQUIRE(vault.withdraw(alice, usd, 400) == errors::OK);
        REQUIRE(ll(vault.balance_of(alice, usd)) == 600);
        REQUIRE(vault.withdraw(alice, usd, 601) == errors::INSUFFICIENT_BALANCE);
    }

    SECTION("Transfer") {
        REQUIRE(vault.transfer(alice, bob, usd, 250) == errors::OK);
        REQUIRE(ll(vault.balance_of(alice, usd)) == 750);
        REQUIRE(ll(vault.balance_of(bob, usd)) == 250);
        REQUIRE(vault.transfer(bob, alice, usd, 251) == errors::INSUFFICIENT_BALANCE);
    }
}

TEST_CASE("Vault settlement batches are all or nothing", "[vault]") {
    TokenVault vault;
    Address reserve = addresses::POOL_MANAGER;
    Address alice = addresses::from_u64(1);
    Address hook = addresses::from_u64(0xE);
    Currency c0(addresses::from_u64(0x1000));
    Currency c1(addresses::from_u64(0x2000));

    vault.deposit(alice, c0, 100);
    vault.deposit(reserve, c1, 50);

    SECTION("Netted batch applies") {
        // Reserve pays out more c1 than it holds before alice's payment lands
        std::vector<Transfer> batch = {
            {hook, c1, -60},
            {alice, c1, 10},
            {alice, c0, 100},
        };
        vault.deposit(alice, c1, 10);
        REQUIRE(vault.pre_check_transfers(reserve, batch) == errors::OK);
        REQUIRE(vault.apply_transfers(reserve, batch) == errors::OK);
        REQUIRE(ll(vault.balance_of(hook, c1)) == 60);
        REQUIRE(ll(vault.balance_of(reserve, c1)) == 0);
        REQUIRE(ll(vault.balance_of(reserve, c0)) == 100);
        REQUIRE(ll(vault.balance_of(alice, c0)) == 0);
    }

    SECTION("Underfunded batch leaves balances untouched") {
        std::vector<Transfer> batch = {
            {alice, c0, 100},
            {alice, c1, -80},
        };
        REQUIRE(vault.pre_check_transfers(reserve, batch) == errors::INSUFFICIENT_BALANCE);
        REQUIRE(vault.apply_transfers(reserve, batch) == errors::INSUFFICIENT_BALANCE);
        REQUIRE(ll(vault.balance_of(alice, c0)) == 100);
        REQUIRE(ll(vault.balance_of(reserve, c1)) == 50);
    }

    SECTION("Stats") {
        vault.apply_transfers(reserve, {{alice, c0, 40}});
        auto stats = vault.get_stats();
        REQUIRE(stats.batches_applied == 1);
        REQUIRE(stats.transfers_applied == 1);
        REQUIRE(stats.total_accounts == 2);
    }
}
