// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

#include <boost/test/unit_test.hpp>

#include <registry/seed_registry.h>
#include <core/registryparams.h>
#include <test/test_ledger.h>

#include <memory>
#include <vector>

namespace {

struct GovernanceTestingSetup {
    Seedline::RegistryParams params;
    CTestLedger ledger;
    std::unique_ptr<CSeedRegistry> registry;

    Account authority = MakeAccount(0xa0);
    Account alice = MakeAccount(0xa1);
    Account bob = MakeAccount(0xb0);

    GovernanceTestingSetup() {
        params = Seedline::RegistryParams::Standard();
        params.codeLength = 2;
        params.founderSlots = 5;
        params.derivationFee = 10;
        registry.reset(new CSeedRegistry(params, ledger));

        CRegistryStatus status;
        BOOST_REQUIRE(registry->Initialize(authority, status));
        for (SeedId id = 1; id <= 5; id++) {
            uint8_t value = static_cast<uint8_t>(id * 20);
            BOOST_REQUIRE(registry->Consolidate(authority, id, CSeedCode(std::vector<uint8_t>{value, value}), status));
        }
    }

    void OpenGate() {
        CRegistryStatus status;
        BOOST_REQUIRE(registry->OpenGate(authority, status));
    }

    void GiveFounders(const Account& to, SeedId first, SeedId last) {
        for (SeedId id = first; id <= last; id++) {
            ledger.TransferSeed(id, to);
        }
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(governor_tests, GovernanceTestingSetup)

BOOST_AUTO_TEST_CASE(open_gate_rules) {
    CRegistryStatus status;
    BOOST_CHECK(!registry->OpenGate(alice, status));
    BOOST_CHECK(status.GetError() == RegistryError::AUTHORIZATION);

    status.Clear();
    BOOST_REQUIRE(registry->OpenGate(authority, status));
    BOOST_CHECK(registry->IsGateOpen());

    BOOST_CHECK(!registry->OpenGate(authority, status));
    BOOST_CHECK(status.GetError() == RegistryError::STATE_CONFLICT);
    BOOST_CHECK_EQUAL(status.GetReason(), "gate-open");
}

BOOST_AUTO_TEST_CASE(open_gate_requires_founding_era) {
    CTestLedger freshLedger;
    CSeedRegistry fresh(params, freshLedger);

    CRegistryStatus status;
    BOOST_REQUIRE(fresh.Initialize(authority, status));
    BOOST_CHECK(!fresh.OpenGate(authority, status));
    BOOST_CHECK_EQUAL(status.GetReason(), "era-not-ready");
}

BOOST_AUTO_TEST_CASE(claim_requires_open_gate) {
    GiveFounders(alice, 1, 3);

    CRegistryStatus status;
    BOOST_CHECK(!registry->Claim(alice, status));
    BOOST_CHECK(status.GetError() == RegistryError::STATE_CONFLICT);
    BOOST_CHECK_EQUAL(status.GetReason(), "gate-closed");
}

BOOST_AUTO_TEST_CASE(claim_requires_strict_majority_over_authority) {
    OpenGate();

    // 2 vs 3: not enough
    GiveFounders(alice, 1, 2);
    CRegistryStatus status;
    BOOST_CHECK(!registry->Claim(alice, status));
    BOOST_CHECK(status.GetError() == RegistryError::AUTHORIZATION);
    BOOST_CHECK_EQUAL(status.GetReason(), "insufficient-holdings");

    // 2 vs 2 (one founder with a third party): a tie is not enough
    ledger.TransferSeed(3, bob);
    status.Clear();
    BOOST_CHECK(!registry->Claim(alice, status));
    BOOST_CHECK_EQUAL(status.GetReason(), "insufficient-holdings");

    // 3 vs 2
    ledger.TransferSeed(3, alice);
    status.Clear();
    BOOST_REQUIRE(registry->Claim(alice, status));
    BOOST_CHECK(registry->GetAuthority() == alice);
    BOOST_CHECK(registry->IsSuccessionPending());

    uint32_t nCount = 0;
    BOOST_REQUIRE(registry->CountFoundersOwnedBy(alice, nCount));
    BOOST_CHECK_EQUAL(nCount, 3U);
}

BOOST_AUTO_TEST_CASE(claim_by_authority_rejected) {
    OpenGate();

    CRegistryStatus status;
    BOOST_CHECK(!registry->Claim(authority, status));
    BOOST_CHECK_EQUAL(status.GetReason(), "already-authority");
}

BOOST_AUTO_TEST_CASE(derived_records_do_not_count) {
    OpenGate();
    ledger.Fund(alice, 100);

    // Alice holds several derived records but only two founders
    CRegistryStatus status;
    BOOST_REQUIRE(registry->CreateDerived(alice, alice, 1, 2, CSeedCode(std::vector<uint8_t>{25, 25}), status));
    BOOST_REQUIRE(registry->CreateDerived(alice, alice, 1, 2, CSeedCode(std::vector<uint8_t>{30, 30}), status));
    BOOST_REQUIRE(registry->CreateDerived(alice, alice, 1, 2, CSeedCode(std::vector<uint8_t>{35, 35}), status));
    GiveFounders(alice, 1, 2);

    BOOST_CHECK(!registry->Claim(alice, status));
    BOOST_CHECK_EQUAL(status.GetReason(), "insufficient-holdings");
}

BOOST_AUTO_TEST_CASE(claim_pays_out_accrued_balance) {
    OpenGate();
    ledger.Fund(bob, 100);

    CRegistryStatus status;
    BOOST_REQUIRE(registry->CreateDerived(bob, bob, 1, 2, CSeedCode(std::vector<uint8_t>{25, 25}), status));
    BOOST_REQUIRE(registry->CreateDerived(bob, bob, 1, 2, CSeedCode(std::vector<uint8_t>{30, 30}), status));
    BOOST_CHECK_EQUAL(registry->GetAccruedBalance(), 20);
    BOOST_CHECK_EQUAL(ledger.GetBalance(params.registryAccount), 20);

    GiveFounders(alice, 1, 3);
    BOOST_REQUIRE(registry->Claim(alice, status));

    BOOST_CHECK_EQUAL(registry->GetAccruedBalance(), 0);
    BOOST_CHECK_EQUAL(ledger.GetBalance(params.registryAccount), 0);
    BOOST_CHECK_EQUAL(ledger.GetBalance(authority), 20);
}

BOOST_AUTO_TEST_CASE(rollback_restores_previous_authority) {
    OpenGate();
    GiveFounders(alice, 1, 3);

    CRegistryStatus status;
    BOOST_REQUIRE(registry->Claim(alice, status));

    // Only the previous authority can roll back
    BOOST_CHECK(!registry->Rollback(bob, status));
    BOOST_CHECK_EQUAL(status.GetReason(), "not-previous-authority");

    // And only with more founders than the new authority
    status.Clear();
    BOOST_CHECK(!registry->Rollback(authority, status));
    BOOST_CHECK_EQUAL(status.GetReason(), "insufficient-holdings");

    GiveFounders(authority, 1, 2);
    status.Clear();
    BOOST_REQUIRE(registry->Rollback(authority, status));
    BOOST_CHECK(registry->GetAuthority() == authority);
    BOOST_CHECK(!registry->IsSuccessionPending());

    BOOST_CHECK(!registry->Rollback(authority, status));
    BOOST_CHECK_EQUAL(status.GetReason(), "succession-confirmed");
}

BOOST_AUTO_TEST_CASE(confirm_ends_rollback_window) {
    OpenGate();
    GiveFounders(alice, 1, 3);

    CRegistryStatus status;
    BOOST_CHECK(!registry->Confirm(alice, status));
    BOOST_CHECK_EQUAL(status.GetReason(), "not-authority");

    status.Clear();
    BOOST_REQUIRE(registry->Claim(alice, status));
    BOOST_CHECK(!registry->Confirm(authority, status));
    BOOST_CHECK(status.GetError() == RegistryError::AUTHORIZATION);

    status.Clear();
    BOOST_REQUIRE(registry->Confirm(alice, status));
    BOOST_CHECK(!registry->IsSuccessionPending());

    GiveFounders(authority, 1, 5);
    BOOST_CHECK(!registry->Rollback(authority, status));
    BOOST_CHECK_EQUAL(status.GetReason(), "succession-confirmed");

    BOOST_CHECK(!registry->Confirm(alice, status));
    BOOST_CHECK_EQUAL(status.GetReason(), "nothing-to-confirm");
}

BOOST_AUTO_TEST_CASE(new_authority_controls_registry) {
    OpenGate();
    GiveFounders(alice, 1, 3);

    CRegistryStatus status;
    BOOST_REQUIRE(registry->Claim(alice, status));

    BOOST_CHECK(!registry->SetMintingOpen(authority, false, status));
    BOOST_CHECK(status.GetError() == RegistryError::AUTHORIZATION);

    status.Clear();
    BOOST_CHECK(registry->SetMintingOpen(alice, false, status));
}

BOOST_AUTO_TEST_CASE(holdings_lookup_failure) {
    OpenGate();
    GiveFounders(alice, 1, 3);
    ledger.setBrokenOwners.insert(4);

    CRegistryStatus status;
    BOOST_CHECK(!registry->Claim(alice, status));
    BOOST_CHECK(status.GetError() == RegistryError::EXTERNAL_FAILURE);
    BOOST_CHECK(registry->GetAuthority() == authority);

    uint32_t nCount = 0;
    BOOST_CHECK(!registry->CountFoundersOwnedBy(alice, nCount));
}

BOOST_AUTO_TEST_SUITE_END()
