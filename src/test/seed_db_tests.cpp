// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

/**
 * Registry database tests
 *
 * Snapshot round trips through LevelDB and rejection of stored states
 * that fail the consistency checks.
 */

#include <boost/test/unit_test.hpp>

#include <db/seed_db.h>
#include <registry/seed_registry.h>
#include <core/registryparams.h>
#include <test/test_ledger.h>

#include <leveldb/db.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

BOOST_AUTO_TEST_SUITE(seed_db_tests)

// ============================================================================
// Helper Functions
// ============================================================================

/**
 * Unique temporary directory for one test database
 */
static std::string MakeTestDBPath(const std::string& name) {
    auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    std::string path = std::filesystem::temp_directory_path().string() +
                       "/seedline_" + name + "_" + std::to_string(ticks);
    std::filesystem::create_directories(path);
    return path;
}

static void CleanupTestDB(const std::string& path) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
}

/** Registry with three founders and one derived record owned by `owner` */
static void BuildRegistry(CSeedRegistry& registry, const Account& authority, const Account& owner) {
    CRegistryStatus status;
    BOOST_REQUIRE(registry.Initialize(authority, status));
    BOOST_REQUIRE(registry.Consolidate(authority, 1, CSeedCode(std::vector<uint8_t>{10, 20}), status));
    BOOST_REQUIRE(registry.Consolidate(authority, 2, CSeedCode(std::vector<uint8_t>{50, 60}), status));
    BOOST_REQUIRE(registry.Consolidate(authority, 3, CSeedCode(std::vector<uint8_t>{90, 100}), status));
    BOOST_REQUIRE(registry.CreateDerived(owner, owner, 1, 2, CSeedCode(std::vector<uint8_t>{30, 40}), status));
    BOOST_REQUIRE(registry.SetBreedingFee(owner, 4, 75, status));
    BOOST_REQUIRE(registry.Mutate(owner, 4, 3, CSeedCode(std::vector<uint8_t>{60, 70}), status));
    BOOST_REQUIRE(registry.OpenGate(authority, status));
}

static Seedline::RegistryParams SmallParams() {
    Seedline::RegistryParams params = Seedline::RegistryParams::Standard();
    params.codeLength = 2;
    params.founderSlots = 3;
    return params;
}

// ============================================================================
// Tests
// ============================================================================

BOOST_AUTO_TEST_CASE(empty_database_reads_null_state) {
    std::string path = MakeTestDBPath("empty");
    {
        CSeedDB db;
        BOOST_REQUIRE(db.Open(path));
        BOOST_CHECK(db.IsOpen());

        CRegistryState state;
        std::string error;
        BOOST_REQUIRE(db.ReadState(state, error));
        BOOST_CHECK(!state.fInitialized);
        BOOST_CHECK(state.mapSeeds.empty());
    }
    CleanupTestDB(path);
}

BOOST_AUTO_TEST_CASE(open_missing_without_create) {
    std::string path = MakeTestDBPath("missing") + "/absent";
    CSeedDB db;
    BOOST_CHECK(!db.Open(path, false));
    BOOST_CHECK(!db.IsOpen());

    CRegistryState state;
    std::string error;
    BOOST_CHECK(!db.ReadState(state, error));
    BOOST_CHECK(!db.WriteState(state));
    CleanupTestDB(std::filesystem::path(path).parent_path().string());
}

BOOST_AUTO_TEST_CASE(snapshot_round_trip) {
    std::string path = MakeTestDBPath("roundtrip");
    Seedline::RegistryParams params = SmallParams();
    Account authority = MakeAccount(0xa0);
    Account owner = MakeAccount(0xb0);

    CTestLedger ledger;
    ledger.nHeight = 42;
    CSeedRegistry registry(params, ledger);
    BuildRegistry(registry, authority, owner);

    {
        CSeedDB db;
        BOOST_REQUIRE(db.Open(path));
        BOOST_REQUIRE(db.WriteState(registry.GetState()));
    }

    CSeedDB db;
    BOOST_REQUIRE(db.Open(path, false));

    CRegistryState state;
    std::string error;
    BOOST_REQUIRE_MESSAGE(db.ReadState(state, error), error);

    const CRegistryState& original = registry.GetState();
    BOOST_CHECK(state.fInitialized);
    BOOST_CHECK(state.fGateOpen);
    BOOST_CHECK(state.fFoundingEraComplete);
    BOOST_CHECK(state.fMintingOpen);
    BOOST_CHECK(!state.fGeneratorInstalled);
    BOOST_CHECK_EQUAL(state.nFounderSlots, original.nFounderSlots);
    BOOST_CHECK_EQUAL(state.nLastId, original.nLastId);
    BOOST_CHECK_EQUAL(state.nLastMarker, 42U);
    BOOST_CHECK(state.authority == authority);
    BOOST_CHECK_EQUAL(state.mapSeeds.size(), 4U);
    BOOST_CHECK_EQUAL(state.hashIndex.Size(), original.hashIndex.Size());

    const CSeed* derived = state.Find(4);
    BOOST_REQUIRE(derived != nullptr);
    BOOST_CHECK(derived->kind == SeedKind::DERIVED);
    BOOST_CHECK(derived->code == CSeedCode(std::vector<uint8_t>{60, 70}));
    BOOST_CHECK_EQUAL(derived->nMutations, 1U);
    BOOST_CHECK_EQUAL(derived->nBreedingFee, 75);

    // The retired code is still reserved after reload
    BOOST_CHECK(state.hashIndex.Contains(CSeedCode(std::vector<uint8_t>{30, 40}).GetHash()));

    // And the reloaded state drives a registry again
    CSeedRegistry restored(params, ledger);
    BOOST_REQUIRE_MESSAGE(restored.LoadState(state, error), error);
    CRegistryStatus status;
    BOOST_CHECK(!restored.CreateDerived(owner, owner, 1, 2, CSeedCode(std::vector<uint8_t>{30, 40}), status));
    BOOST_CHECK(status.GetError() == RegistryError::DUPLICATE_CONTENT);

    db.Close();
    CleanupTestDB(path);
}

BOOST_AUTO_TEST_CASE(rewrite_replaces_snapshot) {
    std::string path = MakeTestDBPath("rewrite");
    Seedline::RegistryParams params = SmallParams();
    Account authority = MakeAccount(0xa0);

    CTestLedger ledger;
    CSeedRegistry registry(params, ledger);
    BuildRegistry(registry, authority, MakeAccount(0xb0));

    CSeedDB db;
    BOOST_REQUIRE(db.Open(path));
    BOOST_REQUIRE(db.WriteState(registry.GetState()));

    // A smaller state overwrites every key of the larger one
    CTestLedger smallLedger;
    CSeedRegistry small(params, smallLedger);
    CRegistryStatus status;
    BOOST_REQUIRE(small.Initialize(authority, status));
    BOOST_REQUIRE(db.WriteState(small.GetState()));

    CRegistryState state;
    std::string error;
    BOOST_REQUIRE_MESSAGE(db.ReadState(state, error), error);
    BOOST_CHECK_EQUAL(state.mapSeeds.size(), 3U);
    BOOST_CHECK_EQUAL(state.hashIndex.Size(), 0U);
    BOOST_CHECK(!state.fGateOpen);

    BOOST_REQUIRE(db.Clear());
    BOOST_REQUIRE(db.ReadState(state, error));
    BOOST_CHECK(!state.fInitialized);

    db.Close();
    CleanupTestDB(path);
}

BOOST_AUTO_TEST_CASE(unreserved_fingerprint_rejected) {
    std::string path = MakeTestDBPath("unreserved");
    Seedline::RegistryParams params = SmallParams();
    Account authority = MakeAccount(0xa0);

    CTestLedger ledger;
    CSeedRegistry registry(params, ledger);
    BuildRegistry(registry, authority, MakeAccount(0xb0));

    CRegistryState tampered = registry.GetState();
    tampered.hashIndex.Release(tampered.Find(4)->hashContent);

    CSeedDB db;
    BOOST_REQUIRE(db.Open(path));
    BOOST_REQUIRE(db.WriteState(tampered));

    CRegistryState state;
    std::string error;
    BOOST_CHECK(!db.ReadState(state, error));
    BOOST_CHECK(!error.empty());
    BOOST_CHECK(!state.fInitialized);

    db.Close();
    CleanupTestDB(path);
}

BOOST_AUTO_TEST_CASE(mismatched_fingerprint_rejected) {
    std::string path = MakeTestDBPath("mismatch");
    Seedline::RegistryParams params = SmallParams();
    Account authority = MakeAccount(0xa0);

    CTestLedger ledger;
    CSeedRegistry registry(params, ledger);
    BuildRegistry(registry, authority, MakeAccount(0xb0));

    CRegistryState tampered = registry.GetState();
    tampered.Find(1)->code = CSeedCode(std::vector<uint8_t>{11, 21});

    CSeedDB db;
    BOOST_REQUIRE(db.Open(path));
    BOOST_REQUIRE(db.WriteState(tampered));

    CRegistryState state;
    std::string error;
    BOOST_CHECK(!db.ReadState(state, error));
    BOOST_CHECK(error.find("fingerprint") != std::string::npos);

    db.Close();
    CleanupTestDB(path);
}

BOOST_AUTO_TEST_CASE(corrupt_record_rejected) {
    std::string path = MakeTestDBPath("corrupt");
    Seedline::RegistryParams params = SmallParams();

    CTestLedger ledger;
    CSeedRegistry registry(params, ledger);
    BuildRegistry(registry, MakeAccount(0xa0), MakeAccount(0xb0));

    {
        CSeedDB db;
        BOOST_REQUIRE(db.Open(path));
        BOOST_REQUIRE(db.WriteState(registry.GetState()));
    }

    // Truncate one record behind the database's back
    {
        leveldb::DB* raw = nullptr;
        leveldb::Options options;
        BOOST_REQUIRE(leveldb::DB::Open(options, path, &raw).ok());
        std::unique_ptr<leveldb::DB> guard(raw);
        BOOST_REQUIRE(raw->Put(leveldb::WriteOptions(), "seed:0000000000000002", "short").ok());
    }

    CSeedDB db;
    BOOST_REQUIRE(db.Open(path, false));
    CRegistryState state;
    std::string error;
    BOOST_CHECK(!db.ReadState(state, error));
    BOOST_CHECK(error.find("seed:0000000000000002") != std::string::npos);

    db.Close();
    CleanupTestDB(path);
}

BOOST_AUTO_TEST_SUITE_END()
