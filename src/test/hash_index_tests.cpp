// Copyright (c) 2025 The Seedline Core developers
// Distributed under the MIT software license

#include <boost/test/unit_test.hpp>

#include <registry/hash_index.h>
#include <primitives/seed.h>
#include <crypto/sha3.h>
#include <uint256.h>
#include <util/strencodings.h>

#include <cstring>
#include <stdexcept>
#include <vector>

BOOST_AUTO_TEST_SUITE(hash_index_tests)

static uint256 MakeTestHash(uint8_t fill) {
    uint256 hash;
    memset(hash.data, fill, 32);
    return hash;
}

BOOST_AUTO_TEST_CASE(reserve_and_contains) {
    CHashIndex index;
    uint256 a = MakeTestHash(0x11);
    uint256 b = MakeTestHash(0x22);

    BOOST_CHECK(!index.Contains(a));
    BOOST_CHECK(index.Reserve(a));
    BOOST_CHECK(index.Contains(a));
    BOOST_CHECK(!index.Contains(b));
    BOOST_CHECK_EQUAL(index.Size(), 1U);
}

BOOST_AUTO_TEST_CASE(duplicate_reserve_rejected) {
    CHashIndex index;
    uint256 a = MakeTestHash(0x11);

    BOOST_REQUIRE(index.Reserve(a));
    BOOST_CHECK(!index.Reserve(a));
    BOOST_CHECK_EQUAL(index.Size(), 1U);
}

BOOST_AUTO_TEST_CASE(release_frees_fingerprint) {
    CHashIndex index;
    uint256 a = MakeTestHash(0x11);

    BOOST_CHECK(!index.Release(a));
    BOOST_REQUIRE(index.Reserve(a));
    BOOST_CHECK(index.Release(a));
    BOOST_CHECK(!index.Contains(a));
    BOOST_CHECK(index.Reserve(a));
}

BOOST_AUTO_TEST_CASE(get_all_is_ordered) {
    CHashIndex index;
    index.Reserve(MakeTestHash(0x33));
    index.Reserve(MakeTestHash(0x11));
    index.Reserve(MakeTestHash(0x22));

    std::vector<uint256> all = index.GetAll();
    BOOST_REQUIRE_EQUAL(all.size(), 3U);
    BOOST_CHECK(all[0] < all[1]);
    BOOST_CHECK(all[1] < all[2]);

    index.Clear();
    BOOST_CHECK_EQUAL(index.Size(), 0U);
}

BOOST_AUTO_TEST_CASE(code_fingerprint_is_sha3_of_elements) {
    std::vector<uint8_t> values = {5, 10, 200, 0};
    CSeedCode code(values);

    uint8_t digest[32];
    SHA3_256(values.data(), values.size(), digest);

    uint256 expected;
    memcpy(expected.data, digest, 32);
    BOOST_CHECK(code.GetHash() == expected);

    // Order matters
    CSeedCode reordered(std::vector<uint8_t>{10, 5, 200, 0});
    BOOST_CHECK(reordered.GetHash() != code.GetHash());
}

BOOST_AUTO_TEST_CASE(sha3_known_vector) {
    // SHA3-256("") from FIPS 202
    uint256 empty = SHA3_256(std::vector<uint8_t>());
    BOOST_CHECK_EQUAL(HexStr(empty.data, 32),
                      "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a");
}

BOOST_AUTO_TEST_CASE(sha3_rejects_null_buffers) {
    uint8_t digest[32];
    BOOST_CHECK_THROW(SHA3_256(nullptr, 4, digest), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
