// RngUtilsTest.cpp
//
// Unit tests for benchstat::rng_utils: seed derivation, per-shard engines and
// the stable byte digest used for fingerprints and report checksums.

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <random>
#include <set>
#include <string>
#include <vector>

#include "RngUtils.h"

using namespace benchstat::rng_utils;

TEST_CASE("splitmix64 is a fixed, non-trivial mixing function", "[RngUtils][splitmix]")
{
    // Reference output of SplitMix64 for state 0.
    REQUIRE(splitmix64(0) == 0xe220a8397b1dcdafull);
    REQUIRE(splitmix64(1) != splitmix64(2));
}

TEST_CASE("derive_shard_seed produces distinct, reproducible seeds", "[RngUtils][seed]")
{
    const uint64_t master = 42;

    std::set<uint64_t> seen;
    for (std::size_t shard = 0; shard < 256; ++shard)
        seen.insert(derive_shard_seed(master, shard));
    REQUIRE(seen.size() == 256);

    REQUIRE(derive_shard_seed(master, 7) == derive_shard_seed(master, 7));
    REQUIRE(derive_shard_seed(master, 7) != derive_shard_seed(master + 1, 7));
}

TEST_CASE("ShardEngineProvider hands out independent deterministic engines", "[RngUtils][provider]")
{
    ShardEngineProvider<> a(12345);
    ShardEngineProvider<> b(12345);
    REQUIRE(a.masterSeed() == 12345);

    auto e1 = a.make_engine(3);
    auto e2 = b.make_engine(3);
    for (int i = 0; i < 100; ++i)
        REQUIRE(e1() == e2());

    auto s0 = a.make_engine(0);
    auto s1 = a.make_engine(1);
    REQUIRE(s0() != s1());

    SECTION("Engine drawn for a shard does not depend on creation order")
    {
        auto late = a.make_engine(3);
        auto fresh = ShardEngineProvider<>(12345).make_engine(3);
        REQUIRE(late() == fresh());
    }
}

TEST_CASE("get_random_index stays in range", "[RngUtils][index]")
{
    std::mt19937_64 rng(7);
    REQUIRE(get_random_index(rng, 0) == 0);
    for (int i = 0; i < 1000; ++i)
        REQUIRE(get_random_index(rng, 13) < 13);
}

TEST_CASE("digest_bytes is stable and content-sensitive", "[RngUtils][digest]")
{
    const std::string text = "mean=0.80 stddev=0.03 n=1000";
    REQUIRE(digest_bytes(text) == digest_bytes(std::string(text)));
    REQUIRE(digest_bytes(text) != digest_bytes("mean=0.80 stddev=0.03 n=1001"));

    // Length is folded in, so trailing zero bytes change the digest.
    REQUIRE(digest_bytes(std::string("a")) != digest_bytes(std::string("a\0", 2)));
    REQUIRE(digest_bytes("") != digest_bytes(std::string(1, '\0')));
}

TEST_CASE("hash_combine64 is order-sensitive", "[RngUtils][hash]")
{
    REQUIRE(hash_combine64({1, 2}) != hash_combine64({2, 1}));
    REQUIRE(hash_combine64({1, 2, 3}) == hash_combine64({1, 2, 3}));
}
