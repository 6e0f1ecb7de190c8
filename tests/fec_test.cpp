#include <algorithm>
#include <bitset>
#include <stdexcept>

#include <gtest/gtest.h>

#include "crypto.hpp"
#include "fec.hpp"
#include "test_support.hpp"

namespace {
dasim::ShardMap subset(const std::vector<dasim::Bytes>& shards, unsigned mask) {
    dasim::ShardMap m;
    for (uint32_t i = 0; i < shards.size(); ++i) {
        if (mask & (1u << i)) m[i] = shards[i];
    }
    return m;
}

size_t popcount(unsigned v) { return std::bitset<32>(v).count(); }
} // namespace

TEST(Padding, SmallestMultipleOfKWithZeroFill) {
    for (size_t k = 1; k <= 7; ++k) {
        for (size_t len = 0; len <= 40; ++len) {
            dasim::Bytes data(len, 0xAB);
            dasim::Bytes padded = dasim::pad_to_multiple(data, k);
            ASSERT_EQ(padded.size() % k, 0u) << "k=" << k << " len=" << len;
            ASSERT_GE(padded.size(), len);
            ASSERT_LT(padded.size() - len, k);
            EXPECT_TRUE(std::equal(data.begin(), data.end(), padded.begin()));
            for (size_t i = len; i < padded.size(); ++i) EXPECT_EQ(padded[i], 0);
        }
    }
}

TEST(ReedSolomon, EncodeIsSystematicWithEqualShardLengths) {
    dasim::ReedSolomon rs;
    const dasim::Bytes blob = dasim_test::random_blob(103, 7);
    const auto shards = rs.encode(blob);
    ASSERT_EQ(shards.size(), dasim::kTotalShards);

    const size_t len = rs.shard_size(blob.size());
    EXPECT_EQ(len, 26u);
    for (const auto& s : shards) EXPECT_EQ(s.size(), len);

    const dasim::Bytes padded = dasim::pad_to_multiple(blob, dasim::kDataShards);
    for (size_t i = 0; i < dasim::kDataShards; ++i) {
        EXPECT_TRUE(std::equal(shards[i].begin(), shards[i].end(), padded.begin() + i * len));
    }
}

TEST(ReedSolomon, EveryKSubsetReconstructs) {
    dasim::ReedSolomon rs;
    const dasim::Bytes blob = dasim_test::random_blob(1000, 42);
    const auto shards = rs.encode(blob);

    size_t tried = 0;
    for (unsigned mask = 0; mask < (1u << dasim::kTotalShards); ++mask) {
        if (popcount(mask) != dasim::kDataShards) continue;
        ++tried;
        auto out = rs.reconstruct(subset(shards, mask), blob.size());
        ASSERT_TRUE(out.has_value()) << "mask=" << mask;
        EXPECT_EQ(*out, blob) << "mask=" << mask;
    }
    EXPECT_EQ(tried, 15u);
}

TEST(ReedSolomon, MoreThanKShardsAlsoReconstruct) {
    dasim::ReedSolomon rs;
    const dasim::Bytes blob = dasim_test::random_blob(77, 3);
    const auto shards = rs.encode(blob);
    for (unsigned mask = 0; mask < (1u << dasim::kTotalShards); ++mask) {
        if (popcount(mask) <= dasim::kDataShards) continue;
        auto out = rs.reconstruct(subset(shards, mask), blob.size());
        ASSERT_TRUE(out.has_value()) << "mask=" << mask;
        EXPECT_EQ(*out, blob);
    }
}

TEST(ReedSolomon, FewerThanKShardsFail) {
    dasim::ReedSolomon rs;
    const dasim::Bytes blob = dasim_test::random_blob(64, 9);
    const auto shards = rs.encode(blob);
    for (unsigned mask = 0; mask < (1u << dasim::kTotalShards); ++mask) {
        if (popcount(mask) >= dasim::kDataShards) continue;
        EXPECT_FALSE(rs.reconstruct(subset(shards, mask), blob.size()).has_value()) << "mask=" << mask;
    }
}

TEST(ReedSolomon, ReconstructShardsRestoresDataAndParity) {
    dasim::ReedSolomon rs;
    const dasim::Bytes blob = dasim_test::random_blob(240, 11);
    const auto expected = rs.encode(blob);

    std::vector<dasim::Bytes> shards = expected;
    std::vector<bool> present(dasim::kTotalShards, true);
    shards[0].clear();
    present[0] = false;
    shards[5].clear();
    present[5] = false;

    ASSERT_TRUE(rs.reconstruct_shards(shards, present));
    EXPECT_EQ(shards, expected);
    EXPECT_TRUE(std::all_of(present.begin(), present.end(), [](bool p) { return p; }));
}

TEST(ReedSolomon, ChecksumSurvivesPaddingBoundaries) {
    ASSERT_TRUE(dasim::crypto_init());
    dasim::ReedSolomon rs;
    const size_t shard = 25;
    const size_t sizes[] = {0, 1, shard - 1, shard, shard + 1, 10 * shard};
    for (size_t len : sizes) {
        const dasim::Bytes blob = dasim_test::random_blob(len, (uint32_t)len + 1);
        const auto shards = rs.encode(blob);
        // parity-heavy subset: data 1, 2 plus both parity shards
        auto out = rs.reconstruct(subset(shards, 0b110110), blob.size());
        ASSERT_TRUE(out.has_value()) << "len=" << len;
        EXPECT_EQ(dasim::sha256_hex(*out), dasim::sha256_hex(blob)) << "len=" << len;
    }
}

TEST(ReedSolomon, InconsistentShardLengthsFail) {
    dasim::ReedSolomon rs;
    auto shards = rs.encode(dasim_test::random_blob(100, 5));
    shards[2].push_back(0);
    EXPECT_FALSE(rs.reconstruct(subset(shards, 0b001111), 100).has_value());
}

TEST(ReedSolomon, OutOfRangeIndexFails) {
    dasim::ReedSolomon rs;
    auto shards = rs.encode(dasim_test::random_blob(40, 5));
    dasim::ShardMap m = subset(shards, 0b001111);
    m[dasim::kTotalShards] = shards[0];
    EXPECT_FALSE(rs.reconstruct(m, 40).has_value());
}

TEST(ReedSolomon, DeclaredLengthBeyondPaddedSizeFails) {
    dasim::ReedSolomon rs;
    auto shards = rs.encode(dasim_test::random_blob(40, 5));
    EXPECT_FALSE(rs.reconstruct(subset(shards, 0b001111), 41).has_value());
    EXPECT_TRUE(rs.reconstruct(subset(shards, 0b001111), 40).has_value());
}

TEST(ReedSolomon, WiderPlanRecoversFromParityOnlyMix) {
    dasim::ShardPlan plan;
    plan.data_count = 10;
    plan.parity_count = 4;
    dasim::ReedSolomon rs(plan);
    const dasim::Bytes blob = dasim_test::random_blob(4099, 21);
    const auto shards = rs.encode(blob);
    ASSERT_EQ(shards.size(), 14u);

    dasim::ShardMap m;
    for (uint32_t i = 4; i < 14; ++i) m[i] = shards[i];
    auto out = rs.reconstruct(m, blob.size());
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, blob);
}

TEST(ReedSolomon, RejectsInvalidPlans) {
    dasim::ShardPlan zero;
    zero.data_count = 0;
    EXPECT_THROW(dasim::ReedSolomon{zero}, std::invalid_argument);

    dasim::ShardPlan wide;
    wide.data_count = 200;
    wide.parity_count = 57;
    EXPECT_THROW(dasim::ReedSolomon{wide}, std::invalid_argument);
}
