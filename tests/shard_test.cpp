#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

#include <terf/shard.hpp>

using namespace terf;

namespace {

RowDescriptor row(int id) {
    RowDescriptor r;
    r.path = "img" + std::to_string(id) + ".jpg";
    r.image_id = id;
    return r;
}

} // namespace

TEST(ShardTest, TotalShards) {
    EXPECT_EQ(total_shards(2500, 1024), 3u);
    EXPECT_EQ(total_shards(2048, 1024), 2u);
    EXPECT_EQ(total_shards(2049, 1024), 3u);
    EXPECT_EQ(total_shards(1, 1024), 1u);
    EXPECT_EQ(total_shards(1024, 1024), 1u);
    EXPECT_EQ(total_shards(10, 1), 10u);
    EXPECT_THROW(total_shards(10, 0), std::invalid_argument);

    for (std::size_t total = 1; total < 50; ++total) {
        for (std::size_t per = 1; per < 20; ++per) {
            std::size_t n = total_shards(total, per);
            EXPECT_GE(n * per, total);
            EXPECT_LT((n - 1) * per, total);
        }
    }
}

TEST(ShardTest, FileNames) {
    EXPECT_EQ(shard_file_name("train", 1, 3), "train-00001-of-00003");
    EXPECT_EQ(shard_file_name("eval", 12, 100000), "eval-00012-of-100000");
    Shard s;
    s.id = 2;
    s.total = 3;
    EXPECT_EQ(shard_file_name("train", s), "train-00002-of-00003");
}

TEST(ShardTest, AccumulatorSplitsRows) {
    const std::size_t total = 2500;
    ShardAccumulator acc(1024, total_shards(total, 1024));
    std::vector<Shard> shards;
    for (std::size_t i = 1; i <= total; ++i) {
        if (auto s = acc.accumulate(row(static_cast<int>(i))))
            shards.push_back(std::move(*s));
    }
    if (auto s = acc.flush())
        shards.push_back(std::move(*s));
    EXPECT_FALSE(acc.flush().has_value());

    ASSERT_EQ(shards.size(), 3u);
    EXPECT_EQ(shards[0].rows.size(), 1024u);
    EXPECT_EQ(shards[1].rows.size(), 1024u);
    EXPECT_EQ(shards[2].rows.size(), 452u);

    int expected = 1;
    for (std::size_t i = 0; i < shards.size(); ++i) {
        EXPECT_EQ(shards[i].id, i + 1);
        EXPECT_EQ(shards[i].total, 3u);
        for (const auto& r : shards[i].rows)
            EXPECT_EQ(r.image_id, expected++);
    }
}

TEST(ShardTest, ExactMultipleHasNoTrailingShard) {
    ShardAccumulator acc(2, 2);
    EXPECT_FALSE(acc.accumulate(row(1)).has_value());
    auto first = acc.accumulate(row(2));
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->id, 1u);
    EXPECT_FALSE(acc.accumulate(row(3)).has_value());
    auto second = acc.accumulate(row(4));
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->id, 2u);
    EXPECT_FALSE(acc.flush().has_value());
}

TEST(ShardTest, ZeroPerShardRejected) {
    EXPECT_THROW(ShardAccumulator(0, 1), std::invalid_argument);
}

TEST(ShardTest, HugeShardSizeOnSmallTable) {
    const std::size_t per_shard = 2000000000;
    ShardAccumulator acc(per_shard, total_shards(5, per_shard));
    for (int i = 1; i <= 5; ++i)
        EXPECT_FALSE(acc.accumulate(row(i)).has_value());
    auto only = acc.flush();
    ASSERT_TRUE(only.has_value());
    EXPECT_EQ(only->id, 1u);
    EXPECT_EQ(only->total, 1u);
    EXPECT_EQ(only->rows.size(), 5u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
