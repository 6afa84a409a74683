#include <numeric>
#include <thread>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "bytestring/seq/bytes.hpp"

using namespace bytestring::core;
using namespace bytestring::seq;

namespace {
    Bytes ramp(std::size_t n) {
        std::vector<u8> v(n);
        for (std::size_t i = 0; i < n; ++i) {
            v[i] = static_cast<u8>(i);
        }
        Bytes b;
        EXPECT_TRUE(is_ok(Bytes::copy_of({v.data(), v.size()}, &b)));
        return b;
    }
} // namespace

TEST(ByteSpliterator, YieldsUnsignedValuesInOrder) {
    std::vector<u8> raw{0x00, 0x7f, 0x80, 0xff};
    Bytes b;
    ASSERT_TRUE(is_ok(Bytes::copy_of({raw.data(), raw.size()}, &b)));
    ByteSpliterator it;
    ASSERT_TRUE(is_ok(b.spliterator(&it)));

    std::vector<u32> seen;
    while (it.try_advance([&](u32 v) { seen.push_back(v); })) {
    }
    EXPECT_EQ(seen, (std::vector<u32>{0, 127, 128, 255}));
    EXPECT_EQ(it.estimate_size(), 0);
    EXPECT_FALSE(it.try_advance([](u32) {}));
}

TEST(ByteSpliterator, Characteristics) {
    ByteSpliterator it;
    ASSERT_TRUE(is_ok(ramp(4).spliterator(&it)));
    const u32 c = it.characteristics();
    EXPECT_NE(c & kSpliteratorOrdered, 0u);
    EXPECT_NE(c & kSpliteratorSized, 0u);
    EXPECT_NE(c & kSpliteratorImmutable, 0u);
    EXPECT_NE(c & kSpliteratorSubsized, 0u);
}

TEST(ByteSpliterator, SplitKeepsLowerHalf) {
    ByteSpliterator lower;
    ASSERT_TRUE(is_ok(ramp(5).spliterator(&lower)));
    ByteSpliterator upper;
    ASSERT_TRUE(lower.try_split(&upper));
    EXPECT_EQ(lower.estimate_size(), 2);
    EXPECT_EQ(upper.estimate_size(), 3);

    std::vector<u32> lo;
    std::vector<u32> hi;
    lower.for_each_remaining([&](u32 v) { lo.push_back(v); });
    upper.for_each_remaining([&](u32 v) { hi.push_back(v); });
    EXPECT_EQ(lo, (std::vector<u32>{0, 1}));
    EXPECT_EQ(hi, (std::vector<u32>{2, 3, 4}));
}

TEST(ByteSpliterator, NoSplitBelowTwoElements) {
    ByteSpliterator it;
    ASSERT_TRUE(is_ok(ramp(2).spliterator(&it)));
    ASSERT_TRUE(it.try_advance([](u32) {}));
    ByteSpliterator other;
    EXPECT_FALSE(it.try_split(&other));
    EXPECT_EQ(it.estimate_size(), 1);
    EXPECT_EQ(other.estimate_size(), 0);
}

TEST(ByteSpliterator, SplitAfterPartialConsumption) {
    ByteSpliterator it;
    ASSERT_TRUE(is_ok(ramp(10).spliterator(&it)));
    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(it.try_advance([](u32) {}));
    }
    ByteSpliterator upper;
    ASSERT_TRUE(it.try_split(&upper));
    u32 first = 0;
    ASSERT_TRUE(upper.try_advance([&](u32 v) { first = v; }));
    EXPECT_EQ(first, 7u);
    EXPECT_EQ(it.estimate_size(), 3);
}

TEST(ByteSpliterator, ParallelHalvesSumToTotal) {
    const Bytes data = ramp(1 << 16);
    ByteSpliterator root;
    ASSERT_TRUE(is_ok(data.spliterator(&root)));

    std::vector<ByteSpliterator> parts;
    parts.push_back(root);
    // Four rounds of splitting give sixteen disjoint ranges.
    for (int round = 0; round < 4; ++round) {
        const std::size_t n = parts.size();
        for (std::size_t i = 0; i < n; ++i) {
            ByteSpliterator upper;
            ASSERT_TRUE(parts[i].try_split(&upper));
            parts.push_back(upper);
        }
    }
    ASSERT_EQ(parts.size(), 16u);

    std::vector<u64> sums(parts.size(), 0);
    std::vector<std::thread> workers;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        workers.emplace_back([&parts, &sums, i] {
            parts[i].for_each_remaining([&](u32 v) { sums[i] += v; });
        });
    }
    for (std::thread& t : workers) {
        t.join();
    }

    u64 expected = 0;
    for (std::size_t i = 0; i < (1u << 16); ++i) {
        expected += static_cast<u8>(i);
    }
    EXPECT_EQ(std::accumulate(sums.begin(), sums.end(), u64{0}), expected);
}

TEST(ByteSpliterator, EmptySequence) {
    ByteSpliterator it;
    ASSERT_TRUE(is_ok(Bytes::empty().spliterator(&it)));
    EXPECT_EQ(it.estimate_size(), 0);
    EXPECT_FALSE(it.try_advance([](u32) {}));
}

TEST(ByteSpliterator, MovedFromStillEnumerates) {
    const Bytes b = ramp(4);
    ByteSpliterator a;
    ASSERT_TRUE(is_ok(b.spliterator(&a)));
    ByteSpliterator moved = std::move(a);
    EXPECT_EQ(moved.estimate_size(), 4);
    ASSERT_EQ(a.estimate_size(), 4);
    u32 sum = 0;
    a.for_each_remaining([&](u32 v) { sum += v; });
    EXPECT_EQ(sum, 0u + 1u + 2u + 3u);
}
