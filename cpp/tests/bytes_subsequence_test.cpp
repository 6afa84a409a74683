#include <array>
#include <memory>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "bytestring/io/data_input.hpp"
#include "bytestring/seq/bytes.hpp"
#include "bytestring/seq/bytes_subsequence.hpp"

using namespace bytestring::core;
using namespace bytestring::seq;

class BytesSubsequenceTest : public ::testing::Test {
protected:
    void SetUp() override {
        const std::array<u8, 8> raw{0, 1, 2, 3, 4, 5, 6, 7};
        ASSERT_TRUE(is_ok(Bytes::copy_of({raw.data(), raw.size()}, &parent_)));
    }

    Bytes parent_;
};

TEST_F(BytesSubsequenceTest, ReadsThroughOffset) {
    BytesSubsequence s;
    ASSERT_TRUE(is_ok(parent_.slice(2, 6, &s)));
    EXPECT_EQ(s.offset(), 2);
    EXPECT_EQ(s.length(), 4);

    u8 v = 0;
    ASSERT_TRUE(is_ok(s.get(0, &v)));
    EXPECT_EQ(v, 2);
    EXPECT_EQ(s.get(4, &v).code, StatusCode::OutOfRange);

    i32 i = 0;
    ASSERT_TRUE(is_ok(s.get_int(0, &i)));
    EXPECT_EQ(i, 0x02030405);
}

TEST_F(BytesSubsequenceTest, ResliceComposesOffsets) {
    BytesSubsequence outer;
    ASSERT_TRUE(is_ok(parent_.slice(1, 7, &outer)));
    BytesSubsequence inner;
    ASSERT_TRUE(is_ok(outer.slice(2, 4, &inner)));

    EXPECT_EQ(inner.offset(), 3);
    EXPECT_EQ(inner.view().data, parent_.view().data + 3);
    EXPECT_EQ(inner.to_hex_string(), "0304");

    std::shared_ptr<const ByteSequence> via_virtual;
    ASSERT_TRUE(is_ok(outer.sub_sequence(2, 4, &via_virtual)));
    EXPECT_EQ(*via_virtual, inner);
    EXPECT_EQ(outer.slice(2, 7, &inner).code, StatusCode::OutOfRange);
}

TEST_F(BytesSubsequenceTest, OutlivesParent) {
    BytesSubsequence s;
    {
        Bytes temp;
        const std::array<u8, 3> raw{9, 8, 7};
        ASSERT_TRUE(is_ok(Bytes::copy_of({raw.data(), raw.size()}, &temp)));
        ASSERT_TRUE(is_ok(temp.slice(1, 3, &s)));
    }
    EXPECT_EQ(s.to_hex_string(), "0807");
}

TEST_F(BytesSubsequenceTest, ToBytesCopiesPartialView) {
    BytesSubsequence s;
    ASSERT_TRUE(is_ok(parent_.slice(0, 4, &s)));
    Bytes owned;
    ASSERT_TRUE(is_ok(s.to_bytes(&owned)));
    EXPECT_EQ(owned, s);
    EXPECT_EQ(owned.length(), 4);
    EXPECT_NE(owned.view().data, parent_.view().data);
}

TEST_F(BytesSubsequenceTest, ToBytesAdoptsFullView) {
    BytesSubsequence s;
    ASSERT_TRUE(is_ok(parent_.slice(0, parent_.length(), &s)));
    Bytes owned;
    ASSERT_TRUE(is_ok(s.to_bytes(&owned)));
    EXPECT_EQ(owned, parent_);
    EXPECT_EQ(owned.view().data, parent_.view().data);
}

TEST_F(BytesSubsequenceTest, EmptySliceIsCanonical) {
    BytesSubsequence s;
    ASSERT_TRUE(is_ok(parent_.slice(3, 3, &s)));
    EXPECT_TRUE(s.is_empty());
    EXPECT_EQ(s.view().data, nullptr);
    EXPECT_EQ(s, BytesSubsequence::empty());

    Bytes owned = parent_;
    ASSERT_TRUE(is_ok(s.to_bytes(&owned)));
    EXPECT_TRUE(owned.is_empty());
}

TEST_F(BytesSubsequenceTest, EndsWithAndVector) {
    BytesSubsequence s;
    ASSERT_TRUE(is_ok(parent_.slice(2, 5, &s)));
    BytesSubsequence tail;
    ASSERT_TRUE(is_ok(parent_.slice(3, 5, &tail)));
    EXPECT_TRUE(s.ends_with(tail));
    EXPECT_FALSE(tail.ends_with(s));
    EXPECT_EQ(s.to_vector(), (std::vector<u8>{2, 3, 4}));
}

TEST_F(BytesSubsequenceTest, IntoByteArrayCopiesFromOffset) {
    BytesSubsequence s;
    ASSERT_TRUE(is_ok(parent_.slice(5, 8, &s)));
    std::array<u8, 3> dst{};
    ASSERT_TRUE(is_ok(s.into_byte_array({dst.data(), dst.size()}, 0, 3)));
    EXPECT_EQ(dst, (std::array<u8, 3>{5, 6, 7}));
    EXPECT_EQ(s.into_byte_array({dst.data(), dst.size()}, 1, 3).code, StatusCode::OutOfRange);
}

TEST_F(BytesSubsequenceTest, SpliteratorCoversOnlyView) {
    BytesSubsequence s;
    ASSERT_TRUE(is_ok(parent_.slice(6, 8, &s)));
    ByteSpliterator it;
    ASSERT_TRUE(is_ok(s.spliterator(&it)));
    std::vector<u32> seen;
    it.for_each_remaining([&](u32 v) { seen.push_back(v); });
    EXPECT_EQ(seen, (std::vector<u32>{6, 7}));
}

TEST_F(BytesSubsequenceTest, DataInputStartsAtViewStart) {
    BytesSubsequence s;
    ASSERT_TRUE(is_ok(parent_.slice(4, 8, &s)));
    bytestring::io::BytesDataInput in = s.data_input();
    EXPECT_EQ(in.remaining(), 4);
    u8 b = 0;
    ASSERT_TRUE(is_ok(in.read_unsigned_byte(&b)));
    EXPECT_EQ(b, 4);
}

TEST_F(BytesSubsequenceTest, MovedFromViewStillReads) {
    BytesSubsequence a;
    ASSERT_TRUE(is_ok(parent_.slice(1, 5, &a)));
    BytesSubsequence b;
    b = std::move(a);
    EXPECT_EQ(a, b);
    ASSERT_EQ(a.offset(), 1);
    u8 v = 0;
    ASSERT_TRUE(is_ok(a.get(3, &v)));
    EXPECT_EQ(v, 4);
}
