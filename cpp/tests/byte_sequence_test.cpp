#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "bytestring/seq/byte_array.hpp"
#include "bytestring/seq/bytes.hpp"
#include "bytestring/seq/bytes_buffer.hpp"
#include "bytestring/seq/bytes_subsequence.hpp"

using namespace bytestring::core;
using namespace bytestring::seq;

namespace {
    // The same content in each of the four concrete representations.
    struct Representations {
        Bytes bytes;
        BytesSubsequence sub;
        ByteArray array;
        BytesBuffer buffer;

        std::vector<const ByteSequence*> all() const { return {&bytes, &sub, &array, &buffer}; }
    };

    Representations make_all(const std::vector<u8>& content) {
        Representations r;
        const u64 n = content.size();

        EXPECT_TRUE(is_ok(Bytes::copy_of({content.data(), n}, &r.bytes)));

        // The subsequence sits inside a padded store so offsets are exercised.
        std::vector<u8> padded;
        padded.push_back(0xaa);
        padded.insert(padded.end(), content.begin(), content.end());
        padded.push_back(0xbb);
        Bytes parent;
        EXPECT_TRUE(is_ok(Bytes::copy_of({padded.data(), padded.size()}, &parent)));
        EXPECT_TRUE(is_ok(parent.slice(1, 1 + static_cast<i64>(n), &r.sub)));

        EXPECT_TRUE(is_ok(ByteArray::allocate(static_cast<i64>(n), &r.array)));
        if (n > 0) {
            std::memcpy(r.array.data().data, content.data(), n);
        }

        EXPECT_TRUE(is_ok(BytesBuffer::allocate(static_cast<i64>(n), &r.buffer)));
        EXPECT_TRUE(is_ok(r.buffer.put(BufferView{content.data(), n})));
        r.buffer.rewind();
        return r;
    }

    Bytes bytes_of(std::initializer_list<u8> values) {
        std::vector<u8> v(values);
        Bytes b;
        EXPECT_TRUE(is_ok(Bytes::copy_of({v.data(), v.size()}, &b)));
        return b;
    }
} // namespace

TEST(ByteSequence, EqualAcrossRepresentations) {
    const Representations r = make_all({0x00, 0x7f, 0x80, 0xff, 0x10});
    for (const ByteSequence* a : r.all()) {
        for (const ByteSequence* b : r.all()) {
            EXPECT_TRUE(a->equals(*b));
            EXPECT_EQ(*a, *b);
            EXPECT_EQ(a->compare_to(*b), 0);
            EXPECT_EQ(a->hash_code(), b->hash_code());
        }
    }
}

TEST(ByteSequence, DifferentContentIsNotEqual) {
    const Bytes a = bytes_of({1, 2, 3});
    const Bytes b = bytes_of({1, 2, 4});
    const Bytes c = bytes_of({1, 2});
    EXPECT_NE(a, b);
    EXPECT_NE(a, c);
}

TEST(ByteSequence, HashFormula) {
    const Representations r = make_all({0x01, 0x02});
    for (const ByteSequence* s : r.all()) {
        EXPECT_EQ(s->hash_code(), 31 * (31 * 1 + 1) + 2);
    }
}

TEST(ByteSequence, HashOfEmptyIsZero) {
    const Representations r = make_all({});
    for (const ByteSequence* s : r.all()) {
        EXPECT_EQ(s->hash_code(), 0);
    }
}

TEST(ByteSequence, HashFoldsSignedBytes) {
    EXPECT_EQ(bytes_of({0xff}).hash_code(), 31 - 1);
    EXPECT_EQ(bytes_of({0x80, 0x01}).hash_code(), 31 * (31 - 128) + 1);
}

TEST(ByteSequence, OrderingIsUnsigned) {
    EXPECT_GT(bytes_of({0xff}).compare_to(bytes_of({0x7f})), 0);
    EXPECT_LT(bytes_of({0x7f}).compare_to(bytes_of({0xff})), 0);
    EXPECT_TRUE(bytes_of({0x7f}) < bytes_of({0xff}));
}

TEST(ByteSequence, ShorterPrefixSortsFirst) {
    EXPECT_LT(bytes_of({0x01}).compare_to(bytes_of({0x01, 0x00})), 0);
    EXPECT_GT(bytes_of({0x01, 0x00}).compare_to(bytes_of({0x01})), 0);
    EXPECT_LT(Bytes::empty().compare_to(bytes_of({0x00})), 0);
}

TEST(ByteSequence, GetOutOfRangeForEveryRepresentation) {
    const Representations r = make_all({1, 2, 3});
    for (const ByteSequence* s : r.all()) {
        u8 v = 0;
        EXPECT_EQ(s->get(-1, &v).code, StatusCode::OutOfRange);
        EXPECT_EQ(s->get(s->length(), &v).code, StatusCode::OutOfRange);
        ASSERT_TRUE(is_ok(s->get(2, &v)));
        EXPECT_EQ(v, 3);
    }
}

TEST(ByteSequence, NullOutputIsInvalid) {
    const Bytes b = bytes_of({1});
    EXPECT_EQ(b.get(0, nullptr).code, StatusCode::Invalid);
    EXPECT_EQ(b.get_int(0, nullptr).code, StatusCode::Invalid);
}

TEST(ByteSequence, MultiByteGettersAreBigEndian) {
    const Representations r = make_all({0x00, 0x00, 0x00, 0x05, 0xff, 0xfe, 0x41, 0x00});
    for (const ByteSequence* s : r.all()) {
        i32 i = 0;
        ASSERT_TRUE(is_ok(s->get_int(0, &i)));
        EXPECT_EQ(i, 5);

        i16 sh = 0;
        ASSERT_TRUE(is_ok(s->get_short(4, &sh)));
        EXPECT_EQ(sh, -2);

        u16 ush = 0;
        ASSERT_TRUE(is_ok(s->get_unsigned_short(4, &ush)));
        EXPECT_EQ(ush, 0xfffe);

        u32 ub = 0;
        ASSERT_TRUE(is_ok(s->get_unsigned_byte(4, &ub)));
        EXPECT_EQ(ub, 255u);

        char16_t ch = 0;
        ASSERT_TRUE(is_ok(s->get_char(6, &ch)));
        EXPECT_EQ(ch, u'\u4100');

        i64 l = 0;
        ASSERT_TRUE(is_ok(s->get_long(0, &l)));
        EXPECT_EQ(l, 0x00000005fffe4100ll);
    }
}

TEST(ByteSequence, MultiByteGettersRejectShortTail) {
    const Representations r = make_all({0x00, 0x00, 0x00, 0x05});
    for (const ByteSequence* s : r.all()) {
        i32 i = 0;
        EXPECT_EQ(s->get_int(1, &i).code, StatusCode::OutOfRange);
        EXPECT_EQ(s->get_int(-1, &i).code, StatusCode::OutOfRange);
        i64 l = 0;
        EXPECT_EQ(s->get_long(0, &l).code, StatusCode::OutOfRange);
        i16 sh = 0;
        EXPECT_EQ(s->get_short(3, &sh).code, StatusCode::OutOfRange);
    }
}

TEST(ByteSequence, FloatingPointReinterpretsBits) {
    const Bytes f = bytes_of({0x3f, 0x80, 0x00, 0x00});
    float fv = 0.0f;
    ASSERT_TRUE(is_ok(f.get_float(0, &fv)));
    EXPECT_EQ(fv, 1.0f);

    const Bytes d = bytes_of({0xc0, 0x00, 0, 0, 0, 0, 0, 0});
    double dv = 0.0;
    ASSERT_TRUE(is_ok(d.get_double(0, &dv)));
    EXPECT_EQ(dv, -2.0);
}

TEST(ByteSequence, IndexOfBoundaries) {
    const Representations hay = make_all({1, 2, 3, 1, 2, 3});
    const Bytes needle = bytes_of({2, 3});
    const Bytes longer = bytes_of({3, 1, 2, 3});

    for (const ByteSequence* s : hay.all()) {
        EXPECT_EQ(s->index_of(Bytes::empty()), 0);
        EXPECT_EQ(s->index_of(Bytes::empty(), 4), 0);
        EXPECT_EQ(s->index_of(needle), 1);
        EXPECT_EQ(s->index_of(needle, 2), 4);
        EXPECT_EQ(s->index_of(needle, -7), 1);
        EXPECT_EQ(s->index_of(needle, 5), kNotFound);
        EXPECT_EQ(s->index_of(longer, 3), kNotFound);
        EXPECT_EQ(s->index_of(longer), 2);
        EXPECT_TRUE(s->contains(needle));
        EXPECT_FALSE(s->contains(bytes_of({3, 3})));
    }
}

TEST(ByteSequence, IndexOfSingleByte) {
    const Bytes b = bytes_of({9, 8, 7, 8});
    EXPECT_EQ(b.index_of(static_cast<u8>(8)), 1);
    EXPECT_EQ(b.index_of(static_cast<u8>(8), 2), 3);
    EXPECT_EQ(b.index_of(static_cast<u8>(8), -1), 1);
    EXPECT_EQ(b.index_of(static_cast<u8>(1)), kNotFound);
    EXPECT_TRUE(b.contains(static_cast<u8>(7)));
    EXPECT_FALSE(b.contains(static_cast<u8>(6)));
}

TEST(ByteSequence, IndexOfAcrossRepresentations) {
    const Representations needle = make_all({0x7f, 0x80});
    const Bytes hay = bytes_of({0x00, 0x7f, 0x80, 0xff});
    for (const ByteSequence* n : needle.all()) {
        EXPECT_EQ(hay.index_of(*n), 1);
    }
}

TEST(ByteSequence, HexRoundTrip) {
    const Representations r = make_all({0x00, 0x0f, 0xa0, 0xff});
    for (const ByteSequence* s : r.all()) {
        const std::string lower = s->to_hex_string();
        EXPECT_EQ(lower, "000fa0ff");
        EXPECT_EQ(s->to_hex_string(true), "000FA0FF");

        Bytes back;
        ASSERT_TRUE(is_ok(Bytes::of_hex_string(lower, &back)));
        EXPECT_EQ(back, *s);
    }
    EXPECT_EQ(Bytes::empty().to_hex_string(), "");
}

TEST(ByteSequence, FullSubSequenceEqualsSource) {
    const Representations r = make_all({4, 5, 6});
    for (const ByteSequence* s : r.all()) {
        std::shared_ptr<const ByteSequence> whole;
        ASSERT_TRUE(is_ok(s->sub_sequence(0, s->length(), &whole)));
        ASSERT_NE(whole, nullptr);
        EXPECT_EQ(*whole, *s);

        std::shared_ptr<const ByteSequence> mid;
        ASSERT_TRUE(is_ok(s->sub_sequence(1, 2, &mid)));
        EXPECT_EQ(*mid, bytes_of({5}));
    }
}

TEST(ByteSequence, EmptySubSequenceIsCanonical) {
    const Representations r = make_all({4, 5, 6});
    for (const ByteSequence* s : r.all()) {
        std::shared_ptr<const ByteSequence> e;
        ASSERT_TRUE(is_ok(s->sub_sequence(2, 2, &e)));
        EXPECT_EQ(e.get(), &BytesSubsequence::empty());
        EXPECT_TRUE(e->is_empty());
    }
}

TEST(ByteSequence, SubSequenceRejectsBadRanges) {
    const Representations r = make_all({4, 5, 6});
    for (const ByteSequence* s : r.all()) {
        std::shared_ptr<const ByteSequence> out;
        EXPECT_EQ(s->sub_sequence(-1, 2, &out).code, StatusCode::OutOfRange);
        EXPECT_EQ(s->sub_sequence(2, 1, &out).code, StatusCode::OutOfRange);
        EXPECT_EQ(s->sub_sequence(0, 4, &out).code, StatusCode::OutOfRange);
        EXPECT_EQ(out, nullptr);
    }
}

TEST(ByteSequence, ToBytesEqualsSource) {
    const Representations r = make_all({1, 2, 3, 4});
    for (const ByteSequence* s : r.all()) {
        Bytes owned;
        ASSERT_TRUE(is_ok(s->to_bytes(&owned)));
        EXPECT_EQ(owned, *s);
    }
}

TEST(ByteSequence, AsUtf8String) {
    Bytes b;
    ASSERT_TRUE(is_ok(Bytes::of_utf8("h\xc3\xa9llo", &b)));
    EXPECT_EQ(b.length(), 6);

    std::string s;
    ASSERT_TRUE(is_ok(b.as_utf8_string(&s)));
    EXPECT_EQ(s, "h\xc3\xa9llo");
}

TEST(ByteSequence, CopyToRequiresRoom) {
    const Bytes b = bytes_of({1, 2, 3});
    u8 small[2]{};
    EXPECT_EQ(b.copy_to({small, sizeof(small)}).code, StatusCode::OutOfRange);

    u8 room[4]{};
    ASSERT_TRUE(is_ok(b.copy_to({room, sizeof(room)})));
    EXPECT_EQ(room[0], 1);
    EXPECT_EQ(room[2], 3);
    EXPECT_EQ(room[3], 0);
}

TEST(ByteSequence, SpliteratorCoversContent) {
    const Representations r = make_all({10, 20, 30});
    for (const ByteSequence* s : r.all()) {
        ByteSpliterator it;
        ASSERT_TRUE(is_ok(s->spliterator(&it)));
        EXPECT_EQ(it.estimate_size(), 3);
        u32 sum = 0;
        it.for_each_remaining([&](u32 v) { sum += v; });
        EXPECT_EQ(sum, 60u);
    }
}
