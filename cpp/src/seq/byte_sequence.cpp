#include "bytestring/seq/byte_sequence.hpp"

#include <cstring>

#include "bytestring/codec/charset.hpp"
#include "bytestring/codec/hex.hpp"
#include "bytestring/core/endian.hpp"
#include "bytestring/seq/bytes.hpp"

namespace bytestring::seq {
    using core::StatusCode;

    bool ByteSequence::try_view(BufferView* out) const noexcept {
        (void)out;
        return false;
    }

    Status ByteSequence::spliterator(ByteSpliterator* out) const noexcept {
        if (out == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        Bytes owned;
        const Status s = to_bytes(&owned);
        if (!core::is_ok(s)) {
            return s;
        }
        return owned.spliterator(out);
    }

    Status ByteSequence::as_string(std::string_view charset, std::string* out) const {
        if (out == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        BufferView view{};
        if (try_view(&view)) {
            return codec::charset_decode(view, charset, out);
        }
        std::string raw(static_cast<std::size_t>(length()), '\0');
        const Status s = copy_to({reinterpret_cast<u8*>(raw.data()), raw.size()});
        if (!core::is_ok(s)) {
            return s;
        }
        return codec::charset_decode({reinterpret_cast<const u8*>(raw.data()), raw.size()}, charset, out);
    }

    Status ByteSequence::as_utf8_string(std::string* out) const {
        return as_string(codec::kUtf8, out);
    }

    Status ByteSequence::check_span(i64 index, i64 width) const noexcept {
        if (index < 0 || index > length() - width) {
            return sequence_status(StatusCode::OutOfRange);
        }
        return core::ok_status();
    }

    template <typename U>
    Status ByteSequence::read_value(i64 index, U* out) const noexcept {
        if (out == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        const Status s = check_span(index, static_cast<i64>(sizeof(U)));
        if (!core::is_ok(s)) {
            return s;
        }
        u8 scratch[sizeof(U)];
        for (std::size_t i = 0; i < sizeof(U); ++i) {
            scratch[i] = byte_at(index + static_cast<i64>(i));
        }
        *out = core::load<U>(scratch, order());
        return core::ok_status();
    }

    Status ByteSequence::get(i64 index, u8* out) const noexcept {
        if (out == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        if (index < 0 || index >= length()) {
            return sequence_status(StatusCode::OutOfRange);
        }
        *out = byte_at(index);
        return core::ok_status();
    }

    Status ByteSequence::get_unsigned_byte(i64 index, u32* out) const noexcept {
        if (out == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        u8 b = 0;
        const Status s = get(index, &b);
        if (!core::is_ok(s)) {
            return s;
        }
        *out = b;
        return core::ok_status();
    }

    Status ByteSequence::get_char(i64 index, char16_t* out) const noexcept {
        if (out == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        u16 v = 0;
        const Status s = read_value<u16>(index, &v);
        if (core::is_ok(s)) {
            *out = static_cast<char16_t>(v);
        }
        return s;
    }

    Status ByteSequence::get_short(i64 index, i16* out) const noexcept {
        if (out == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        u16 v = 0;
        const Status s = read_value<u16>(index, &v);
        if (core::is_ok(s)) {
            *out = static_cast<i16>(v);
        }
        return s;
    }

    Status ByteSequence::get_unsigned_short(i64 index, u16* out) const noexcept {
        return read_value<u16>(index, out);
    }

    Status ByteSequence::get_int(i64 index, i32* out) const noexcept {
        if (out == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        u32 v = 0;
        const Status s = read_value<u32>(index, &v);
        if (core::is_ok(s)) {
            *out = static_cast<i32>(v);
        }
        return s;
    }

    Status ByteSequence::get_long(i64 index, i64* out) const noexcept {
        if (out == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        core::u64 v = 0;
        const Status s = read_value<core::u64>(index, &v);
        if (core::is_ok(s)) {
            *out = static_cast<i64>(v);
        }
        return s;
    }

    Status ByteSequence::get_float(i64 index, float* out) const noexcept {
        if (out == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        u32 bits = 0;
        const Status s = read_value<u32>(index, &bits);
        if (core::is_ok(s)) {
            *out = core::float_from_bits(bits);
        }
        return s;
    }

    Status ByteSequence::get_double(i64 index, double* out) const noexcept {
        if (out == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        core::u64 bits = 0;
        const Status s = read_value<core::u64>(index, &bits);
        if (core::is_ok(s)) {
            *out = core::double_from_bits(bits);
        }
        return s;
    }

    Status ByteSequence::copy_to(BufferMut dst) const noexcept {
        const i64 n = length();
        if (n == 0) {
            return core::ok_status();
        }
        if (dst.data == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        if (dst.len < static_cast<core::u64>(n)) {
            return sequence_status(StatusCode::OutOfRange);
        }
        BufferView view{};
        if (try_view(&view)) {
            std::memcpy(dst.data, view.data, static_cast<std::size_t>(n));
            return core::ok_status();
        }
        for (i64 i = 0; i < n; ++i) {
            dst.data[i] = byte_at(i);
        }
        return core::ok_status();
    }

    i64 ByteSequence::index_of(const ByteSequence& needle, i64 from_index) const noexcept {
        const i64 n = length();
        const i64 m = needle.length();
        if (m == 0) {
            return 0;
        }
        if (from_index < 0) {
            from_index = 0;
        }
        if (from_index > n - m) {
            return core::kNotFound;
        }
        const u8 first = needle.byte_at(0);
        for (i64 i = from_index; i <= n - m; ++i) {
            if (byte_at(i) != first) {
                continue;
            }
            i64 j = 1;
            while (j < m && byte_at(i + j) == needle.byte_at(j)) {
                ++j;
            }
            if (j == m) {
                return i;
            }
        }
        return core::kNotFound;
    }

    i64 ByteSequence::index_of(u8 value, i64 from_index) const noexcept {
        if (from_index < 0) {
            from_index = 0;
        }
        const i64 n = length();
        for (i64 i = from_index; i < n; ++i) {
            if (byte_at(i) == value) {
                return i;
            }
        }
        return core::kNotFound;
    }

    std::string ByteSequence::to_hex_string(bool uppercase) const {
        const i64 n = length();
        std::string out;
        out.reserve(static_cast<std::size_t>(n) * 2);
        for (i64 i = 0; i < n; ++i) {
            codec::hex_append(byte_at(i), uppercase, &out);
        }
        return out;
    }

    int ByteSequence::compare_to(const ByteSequence& other) const noexcept {
        const i64 a_len = length();
        const i64 b_len = other.length();
        const i64 shortest = a_len < b_len ? a_len : b_len;
        for (i64 i = 0; i < shortest; ++i) {
            const int diff = static_cast<int>(byte_at(i)) - static_cast<int>(other.byte_at(i));
            if (diff != 0) {
                return diff;
            }
        }
        if (a_len == b_len) {
            return 0;
        }
        return a_len < b_len ? -1 : 1;
    }

    bool ByteSequence::equals(const ByteSequence& other) const noexcept {
        if (this == &other) {
            return true;
        }
        const i64 n = length();
        if (other.length() != n) {
            return false;
        }
        for (i64 i = 0; i < n; ++i) {
            if (byte_at(i) != other.byte_at(i)) {
                return false;
            }
        }
        return true;
    }

    i32 ByteSequence::hash_code() const noexcept {
        const i64 n = length();
        if (n == 0) {
            return 0;
        }
        u32 h = 1;
        for (i64 i = 0; i < n; ++i) {
            const i32 b = static_cast<core::i8>(byte_at(i));
            h = 31u * h + static_cast<u32>(b);
        }
        return static_cast<i32>(h);
    }
} // namespace bytestring::seq
