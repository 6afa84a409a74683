#pragma once

#include <compare>
#include <memory>
#include <string>
#include <string_view>

#include "bytestring/core/errors.hpp"
#include "bytestring/core/types.hpp"
#include "bytestring/seq/spliterator.hpp"

namespace bytestring::seq {
    using u8 = bytestring::core::u8;
    using u16 = bytestring::core::u16;
    using u32 = bytestring::core::u32;
    using i16 = bytestring::core::i16;
    using i32 = bytestring::core::i32;
    using i64 = bytestring::core::i64;
    using ByteOrder = bytestring::core::ByteOrder;
    using BufferView = bytestring::core::BufferView;
    using BufferMut = bytestring::core::BufferMut;
    using Status = bytestring::core::Status;

    class Bytes;

    // Read-only capability shared by every byte sequence representation.
    //
    // Concrete types supply length() and the unchecked byte_at() primitive; indexing,
    // multi-byte decoding, search, equality, ordering and hashing are defined once here
    // so that every representation agrees on them. Equality, ordering and hash_code()
    // depend only on the bytes, never on the representation.
    class ByteSequence {
    public:
        virtual ~ByteSequence() = default;

        [[nodiscard]] virtual i64 length() const noexcept = 0;

        // Byte order used by the multi-byte getters. Fixed at network order unless a
        // mutable representation opts into little-endian.
        [[nodiscard]] virtual ByteOrder order() const noexcept { return core::kNetworkOrder; }

        // View of [start, end). start == end yields a canonical empty instance.
        [[nodiscard]] virtual Status sub_sequence(i64 start, i64 end,
                                                  std::shared_ptr<const ByteSequence>* out) const noexcept = 0;

        // Owned immutable copy of the content (identity for Bytes).
        [[nodiscard]] virtual Status to_bytes(Bytes* out) const noexcept = 0;

        // Exposes the bytes as one contiguous read-only span when the representation has one.
        [[nodiscard]] virtual bool try_view(BufferView* out) const noexcept;

        [[nodiscard]] virtual Status spliterator(ByteSpliterator* out) const noexcept;

        // Decodes the content from 'charset' into UTF-8.
        [[nodiscard]] Status as_string(std::string_view charset, std::string* out) const;
        [[nodiscard]] Status as_utf8_string(std::string* out) const;

        [[nodiscard]] bool is_empty() const noexcept { return length() == 0; }

        [[nodiscard]] Status get(i64 index, u8* out) const noexcept;
        [[nodiscard]] Status get_unsigned_byte(i64 index, u32* out) const noexcept;
        [[nodiscard]] Status get_char(i64 index, char16_t* out) const noexcept;
        [[nodiscard]] Status get_short(i64 index, i16* out) const noexcept;
        [[nodiscard]] Status get_unsigned_short(i64 index, u16* out) const noexcept;
        [[nodiscard]] Status get_int(i64 index, i32* out) const noexcept;
        [[nodiscard]] Status get_long(i64 index, i64* out) const noexcept;
        [[nodiscard]] Status get_float(i64 index, float* out) const noexcept;
        [[nodiscard]] Status get_double(i64 index, double* out) const noexcept;

        // Copies all length() bytes to the front of 'dst'.
        [[nodiscard]] Status copy_to(BufferMut dst) const noexcept;

        // First index >= from_index where 'needle' occurs, or core::kNotFound.
        // A negative from_index is treated as 0; an empty needle matches at 0.
        [[nodiscard]] i64 index_of(const ByteSequence& needle, i64 from_index = 0) const noexcept;
        [[nodiscard]] i64 index_of(u8 value, i64 from_index = 0) const noexcept;

        [[nodiscard]] bool contains(const ByteSequence& needle, i64 from_index = 0) const noexcept {
            return index_of(needle, from_index) != core::kNotFound;
        }
        [[nodiscard]] bool contains(u8 value) const noexcept {
            return index_of(value) != core::kNotFound;
        }

        // Exactly 2 * length() hex digits, no separators.
        [[nodiscard]] std::string to_hex_string(bool uppercase = false) const;

        // Unsigned bytewise comparison; on a common prefix the shorter sequence sorts first.
        [[nodiscard]] int compare_to(const ByteSequence& other) const noexcept;
        [[nodiscard]] bool equals(const ByteSequence& other) const noexcept;

        // h = 31 * h + (signed) byte over all bytes starting from h = 1, wrapping mod 2^32;
        // 0 for the empty sequence.
        [[nodiscard]] i32 hash_code() const noexcept;

        friend bool operator==(const ByteSequence& a, const ByteSequence& b) noexcept {
            return a.equals(b);
        }

        friend std::strong_ordering operator<=>(const ByteSequence& a, const ByteSequence& b) noexcept {
            return a.compare_to(b) <=> 0;
        }

    protected:
        ByteSequence() noexcept = default;
        ByteSequence(const ByteSequence&) noexcept = default;
        ByteSequence(ByteSequence&&) noexcept = default;
        ByteSequence& operator=(const ByteSequence&) noexcept = default;
        ByteSequence& operator=(ByteSequence&&) noexcept = default;

        // Caller guarantees 0 <= index < length().
        [[nodiscard]] virtual u8 byte_at(i64 index) const noexcept = 0;

        [[nodiscard]] static u8 byte_of(const ByteSequence& s, i64 index) noexcept { return s.byte_at(index); }

        // Validates [index, index + width) against length().
        [[nodiscard]] Status check_span(i64 index, i64 width) const noexcept;

        template <typename U>
        [[nodiscard]] Status read_value(i64 index, U* out) const noexcept;
    };

    [[nodiscard]] inline Status sequence_status(core::StatusCode code) noexcept {
        return core::make_status(core::StatusDomain::Sequence, code);
    }

    // Shared range check for [start, end) slices of a sequence of 'length' bytes.
    [[nodiscard]] inline Status check_slice(i64 start, i64 end, i64 length) noexcept {
        if (start < 0 || end < start || end > length) {
            return sequence_status(core::StatusCode::OutOfRange);
        }
        return core::ok_status();
    }

} // namespace bytestring::seq
