#pragma once

#include <string>

#include "bytestring/core/errors.hpp"
#include "bytestring/core/types.hpp"
#include "bytestring/seq/bytes_subsequence.hpp"

namespace bytestring::io {
    using u8 = bytestring::core::u8;
    using u16 = bytestring::core::u16;
    using i8 = bytestring::core::i8;
    using i16 = bytestring::core::i16;
    using i32 = bytestring::core::i32;
    using i64 = bytestring::core::i64;
    using BufferView = bytestring::core::BufferView;
    using BufferMut = bytestring::core::BufferMut;
    using Status = bytestring::core::Status;

    // Sequential big-endian reader over an immutable sequence.
    //
    // Each fixed-width read advances the cursor by its width, or fails with EndOfData and
    // leaves the cursor where it was. The reader holds a share of the store, so it stays
    // valid after the Bytes it came from is gone. One reader per read session.
    class BytesDataInput {
    public:
        explicit BytesDataInput(seq::BytesSubsequence source) noexcept;

        // Fills all of 'dst'.
        [[nodiscard]] Status read_fully(BufferMut dst) noexcept;
        // Fills dst[offset, offset + length).
        [[nodiscard]] Status read_fully(BufferMut dst, i64 offset, i64 length) noexcept;

        // Advances by min(n, remaining()); Invalid for negative n.
        [[nodiscard]] Status skip_bytes(i64 n, i64* skipped) noexcept;

        [[nodiscard]] Status read_boolean(bool* out) noexcept;
        [[nodiscard]] Status read_byte(i8* out) noexcept;
        [[nodiscard]] Status read_unsigned_byte(u8* out) noexcept;
        [[nodiscard]] Status read_short(i16* out) noexcept;
        [[nodiscard]] Status read_unsigned_short(u16* out) noexcept;
        [[nodiscard]] Status read_char(char16_t* out) noexcept;
        [[nodiscard]] Status read_int(i32* out) noexcept;
        [[nodiscard]] Status read_long(i64* out) noexcept;
        [[nodiscard]] Status read_float(float* out) noexcept;
        [[nodiscard]] Status read_double(double* out) noexcept;

        // Bytes up to "\n", "\r" or "\r\n", terminator consumed but not returned.
        // At end of data returns what was accumulated, possibly nothing.
        [[nodiscard]] Status read_line(std::string* out);

        // Decodes the bytes up to the next NUL byte, or to end of data, as UTF-8. The NUL is
        // consumed. UTF-8 passes through the codec unchanged, so the bytes are not validated.
        [[nodiscard]] Status read_c_string(std::string* out);

        [[nodiscard]] i64 position() const noexcept { return index_; }
        [[nodiscard]] i64 remaining() const noexcept { return source_.length() - index_; }
        void rewind() noexcept { index_ = 0; }

    private:
        // Validates that 'width' bytes remain.
        [[nodiscard]] Status require(i64 width) const noexcept;

        seq::BytesSubsequence source_;
        i64 index_{0};
    };

    [[nodiscard]] inline Status reader_status(core::StatusCode code) noexcept {
        return core::make_status(core::StatusDomain::Reader, code);
    }

} // namespace bytestring::io
