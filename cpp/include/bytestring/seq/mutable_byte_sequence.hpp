#pragma once

#include "bytestring/seq/byte_sequence.hpp"

namespace bytestring::seq {

    // Fixed-length sequence that also accepts in-place writes. There is no insert or append.
    // Not synchronised: the holder of a mutable sequence owns write exclusivity.
    class MutableByteSequence : public ByteSequence {
    public:
        ~MutableByteSequence() override = default;

        [[nodiscard]] Status put(i64 index, u8 value) noexcept;

        // Multi-byte writers, decomposed into single-byte writes under order().
        [[nodiscard]] Status put_char(i64 index, char16_t value) noexcept;
        [[nodiscard]] Status put_short(i64 index, i16 value) noexcept;
        [[nodiscard]] Status put_int(i64 index, i32 value) noexcept;
        [[nodiscard]] Status put_long(i64 index, i64 value) noexcept;
        [[nodiscard]] Status put_float(i64 index, float value) noexcept;
        [[nodiscard]] Status put_double(i64 index, double value) noexcept;

        // Only network order is accepted unless an implementation supports both.
        [[nodiscard]] virtual Status set_order(ByteOrder order) noexcept;

        [[nodiscard]] virtual bool is_read_only() const noexcept { return false; }

    protected:
        MutableByteSequence() noexcept = default;
        MutableByteSequence(const MutableByteSequence&) noexcept = default;
        MutableByteSequence(MutableByteSequence&&) noexcept = default;
        MutableByteSequence& operator=(const MutableByteSequence&) noexcept = default;
        MutableByteSequence& operator=(MutableByteSequence&&) noexcept = default;

        // Caller guarantees 0 <= index < length() and !is_read_only().
        virtual void store_byte(i64 index, u8 value) noexcept = 0;

    private:
        template <typename U>
        [[nodiscard]] Status write_value(i64 index, U value) noexcept;
    };

} // namespace bytestring::seq
