#include "bytestring/seq/mutable_byte_sequence.hpp"

#include "bytestring/core/endian.hpp"

namespace bytestring::seq {
    using core::StatusCode;

    Status MutableByteSequence::put(i64 index, u8 value) noexcept {
        if (index < 0 || index >= length()) {
            return sequence_status(StatusCode::OutOfRange);
        }
        if (is_read_only()) {
            return sequence_status(StatusCode::ReadOnly);
        }
        store_byte(index, value);
        return core::ok_status();
    }

    template <typename U>
    Status MutableByteSequence::write_value(i64 index, U value) noexcept {
        const Status s = check_span(index, static_cast<i64>(sizeof(U)));
        if (!core::is_ok(s)) {
            return s;
        }
        if (is_read_only()) {
            return sequence_status(StatusCode::ReadOnly);
        }
        u8 scratch[sizeof(U)];
        core::store<U>(scratch, value, order());
        for (std::size_t i = 0; i < sizeof(U); ++i) {
            store_byte(index + static_cast<i64>(i), scratch[i]);
        }
        return core::ok_status();
    }

    Status MutableByteSequence::put_char(i64 index, char16_t value) noexcept {
        return write_value<u16>(index, static_cast<u16>(value));
    }

    Status MutableByteSequence::put_short(i64 index, i16 value) noexcept {
        return write_value<u16>(index, static_cast<u16>(value));
    }

    Status MutableByteSequence::put_int(i64 index, i32 value) noexcept {
        return write_value<u32>(index, static_cast<u32>(value));
    }

    Status MutableByteSequence::put_long(i64 index, i64 value) noexcept {
        return write_value<core::u64>(index, static_cast<core::u64>(value));
    }

    Status MutableByteSequence::put_float(i64 index, float value) noexcept {
        return write_value<u32>(index, core::float_to_bits(value));
    }

    Status MutableByteSequence::put_double(i64 index, double value) noexcept {
        return write_value<core::u64>(index, core::double_to_bits(value));
    }

    Status MutableByteSequence::set_order(ByteOrder order) noexcept {
        if (order != core::kNetworkOrder) {
            return sequence_status(StatusCode::Unsupported);
        }
        return core::ok_status();
    }
} // namespace bytestring::seq
