#include "bytestring/seq/byte_array.hpp"

#include <cstring>
#include <new>
#include <utility>

#include "bytestring/seq/bytes.hpp"
#include "bytestring/seq/bytes_subsequence.hpp"

namespace bytestring::seq {
    using core::StatusCode;

    Status ByteArray::wrap(BufferMut data, ByteArray* out) noexcept {
        if (out == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        if (data.data == nullptr && data.len > 0) {
            return sequence_status(StatusCode::Invalid);
        }
        ByteArray a;
        a.data_ = data.data;
        a.len_ = static_cast<i64>(data.len);
        *out = std::move(a);
        return core::ok_status();
    }

    Status ByteArray::allocate(i64 length, ByteArray* out) noexcept {
        if (out == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        if (length < 0) {
            return sequence_status(StatusCode::OutOfRange);
        }
        ByteArray a;
        if (length > 0) {
            u8* raw = new (std::nothrow) u8[static_cast<std::size_t>(length)]();
            if (raw == nullptr) {
                return sequence_status(StatusCode::OutOfMemory);
            }
            a.owned_ = std::shared_ptr<u8[]>(raw);
            a.data_ = raw;
            a.len_ = length;
        }
        *out = std::move(a);
        return core::ok_status();
    }

    Status ByteArray::copy_range(i64 start, i64 end, ByteArray* out) const noexcept {
        if (out == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        Status s = check_slice(start, end, len_);
        if (!core::is_ok(s)) {
            return s;
        }
        ByteArray copy;
        s = allocate(end - start, &copy);
        if (!core::is_ok(s)) {
            return s;
        }
        if (end > start) {
            std::memcpy(copy.data_, data_ + start, static_cast<std::size_t>(end - start));
        }
        *out = std::move(copy);
        return core::ok_status();
    }

    Status ByteArray::sub_sequence(i64 start, i64 end, std::shared_ptr<const ByteSequence>* out) const noexcept {
        if (out == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        const Status s = check_slice(start, end, len_);
        if (!core::is_ok(s)) {
            return s;
        }
        if (start == end) {
            *out = canonical_empty_sequence();
            return core::ok_status();
        }
        ByteArray copy;
        const Status cs = copy_range(start, end, &copy);
        if (!core::is_ok(cs)) {
            return cs;
        }
        auto* holder = new (std::nothrow) ByteArray(std::move(copy));
        if (holder == nullptr) {
            return sequence_status(StatusCode::OutOfMemory);
        }
        *out = std::shared_ptr<const ByteSequence>(holder);
        return core::ok_status();
    }

    Status ByteArray::to_bytes(Bytes* out) const noexcept {
        return Bytes::copy_of(view(), out);
    }

    bool ByteArray::try_view(BufferView* out) const noexcept {
        if (out == nullptr) {
            return false;
        }
        *out = view();
        return true;
    }
} // namespace bytestring::seq
