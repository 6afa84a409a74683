#include "bytestring/seq/bytes_buffer.hpp"

#include <new>
#include <utility>

#include "bytestring/seq/bytes.hpp"
#include "bytestring/seq/bytes_subsequence.hpp"

namespace bytestring::seq {
    using core::StatusCode;
    using core::u64;

    BytesBuffer::BytesBuffer(io::ByteBuffer buffer) noexcept : buffer_(std::move(buffer)) {}

    Status BytesBuffer::allocate(i64 capacity, BytesBuffer* out) noexcept {
        if (out == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        if (capacity < 0) {
            return sequence_status(StatusCode::OutOfRange);
        }
        io::ByteBuffer b;
        const Status s = io::ByteBuffer::allocate(static_cast<u64>(capacity), &b);
        if (!core::is_ok(s)) {
            return s;
        }
        *out = BytesBuffer(std::move(b));
        return core::ok_status();
    }

    Status BytesBuffer::wrap(BufferMut data, BytesBuffer* out) noexcept {
        return wrap(data, 0, static_cast<i64>(data.len), out);
    }

    Status BytesBuffer::wrap(BufferMut data, i64 offset, i64 length, BytesBuffer* out) noexcept {
        if (out == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        if (offset < 0 || length < 0) {
            return sequence_status(StatusCode::OutOfRange);
        }
        io::ByteBuffer b;
        const Status s = io::ByteBuffer::wrap(data, static_cast<u64>(offset), static_cast<u64>(length), &b);
        if (!core::is_ok(s)) {
            return s;
        }
        *out = BytesBuffer(std::move(b));
        return core::ok_status();
    }

    Status BytesBuffer::wrap(const io::ByteBuffer& buffer, BytesBuffer* out) noexcept {
        if (out == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        *out = BytesBuffer(buffer.duplicate());
        return core::ok_status();
    }

    Status BytesBuffer::map_file(const char* path, const io::MapConfig& cfg, BytesBuffer* out) noexcept {
        if (out == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        io::ByteBuffer b;
        const Status s = io::ByteBuffer::map_file(path, cfg, &b);
        if (!core::is_ok(s)) {
            return s;
        }
        *out = BytesBuffer(std::move(b));
        return core::ok_status();
    }

    Status BytesBuffer::set_order(ByteOrder order) noexcept {
        buffer_.set_order(order);
        return core::ok_status();
    }

    Status BytesBuffer::slice_range(i64 start, i64 end, BytesBuffer* out) const noexcept {
        if (out == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        const Status s = check_slice(start, end, length());
        if (!core::is_ok(s)) {
            return s;
        }
        io::ByteBuffer dup = buffer_.duplicate();
        // end <= limit, so narrowing the limit first keeps position valid.
        Status ds = dup.set_limit(static_cast<u64>(end));
        if (core::is_ok(ds)) {
            ds = dup.set_position(static_cast<u64>(start));
        }
        if (!core::is_ok(ds)) {
            return ds;
        }
        *out = BytesBuffer(dup.slice());
        return core::ok_status();
    }

    Status BytesBuffer::sub_sequence(i64 start, i64 end, std::shared_ptr<const ByteSequence>* out) const noexcept {
        if (out == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        const Status s = check_slice(start, end, length());
        if (!core::is_ok(s)) {
            return s;
        }
        if (start == end) {
            *out = canonical_empty_sequence();
            return core::ok_status();
        }
        BytesBuffer view;
        const Status vs = slice_range(start, end, &view);
        if (!core::is_ok(vs)) {
            return vs;
        }
        auto* holder = new (std::nothrow) BytesBuffer(std::move(view));
        if (holder == nullptr) {
            return sequence_status(StatusCode::OutOfMemory);
        }
        *out = std::shared_ptr<const ByteSequence>(holder);
        return core::ok_status();
    }

    Status BytesBuffer::to_bytes(Bytes* out) const noexcept {
        return Bytes::copy_of(buffer_.view(), out);
    }

    bool BytesBuffer::try_view(BufferView* out) const noexcept {
        if (out == nullptr) {
            return false;
        }
        *out = buffer_.view();
        return true;
    }

    Status BytesBuffer::set_position(i64 position) noexcept {
        if (position < 0) {
            return sequence_status(StatusCode::OutOfRange);
        }
        return buffer_.set_position(static_cast<u64>(position));
    }

    Status BytesBuffer::set_limit(i64 limit) noexcept {
        if (limit < 0) {
            return sequence_status(StatusCode::OutOfRange);
        }
        return buffer_.set_limit(static_cast<u64>(limit));
    }

    BytesBuffer BytesBuffer::duplicate() const noexcept {
        return BytesBuffer(buffer_.duplicate());
    }

    BytesBuffer BytesBuffer::slice() const noexcept {
        return BytesBuffer(buffer_.slice());
    }

    BytesBuffer BytesBuffer::as_read_only() const noexcept {
        if (is_read_only()) {
            return *this;
        }
        return BytesBuffer(buffer_.as_read_only());
    }

    Status BytesBuffer::put(BytesBuffer& src) noexcept {
        if (&src == this) {
            return sequence_status(StatusCode::Invalid);
        }
        return buffer_.put(src.buffer_);
    }
} // namespace bytestring::seq
