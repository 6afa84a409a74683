#include "bytestring/seq/bytes_subsequence.hpp"

#include <cstring>
#include <new>
#include <utility>

#include "bytestring/io/data_input.hpp"
#include "bytestring/io/sink.hpp"
#include "bytestring/seq/bytes.hpp"

namespace bytestring::seq {
    using core::StatusCode;

    BytesSubsequence::BytesSubsequence(std::shared_ptr<const u8[]> store, i64 store_len, i64 offset, i64 length) noexcept
        : store_(std::move(store)), store_len_(store_len), offset_(offset), len_(length) {}

    const BytesSubsequence& BytesSubsequence::empty() noexcept {
        static const BytesSubsequence kEmpty;
        return kEmpty;
    }

    std::shared_ptr<const ByteSequence> canonical_empty_sequence() noexcept {
        return std::shared_ptr<const ByteSequence>(std::shared_ptr<const ByteSequence>(), &BytesSubsequence::empty());
    }

    Status BytesSubsequence::sub_sequence(i64 start, i64 end,
                                          std::shared_ptr<const ByteSequence>* out) const noexcept {
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
        auto* view = new (std::nothrow) BytesSubsequence(store_, store_len_, offset_ + start, end - start);
        if (view == nullptr) {
            return sequence_status(StatusCode::OutOfMemory);
        }
        *out = std::shared_ptr<const ByteSequence>(view);
        return core::ok_status();
    }

    Status BytesSubsequence::slice(i64 start, i64 end, BytesSubsequence* out) const noexcept {
        if (out == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        const Status s = check_slice(start, end, len_);
        if (!core::is_ok(s)) {
            return s;
        }
        if (start == end) {
            *out = empty();
            return core::ok_status();
        }
        *out = BytesSubsequence(store_, store_len_, offset_ + start, end - start);
        return core::ok_status();
    }

    Status BytesSubsequence::to_bytes(Bytes* out) const noexcept {
        if (out == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        if (len_ == 0) {
            *out = Bytes::empty();
            return core::ok_status();
        }
        if (offset_ == 0 && len_ == store_len_) {
            // The store is immutable, so the owned value may adopt it as is.
            *out = Bytes(store_, len_);
            return core::ok_status();
        }
        return Bytes::copy_of(view(), out);
    }

    bool BytesSubsequence::try_view(BufferView* out) const noexcept {
        if (out == nullptr) {
            return false;
        }
        *out = view();
        return true;
    }

    Status BytesSubsequence::spliterator(ByteSpliterator* out) const noexcept {
        if (out == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        *out = ByteSpliterator(store_, offset_, offset_ + len_);
        return core::ok_status();
    }

    bool BytesSubsequence::ends_with(const ByteSequence& suffix) const noexcept {
        const i64 n = suffix.length();
        if (n > len_) {
            return false;
        }
        for (i64 i = 1; i <= n; ++i) {
            if (byte_of(suffix, n - i) != byte_at(len_ - i)) {
                return false;
            }
        }
        return true;
    }

    BufferView BytesSubsequence::view() const noexcept {
        if (len_ == 0) {
            return BufferView{};
        }
        return BufferView{store_.get() + offset_, static_cast<core::u64>(len_)};
    }

    std::vector<u8> BytesSubsequence::to_vector() const {
        const BufferView v = view();
        if (v.len == 0) {
            return {};
        }
        return std::vector<u8>(v.data, v.data + v.len);
    }

    Status BytesSubsequence::into_byte_array(BufferMut dst, i64 offset, i64 length) const noexcept {
        if (dst.data == nullptr && dst.len > 0) {
            return sequence_status(StatusCode::Invalid);
        }
        const i64 dst_len = static_cast<i64>(dst.len);
        if (offset < 0 || offset > dst_len || length < 0 || length > dst_len - offset || length > len_) {
            return sequence_status(StatusCode::OutOfRange);
        }
        if (length > 0) {
            std::memcpy(dst.data + offset, store_.get() + offset_, static_cast<std::size_t>(length));
        }
        return core::ok_status();
    }

    Status BytesSubsequence::into_fd(int fd) const noexcept {
        return io::sink_write_fd(fd, view());
    }

    Status BytesSubsequence::into_file(std::FILE* file) const noexcept {
        return io::sink_write_file(file, view());
    }

    io::BytesDataInput BytesSubsequence::data_input() const noexcept {
        return io::BytesDataInput(*this);
    }
} // namespace bytestring::seq
