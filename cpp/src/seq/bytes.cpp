#include "bytestring/seq/bytes.hpp"

#include <cstring>
#include <new>
#include <utility>

#include "bytestring/codec/charset.hpp"
#include "bytestring/codec/hex.hpp"
#include "bytestring/io/byte_buffer.hpp"
#include "bytestring/io/data_input.hpp"
#include "bytestring/io/sink.hpp"
#include "bytestring/seq/bytes_subsequence.hpp"

namespace bytestring::seq {
    using core::StatusCode;

    Bytes::Bytes(std::shared_ptr<const u8[]> store, i64 length) noexcept
        : store_(std::move(store)), len_(length) {}

    const Bytes& Bytes::empty() noexcept {
        static const Bytes kEmpty;
        return kEmpty;
    }

    Status Bytes::allocate_store(i64 length, std::shared_ptr<u8[]>* out) noexcept {
        u8* raw = new (std::nothrow) u8[static_cast<std::size_t>(length)];
        if (raw == nullptr) {
            return sequence_status(StatusCode::OutOfMemory);
        }
        *out = std::shared_ptr<u8[]>(raw);
        return core::ok_status();
    }

    Status Bytes::copy_of(BufferView input, Bytes* out) noexcept {
        return copy_of(input, 0, static_cast<i64>(input.len), out);
    }

    Status Bytes::copy_of(BufferView input, i64 offset, i64 length, Bytes* out) noexcept {
        if (out == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        if (input.data == nullptr && input.len > 0) {
            return sequence_status(StatusCode::Invalid);
        }
        const i64 input_len = static_cast<i64>(input.len);
        if (offset < 0 || offset > input_len) {
            return sequence_status(StatusCode::OutOfRange);
        }
        if (length < 0 || length > input_len - offset) {
            return sequence_status(StatusCode::OutOfRange);
        }
        if (length == 0) {
            *out = empty();
            return core::ok_status();
        }

        std::shared_ptr<u8[]> store;
        const Status s = allocate_store(length, &store);
        if (!core::is_ok(s)) {
            return s;
        }
        std::memcpy(store.get(), input.data + offset, static_cast<std::size_t>(length));
        *out = Bytes(std::move(store), length);
        return core::ok_status();
    }

    Status Bytes::from_buffer(const io::ByteBuffer& buffer, Bytes* out) noexcept {
        const BufferView remaining = buffer.remaining_view();
        return copy_of(remaining, out);
    }

    Status Bytes::of_utf8(std::string_view text, Bytes* out) {
        return of_string(text, codec::kUtf8, out);
    }

    Status Bytes::of_string(std::string_view text, std::string_view charset, Bytes* out) {
        if (out == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        std::string encoded;
        const Status s = codec::charset_encode(text, charset, &encoded);
        if (!core::is_ok(s)) {
            return s;
        }
        return copy_of({reinterpret_cast<const u8*>(encoded.data()), encoded.size()}, out);
    }

    Status Bytes::of_hex_string(std::string_view hex, Bytes* out) noexcept {
        if (out == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        if (hex.size() % 2 != 0) {
            return core::make_status(core::StatusDomain::Codec, StatusCode::Format);
        }
        const i64 length = static_cast<i64>(hex.size() / 2);
        if (length == 0) {
            *out = empty();
            return core::ok_status();
        }

        std::shared_ptr<u8[]> store;
        Status s = allocate_store(length, &store);
        if (!core::is_ok(s)) {
            return s;
        }
        s = codec::hex_decode(hex, {store.get(), static_cast<core::u64>(length)});
        if (!core::is_ok(s)) {
            return s;
        }
        *out = Bytes(std::move(store), length);
        return core::ok_status();
    }

    Status Bytes::join(std::span<const ByteSequence* const> elements, Bytes* out) noexcept {
        if (out == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        i64 total = 0;
        for (const ByteSequence* element : elements) {
            if (element == nullptr) {
                return sequence_status(StatusCode::Invalid);
            }
            total += element->length();
        }
        if (total == 0) {
            *out = empty();
            return core::ok_status();
        }

        std::shared_ptr<u8[]> store;
        Status s = allocate_store(total, &store);
        if (!core::is_ok(s)) {
            return s;
        }
        i64 offset = 0;
        for (const ByteSequence* element : elements) {
            const i64 n = element->length();
            s = element->copy_to({store.get() + offset, static_cast<core::u64>(total - offset)});
            if (!core::is_ok(s)) {
                return s;
            }
            offset += n;
        }
        *out = Bytes(std::move(store), total);
        return core::ok_status();
    }

    Status Bytes::join(std::initializer_list<const ByteSequence*> elements, Bytes* out) noexcept {
        return join(std::span<const ByteSequence* const>(elements.begin(), elements.size()), out);
    }

    Status Bytes::sub_sequence(i64 start, i64 end, std::shared_ptr<const ByteSequence>* out) const noexcept {
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
        auto* view = new (std::nothrow) BytesSubsequence(store_, len_, start, end - start);
        if (view == nullptr) {
            return sequence_status(StatusCode::OutOfMemory);
        }
        *out = std::shared_ptr<const ByteSequence>(view);
        return core::ok_status();
    }

    Status Bytes::to_bytes(Bytes* out) const noexcept {
        if (out == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        *out = *this;
        return core::ok_status();
    }

    bool Bytes::try_view(BufferView* out) const noexcept {
        if (out == nullptr) {
            return false;
        }
        *out = view();
        return true;
    }

    Status Bytes::spliterator(ByteSpliterator* out) const noexcept {
        if (out == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        *out = ByteSpliterator(store_, 0, len_);
        return core::ok_status();
    }

    Status Bytes::slice(i64 start, i64 end, BytesSubsequence* out) const noexcept {
        if (out == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        const Status s = check_slice(start, end, len_);
        if (!core::is_ok(s)) {
            return s;
        }
        if (start == end) {
            *out = BytesSubsequence::empty();
            return core::ok_status();
        }
        *out = BytesSubsequence(store_, len_, start, end - start);
        return core::ok_status();
    }

    Status Bytes::concat(const ByteSequence& suffix, Bytes* out) const noexcept {
        return join({this, &suffix}, out);
    }

    Status Bytes::concat(BufferView suffix, i64 offset, i64 length, Bytes* out) const noexcept {
        if (out == nullptr) {
            return sequence_status(StatusCode::Invalid);
        }
        if (suffix.data == nullptr && suffix.len > 0) {
            return sequence_status(StatusCode::Invalid);
        }
        const i64 suffix_len = static_cast<i64>(suffix.len);
        if (offset < 0 || offset > suffix_len || length < 0 || length > suffix_len - offset) {
            return sequence_status(StatusCode::OutOfRange);
        }
        const i64 total = len_ + length;
        if (total == 0) {
            *out = empty();
            return core::ok_status();
        }

        std::shared_ptr<u8[]> store;
        const Status s = allocate_store(total, &store);
        if (!core::is_ok(s)) {
            return s;
        }
        if (len_ > 0) {
            std::memcpy(store.get(), store_.get(), static_cast<std::size_t>(len_));
        }
        if (length > 0) {
            std::memcpy(store.get() + len_, suffix.data + offset, static_cast<std::size_t>(length));
        }
        *out = Bytes(std::move(store), total);
        return core::ok_status();
    }

    bool Bytes::starts_with(const ByteSequence& prefix) const noexcept {
        const i64 n = prefix.length();
        if (n > len_) {
            return false;
        }
        for (i64 i = 0; i < n; ++i) {
            if (byte_of(prefix, i) != store_[i]) {
                return false;
            }
        }
        return true;
    }

    bool Bytes::ends_with(const ByteSequence& suffix) const noexcept {
        const i64 n = suffix.length();
        if (n > len_) {
            return false;
        }
        for (i64 i = 1; i <= n; ++i) {
            if (byte_of(suffix, n - i) != store_[len_ - i]) {
                return false;
            }
        }
        return true;
    }

    std::vector<u8> Bytes::to_vector() const {
        if (len_ == 0) {
            return {};
        }
        return std::vector<u8>(store_.get(), store_.get() + len_);
    }

    Status Bytes::into_byte_array(BufferMut dst, i64 offset, i64 length) const noexcept {
        if (dst.data == nullptr && dst.len > 0) {
            return sequence_status(StatusCode::Invalid);
        }
        const i64 dst_len = static_cast<i64>(dst.len);
        if (offset < 0 || offset > dst_len || length < 0 || length > dst_len - offset) {
            return sequence_status(StatusCode::OutOfRange);
        }
        if (length > len_) {
            return sequence_status(StatusCode::OutOfRange);
        }
        if (length > 0) {
            std::memcpy(dst.data + offset, store_.get(), static_cast<std::size_t>(length));
        }
        return core::ok_status();
    }

    Status Bytes::into_fd(int fd) const noexcept {
        return io::sink_write_fd(fd, view());
    }

    Status Bytes::into_file(std::FILE* file) const noexcept {
        return io::sink_write_file(file, view());
    }

    io::BytesDataInput Bytes::data_input() const noexcept {
        return io::BytesDataInput(BytesSubsequence(store_, len_, 0, len_));
    }
} // namespace bytestring::seq
