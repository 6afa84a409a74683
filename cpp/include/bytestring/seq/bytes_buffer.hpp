#pragma once

#include <memory>

#include "bytestring/io/byte_buffer.hpp"
#include "bytestring/seq/mutable_byte_sequence.hpp"

namespace bytestring::seq {

    // Mutable sequence over an io::ByteBuffer.
    //
    // The sequence is [0, limit()) of the buffer: every ByteSequence operation uses absolute
    // indices and ignores the cursor. Both byte orders are supported. Slicing yields a new
    // BytesBuffer that shares the storage with its own cursor, so writes through either are
    // visible through both.
    class BytesBuffer final : public MutableByteSequence {
    public:
        BytesBuffer() noexcept = default;
        // No move operations: a moved-from value keeps its store and stays usable.
        BytesBuffer(const BytesBuffer&) noexcept = default;
        BytesBuffer& operator=(const BytesBuffer&) noexcept = default;
        ~BytesBuffer() override = default;

        [[nodiscard]] static Status allocate(i64 capacity, BytesBuffer* out) noexcept;
        [[nodiscard]] static Status wrap(BufferMut data, BytesBuffer* out) noexcept;
        [[nodiscard]] static Status wrap(BufferMut data, i64 offset, i64 length, BytesBuffer* out) noexcept;

        // Adopts a duplicate of 'buffer': same storage, independent cursor.
        [[nodiscard]] static Status wrap(const io::ByteBuffer& buffer, BytesBuffer* out) noexcept;

        [[nodiscard]] static Status map_file(const char* path, const io::MapConfig& cfg, BytesBuffer* out) noexcept;

        [[nodiscard]] i64 length() const noexcept override { return static_cast<i64>(buffer_.limit()); }
        [[nodiscard]] ByteOrder order() const noexcept override { return buffer_.order(); }
        [[nodiscard]] Status set_order(ByteOrder order) noexcept override;
        [[nodiscard]] bool is_read_only() const noexcept override { return buffer_.is_read_only(); }

        [[nodiscard]] Status sub_sequence(i64 start, i64 end,
                                          std::shared_ptr<const ByteSequence>* out) const noexcept override;
        [[nodiscard]] Status slice_range(i64 start, i64 end, BytesBuffer* out) const noexcept;

        // Copies [0, limit).
        [[nodiscard]] Status to_bytes(Bytes* out) const noexcept override;
        [[nodiscard]] bool try_view(BufferView* out) const noexcept override;

        [[nodiscard]] const io::ByteBuffer& buffer() const noexcept { return buffer_; }
        [[nodiscard]] io::ByteBuffer& buffer() noexcept { return buffer_; }

        // Cursor
        [[nodiscard]] i64 capacity() const noexcept { return static_cast<i64>(buffer_.capacity()); }
        [[nodiscard]] i64 position() const noexcept { return static_cast<i64>(buffer_.position()); }
        [[nodiscard]] i64 limit() const noexcept { return static_cast<i64>(buffer_.limit()); }
        [[nodiscard]] i64 remaining() const noexcept { return static_cast<i64>(buffer_.remaining()); }
        [[nodiscard]] bool has_remaining() const noexcept { return buffer_.has_remaining(); }
        [[nodiscard]] Status set_position(i64 position) noexcept;
        [[nodiscard]] Status set_limit(i64 limit) noexcept;
        void mark() noexcept { buffer_.mark(); }
        [[nodiscard]] Status reset() noexcept { return buffer_.reset(); }
        void clear() noexcept { buffer_.clear(); }
        void flip() noexcept { buffer_.flip(); }
        void rewind() noexcept { buffer_.rewind(); }
        [[nodiscard]] Status compact() noexcept { return buffer_.compact(); }

        [[nodiscard]] BytesBuffer duplicate() const noexcept;
        // Shares [position, limit) with a fresh cursor.
        [[nodiscard]] BytesBuffer slice() const noexcept;
        [[nodiscard]] BytesBuffer as_read_only() const noexcept;

        // Relative access at the cursor, in addition to the absolute forms inherited.
        using ByteSequence::get;
        using ByteSequence::get_char;
        using ByteSequence::get_short;
        using ByteSequence::get_int;
        using ByteSequence::get_long;
        using ByteSequence::get_float;
        using ByteSequence::get_double;
        using MutableByteSequence::put;
        using MutableByteSequence::put_char;
        using MutableByteSequence::put_short;
        using MutableByteSequence::put_int;
        using MutableByteSequence::put_long;
        using MutableByteSequence::put_float;
        using MutableByteSequence::put_double;

        [[nodiscard]] Status get(u8* out) noexcept { return buffer_.get(out); }
        [[nodiscard]] Status put(u8 value) noexcept { return buffer_.put(value); }
        [[nodiscard]] Status get(BufferMut dst) noexcept { return buffer_.get(dst); }
        [[nodiscard]] Status put(BufferView src) noexcept { return buffer_.put(src); }
        [[nodiscard]] Status put(BytesBuffer& src) noexcept;

        [[nodiscard]] Status get_char(char16_t* out) noexcept { return buffer_.get_char(out); }
        [[nodiscard]] Status put_char(char16_t value) noexcept { return buffer_.put_char(value); }
        [[nodiscard]] Status get_short(i16* out) noexcept { return buffer_.get_short(out); }
        [[nodiscard]] Status put_short(i16 value) noexcept { return buffer_.put_short(value); }
        [[nodiscard]] Status get_int(i32* out) noexcept { return buffer_.get_int(out); }
        [[nodiscard]] Status put_int(i32 value) noexcept { return buffer_.put_int(value); }
        [[nodiscard]] Status get_long(i64* out) noexcept { return buffer_.get_long(out); }
        [[nodiscard]] Status put_long(i64 value) noexcept { return buffer_.put_long(value); }
        [[nodiscard]] Status get_float(float* out) noexcept { return buffer_.get_float(out); }
        [[nodiscard]] Status put_float(float value) noexcept { return buffer_.put_float(value); }
        [[nodiscard]] Status get_double(double* out) noexcept { return buffer_.get_double(out); }
        [[nodiscard]] Status put_double(double value) noexcept { return buffer_.put_double(value); }

        // Mapped buffers
        [[nodiscard]] bool is_mapped() const noexcept { return buffer_.is_mapped(); }
        [[nodiscard]] bool is_loaded() const noexcept { return buffer_.is_loaded(); }
        [[nodiscard]] Status load() const noexcept { return buffer_.load(); }
        [[nodiscard]] Status force() const noexcept { return buffer_.force(); }

    protected:
        [[nodiscard]] u8 byte_at(i64 index) const noexcept override { return buffer_.view().data[index]; }
        void store_byte(i64 index, u8 value) noexcept override { buffer_.writable_view().data[index] = value; }

    private:
        explicit BytesBuffer(io::ByteBuffer buffer) noexcept;

        io::ByteBuffer buffer_;
    };

} // namespace bytestring::seq
