#include "bytestring/io/byte_buffer.hpp"

#include <cerrno>
#include <cstring>
#include <memory>
#include <new>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include "bytestring/core/endian.hpp"

namespace bytestring::io {
    using core::StatusCode;
    using core::u16;
    using core::u32;

    namespace {
        u64 page_size() noexcept {
            const long ps = ::sysconf(_SC_PAGESIZE);
            return ps > 0 ? static_cast<u64>(ps) : 4096u;
        }

        Status errno_status() noexcept {
            return core::make_status(core::StatusDomain::Io, StatusCode::Io, static_cast<u32>(errno));
        }

        // Closes the descriptor on every exit path of map_file.
        class FdGuard {
        public:
            explicit FdGuard(int fd) noexcept : fd_(fd) {}
            ~FdGuard() {
                if (fd_ >= 0) {
                    ::close(fd_);
                }
            }
            FdGuard(const FdGuard&) = delete;
            FdGuard& operator=(const FdGuard&) = delete;

            [[nodiscard]] int get() const noexcept { return fd_; }

        private:
            int fd_;
        };
    } // namespace

    // ========================================================================
    // Creation
    // ========================================================================

    Status ByteBuffer::allocate(u64 capacity, ByteBuffer* out) noexcept {
        if (out == nullptr) {
            return buffer_status(StatusCode::Invalid);
        }
        ByteBuffer b;
        if (capacity > 0) {
            u8* raw = new (std::nothrow) u8[capacity]();
            if (raw == nullptr) {
                return buffer_status(StatusCode::OutOfMemory);
            }
            b.holder_ = std::shared_ptr<void>(raw, std::default_delete<u8[]>());
            b.base_ = raw;
        }
        b.capacity_ = capacity;
        b.limit_ = capacity;
        *out = b;
        return core::ok_status();
    }

    Status ByteBuffer::wrap(BufferMut data, ByteBuffer* out) noexcept {
        return wrap(data, 0, data.len, out);
    }

    Status ByteBuffer::wrap(BufferMut data, u64 offset, u64 length, ByteBuffer* out) noexcept {
        if (out == nullptr || (data.data == nullptr && data.len > 0)) {
            return buffer_status(StatusCode::Invalid);
        }
        if (offset > data.len || length > data.len - offset) {
            return buffer_status(StatusCode::OutOfRange);
        }
        ByteBuffer b;
        b.base_ = data.data;
        b.capacity_ = data.len;
        b.position_ = offset;
        b.limit_ = offset + length;
        *out = b;
        return core::ok_status();
    }

    Status ByteBuffer::map_file(const char* path, const MapConfig& cfg, ByteBuffer* out) noexcept {
        if (path == nullptr || out == nullptr) {
            return buffer_status(StatusCode::Invalid);
        }

        const int flags = cfg.mode == MapMode::ReadWrite ? O_RDWR : O_RDONLY;
        FdGuard fd(::open(path, flags | O_CLOEXEC));
        if (fd.get() < 0) {
            return errno_status();
        }

        struct stat st{};
        if (::fstat(fd.get(), &st) != 0) {
            return errno_status();
        }
        const u64 file_size = static_cast<u64>(st.st_size);
        if (cfg.offset > file_size) {
            return buffer_status(StatusCode::OutOfRange);
        }
        u64 length = cfg.length;
        if (length == 0) {
            length = file_size - cfg.offset;
        } else if (length > file_size - cfg.offset) {
            return buffer_status(StatusCode::OutOfRange);
        }

        ByteBuffer b;
        b.mapped_ = true;
        b.read_only_ = cfg.mode == MapMode::ReadOnly;
        b.map_shared_writable_ = cfg.mode == MapMode::ReadWrite;
        if (length == 0) {
            // mmap rejects empty regions; an empty mapped buffer has nothing to sync or load.
            *out = b;
            return core::ok_status();
        }

        const u64 ps = page_size();
        const u64 aligned_offset = cfg.offset - (cfg.offset % ps);
        const u64 lead = cfg.offset - aligned_offset;
        const u64 map_len = lead + length;

        int prot = PROT_READ;
        if (cfg.mode != MapMode::ReadOnly) {
            prot |= PROT_WRITE;
        }
        int mflags = cfg.mode == MapMode::Private ? MAP_PRIVATE : MAP_SHARED;
#ifdef MAP_POPULATE
        if (cfg.populate) {
            mflags |= MAP_POPULATE;
        }
#endif

        void* addr = ::mmap(nullptr, static_cast<std::size_t>(map_len), prot, mflags, fd.get(),
                            static_cast<off_t>(aligned_offset));
        if (addr == MAP_FAILED) {
            return errno_status();
        }

        b.holder_ = std::shared_ptr<void>(addr, [map_len](void* p) {
            ::munmap(p, static_cast<std::size_t>(map_len));
        });
        b.map_addr_ = addr;
        b.map_len_ = map_len;
        b.base_ = static_cast<u8*>(addr) + lead;
        b.capacity_ = length;
        b.limit_ = length;
        *out = b;
        return core::ok_status();
    }

    // ========================================================================
    // Cursor
    // ========================================================================

    Status ByteBuffer::set_position(u64 position) noexcept {
        if (position > limit_) {
            return buffer_status(StatusCode::OutOfRange);
        }
        if (mark_ > static_cast<i64>(position)) {
            mark_ = -1;
        }
        position_ = position;
        return core::ok_status();
    }

    Status ByteBuffer::set_limit(u64 limit) noexcept {
        if (limit > capacity_) {
            return buffer_status(StatusCode::OutOfRange);
        }
        limit_ = limit;
        if (position_ > limit_) {
            position_ = limit_;
        }
        if (mark_ > static_cast<i64>(limit_)) {
            mark_ = -1;
        }
        return core::ok_status();
    }

    Status ByteBuffer::reset() noexcept {
        if (mark_ < 0) {
            return buffer_status(StatusCode::InvalidMark);
        }
        position_ = static_cast<u64>(mark_);
        return core::ok_status();
    }

    void ByteBuffer::clear() noexcept {
        position_ = 0;
        limit_ = capacity_;
        mark_ = -1;
    }

    void ByteBuffer::flip() noexcept {
        limit_ = position_;
        position_ = 0;
        mark_ = -1;
    }

    void ByteBuffer::rewind() noexcept {
        position_ = 0;
        mark_ = -1;
    }

    Status ByteBuffer::compact() noexcept {
        if (read_only_) {
            return buffer_status(StatusCode::ReadOnly);
        }
        const u64 n = remaining();
        if (n > 0 && position_ > 0) {
            std::memmove(base_, base_ + position_, static_cast<std::size_t>(n));
        }
        position_ = n;
        limit_ = capacity_;
        mark_ = -1;
        return core::ok_status();
    }

    // ========================================================================
    // Views
    // ========================================================================

    ByteBuffer ByteBuffer::slice() const noexcept {
        ByteBuffer b = *this;
        b.base_ = remaining() > 0 ? base_ + position_ : nullptr;
        b.capacity_ = remaining();
        b.position_ = 0;
        b.limit_ = b.capacity_;
        b.mark_ = -1;
        return b;
    }

    ByteBuffer ByteBuffer::as_read_only() const noexcept {
        ByteBuffer b = *this;
        b.read_only_ = true;
        return b;
    }

    BufferView ByteBuffer::view() const noexcept {
        if (limit_ == 0) {
            return BufferView{};
        }
        return BufferView{base_, limit_};
    }

    BufferView ByteBuffer::remaining_view() const noexcept {
        if (position_ == limit_) {
            return BufferView{};
        }
        return BufferView{base_ + position_, limit_ - position_};
    }

    BufferMut ByteBuffer::writable_view() noexcept {
        if (read_only_ || limit_ == 0) {
            return BufferMut{};
        }
        return BufferMut{base_, limit_};
    }

    // ========================================================================
    // Single-byte and bulk access
    // ========================================================================

    Status ByteBuffer::get(u8* out) noexcept {
        if (out == nullptr) {
            return buffer_status(StatusCode::Invalid);
        }
        if (position_ >= limit_) {
            return buffer_status(StatusCode::EndOfData);
        }
        *out = base_[position_++];
        return core::ok_status();
    }

    Status ByteBuffer::put(u8 value) noexcept {
        if (read_only_) {
            return buffer_status(StatusCode::ReadOnly);
        }
        if (position_ >= limit_) {
            return buffer_status(StatusCode::OutOfRange);
        }
        base_[position_++] = value;
        return core::ok_status();
    }

    Status ByteBuffer::get(u64 index, u8* out) const noexcept {
        if (out == nullptr) {
            return buffer_status(StatusCode::Invalid);
        }
        if (index >= limit_) {
            return buffer_status(StatusCode::OutOfRange);
        }
        *out = base_[index];
        return core::ok_status();
    }

    Status ByteBuffer::put(u64 index, u8 value) noexcept {
        if (read_only_) {
            return buffer_status(StatusCode::ReadOnly);
        }
        if (index >= limit_) {
            return buffer_status(StatusCode::OutOfRange);
        }
        base_[index] = value;
        return core::ok_status();
    }

    Status ByteBuffer::get(BufferMut dst) noexcept {
        if (dst.data == nullptr && dst.len > 0) {
            return buffer_status(StatusCode::Invalid);
        }
        if (dst.len > remaining()) {
            return buffer_status(StatusCode::EndOfData);
        }
        if (dst.len > 0) {
            std::memcpy(dst.data, base_ + position_, static_cast<std::size_t>(dst.len));
            position_ += dst.len;
        }
        return core::ok_status();
    }

    Status ByteBuffer::put(BufferView src) noexcept {
        if (src.data == nullptr && src.len > 0) {
            return buffer_status(StatusCode::Invalid);
        }
        if (read_only_) {
            return buffer_status(StatusCode::ReadOnly);
        }
        if (src.len > remaining()) {
            return buffer_status(StatusCode::OutOfRange);
        }
        if (src.len > 0) {
            // src may alias this buffer's storage
            std::memmove(base_ + position_, src.data, static_cast<std::size_t>(src.len));
            position_ += src.len;
        }
        return core::ok_status();
    }

    Status ByteBuffer::put(ByteBuffer& src) noexcept {
        if (&src == this) {
            return buffer_status(StatusCode::Invalid);
        }
        const Status s = put(src.remaining_view());
        if (!core::is_ok(s)) {
            return s;
        }
        src.position_ = src.limit_;
        return core::ok_status();
    }

    // ========================================================================
    // Typed access
    // ========================================================================

    template <typename U>
    Status ByteBuffer::read_relative(U* out) noexcept {
        if (out == nullptr) {
            return buffer_status(StatusCode::Invalid);
        }
        if (remaining() < sizeof(U)) {
            return buffer_status(StatusCode::EndOfData);
        }
        *out = core::load<U>(base_ + position_, order_);
        position_ += sizeof(U);
        return core::ok_status();
    }

    template <typename U>
    Status ByteBuffer::read_absolute(u64 index, U* out) const noexcept {
        if (out == nullptr) {
            return buffer_status(StatusCode::Invalid);
        }
        if (index > limit_ || limit_ - index < sizeof(U)) {
            return buffer_status(StatusCode::OutOfRange);
        }
        *out = core::load<U>(base_ + index, order_);
        return core::ok_status();
    }

    template <typename U>
    Status ByteBuffer::write_relative(U value) noexcept {
        if (read_only_) {
            return buffer_status(StatusCode::ReadOnly);
        }
        if (remaining() < sizeof(U)) {
            return buffer_status(StatusCode::OutOfRange);
        }
        core::store<U>(base_ + position_, value, order_);
        position_ += sizeof(U);
        return core::ok_status();
    }

    template <typename U>
    Status ByteBuffer::write_absolute(u64 index, U value) noexcept {
        if (read_only_) {
            return buffer_status(StatusCode::ReadOnly);
        }
        if (index > limit_ || limit_ - index < sizeof(U)) {
            return buffer_status(StatusCode::OutOfRange);
        }
        core::store<U>(base_ + index, value, order_);
        return core::ok_status();
    }

    Status ByteBuffer::get_char(char16_t* out) noexcept {
        u16 v = 0;
        const Status s = read_relative<u16>(out == nullptr ? nullptr : &v);
        if (core::is_ok(s)) {
            *out = static_cast<char16_t>(v);
        }
        return s;
    }

    Status ByteBuffer::get_char(u64 index, char16_t* out) const noexcept {
        u16 v = 0;
        const Status s = read_absolute<u16>(index, out == nullptr ? nullptr : &v);
        if (core::is_ok(s)) {
            *out = static_cast<char16_t>(v);
        }
        return s;
    }

    Status ByteBuffer::put_char(char16_t value) noexcept { return write_relative<u16>(static_cast<u16>(value)); }
    Status ByteBuffer::put_char(u64 index, char16_t value) noexcept {
        return write_absolute<u16>(index, static_cast<u16>(value));
    }

    Status ByteBuffer::get_short(i16* out) noexcept {
        u16 v = 0;
        const Status s = read_relative<u16>(out == nullptr ? nullptr : &v);
        if (core::is_ok(s)) {
            *out = static_cast<i16>(v);
        }
        return s;
    }

    Status ByteBuffer::get_short(u64 index, i16* out) const noexcept {
        u16 v = 0;
        const Status s = read_absolute<u16>(index, out == nullptr ? nullptr : &v);
        if (core::is_ok(s)) {
            *out = static_cast<i16>(v);
        }
        return s;
    }

    Status ByteBuffer::put_short(i16 value) noexcept { return write_relative<u16>(static_cast<u16>(value)); }
    Status ByteBuffer::put_short(u64 index, i16 value) noexcept {
        return write_absolute<u16>(index, static_cast<u16>(value));
    }

    Status ByteBuffer::get_int(i32* out) noexcept {
        u32 v = 0;
        const Status s = read_relative<u32>(out == nullptr ? nullptr : &v);
        if (core::is_ok(s)) {
            *out = static_cast<i32>(v);
        }
        return s;
    }

    Status ByteBuffer::get_int(u64 index, i32* out) const noexcept {
        u32 v = 0;
        const Status s = read_absolute<u32>(index, out == nullptr ? nullptr : &v);
        if (core::is_ok(s)) {
            *out = static_cast<i32>(v);
        }
        return s;
    }

    Status ByteBuffer::put_int(i32 value) noexcept { return write_relative<u32>(static_cast<u32>(value)); }
    Status ByteBuffer::put_int(u64 index, i32 value) noexcept {
        return write_absolute<u32>(index, static_cast<u32>(value));
    }

    Status ByteBuffer::get_long(i64* out) noexcept {
        u64 v = 0;
        const Status s = read_relative<u64>(out == nullptr ? nullptr : &v);
        if (core::is_ok(s)) {
            *out = static_cast<i64>(v);
        }
        return s;
    }

    Status ByteBuffer::get_long(u64 index, i64* out) const noexcept {
        u64 v = 0;
        const Status s = read_absolute<u64>(index, out == nullptr ? nullptr : &v);
        if (core::is_ok(s)) {
            *out = static_cast<i64>(v);
        }
        return s;
    }

    Status ByteBuffer::put_long(i64 value) noexcept { return write_relative<u64>(static_cast<u64>(value)); }
    Status ByteBuffer::put_long(u64 index, i64 value) noexcept {
        return write_absolute<u64>(index, static_cast<u64>(value));
    }

    Status ByteBuffer::get_float(float* out) noexcept {
        u32 v = 0;
        const Status s = read_relative<u32>(out == nullptr ? nullptr : &v);
        if (core::is_ok(s)) {
            *out = core::float_from_bits(v);
        }
        return s;
    }

    Status ByteBuffer::get_float(u64 index, float* out) const noexcept {
        u32 v = 0;
        const Status s = read_absolute<u32>(index, out == nullptr ? nullptr : &v);
        if (core::is_ok(s)) {
            *out = core::float_from_bits(v);
        }
        return s;
    }

    Status ByteBuffer::put_float(float value) noexcept { return write_relative<u32>(core::float_to_bits(value)); }
    Status ByteBuffer::put_float(u64 index, float value) noexcept {
        return write_absolute<u32>(index, core::float_to_bits(value));
    }

    Status ByteBuffer::get_double(double* out) noexcept {
        u64 v = 0;
        const Status s = read_relative<u64>(out == nullptr ? nullptr : &v);
        if (core::is_ok(s)) {
            *out = core::double_from_bits(v);
        }
        return s;
    }

    Status ByteBuffer::get_double(u64 index, double* out) const noexcept {
        u64 v = 0;
        const Status s = read_absolute<u64>(index, out == nullptr ? nullptr : &v);
        if (core::is_ok(s)) {
            *out = core::double_from_bits(v);
        }
        return s;
    }

    Status ByteBuffer::put_double(double value) noexcept { return write_relative<u64>(core::double_to_bits(value)); }
    Status ByteBuffer::put_double(u64 index, double value) noexcept {
        return write_absolute<u64>(index, core::double_to_bits(value));
    }

    // ========================================================================
    // Mapped buffers
    // ========================================================================

    bool ByteBuffer::is_loaded() const noexcept {
        if (!mapped_) {
            return false;
        }
        if (map_len_ == 0) {
            return true;
        }
        const u64 ps = page_size();
        const u64 pages = (map_len_ + ps - 1) / ps;
        std::unique_ptr<unsigned char[]> vec(new (std::nothrow) unsigned char[pages]);
        if (!vec) {
            return false;
        }
        if (::mincore(map_addr_, static_cast<std::size_t>(map_len_), vec.get()) != 0) {
            return false;
        }
        for (u64 i = 0; i < pages; ++i) {
            if ((vec[i] & 1u) == 0) {
                return false;
            }
        }
        return true;
    }

    Status ByteBuffer::load() const noexcept {
        if (!mapped_) {
            return buffer_status(StatusCode::Unsupported);
        }
        if (map_len_ == 0) {
            return core::ok_status();
        }
        if (::madvise(map_addr_, static_cast<std::size_t>(map_len_), MADV_WILLNEED) != 0) {
            return errno_status();
        }
        // Reading one byte per page faults it in.
        const u64 ps = page_size();
        const volatile u8* p = static_cast<const u8*>(map_addr_);
        u8 sink = 0;
        for (u64 off = 0; off < map_len_; off += ps) {
            sink = static_cast<u8>(sink ^ p[off]);
        }
        static_cast<void>(sink);
        return core::ok_status();
    }

    Status ByteBuffer::force() const noexcept {
        if (!mapped_) {
            return buffer_status(StatusCode::Unsupported);
        }
        if (!map_shared_writable_ || map_len_ == 0) {
            return core::ok_status();
        }
        if (::msync(map_addr_, static_cast<std::size_t>(map_len_), MS_SYNC) != 0) {
            return errno_status();
        }
        return core::ok_status();
    }
} // namespace bytestring::io
