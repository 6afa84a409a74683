#pragma once

#include <memory>

#include "bytestring/core/errors.hpp"
#include "bytestring/core/types.hpp"

namespace bytestring::io {
    using u8 = bytestring::core::u8;
    using u64 = bytestring::core::u64;
    using i16 = bytestring::core::i16;
    using i32 = bytestring::core::i32;
    using i64 = bytestring::core::i64;
    using ByteOrder = bytestring::core::ByteOrder;
    using BufferView = bytestring::core::BufferView;
    using BufferMut = bytestring::core::BufferMut;
    using Status = bytestring::core::Status;

    enum class MapMode : u8 {
        ReadOnly = 0,   // PROT_READ, MAP_SHARED
        ReadWrite = 1,  // writes reach the file
        Private = 2,    // copy-on-write, writes stay in memory
    };

    // Region of a file to map
    struct MapConfig {
        MapMode mode{MapMode::ReadOnly};
        u64 offset{0};        // byte offset into the file, need not be page aligned
        u64 length{0};        // 0 = up to end of file
        bool populate{false}; // prefault the pages (MAP_POPULATE)
    };

    // Fixed-capacity cursor buffer.
    //
    // Holds capacity, position, limit and an optional mark with
    // 0 <= mark <= position <= limit <= capacity. Copies, duplicate() and slice() share the
    // storage but carry their own cursor. Storage is either owned (allocate), borrowed from
    // the caller (wrap), or a memory-mapped file region (map_file).
    // Not synchronised.
    class ByteBuffer {
    public:
        ByteBuffer() noexcept = default;
        // No move operations: a moved-from buffer keeps its share of the storage.
        ByteBuffer(const ByteBuffer&) noexcept = default;
        ByteBuffer& operator=(const ByteBuffer&) noexcept = default;
        ~ByteBuffer() = default;

        // Zero-filled, owned storage.
        [[nodiscard]] static Status allocate(u64 capacity, ByteBuffer* out) noexcept;

        // Borrows caller memory; nothing is copied and the caller keeps it alive.
        [[nodiscard]] static Status wrap(BufferMut data, ByteBuffer* out) noexcept;

        // As wrap(data), with position = offset and limit = offset + length.
        [[nodiscard]] static Status wrap(BufferMut data, u64 offset, u64 length, ByteBuffer* out) noexcept;

        [[nodiscard]] static Status map_file(const char* path, const MapConfig& cfg, ByteBuffer* out) noexcept;

        [[nodiscard]] u64 capacity() const noexcept { return capacity_; }
        [[nodiscard]] u64 position() const noexcept { return position_; }
        [[nodiscard]] u64 limit() const noexcept { return limit_; }
        [[nodiscard]] u64 remaining() const noexcept { return limit_ - position_; }
        [[nodiscard]] bool has_remaining() const noexcept { return position_ < limit_; }

        // Drops the mark when it lies beyond the new position.
        [[nodiscard]] Status set_position(u64 position) noexcept;

        // Clamps position to the new limit and drops a mark beyond it.
        [[nodiscard]] Status set_limit(u64 limit) noexcept;

        void mark() noexcept { mark_ = static_cast<i64>(position_); }
        [[nodiscard]] Status reset() noexcept;
        void clear() noexcept;
        void flip() noexcept;
        void rewind() noexcept;

        // Moves [position, limit) to the front, then position = remaining, limit = capacity.
        [[nodiscard]] Status compact() noexcept;

        [[nodiscard]] ByteOrder order() const noexcept { return order_; }
        void set_order(ByteOrder order) noexcept { order_ = order; }

        [[nodiscard]] bool is_read_only() const noexcept { return read_only_; }

        [[nodiscard]] ByteBuffer duplicate() const noexcept { return *this; }

        // Shares [position, limit) as a new buffer whose position is 0 and capacity = remaining().
        [[nodiscard]] ByteBuffer slice() const noexcept;

        [[nodiscard]] ByteBuffer as_read_only() const noexcept;

        // [0, limit)
        [[nodiscard]] BufferView view() const noexcept;
        // [position, limit)
        [[nodiscard]] BufferView remaining_view() const noexcept;
        // [0, limit), or an empty span when read-only.
        [[nodiscard]] BufferMut writable_view() noexcept;

        // Relative single-byte access; reads past limit report EndOfData.
        [[nodiscard]] Status get(u8* out) noexcept;
        [[nodiscard]] Status put(u8 value) noexcept;

        // Absolute access against limit; the cursor is not moved.
        [[nodiscard]] Status get(u64 index, u8* out) const noexcept;
        [[nodiscard]] Status put(u64 index, u8 value) noexcept;

        // Bulk transfers, all or nothing.
        [[nodiscard]] Status get(BufferMut dst) noexcept;
        [[nodiscard]] Status put(BufferView src) noexcept;
        [[nodiscard]] Status put(ByteBuffer& src) noexcept;

        [[nodiscard]] Status get_char(char16_t* out) noexcept;
        [[nodiscard]] Status get_char(u64 index, char16_t* out) const noexcept;
        [[nodiscard]] Status put_char(char16_t value) noexcept;
        [[nodiscard]] Status put_char(u64 index, char16_t value) noexcept;

        [[nodiscard]] Status get_short(i16* out) noexcept;
        [[nodiscard]] Status get_short(u64 index, i16* out) const noexcept;
        [[nodiscard]] Status put_short(i16 value) noexcept;
        [[nodiscard]] Status put_short(u64 index, i16 value) noexcept;

        [[nodiscard]] Status get_int(i32* out) noexcept;
        [[nodiscard]] Status get_int(u64 index, i32* out) const noexcept;
        [[nodiscard]] Status put_int(i32 value) noexcept;
        [[nodiscard]] Status put_int(u64 index, i32 value) noexcept;

        [[nodiscard]] Status get_long(i64* out) noexcept;
        [[nodiscard]] Status get_long(u64 index, i64* out) const noexcept;
        [[nodiscard]] Status put_long(i64 value) noexcept;
        [[nodiscard]] Status put_long(u64 index, i64 value) noexcept;

        [[nodiscard]] Status get_float(float* out) noexcept;
        [[nodiscard]] Status get_float(u64 index, float* out) const noexcept;
        [[nodiscard]] Status put_float(float value) noexcept;
        [[nodiscard]] Status put_float(u64 index, float value) noexcept;

        [[nodiscard]] Status get_double(double* out) noexcept;
        [[nodiscard]] Status get_double(u64 index, double* out) const noexcept;
        [[nodiscard]] Status put_double(double value) noexcept;
        [[nodiscard]] Status put_double(u64 index, double value) noexcept;

        // ====================================================================
        // Mapped buffers
        // ====================================================================
        // These act on the whole mapping, including for slices and duplicates.
        // On a buffer that is not mapped they report Unsupported.

        [[nodiscard]] bool is_mapped() const noexcept { return mapped_; }

        // true when every page of the mapping is resident (mincore).
        [[nodiscard]] bool is_loaded() const noexcept;

        // madvise(WILLNEED), then touches one byte per page.
        [[nodiscard]] Status load() const noexcept;

        // msync(MS_SYNC). A no-op for read-only and private mappings.
        [[nodiscard]] Status force() const noexcept;

    private:
        template <typename U>
        [[nodiscard]] Status read_relative(U* out) noexcept;
        template <typename U>
        [[nodiscard]] Status read_absolute(u64 index, U* out) const noexcept;
        template <typename U>
        [[nodiscard]] Status write_relative(U value) noexcept;
        template <typename U>
        [[nodiscard]] Status write_absolute(u64 index, U value) noexcept;

        std::shared_ptr<void> holder_;  // owned heap store or mapping; null when borrowed
        u8* base_{nullptr};
        u64 capacity_{0};
        u64 position_{0};
        u64 limit_{0};
        i64 mark_{-1};
        ByteOrder order_{core::kNetworkOrder};
        bool read_only_{false};

        bool mapped_{false};
        bool map_shared_writable_{false};
        void* map_addr_{nullptr};  // page-aligned start of the whole mapping
        u64 map_len_{0};
    };

    [[nodiscard]] inline Status buffer_status(core::StatusCode code, core::u32 aux = 0) noexcept {
        return core::make_status(core::StatusDomain::Buffer, code, aux);
    }

} // namespace bytestring::io
