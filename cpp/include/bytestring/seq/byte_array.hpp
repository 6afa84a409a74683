#pragma once

#include <memory>

#include "bytestring/seq/mutable_byte_sequence.hpp"

namespace bytestring::seq {

    // Mutable sequence over caller memory.
    //
    // wrap() does not copy: writes through put() land in the caller's array and caller-side
    // writes are visible here. The caller owns the memory and must keep it alive while the
    // wrapper is in use. Slicing always copies into a new, self-owned array so that no two
    // handles can write to the same bytes. Use Bytes when isolation is required.
    class ByteArray final : public MutableByteSequence {
    public:
        ByteArray() noexcept = default;
        // No move operations: a moved-from value keeps its store and stays usable.
        ByteArray(const ByteArray&) noexcept = default;
        ByteArray& operator=(const ByteArray&) noexcept = default;
        ~ByteArray() override = default;

        [[nodiscard]] static Status wrap(BufferMut data, ByteArray* out) noexcept;

        // Zero-filled array owned by the wrapper itself.
        [[nodiscard]] static Status allocate(i64 length, ByteArray* out) noexcept;

        [[nodiscard]] i64 length() const noexcept override { return len_; }

        // Returns a ByteArray holding a copy of [start, end).
        [[nodiscard]] Status sub_sequence(i64 start, i64 end,
                                          std::shared_ptr<const ByteSequence>* out) const noexcept override;
        [[nodiscard]] Status copy_range(i64 start, i64 end, ByteArray* out) const noexcept;

        [[nodiscard]] Status to_bytes(Bytes* out) const noexcept override;
        [[nodiscard]] bool try_view(BufferView* out) const noexcept override;

        [[nodiscard]] BufferMut data() noexcept { return BufferMut{data_, static_cast<core::u64>(len_)}; }
        [[nodiscard]] BufferView view() const noexcept { return BufferView{data_, static_cast<core::u64>(len_)}; }

    protected:
        [[nodiscard]] u8 byte_at(i64 index) const noexcept override { return data_[index]; }
        void store_byte(i64 index, u8 value) noexcept override { data_[index] = value; }

    private:
        u8* data_{nullptr};
        i64 len_{0};
        std::shared_ptr<u8[]> owned_;
    };

} // namespace bytestring::seq
