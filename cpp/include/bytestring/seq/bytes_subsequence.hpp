#pragma once

#include <cstdio>
#include <memory>
#include <vector>

#include "bytestring/seq/byte_sequence.hpp"

namespace bytestring::io {
    class BytesDataInput;
}

namespace bytestring::seq {
    class Bytes;

    // Zero-copy immutable view of [offset, offset + length) of a Bytes store.
    // Only obtainable by slicing; keeps the store alive for as long as it exists.
    class BytesSubsequence final : public ByteSequence {
    public:
        BytesSubsequence() noexcept = default;
        // No move operations: a moved-from value keeps its store and stays usable.
        BytesSubsequence(const BytesSubsequence&) noexcept = default;
        BytesSubsequence& operator=(const BytesSubsequence&) noexcept = default;
        ~BytesSubsequence() override = default;

        [[nodiscard]] static const BytesSubsequence& empty() noexcept;

        [[nodiscard]] i64 length() const noexcept override { return len_; }

        // Offset into the shared store.
        [[nodiscard]] i64 offset() const noexcept { return offset_; }

        [[nodiscard]] Status sub_sequence(i64 start, i64 end,
                                          std::shared_ptr<const ByteSequence>* out) const noexcept override;

        // Copies unless the view spans the whole store, in which case the store is adopted.
        [[nodiscard]] Status to_bytes(Bytes* out) const noexcept override;

        [[nodiscard]] bool try_view(BufferView* out) const noexcept override;
        [[nodiscard]] Status spliterator(ByteSpliterator* out) const noexcept override;

        // Re-slicing composes offsets against the same store.
        [[nodiscard]] Status slice(i64 start, i64 end, BytesSubsequence* out) const noexcept;

        [[nodiscard]] bool ends_with(const ByteSequence& suffix) const noexcept;

        [[nodiscard]] BufferView view() const noexcept;
        [[nodiscard]] std::vector<u8> to_vector() const;

        [[nodiscard]] Status into_byte_array(BufferMut dst, i64 offset, i64 length) const noexcept;
        [[nodiscard]] Status into_fd(int fd) const noexcept;
        [[nodiscard]] Status into_file(std::FILE* file) const noexcept;

        [[nodiscard]] io::BytesDataInput data_input() const noexcept;

    protected:
        [[nodiscard]] u8 byte_at(i64 index) const noexcept override { return store_[offset_ + index]; }

    private:
        friend class Bytes;

        BytesSubsequence(std::shared_ptr<const u8[]> store, i64 store_len, i64 offset, i64 length) noexcept;

        std::shared_ptr<const u8[]> store_;
        i64 store_len_{0};
        i64 offset_{0};
        i64 len_{0};
    };

    // Non-owning handle to BytesSubsequence::empty(); what every sub_sequence() returns for start == end.
    [[nodiscard]] std::shared_ptr<const ByteSequence> canonical_empty_sequence() noexcept;

} // namespace bytestring::seq
