#pragma once

#include <cstddef>
#include <cstdio>
#include <functional>
#include <initializer_list>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "bytestring/seq/byte_sequence.hpp"

namespace bytestring::io {
    class ByteBuffer;
    class BytesDataInput;
}

namespace bytestring::seq {
    class BytesSubsequence;

    // Immutable, owned byte sequence; the byte-level analogue of a string.
    //
    // Every public construction path copies its input into a private, exactly-sized store,
    // so no caller can hold a writable alias of it. Copies of a Bytes share that store,
    // which is never written after construction; instances can therefore be shared across
    // threads freely. The default-constructed value is empty and allocates nothing.
    class Bytes final : public ByteSequence {
    public:
        Bytes() noexcept = default;
        // No move operations: a moved-from value keeps its store and stays usable.
        Bytes(const Bytes&) noexcept = default;
        Bytes& operator=(const Bytes&) noexcept = default;
        ~Bytes() override = default;

        // Process-wide empty instance.
        [[nodiscard]] static const Bytes& empty() noexcept;

        [[nodiscard]] static Status copy_of(BufferView input, Bytes* out) noexcept;

        // Copies input[offset, offset + length).
        [[nodiscard]] static Status copy_of(BufferView input, i64 offset, i64 length, Bytes* out) noexcept;

        // Copies the remaining bytes [position, limit) of 'buffer'; the cursor is not moved.
        [[nodiscard]] static Status from_buffer(const io::ByteBuffer& buffer, Bytes* out) noexcept;

        [[nodiscard]] static Status of_utf8(std::string_view text, Bytes* out);

        // Encodes UTF-8 'text' into 'charset'.
        [[nodiscard]] static Status of_string(std::string_view text, std::string_view charset, Bytes* out);

        // Decodes pairs of hex digits, most significant nibble first.
        [[nodiscard]] static Status of_hex_string(std::string_view hex, Bytes* out) noexcept;

        // Concatenates the elements into one exactly-sized store. No elements, or only empty
        // ones, yields empty(). A null element fails with Invalid.
        [[nodiscard]] static Status join(std::span<const ByteSequence* const> elements, Bytes* out) noexcept;
        [[nodiscard]] static Status join(std::initializer_list<const ByteSequence*> elements, Bytes* out) noexcept;

        [[nodiscard]] i64 length() const noexcept override { return len_; }

        [[nodiscard]] Status sub_sequence(i64 start, i64 end,
                                          std::shared_ptr<const ByteSequence>* out) const noexcept override;
        [[nodiscard]] Status to_bytes(Bytes* out) const noexcept override;
        [[nodiscard]] bool try_view(BufferView* out) const noexcept override;
        [[nodiscard]] Status spliterator(ByteSpliterator* out) const noexcept override;

        // Zero-copy view of [start, end) sharing this store.
        [[nodiscard]] Status slice(i64 start, i64 end, BytesSubsequence* out) const noexcept;

        // Always allocates a new store sized to the combined length.
        [[nodiscard]] Status concat(const ByteSequence& suffix, Bytes* out) const noexcept;
        [[nodiscard]] Status concat(BufferView suffix, i64 offset, i64 length, Bytes* out) const noexcept;

        [[nodiscard]] bool starts_with(const ByteSequence& prefix) const noexcept;
        [[nodiscard]] bool ends_with(const ByteSequence& suffix) const noexcept;

        [[nodiscard]] BufferView view() const noexcept { return BufferView{store_.get(), static_cast<core::u64>(len_)}; }
        [[nodiscard]] std::vector<u8> to_vector() const;

        // Lowercase hex.
        [[nodiscard]] std::string to_string() const { return to_hex_string(false); }

        // Copies the first 'length' bytes of this value into dst[offset, offset + length).
        [[nodiscard]] Status into_byte_array(BufferMut dst, i64 offset, i64 length) const noexcept;
        [[nodiscard]] Status into_fd(int fd) const noexcept;
        [[nodiscard]] Status into_file(std::FILE* file) const noexcept;

        [[nodiscard]] io::BytesDataInput data_input() const noexcept;

    protected:
        [[nodiscard]] u8 byte_at(i64 index) const noexcept override { return store_[index]; }

    private:
        friend class BytesSubsequence;

        // Adopts 'store' without copying. Only for stores freshly allocated by this library
        // that no other handle can write to.
        Bytes(std::shared_ptr<const u8[]> store, i64 length) noexcept;

        [[nodiscard]] static Status allocate_store(i64 length, std::shared_ptr<u8[]>* out) noexcept;

        std::shared_ptr<const u8[]> store_;
        i64 len_{0};
    };

} // namespace bytestring::seq

template <>
struct std::hash<bytestring::seq::Bytes> {
    std::size_t operator()(const bytestring::seq::Bytes& b) const noexcept {
        return static_cast<std::size_t>(static_cast<bytestring::core::u32>(b.hash_code()));
    }
};
