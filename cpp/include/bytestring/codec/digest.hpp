#pragma once

#include "bytestring/core/errors.hpp"
#include "bytestring/core/types.hpp"

namespace bytestring::seq {
    class ByteSequence;
}

namespace bytestring::codec {
    [[nodiscard]] constexpr bool digest_is_zero(const bytestring::core::Hash256& h) noexcept {
        for (core::u8 b : h.b) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    // BLAKE3-256 of the raw bytes.
    [[nodiscard]] bytestring::core::Status digest_compute(core::BufferView data, bytestring::core::Hash256* out) noexcept;

    // BLAKE3-256 of the content; equal sequences digest equally whatever their representation.
    [[nodiscard]] bytestring::core::Status digest_compute(const bytestring::seq::ByteSequence& data,
                                                          bytestring::core::Hash256* out) noexcept;

} // namespace bytestring::codec
