#pragma once

#include <string>
#include <string_view>

#include "bytestring/core/errors.hpp"
#include "bytestring/core/types.hpp"

namespace bytestring::codec {
    using u8 = bytestring::core::u8;

    // Value of a single hex digit (0-9, a-f, A-F), or -1.
    [[nodiscard]] constexpr int hex_digit_value(char c) noexcept {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    // Appends the two digits of 'b', most significant nibble first.
    void hex_append(u8 b, bool uppercase, std::string* out);

    void hex_encode(core::BufferView in, bool uppercase, std::string* out);

    // Decodes an even-length digit string into the first hex.size() / 2 bytes of 'out'.
    // Odd length or a non-hex digit fails with Format before anything is written.
    [[nodiscard]] core::Status hex_decode(std::string_view hex, core::BufferMut out) noexcept;

} // namespace bytestring::codec
