#pragma once

#include <string>
#include <string_view>

#include "bytestring/core/errors.hpp"
#include "bytestring/core/types.hpp"

namespace bytestring::codec {

    inline constexpr std::string_view kUtf8 = "UTF-8";

    // True for "UTF-8"/"UTF8" in any letter case.
    [[nodiscard]] bool charset_is_utf8(std::string_view charset) noexcept;

    // Text crossing the API is UTF-8. Conversions go through iconv(3); UTF-8 to UTF-8 is a
    // verbatim copy. An unknown charset or unconvertible input fails with Codec (aux = errno).
    // 'out' is replaced, not appended to.
    [[nodiscard]] core::Status charset_decode(core::BufferView in, std::string_view charset, std::string* utf8_out);
    [[nodiscard]] core::Status charset_encode(std::string_view utf8, std::string_view charset, std::string* out);

} // namespace bytestring::codec
