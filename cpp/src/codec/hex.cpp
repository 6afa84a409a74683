#include "bytestring/codec/hex.hpp"

namespace bytestring::codec {
    namespace {
        constexpr char kLower[] = "0123456789abcdef";
        constexpr char kUpper[] = "0123456789ABCDEF";
    } // namespace

    void hex_append(u8 b, bool uppercase, std::string* out) {
        const char* digits = uppercase ? kUpper : kLower;
        out->push_back(digits[(b >> 4) & 0xF]);
        out->push_back(digits[b & 0xF]);
    }

    void hex_encode(core::BufferView in, bool uppercase, std::string* out) {
        out->reserve(out->size() + static_cast<std::size_t>(in.len) * 2);
        for (core::u64 i = 0; i < in.len; ++i) {
            hex_append(in.data[i], uppercase, out);
        }
    }

    core::Status hex_decode(std::string_view hex, core::BufferMut out) noexcept {
        if (hex.size() % 2 != 0) {
            return core::make_status(core::StatusDomain::Codec, core::StatusCode::Format);
        }
        const std::size_t n = hex.size() / 2;
        if (n > 0 && out.data == nullptr) {
            return core::make_status(core::StatusDomain::Codec, core::StatusCode::Invalid);
        }
        if (out.len < n) {
            return core::make_status(core::StatusDomain::Codec, core::StatusCode::OutOfRange);
        }
        for (char c : hex) {
            if (hex_digit_value(c) < 0) {
                return core::make_status(core::StatusDomain::Codec, core::StatusCode::Format);
            }
        }
        for (std::size_t i = 0; i < n; ++i) {
            const int hi = hex_digit_value(hex[2 * i]);
            const int lo = hex_digit_value(hex[2 * i + 1]);
            out.data[i] = static_cast<u8>((hi << 4) | lo);
        }
        return core::ok_status();
    }
} // namespace bytestring::codec
