#pragma once

#include <bit>
#include <cstddef>

#include "bytestring/core/types.hpp"

namespace bytestring::core {

    // Width-generic load/store helpers. Callers validate the span; these never bounds-check.

    template <typename U>
    [[nodiscard]] constexpr U load_be(const u8* p) noexcept {
        U v{0};
        for (std::size_t i = 0; i < sizeof(U); ++i) {
            v = static_cast<U>((v << 8) | static_cast<U>(p[i]));
        }
        return v;
    }

    template <typename U>
    [[nodiscard]] constexpr U load_le(const u8* p) noexcept {
        U v{0};
        for (std::size_t i = sizeof(U); i > 0; --i) {
            v = static_cast<U>((v << 8) | static_cast<U>(p[i - 1]));
        }
        return v;
    }

    template <typename U>
    constexpr void store_be(u8* p, U v) noexcept {
        for (std::size_t i = sizeof(U); i > 0; --i) {
            p[i - 1] = static_cast<u8>(v & 0xffu);
            v = static_cast<U>(v >> 8);
        }
    }

    template <typename U>
    constexpr void store_le(u8* p, U v) noexcept {
        for (std::size_t i = 0; i < sizeof(U); ++i) {
            p[i] = static_cast<u8>(v & 0xffu);
            v = static_cast<U>(v >> 8);
        }
    }

    template <typename U>
    [[nodiscard]] constexpr U load(const u8* p, ByteOrder order) noexcept {
        return order == ByteOrder::BigEndian ? load_be<U>(p) : load_le<U>(p);
    }

    template <typename U>
    constexpr void store(u8* p, U v, ByteOrder order) noexcept {
        if (order == ByteOrder::BigEndian) {
            store_be<U>(p, v);
        } else {
            store_le<U>(p, v);
        }
    }

    // IEEE-754 bit reinterpretation, no numeric conversion.
    [[nodiscard]] constexpr float float_from_bits(u32 bits) noexcept { return std::bit_cast<float>(bits); }
    [[nodiscard]] constexpr double double_from_bits(u64 bits) noexcept { return std::bit_cast<double>(bits); }
    [[nodiscard]] constexpr u32 float_to_bits(float v) noexcept { return std::bit_cast<u32>(v); }
    [[nodiscard]] constexpr u64 double_to_bits(double v) noexcept { return std::bit_cast<u64>(v); }

    static_assert(sizeof(float) == 4);
    static_assert(sizeof(double) == 8);

} // namespace bytestring::core
