#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <compare>

namespace bytestring::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i8 = std::int8_t;
    using i16 = std::int16_t;
    using i32 = std::int32_t;
    using i64 = std::int64_t;

    // Sentinel returned by searches that find nothing.
    inline constexpr i64 kNotFound = -1;

    enum class ByteOrder : u8 {
        BigEndian = 0,
        LittleEndian = 1,
    };

    // Network order is the default for every multi-byte accessor.
    inline constexpr ByteOrder kNetworkOrder = ByteOrder::BigEndian;

    struct BufferView {
        const u8* data{nullptr};
        u64 len{0};
    };

    struct BufferMut {
        u8* data{nullptr};
        u64 len{0};
    };

    struct Hash256 {
        std::array<u8, 32> b{};
        friend constexpr bool operator==(Hash256, Hash256) noexcept = default;
        friend constexpr auto operator<=>(Hash256, Hash256) noexcept = default;
    };
    static_assert(sizeof(Hash256) == 32);

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);
    static_assert(std::is_trivially_copyable_v<BufferMut>);
    static_assert(std::is_standard_layout_v<BufferMut>);

} // namespace bytestring::core
