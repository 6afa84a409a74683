#pragma once

#include <memory>
#include <utility>

#include "bytestring/core/types.hpp"

namespace bytestring::seq {
    using u8 = bytestring::core::u8;
    using u32 = bytestring::core::u32;
    using i64 = bytestring::core::i64;

    inline constexpr u32 kSpliteratorOrdered = 0x00000010u;
    inline constexpr u32 kSpliteratorSized = 0x00000040u;
    inline constexpr u32 kSpliteratorImmutable = 0x00000400u;
    inline constexpr u32 kSpliteratorSubsized = 0x00004000u;

    // Lazy, splittable enumerator over the unsigned values of [pos, end) of a byte store.
    // Yields each element at most once. The store is kept alive by the enumerator itself,
    // so halves produced by try_split() can be handed to other threads.
    class ByteSpliterator {
    public:
        ByteSpliterator() noexcept = default;
        ByteSpliterator(const ByteSpliterator&) noexcept = default;
        ByteSpliterator& operator=(const ByteSpliterator&) noexcept = default;
        ByteSpliterator(std::shared_ptr<const u8[]> store, i64 pos, i64 end) noexcept
            : store_(std::move(store)), pos_(pos), end_(end) {}

        // Calls action(u32) with the next value and returns true, or returns false when exhausted.
        template <typename F>
        bool try_advance(F&& action) {
            if (pos_ >= end_) {
                return false;
            }
            const u32 v = store_[pos_++];
            action(v);
            return true;
        }

        template <typename F>
        void for_each_remaining(F&& action) {
            const i64 end = end_;
            for (i64 i = pos_; i < end; ++i) {
                action(static_cast<u32>(store_[i]));
            }
            pos_ = end;
        }

        // Moves the upper half of the remaining range into 'upper' and keeps the lower half.
        // Returns false (leaving both untouched) when fewer than two elements remain.
        [[nodiscard]] bool try_split(ByteSpliterator* upper) noexcept;

        [[nodiscard]] i64 estimate_size() const noexcept { return end_ - pos_; }

        [[nodiscard]] u32 characteristics() const noexcept {
            return kSpliteratorOrdered | kSpliteratorSized | kSpliteratorImmutable | kSpliteratorSubsized;
        }

    private:
        std::shared_ptr<const u8[]> store_;
        i64 pos_{0};
        i64 end_{0};
    };

} // namespace bytestring::seq
