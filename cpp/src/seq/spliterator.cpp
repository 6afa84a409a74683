#include "bytestring/seq/spliterator.hpp"

namespace bytestring::seq {
    bool ByteSpliterator::try_split(ByteSpliterator* upper) noexcept {
        if (upper == nullptr) {
            return false;
        }
        if (end_ - pos_ < 2) {
            return false;
        }
        const i64 mid = pos_ + (end_ - pos_) / 2;
        *upper = ByteSpliterator(store_, mid, end_);
        end_ = mid;
        return true;
    }
} // namespace bytestring::seq
