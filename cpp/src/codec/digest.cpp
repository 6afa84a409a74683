#include "bytestring/codec/digest.hpp"

#include <cstddef>

#include <blake3.h>

#include "bytestring/seq/byte_sequence.hpp"

namespace bytestring::codec {
    namespace {
        constexpr std::size_t kChunkBytes = 4096;
    } // namespace

    bytestring::core::Status digest_compute(core::BufferView data, bytestring::core::Hash256* out) noexcept {
        if (out == nullptr) {
            return core::make_status(core::StatusDomain::Codec, core::StatusCode::Invalid);
        }
        if (data.len > 0 && data.data == nullptr) {
            return core::make_status(core::StatusDomain::Codec, core::StatusCode::Invalid);
        }

        blake3_hasher hasher;
        blake3_hasher_init(&hasher);

        if (data.len > 0) {
            blake3_hasher_update(&hasher, data.data, static_cast<std::size_t>(data.len));
        }

        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        return core::ok_status();
    }

    bytestring::core::Status digest_compute(const bytestring::seq::ByteSequence& data,
                                            bytestring::core::Hash256* out) noexcept {
        if (out == nullptr) {
            return core::make_status(core::StatusDomain::Codec, core::StatusCode::Invalid);
        }

        core::BufferView view{};
        if (data.try_view(&view)) {
            return digest_compute(view, out);
        }

        blake3_hasher hasher;
        blake3_hasher_init(&hasher);

        core::u8 chunk[kChunkBytes];
        const core::i64 n = data.length();
        for (core::i64 off = 0; off < n;) {
            std::size_t take = 0;
            while (take < kChunkBytes && off < n) {
                const core::Status s = data.get(off, &chunk[take]);
                if (!core::is_ok(s)) {
                    return s;
                }
                ++take;
                ++off;
            }
            blake3_hasher_update(&hasher, chunk, take);
        }

        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        return core::ok_status();
    }
} // namespace bytestring::codec
