#include "bytestring/codec/charset.hpp"

#include <cerrno>
#include <cstddef>
#include <utility>

#include <iconv.h>

namespace bytestring::codec {
    namespace {
        [[nodiscard]] core::Status codec_status(core::StatusCode code, int err = 0) noexcept {
            return core::make_status(core::StatusDomain::Codec, code, static_cast<core::u32>(err));
        }

        [[nodiscard]] char ascii_upper(char c) noexcept {
            return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
        }

        // Owns one conversion descriptor.
        class IconvHandle {
        public:
            IconvHandle(const std::string& to, const std::string& from) noexcept
                : cd_(iconv_open(to.c_str(), from.c_str())) {}
            ~IconvHandle() noexcept {
                if (valid()) {
                    iconv_close(cd_);
                }
            }
            IconvHandle(const IconvHandle&) = delete;
            IconvHandle& operator=(const IconvHandle&) = delete;

            [[nodiscard]] bool valid() const noexcept { return cd_ != reinterpret_cast<iconv_t>(-1); }
            [[nodiscard]] iconv_t get() const noexcept { return cd_; }

        private:
            iconv_t cd_;
        };

        [[nodiscard]] core::Status convert(const char* data, std::size_t len,
                                           const std::string& to, const std::string& from,
                                           std::string* out) {
            IconvHandle handle(to, from);
            if (!handle.valid()) {
                return codec_status(core::StatusCode::Codec, errno);
            }

            std::string result;
            char chunk[4096];
            char* in_ptr = const_cast<char*>(data);
            std::size_t in_left = len;

            while (in_left > 0) {
                char* out_ptr = chunk;
                std::size_t out_left = sizeof(chunk);
                const std::size_t r = iconv(handle.get(), &in_ptr, &in_left, &out_ptr, &out_left);
                const int err = errno;
                result.append(chunk, sizeof(chunk) - out_left);
                if (r == static_cast<std::size_t>(-1) && err != E2BIG) {
                    // EILSEQ: invalid sequence, EINVAL: truncated sequence at end of input.
                    return codec_status(core::StatusCode::Codec, err);
                }
            }

            // Emit any shift sequence a stateful target encoding needs to return to its initial state.
            char* out_ptr = chunk;
            std::size_t out_left = sizeof(chunk);
            if (iconv(handle.get(), nullptr, nullptr, &out_ptr, &out_left) == static_cast<std::size_t>(-1)) {
                return codec_status(core::StatusCode::Codec, errno);
            }
            result.append(chunk, sizeof(chunk) - out_left);

            *out = std::move(result);
            return core::ok_status();
        }
    } // namespace

    bool charset_is_utf8(std::string_view charset) noexcept {
        std::string_view names[] = {"UTF-8", "UTF8"};
        for (std::string_view name : names) {
            if (name.size() != charset.size()) {
                continue;
            }
            bool same = true;
            for (std::size_t i = 0; i < name.size(); ++i) {
                if (ascii_upper(charset[i]) != name[i]) {
                    same = false;
                    break;
                }
            }
            if (same) {
                return true;
            }
        }
        return false;
    }

    core::Status charset_decode(core::BufferView in, std::string_view charset, std::string* utf8_out) {
        if (utf8_out == nullptr || (in.len > 0 && in.data == nullptr)) {
            return codec_status(core::StatusCode::Invalid);
        }
        if (charset.empty()) {
            return codec_status(core::StatusCode::Invalid);
        }
        if (in.len == 0) {
            utf8_out->clear();
            return core::ok_status();
        }
        const char* data = reinterpret_cast<const char*>(in.data);
        if (charset_is_utf8(charset)) {
            utf8_out->assign(data, static_cast<std::size_t>(in.len));
            return core::ok_status();
        }
        return convert(data, static_cast<std::size_t>(in.len), std::string(kUtf8), std::string(charset), utf8_out);
    }

    core::Status charset_encode(std::string_view utf8, std::string_view charset, std::string* out) {
        if (out == nullptr || charset.empty()) {
            return codec_status(core::StatusCode::Invalid);
        }
        if (charset_is_utf8(charset)) {
            out->assign(utf8.data(), utf8.size());
            return core::ok_status();
        }
        return convert(utf8.data(), utf8.size(), std::string(charset), std::string(kUtf8), out);
    }
} // namespace bytestring::codec
