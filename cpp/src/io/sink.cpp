#include "bytestring/io/sink.hpp"

#include <cerrno>
#include <cstddef>

#include <unistd.h>

namespace bytestring::io {
    using namespace bytestring::core;

    Status sink_write_fd(int fd, BufferView data) noexcept {
        if (fd < 0) {
            return make_status(StatusDomain::Io, StatusCode::Invalid);
        }
        if (data.len > 0 && data.data == nullptr) {
            return make_status(StatusDomain::Io, StatusCode::Invalid);
        }

        u64 written = 0;
        while (written < data.len) {
            const ssize_t n = ::write(fd, data.data + written, static_cast<std::size_t>(data.len - written));
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return make_status(StatusDomain::Io, StatusCode::Io, static_cast<u32>(errno));
            }
            written += static_cast<u64>(n);
        }
        return ok_status();
    }

    Status sink_write_file(std::FILE* file, BufferView data) noexcept {
        if (file == nullptr) {
            return make_status(StatusDomain::Io, StatusCode::Invalid);
        }
        if (data.len == 0) {
            return ok_status();
        }
        if (data.data == nullptr) {
            return make_status(StatusDomain::Io, StatusCode::Invalid);
        }

        errno = 0;
        const std::size_t n = std::fwrite(data.data, 1, static_cast<std::size_t>(data.len), file);
        if (n != data.len) {
            return make_status(StatusDomain::Io, StatusCode::Io, static_cast<u32>(errno));
        }
        return ok_status();
    }
} // namespace bytestring::io
