#pragma once

#include <cstdio>

#include "bytestring/core/errors.hpp"
#include "bytestring/core/types.hpp"

namespace bytestring::io {

    // Writes all of 'data' to the descriptor, retrying on EINTR and short writes.
    // Failures report Io with errno in aux.
    [[nodiscard]] bytestring::core::Status sink_write_fd(int fd, bytestring::core::BufferView data) noexcept;

    [[nodiscard]] bytestring::core::Status sink_write_file(std::FILE* file, bytestring::core::BufferView data) noexcept;

} // namespace bytestring::io
