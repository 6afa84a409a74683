#include "bytestring/core/errors.hpp"

#include <cstring>

namespace bytestring::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "Ok";
            case StatusCode::Unknown: return "Unknown";
            case StatusCode::Invalid: return "Invalid";
            case StatusCode::OutOfRange: return "OutOfRange";
            case StatusCode::Format: return "Format";
            case StatusCode::EndOfData: return "EndOfData";
            case StatusCode::Unsupported: return "Unsupported";
            case StatusCode::ReadOnly: return "ReadOnly";
            case StatusCode::InvalidMark: return "InvalidMark";
            case StatusCode::OutOfMemory: return "OutOfMemory";
            case StatusCode::Io: return "Io";
            case StatusCode::Codec: return "Codec";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "Core";
            case StatusDomain::Sequence: return "Sequence";
            case StatusDomain::Buffer: return "Buffer";
            case StatusDomain::Reader: return "Reader";
            case StatusDomain::Codec: return "Codec";
            case StatusDomain::Io: return "Io";
        }
        return "Unknown";
    }

    void status_print(std::FILE* out, const char* context, Status s) noexcept {
        if (out == nullptr) {
            return;
        }
        if (context == nullptr) {
            context = "operation";
        }
        std::fprintf(out,
                     "error: %s failed (code=%s/%u, domain=%s/%u, aux=%u)\n",
                     context,
                     status_code_name(s.code),
                     static_cast<unsigned>(s.code),
                     status_domain_name(s.domain),
                     static_cast<unsigned>(s.domain),
                     s.aux);
        if (s.code == StatusCode::Io && s.aux != 0) {
            std::fprintf(out, "error: %s: %s\n", context, std::strerror(static_cast<int>(s.aux)));
        }
    }
} // namespace bytestring::core
