#include "bytestring/io/data_input.hpp"

#include <cstring>
#include <utility>

#include "bytestring/codec/charset.hpp"

namespace bytestring::io {
    using core::StatusCode;

    BytesDataInput::BytesDataInput(seq::BytesSubsequence source) noexcept : source_(std::move(source)) {}

    Status BytesDataInput::require(i64 width) const noexcept {
        if (width > remaining()) {
            return reader_status(StatusCode::EndOfData);
        }
        return core::ok_status();
    }

    Status BytesDataInput::read_fully(BufferMut dst) noexcept {
        return read_fully(dst, 0, static_cast<i64>(dst.len));
    }

    Status BytesDataInput::read_fully(BufferMut dst, i64 offset, i64 length) noexcept {
        if (dst.data == nullptr && dst.len > 0) {
            return reader_status(StatusCode::Invalid);
        }
        const i64 dst_len = static_cast<i64>(dst.len);
        if (offset < 0 || offset > dst_len || length < 0 || length > dst_len - offset) {
            return reader_status(StatusCode::OutOfRange);
        }
        const Status s = require(length);
        if (!core::is_ok(s)) {
            return s;
        }
        if (length > 0) {
            std::memcpy(dst.data + offset, source_.view().data + index_, static_cast<std::size_t>(length));
            index_ += length;
        }
        return core::ok_status();
    }

    Status BytesDataInput::skip_bytes(i64 n, i64* skipped) noexcept {
        if (skipped == nullptr || n < 0) {
            return reader_status(StatusCode::Invalid);
        }
        const i64 step = n < remaining() ? n : remaining();
        index_ += step;
        *skipped = step;
        return core::ok_status();
    }

    Status BytesDataInput::read_boolean(bool* out) noexcept {
        u8 v = 0;
        const Status s = read_unsigned_byte(out == nullptr ? nullptr : &v);
        if (core::is_ok(s)) {
            *out = v != 0;
        }
        return s;
    }

    Status BytesDataInput::read_byte(i8* out) noexcept {
        u8 v = 0;
        const Status s = read_unsigned_byte(out == nullptr ? nullptr : &v);
        if (core::is_ok(s)) {
            *out = static_cast<i8>(v);
        }
        return s;
    }

    Status BytesDataInput::read_unsigned_byte(u8* out) noexcept {
        if (out == nullptr) {
            return reader_status(StatusCode::Invalid);
        }
        const Status s = require(1);
        if (!core::is_ok(s)) {
            return s;
        }
        *out = source_.view().data[index_];
        index_ += 1;
        return core::ok_status();
    }

    Status BytesDataInput::read_short(i16* out) noexcept {
        if (out == nullptr) {
            return reader_status(StatusCode::Invalid);
        }
        Status s = require(2);
        if (!core::is_ok(s)) {
            return s;
        }
        s = source_.get_short(index_, out);
        if (core::is_ok(s)) {
            index_ += 2;
        }
        return s;
    }

    Status BytesDataInput::read_unsigned_short(u16* out) noexcept {
        if (out == nullptr) {
            return reader_status(StatusCode::Invalid);
        }
        Status s = require(2);
        if (!core::is_ok(s)) {
            return s;
        }
        s = source_.get_unsigned_short(index_, out);
        if (core::is_ok(s)) {
            index_ += 2;
        }
        return s;
    }

    Status BytesDataInput::read_char(char16_t* out) noexcept {
        if (out == nullptr) {
            return reader_status(StatusCode::Invalid);
        }
        Status s = require(2);
        if (!core::is_ok(s)) {
            return s;
        }
        s = source_.get_char(index_, out);
        if (core::is_ok(s)) {
            index_ += 2;
        }
        return s;
    }

    Status BytesDataInput::read_int(i32* out) noexcept {
        if (out == nullptr) {
            return reader_status(StatusCode::Invalid);
        }
        Status s = require(4);
        if (!core::is_ok(s)) {
            return s;
        }
        s = source_.get_int(index_, out);
        if (core::is_ok(s)) {
            index_ += 4;
        }
        return s;
    }

    Status BytesDataInput::read_long(i64* out) noexcept {
        if (out == nullptr) {
            return reader_status(StatusCode::Invalid);
        }
        Status s = require(8);
        if (!core::is_ok(s)) {
            return s;
        }
        s = source_.get_long(index_, out);
        if (core::is_ok(s)) {
            index_ += 8;
        }
        return s;
    }

    Status BytesDataInput::read_float(float* out) noexcept {
        if (out == nullptr) {
            return reader_status(StatusCode::Invalid);
        }
        Status s = require(4);
        if (!core::is_ok(s)) {
            return s;
        }
        s = source_.get_float(index_, out);
        if (core::is_ok(s)) {
            index_ += 4;
        }
        return s;
    }

    Status BytesDataInput::read_double(double* out) noexcept {
        if (out == nullptr) {
            return reader_status(StatusCode::Invalid);
        }
        Status s = require(8);
        if (!core::is_ok(s)) {
            return s;
        }
        s = source_.get_double(index_, out);
        if (core::is_ok(s)) {
            index_ += 8;
        }
        return s;
    }

    Status BytesDataInput::read_line(std::string* out) {
        if (out == nullptr) {
            return reader_status(StatusCode::Invalid);
        }
        out->clear();
        const u8* data = source_.view().data;
        const i64 len = source_.length();
        while (index_ < len) {
            const u8 c = data[index_++];
            if (c == '\n') {
                break;
            }
            if (c == '\r') {
                if (index_ < len && data[index_] == '\n') {
                    ++index_;
                }
                break;
            }
            out->push_back(static_cast<char>(c));
        }
        return core::ok_status();
    }

    Status BytesDataInput::read_c_string(std::string* out) {
        if (out == nullptr) {
            return reader_status(StatusCode::Invalid);
        }
        i64 end = source_.index_of(static_cast<u8>(0), index_);
        const bool terminated = end != core::kNotFound;
        if (!terminated) {
            end = source_.length();
        }
        BufferView span{};
        if (end > index_) {
            span = BufferView{source_.view().data + index_, static_cast<core::u64>(end - index_)};
        }
        const Status s = codec::charset_decode(span, codec::kUtf8, out);
        if (!core::is_ok(s)) {
            return s;
        }
        index_ = terminated ? end + 1 : end;
        return core::ok_status();
    }
} // namespace bytestring::io
