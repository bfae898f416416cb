/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "convert_error.h"

#include <cstdint>
#include <cstring>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace j2m::msgp {
/**
 * Append-only MessagePack writer. Integers use the narrowest encoding of
 * their signedness family: signed values never use the unsigned markers and
 * unsigned values never use the signed ones.
 */
class MsgpWriter {
   public:
    explicit MsgpWriter(std::size_t initial_bytes = 256) { buf_.reserve(initial_bytes); }

    std::size_t size() const { return buf_.size(); }
    const std::vector<std::uint8_t>& bytes() const { return buf_; }
    std::vector<std::uint8_t> take() { return std::move(buf_); }

    void write_nil() { buf_.push_back(0xC0u); }

    void write_bool(bool v) { buf_.push_back(v ? 0xC3u : 0xC2u); }

    void write_int(std::int64_t v) {
        if (v >= 0) {
            if (v <= std::numeric_limits<std::int8_t>::max()) {
                buf_.push_back(static_cast<std::uint8_t>(v));
            } else if (v <= std::numeric_limits<std::int16_t>::max()) {
                buf_.push_back(0xD1u);
                put_be(static_cast<std::uint64_t>(v), 2);
            } else if (v <= std::numeric_limits<std::int32_t>::max()) {
                buf_.push_back(0xD2u);
                put_be(static_cast<std::uint64_t>(v), 4);
            } else {
                buf_.push_back(0xD3u);
                put_be(static_cast<std::uint64_t>(v), 8);
            }
            return;
        }
        if (v >= -32) {
            buf_.push_back(static_cast<std::uint8_t>(static_cast<std::int8_t>(v)));
        } else if (v >= std::numeric_limits<std::int8_t>::min()) {
            buf_.push_back(0xD0u);
            put_be(static_cast<std::uint64_t>(v), 1);
        } else if (v >= std::numeric_limits<std::int16_t>::min()) {
            buf_.push_back(0xD1u);
            put_be(static_cast<std::uint64_t>(v), 2);
        } else if (v >= std::numeric_limits<std::int32_t>::min()) {
            buf_.push_back(0xD2u);
            put_be(static_cast<std::uint64_t>(v), 4);
        } else {
            buf_.push_back(0xD3u);
            put_be(static_cast<std::uint64_t>(v), 8);
        }
    }

    void write_uint(std::uint64_t v) {
        if (v <= 0x7Fu) {
            buf_.push_back(static_cast<std::uint8_t>(v));
        } else if (v <= 0xFFu) {
            buf_.push_back(0xCCu);
            put_be(v, 1);
        } else if (v <= 0xFFFFu) {
            buf_.push_back(0xCDu);
            put_be(v, 2);
        } else if (v <= 0xFFFFFFFFu) {
            buf_.push_back(0xCEu);
            put_be(v, 4);
        } else {
            buf_.push_back(0xCFu);
            put_be(v, 8);
        }
    }

    void write_float32(float v) {
        std::uint32_t bits = 0;
        std::memcpy(&bits, &v, sizeof(bits));
        buf_.push_back(0xCAu);
        put_be(bits, 4);
    }

    void write_float64(double v) {
        std::uint64_t bits = 0;
        std::memcpy(&bits, &v, sizeof(bits));
        buf_.push_back(0xCBu);
        put_be(bits, 8);
    }

    void write_string(std::string_view s) {
        const std::uint32_t len = checked_length(s.size(), "string");
        if (len < 32) {
            buf_.push_back(static_cast<std::uint8_t>(0xA0u | len));
        } else if (len <= 0xFFu) {
            buf_.push_back(0xD9u);
            put_be(len, 1);
        } else if (len <= 0xFFFFu) {
            buf_.push_back(0xDAu);
            put_be(len, 2);
        } else {
            buf_.push_back(0xDBu);
            put_be(len, 4);
        }
        buf_.insert(buf_.end(), s.begin(), s.end());
    }

    void write_bytes(std::span<const std::uint8_t> bytes) {
        const std::uint32_t len = checked_length(bytes.size(), "binary");
        if (len <= 0xFFu) {
            buf_.push_back(0xC4u);
            put_be(len, 1);
        } else if (len <= 0xFFFFu) {
            buf_.push_back(0xC5u);
            put_be(len, 2);
        } else {
            buf_.push_back(0xC6u);
            put_be(len, 4);
        }
        buf_.insert(buf_.end(), bytes.begin(), bytes.end());
    }

    void write_array_header(std::size_t count) {
        write_container_header(checked_length(count, "array"), 0x90u, 0xDCu, 0xDDu);
    }

    void write_map_header(std::size_t count) {
        write_container_header(checked_length(count, "map"), 0x80u, 0xDEu, 0xDFu);
    }

   private:
    void put_be(std::uint64_t v, int byte_count) {
        for (int i = byte_count - 1; i >= 0; i--) {
            buf_.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu));
        }
    }

    void write_container_header(
        std::uint32_t count,
        std::uint8_t fix_marker,
        std::uint8_t marker16,
        std::uint8_t marker32
    ) {
        if (count < 16) {
            buf_.push_back(static_cast<std::uint8_t>(fix_marker | count));
        } else if (count <= 0xFFFFu) {
            buf_.push_back(marker16);
            put_be(count, 2);
        } else {
            buf_.push_back(marker32);
            put_be(count, 4);
        }
    }

    static std::uint32_t checked_length(std::size_t len, const char* what) {
        if (len > 0xFFFFFFFFu) {
            throw ConvertError(std::string("MessagePack ") + what + " too long");
        }
        return static_cast<std::uint32_t>(len);
    }

    std::vector<std::uint8_t> buf_;
};
}  // namespace j2m::msgp
