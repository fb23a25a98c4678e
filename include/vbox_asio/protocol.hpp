/*
MIT License

Copyright (c) 2019 Vladislav Troinich

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/

#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <fmt/format.h>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "interface.hpp"

namespace vbox_asio {

namespace protocol {
    // "VTU"
    constexpr std::array<uint8_t, 3> prefix = {0x56, 0x54, 0x55};

    constexpr uint8_t dir_outgoing = 0x3E; // '>'
    constexpr uint8_t dir_incoming = 0x3C; // '<'

    constexpr std::size_t direction_index = 3;
    constexpr std::size_t command_index = 4;
    constexpr std::size_t length_index = 5;
    constexpr std::size_t message_id_index = 7;
    constexpr std::size_t payload_index = 8;

    // Bytes in front of the region covered by the length field
    constexpr std::size_t header_size = 7;
    // Length counts the message id and checksum bytes on top of the payload
    constexpr std::size_t length_overhead = 2;
    constexpr std::size_t min_frame_size = header_size + length_overhead;
    // Largest frame the box emits is a few hundred bytes; anything declared above this is corrupt
    constexpr std::size_t max_frame_size = 1024;

    constexpr uint8_t login_field_marker = 0x0A;
}

// One wire unit, checksum stripped
struct frame {
    uint8_t direction = protocol::dir_incoming;
    uint8_t command = 0;
    uint8_t message_id = 0;
    bytes_t payload;
};

// Byte sum modulo 256
[[nodiscard]] inline uint8_t checksum(std::span<const uint8_t> bytes) noexcept {
    uint32_t sum = 0;
    for (auto b : bytes) {
        sum += b;
    }
    return static_cast<uint8_t>(sum & 0xFF);
}

[[nodiscard]] inline std::string to_hex_string(std::span<const uint8_t> bytes) {
    std::string out;
    out.reserve(bytes.size() * 3);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i > 0) {
            out.push_back(':');
        }
        out += fmt::format("{:02X}", bytes[i]);
    }
    return out;
}

// UTF-8 in, UTF-16LE code units out
[[nodiscard]] inline bytes_t encode_utf16le(string_view text) {
    bytes_t out;
    out.reserve(text.size() * 2);

    auto push_unit = [&out](uint16_t unit) {
        out.push_back(static_cast<uint8_t>(unit & 0xFF));
        out.push_back(static_cast<uint8_t>(unit >> 8));
    };

    std::size_t i = 0;
    while (i < text.size()) {
        auto c = static_cast<uint8_t>(text[i]);
        uint32_t cp = 0xFFFD;
        std::size_t extra = 0;

        if (c < 0x80) {
            cp = c;
        } else if ((c & 0xE0) == 0xC0) {
            cp = c & 0x1F;
            extra = 1;
        } else if ((c & 0xF0) == 0xE0) {
            cp = c & 0x0F;
            extra = 2;
        } else if ((c & 0xF8) == 0xF0) {
            cp = c & 0x07;
            extra = 3;
        }

        if (i + extra >= text.size() && extra > 0) {
            push_unit(0xFFFD);
            break;
        }

        for (std::size_t k = 1; k <= extra; ++k) {
            cp = (cp << 6) | (static_cast<uint8_t>(text[i + k]) & 0x3F);
        }
        i += extra + 1;

        if (cp >= 0x10000) {
            cp -= 0x10000;
            push_unit(static_cast<uint16_t>(0xD800 + (cp >> 10)));
            push_unit(static_cast<uint16_t>(0xDC00 + (cp & 0x3FF)));
        } else {
            push_unit(static_cast<uint16_t>(cp));
        }
    }

    return out;
}

// UTF-16LE code units in, UTF-8 out; trailing NULs and a dangling odd byte are dropped
[[nodiscard]] inline std::string decode_utf16le(std::span<const uint8_t> bytes) {
    std::string out;
    out.reserve(bytes.size() / 2);

    auto append_cp = [&out](uint32_t cp) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    };

    const std::size_t units = bytes.size() / 2;
    for (std::size_t i = 0; i < units; ++i) {
        uint32_t unit = bytes[i * 2] | (static_cast<uint32_t>(bytes[i * 2 + 1]) << 8);

        if (unit >= 0xD800 && unit < 0xDC00 && i + 1 < units) {
            uint32_t low = bytes[(i + 1) * 2] | (static_cast<uint32_t>(bytes[(i + 1) * 2 + 1]) << 8);
            if (low >= 0xDC00 && low < 0xE000) {
                append_cp(0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
                ++i;
                continue;
            }
        }

        append_cp(unit);
    }

    while (!out.empty() && out.back() == '\0') {
        out.pop_back();
    }

    return out;
}

struct frame_codec {
    // Serialize a request as an outgoing frame carrying message_id
    [[nodiscard]] static bytes_t encode(const request& req, uint8_t message_id) {
        frame f;
        f.direction = protocol::dir_outgoing;
        f.command = static_cast<uint8_t>(req.command);
        f.message_id = message_id;
        f.payload = req.payload;
        return encode(f);
    }

    [[nodiscard]] static bytes_t encode(const frame& f) {
        const std::size_t length = f.payload.size() + protocol::length_overhead;

        bytes_t out;
        out.reserve(protocol::header_size + length);
        out.insert(out.end(), protocol::prefix.begin(), protocol::prefix.end());
        out.push_back(f.direction);
        out.push_back(f.command);
        out.push_back(static_cast<uint8_t>((length >> 8) & 0xFF));
        out.push_back(static_cast<uint8_t>(length & 0xFF));
        out.push_back(f.message_id);
        out.insert(out.end(), f.payload.begin(), f.payload.end());
        out.push_back(checksum(out));
        return out;
    }

    // Total size announced by a frame header; nullopt while fewer than header_size bytes
    [[nodiscard]] static optional<std::size_t> frame_size(std::span<const uint8_t> bytes) noexcept {
        if (bytes.size() < protocol::header_size) {
            return std::nullopt;
        }
        std::size_t length = (static_cast<std::size_t>(bytes[protocol::length_index]) << 8) |
                             bytes[protocol::length_index + 1];
        return protocol::header_size + length;
    }

    // Exactly one complete frame in, checksum and length verified
    [[nodiscard]] static std::pair<frame, status> decode(std::span<const uint8_t> bytes) {
        if (bytes.size() < protocol::min_frame_size) {
            return {frame{}, status(error_code::malformed_frame,
                                    fmt::format("frame too short ({} bytes)", bytes.size()))};
        }

        if (!std::equal(protocol::prefix.begin(), protocol::prefix.end(), bytes.begin())) {
            return {frame{}, status(error_code::malformed_frame, "missing frame prefix")};
        }

        auto declared = frame_size(bytes).value_or(0);
        if (declared < protocol::min_frame_size || declared != bytes.size()) {
            return {frame{}, status(error_code::malformed_frame,
                                    fmt::format("declared size {} does not match {} bytes",
                                                declared, bytes.size()))};
        }

        auto body = bytes.first(bytes.size() - 1);
        auto expected = checksum(body);
        if (expected != bytes.back()) {
            return {frame{}, status(error_code::malformed_frame,
                                    fmt::format("checksum mismatch: got {:#04x}, expected {:#04x}",
                                                bytes.back(), expected))};
        }

        frame f;
        f.direction = bytes[protocol::direction_index];
        f.command = bytes[protocol::command_index];
        f.message_id = bytes[protocol::message_id_index];
        f.payload.assign(body.begin() + protocol::payload_index, body.end());
        return {std::move(f), status()};
    }
};

/**
 * @brief Splits the inbound byte stream into complete frames.
 *
 * A single read may carry zero, one or several frames, and a frame may span reads.
 * Bytes in front of the next prefix are dropped. Consumed bytes are tracked with a read
 * cursor and compacted occasionally instead of erasing on every frame.
 */
class frame_splitter {
public:
    static constexpr std::size_t max_buffer_bytes = 64 * 1024; // hard cap against junk streams
    static constexpr std::size_t compact_threshold = 4096;

    void push_bytes(std::span<const uint8_t> data) {
        if (data.empty())
            return;

        if (available_bytes() + data.size() > max_buffer_bytes) {
            m_dropped += available_bytes();
            clear();
            if (data.size() > max_buffer_bytes) {
                m_dropped += data.size() - max_buffer_bytes;
                data = data.last(max_buffer_bytes);
            }
        }

        m_buf.insert(m_buf.end(), data.begin(), data.end());
    }

    // Next complete frame, undecoded; nullopt when more input is needed
    [[nodiscard]] optional<bytes_t> pop() {
        for (;;) {
            auto avail = std::span<const uint8_t>(m_buf).subspan(m_read_pos);
            if (avail.empty())
                return std::nullopt;

            auto it = std::search(avail.begin(), avail.end(), protocol::prefix.begin(),
                                  protocol::prefix.end());
            if (it == avail.end()) {
                // Keep a tail that could be the start of a prefix split across reads
                std::size_t keep = std::min(avail.size(), protocol::prefix.size() - 1);
                while (keep > 0 && !std::equal(avail.end() - keep, avail.end(), protocol::prefix.begin())) {
                    --keep;
                }
                skip(avail.size() - keep);
                return std::nullopt;
            }

            if (it != avail.begin()) {
                skip(static_cast<std::size_t>(it - avail.begin()));
                continue;
            }

            auto total = frame_codec::frame_size(avail);
            if (!total.has_value())
                return std::nullopt;

            if (*total < protocol::min_frame_size || *total > protocol::max_frame_size) {
                // Corrupt length: resync past this prefix
                skip(1);
                continue;
            }

            if (avail.size() < *total) {
                // Another header inside the declared span means this frame was cut short
                auto next = find_header(avail, 1);
                if (next < avail.size()) {
                    skip(next);
                    continue;
                }
                return std::nullopt;
            }

            bytes_t out(avail.begin(), avail.begin() + static_cast<std::ptrdiff_t>(*total));
            m_read_pos += *total;
            maybe_compact();
            return out;
        }
    }

    void clear() noexcept {
        m_buf.clear();
        m_read_pos = 0;
    }

    [[nodiscard]] std::size_t available_bytes() const noexcept {
        return m_buf.size() - m_read_pos;
    }

    // Garbage discarded while resynchronizing
    [[nodiscard]] std::size_t dropped_bytes() const noexcept {
        return m_dropped;
    }

private:
    // Offset of the next prefix followed by a direction byte, at or after from
    static std::size_t find_header(std::span<const uint8_t> bytes, std::size_t from) {
        const std::size_t header = protocol::prefix.size() + 1;
        for (std::size_t i = from; i + header <= bytes.size(); ++i) {
            if (!std::equal(protocol::prefix.begin(), protocol::prefix.end(),
                            bytes.begin() + static_cast<std::ptrdiff_t>(i)))
                continue;
            auto dir = bytes[i + protocol::direction_index];
            if (dir == protocol::dir_incoming || dir == protocol::dir_outgoing)
                return i;
        }
        return bytes.size();
    }

    void skip(std::size_t n) {
        m_read_pos += n;
        m_dropped += n;
        maybe_compact();
    }

    void maybe_compact() {
        if (m_read_pos == m_buf.size()) {
            clear();
            return;
        }
        if (m_read_pos >= compact_threshold) {
            m_buf.erase(m_buf.begin(), m_buf.begin() + static_cast<std::ptrdiff_t>(m_read_pos));
            m_read_pos = 0;
        }
    }

    bytes_t m_buf;
    std::size_t m_read_pos = 0;
    std::size_t m_dropped = 0;
};

} // namespace vbox_asio
