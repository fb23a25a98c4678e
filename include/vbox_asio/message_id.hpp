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

#include <atomic>
#include <cstdint>

namespace vbox_asio {

// Cycles 1..255; 0 is never handed out
class message_id_allocator {
public:
    explicit message_id_allocator(uint8_t base = 0) : m_last(base) {}

    [[nodiscard]] uint8_t next() noexcept {
        uint8_t last = m_last.load(std::memory_order_relaxed);
        uint8_t id = 0;
        do {
            id = advance(last);
        } while (!m_last.compare_exchange_weak(last, id, std::memory_order_relaxed));
        return id;
    }

    // Last issued id, 0 before the first call
    [[nodiscard]] uint8_t current() const noexcept {
        return m_last.load(std::memory_order_relaxed);
    }

    void reset(uint8_t base = 0) noexcept {
        m_last.store(base, std::memory_order_relaxed);
    }

    // Make id the next value returned
    void set_next(uint8_t id) noexcept {
        m_last.store(id <= 1 ? 0 : static_cast<uint8_t>(id - 1), std::memory_order_relaxed);
    }

private:
    static uint8_t advance(uint8_t last) noexcept {
        return last == 255 ? 1 : static_cast<uint8_t>(last + 1);
    }

    std::atomic<uint8_t> m_last;
};

} // namespace vbox_asio
