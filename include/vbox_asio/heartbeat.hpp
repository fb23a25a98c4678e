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

#include <asio/any_io_executor.hpp>
#include <asio/as_tuple.hpp>
#include <asio/awaitable.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <spdlog/spdlog.h>

#include "interface.hpp"

namespace vbox_asio {

/**
 * @brief Emits a heartbeat after a period of write inactivity.
 *
 * restart() is called after every write and pushes the next tick out by one interval.
 * pause() stops ticking until the next restart(). A failed tick pauses the scheduler;
 * the connection owner restarts it once the link is usable again.
 */
class heartbeat_scheduler : public std::enable_shared_from_this<heartbeat_scheduler> {
public:
    using tick_fn = std::function<asio::awaitable<status>()>;

    heartbeat_scheduler(const asio::any_io_executor& exec, std::chrono::milliseconds interval,
                        tick_fn tick, std::shared_ptr<spdlog::logger> log)
        : m_timer(exec), m_interval(interval), m_tick(std::move(tick)), m_log(std::move(log)) {}

    heartbeat_scheduler(const heartbeat_scheduler&) = delete;
    heartbeat_scheduler& operator=(const heartbeat_scheduler&) = delete;

    void restart() {
        if (m_interval.count() <= 0)
            return;

        m_paused = false;
        if (m_running) {
            m_timer.cancel();
            return;
        }

        m_running = true;
        auto generation = ++m_generation;
        asio::co_spawn(
            m_timer.get_executor(),
            [self = shared_from_this(), generation]() -> asio::awaitable<void> {
                return self->loop(generation);
            },
            asio::detached);
    }

    void pause() noexcept {
        m_paused = true;
        m_timer.cancel();
    }

    [[nodiscard]] bool is_paused() const noexcept {
        return m_paused;
    }

    [[nodiscard]] uint64_t ticks() const noexcept {
        return m_ticks;
    }

    [[nodiscard]] std::chrono::milliseconds interval() const noexcept {
        return m_interval;
    }

private:
    asio::awaitable<void> loop(uint64_t generation) {
        while (!m_paused && generation == m_generation) {
            m_timer.expires_after(m_interval);
            auto [ec] = co_await m_timer.async_wait(asio::as_tuple(asio::use_awaitable));

            if (m_paused)
                break;

            // Cancelled by restart(): wait a full interval again
            if (ec)
                continue;

            ++m_ticks;
            auto s = co_await m_tick();
            if (s.failed() && !m_paused) {
                m_log->warn("heartbeat failed, pausing: {}", s.error());
                m_paused = true;
            }
        }

        if (generation == m_generation) {
            m_running = false;
        }
        co_return;
    }

    asio::steady_timer m_timer;
    std::chrono::milliseconds m_interval;
    tick_fn m_tick;
    std::shared_ptr<spdlog::logger> m_log;

    bool m_running = false;
    bool m_paused = true;
    uint64_t m_generation = 0;
    uint64_t m_ticks = 0;
};

} // namespace vbox_asio
