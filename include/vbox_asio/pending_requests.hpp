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
#include <asio/post.hpp>
#include <asio/steady_timer.hpp>
#include <asio/use_awaitable.hpp>
#include <fmt/format.h>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

#include "interface.hpp"

namespace vbox_asio {

struct pending_request {
    using clock = std::chrono::steady_clock;

    pending_request(const asio::any_io_executor& exec, uint8_t id, optional<command_id> code,
                    clock::time_point until)
        : timer(exec), message_id(id), reply_code(code), deadline(until) {}

    [[nodiscard]] bool accepts(const response& r) const noexcept {
        if (r.message_id != message_id)
            return false;
        return !reply_code.has_value() || static_cast<uint8_t>(*reply_code) == r.code;
    }

    asio::steady_timer timer;
    const uint8_t message_id;
    const optional<command_id> reply_code;
    const clock::time_point deadline;

    // Guarded by the owning table's mutex
    bool done = false;
    response result;
    status result_status;
};
using pending_request_sptr = std::shared_ptr<pending_request>;

/**
 * @brief In-flight requests keyed by message id.
 *
 * Each entry completes exactly once: with the correlated response, with request_timeout once
 * its deadline passes, or with the status given to invalidate_all(). The first completion
 * removes the entry, so a response arriving after its timeout is handled as unsolicited.
 */
class pending_request_table {
public:
    using clock = pending_request::clock;

    // nullptr when the id is still in flight
    [[nodiscard]] pending_request_sptr register_request(const asio::any_io_executor& exec,
                                                        uint8_t message_id,
                                                        optional<command_id> reply_code,
                                                        std::chrono::milliseconds timeout) {
        std::lock_guard<std::mutex> lock(m_mtx);
        if (m_entries.contains(message_id))
            return nullptr;

        auto p = std::make_shared<pending_request>(exec, message_id, reply_code,
                                                   clock::now() + timeout);
        m_entries.emplace(message_id, p);
        return p;
    }

    // True when r completed a pending entry
    bool resolve(const response& r) {
        pending_request_sptr p;
        {
            std::lock_guard<std::mutex> lock(m_mtx);
            auto it = m_entries.find(r.message_id);
            if (it == m_entries.end() || !it->second->accepts(r))
                return false;

            p = it->second;
            m_entries.erase(it);
            p->done = true;
            p->result = r;
        }
        wake(p);
        return true;
    }

    // Times the entry out if its deadline has passed
    bool expire(uint8_t message_id) {
        pending_request_sptr p;
        {
            std::lock_guard<std::mutex> lock(m_mtx);
            auto it = m_entries.find(message_id);
            if (it == m_entries.end() || clock::now() < it->second->deadline)
                return false;

            p = it->second;
            m_entries.erase(it);
            p->done = true;
            p->result_status = status(error_code::request_timeout,
                                      fmt::format("no response for message id {}", message_id));
        }
        wake(p);
        return true;
    }

    // Fails every entry with s; returns how many were released
    std::size_t invalidate_all(const status& s) {
        std::unordered_map<uint8_t, pending_request_sptr> entries;
        {
            std::lock_guard<std::mutex> lock(m_mtx);
            entries.swap(m_entries);
            for (auto& [id, p] : entries) {
                p->done = true;
                p->result_status = s;
            }
        }
        for (auto& [id, p] : entries) {
            wake(p);
        }
        return entries.size();
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(m_mtx);
        return m_entries.size();
    }

    [[nodiscard]] bool contains(uint8_t message_id) const {
        std::lock_guard<std::mutex> lock(m_mtx);
        return m_entries.contains(message_id);
    }

    // Suspends until p completes
    [[nodiscard]] asio::awaitable<std::pair<response, status>> wait(pending_request_sptr p) {
        auto exec = p->timer.get_executor();
        co_return co_await asio::co_spawn(exec, wait_on_timer_executor(std::move(p)),
                                          asio::use_awaitable);
    }

private:
    // The done check, arming and wake()'s cancel share the timer's executor, so a wake
    // posted between the check and async_wait still finds the wait armed
    asio::awaitable<std::pair<response, status>> wait_on_timer_executor(pending_request_sptr p) {
        for (;;) {
            {
                std::lock_guard<std::mutex> lock(m_mtx);
                if (p->done)
                    co_return std::make_pair(p->result, p->result_status);
            }

            p->timer.expires_at(p->deadline);
            auto [ec] = co_await p->timer.async_wait(asio::as_tuple(asio::use_awaitable));
            if (!ec) {
                expire(p->message_id);
            }
        }
    }

    static void wake(const pending_request_sptr& p) {
        asio::post(p->timer.get_executor(), [p]() { p->timer.cancel(); });
    }

    mutable std::mutex m_mtx;
    std::unordered_map<uint8_t, pending_request_sptr> m_entries;
};

} // namespace vbox_asio
