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

#include <asio/awaitable.hpp>
#include <algorithm>
#include <exception>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>
#include <utility>
#include <vector>

#include "interface.hpp"
#include "responses.hpp"

namespace vbox_asio {

// Fans unsolicited responses out to registered listeners, in registration order
class event_dispatcher {
public:
    explicit event_dispatcher(std::shared_ptr<spdlog::logger> log) : m_log(std::move(log)) {}

    listener_id on_key_status(on_key_status_cb cb) {
        std::lock_guard<std::mutex> lock(m_mtx);
        auto id = ++m_last_id;
        m_key_status.emplace_back(id, std::move(cb));
        return id;
    }

    listener_id on_unsolicited(on_response_cb cb) {
        std::lock_guard<std::mutex> lock(m_mtx);
        auto id = ++m_last_id;
        m_unsolicited.emplace_back(id, std::move(cb));
        return id;
    }

    bool remove_listener(listener_id id) {
        std::lock_guard<std::mutex> lock(m_mtx);
        return erase(m_key_status, id) || erase(m_unsolicited, id);
    }

    [[nodiscard]] std::size_t listener_count() const {
        std::lock_guard<std::mutex> lock(m_mtx);
        return m_key_status.size() + m_unsolicited.size();
    }

    // A listener that throws is logged and does not stop the others
    asio::awaitable<void> dispatch(const response& r) {
        std::vector<std::pair<listener_id, on_key_status_cb>> key_status;
        std::vector<std::pair<listener_id, on_response_cb>> unsolicited;
        {
            std::lock_guard<std::mutex> lock(m_mtx);
            unsolicited = m_unsolicited;
            if (r.is<key_status_response>()) {
                key_status = m_key_status;
            }
        }

        if (const auto* ks = r.get_if<key_status_response>()) {
            for (auto& [id, cb] : key_status) {
                try {
                    co_await cb(*ks);
                } catch (const std::exception& e) {
                    m_log->error("key status listener {} failed: {}", id, e.what());
                }
            }
        }

        for (auto& [id, cb] : unsolicited) {
            try {
                co_await cb(r);
            } catch (const std::exception& e) {
                m_log->error("listener {} failed on {}: {}", id, describe(r), e.what());
            }
        }
    }

private:
    template <class Callbacks>
    static bool erase(Callbacks& callbacks, listener_id id) {
        auto it = std::find_if(callbacks.begin(), callbacks.end(),
                               [id](const auto& entry) { return entry.first == id; });
        if (it == callbacks.end())
            return false;
        callbacks.erase(it);
        return true;
    }

    std::shared_ptr<spdlog::logger> m_log;
    mutable std::mutex m_mtx;
    listener_id m_last_id = 0;
    std::vector<std::pair<listener_id, on_key_status_cb>> m_key_status;
    std::vector<std::pair<listener_id, on_response_cb>> m_unsolicited;
};

} // namespace vbox_asio
