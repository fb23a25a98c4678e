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

#include "../include/response_json.hpp"
#include "../include/worker.hpp"
#include <asio/awaitable.hpp>
#include <iostream>
#include <spdlog/spdlog.h>
#include <vbox_asio/vbox_asio.hpp>

namespace vbox_tool {

// Prints key-status pushes until interrupted
class watcher : public worker {
public:
    watcher(asio::io_context& ioc, std::shared_ptr<spdlog::logger>& console,
            vbox_asio::iconnection_sptr conn, int stats_interval, output_mode mode,
            bool all_events)
        : worker(ioc, console, conn, stats_interval), m_output_mode(mode),
          m_all_events(all_events) {}

    ~watcher() override {
        m_conn->remove_listener(m_listener);
    }

    asio::awaitable<void> run() override {
        if (m_all_events) {
            m_listener = m_conn->on_unsolicited(
                [this](const vbox_asio::response& r) -> asio::awaitable<void> {
                    print(r);
                    co_return;
                });
        } else {
            m_listener = m_conn->on_key_status(
                [this](const vbox_asio::key_status_response& ks) -> asio::awaitable<void> {
                    vbox_asio::response r;
                    r.code = static_cast<uint8_t>(vbox_asio::command_id::key_status);
                    r.body = ks;
                    print(r);
                    co_return;
                });
        }

        m_log->info("Watching {} events", m_all_events ? "all unsolicited" : "key status");
        co_return;
    }

private:
    void print(const vbox_asio::response& r) {
        m_counter++;
        switch (m_output_mode) {
        case output_mode::json:
            std::cout << to_json(r).dump() << std::endl;
            break;
        case output_mode::normal:
        default:
            std::cout << vbox_asio::describe(r) << std::endl;
            break;
        }
    }

    output_mode m_output_mode;
    bool m_all_events;
    vbox_asio::listener_id m_listener = 0;
};

} // namespace vbox_tool
