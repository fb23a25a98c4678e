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
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <vbox_asio/client.hpp>

namespace vbox_tool {

enum class query_kind { rooms, nodes, room, node, key, params, on, off, release };

struct query_args {
    query_kind kind = query_kind::rooms;
    uint8_t id = 0;
    uint8_t node = 0;
    uint8_t key = 0;
    uint8_t dimmer = 0;
    uint16_t timer = 0;
};

// Runs one query against the box, prints the result and stops the io_context
class querier : public worker {
public:
    querier(asio::io_context& ioc, std::shared_ptr<spdlog::logger>& console,
            vbox_asio::iconnection_sptr conn, const query_args& args, output_mode mode)
        : worker(ioc, console, conn, 0), m_client(std::move(conn)), m_args(args),
          m_output_mode(mode) {}

    asio::awaitable<void> run() override {
        switch (m_args.kind) {
        case query_kind::rooms:
            co_await list_rooms();
            break;
        case query_kind::nodes:
            co_await list_nodes();
            break;
        case query_kind::room:
            print_result(co_await m_conn->send(vbox_asio::requests::room_meta_data(m_args.id)));
            break;
        case query_kind::node:
            print_result(co_await m_client.get_node_meta_data(m_args.id));
            break;
        case query_kind::key:
            print_result(co_await m_conn->send(
                vbox_asio::requests::key_status(m_args.node, m_args.key)));
            break;
        case query_kind::params:
            print_result(co_await m_client.get_key_parameters(m_args.node, m_args.key));
            break;
        case query_kind::on:
        case query_kind::off:
        case query_kind::release:
            co_await toggle();
            break;
        }

        m_log->info("Query finished, {} response(s)", m_counter);
        m_conn->disconnect();
        m_ioc.stop();
        co_return;
    }

private:
    asio::awaitable<void> list_rooms() {
        auto [rooms, s] = co_await m_client.get_room_count();
        if (s.failed()) {
            m_log->error("room count failed: {}", s.error());
            co_return;
        }

        m_log->info("{} room(s)", rooms.count);
        for (auto id : rooms.ids) {
            print_result(co_await m_conn->send(vbox_asio::requests::room_meta_data(id)));
        }
    }

    asio::awaitable<void> list_nodes() {
        auto [nodes, s] = co_await m_client.get_node_count();
        if (s.failed()) {
            m_log->error("node count failed: {}", s.error());
            co_return;
        }

        m_log->info("{} node(s)", nodes.count);
        for (auto id : nodes.ids) {
            print_result(co_await m_client.get_node_meta_data(id));
        }
    }

    asio::awaitable<void> toggle() {
        vbox_asio::status s;
        if (m_args.kind == query_kind::on) {
            s = co_await m_client.turn_key_on(m_args.node, m_args.key, m_args.dimmer, m_args.timer);
        } else if (m_args.kind == query_kind::off) {
            s = co_await m_client.turn_key_off(m_args.node, m_args.key);
        } else {
            s = co_await m_client.release_key(m_args.node, m_args.key);
        }

        if (s.failed()) {
            m_log->error("toggle of node {} key {} failed: {}", m_args.node, m_args.key, s.error());
            co_return;
        }

        m_counter++;
        m_log->info("node {} key {} set to {}", m_args.node, m_args.key,
                    magic_enum::enum_name(m_args.kind));
    }

    void print_result(const std::pair<vbox_asio::response, vbox_asio::status>& result) {
        const auto& [r, s] = result;
        if (s.failed()) {
            m_log->error("request failed: {}", s.error());
            return;
        }

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

    vbox_asio::client m_client;
    query_args m_args;
    output_mode m_output_mode;
};

} // namespace vbox_tool
