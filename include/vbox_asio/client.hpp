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
#include <fmt/format.h>
#include <utility>

#include "interface.hpp"
#include "requests.hpp"
#include "responses.hpp"

namespace vbox_asio {

/**
 * @brief Typed convenience operations over a connection.
 *
 * Every call returns the decoded body together with a status. A reply whose kind does not
 * match the request fails with operation_failed and leaves the body default-constructed.
 */
class client {
public:
    explicit client(iconnection_sptr conn) : m_conn(std::move(conn)) {}

    [[nodiscard]] iconnection& connection() noexcept {
        return *m_conn;
    }

    [[nodiscard]] asio::awaitable<status> connect(const connect_config& conf) {
        co_return co_await m_conn->connect(conf);
    }

    void disconnect() noexcept {
        m_conn->disconnect();
    }

    [[nodiscard]] asio::awaitable<std::pair<room_count_response, status>> get_room_count() {
        co_return co_await send_as<room_count_response>(requests::room_count());
    }

    [[nodiscard]] asio::awaitable<std::pair<node_count_response, status>> get_node_count() {
        co_return co_await send_as<node_count_response>(requests::node_count());
    }

    [[nodiscard]] asio::awaitable<std::pair<room_meta_data_response, status>> get_room_meta_data(
        uint8_t room_id) {
        co_return co_await send_as<room_meta_data_response>(requests::room_meta_data(room_id));
    }

    // Body is node_meta_data_response for v1, node_meta_data_v2_response for v2
    [[nodiscard]] asio::awaitable<std::pair<response, status>> get_node_meta_data(uint8_t node_id) {
        co_return co_await m_conn->send(requests::node_meta_data(node_id));
    }

    [[nodiscard]] asio::awaitable<std::pair<key_status_response, status>> get_key_status(
        uint8_t node_id, uint8_t key_id) {
        co_return co_await send_as<key_status_response>(requests::key_status(node_id, key_id));
    }

    // Body is key_parameters_response for v1, key_parameters_v2_response for v2
    [[nodiscard]] asio::awaitable<std::pair<response, status>> get_key_parameters(uint8_t node_id,
                                                                                  uint8_t key_id) {
        co_return co_await m_conn->send(requests::key_parameters(node_id, key_id));
    }

    [[nodiscard]] asio::awaitable<std::pair<response, status>> get_node_status(uint8_t node_id) {
        co_return co_await m_conn->send(requests::node_status(node_id));
    }

    [[nodiscard]] asio::awaitable<std::pair<internal_unit_statuses_response, status>>
    get_internal_unit_statuses() {
        co_return co_await send_as<internal_unit_statuses_response>(
            requests::internal_unit_statuses());
    }

    [[nodiscard]] asio::awaitable<status> toggle_key(uint8_t node_id, uint8_t key_id,
                                                     key_power power, uint8_t dimmer = 0,
                                                     uint16_t timer = 0) {
        auto [r, s] = co_await send_as<acknowledgement>(
            requests::toggle_key_status(node_id, key_id, power, dimmer, timer));
        co_return s;
    }

    [[nodiscard]] asio::awaitable<status> turn_key_on(uint8_t node_id, uint8_t key_id,
                                                      uint8_t dimmer = 0, uint16_t timer = 0) {
        co_return co_await toggle_key(node_id, key_id, key_power::on, dimmer, timer);
    }

    [[nodiscard]] asio::awaitable<status> turn_key_off(uint8_t node_id, uint8_t key_id) {
        co_return co_await toggle_key(node_id, key_id, key_power::off);
    }

    [[nodiscard]] asio::awaitable<status> release_key(uint8_t node_id, uint8_t key_id) {
        co_return co_await toggle_key(node_id, key_id, key_power::released);
    }

    [[nodiscard]] asio::awaitable<status> send_heartbeat() {
        auto [r, s] = co_await send_as<acknowledgement>(requests::heartbeat());
        co_return s;
    }

    listener_id on_key_status(on_key_status_cb cb) {
        return m_conn->on_key_status(std::move(cb));
    }

    listener_id on_unsolicited(on_response_cb cb) {
        return m_conn->on_unsolicited(std::move(cb));
    }

    bool remove_listener(listener_id id) {
        return m_conn->remove_listener(id);
    }

private:
    template <class T>
    asio::awaitable<std::pair<T, status>> send_as(request req) {
        auto [r, s] = co_await m_conn->send(req);
        if (s.failed())
            co_return std::make_pair(T{}, s);

        const auto* body = r.get_if<T>();
        if (body == nullptr) {
            co_return std::make_pair(
                T{}, status(error_code::operation_failed,
                            fmt::format("unexpected reply: {}", describe(r))));
        }
        co_return std::make_pair(*body, status{});
    }

    iconnection_sptr m_conn;
};

} // namespace vbox_asio
