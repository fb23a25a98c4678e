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

#include <array>
#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <magic_enum/magic_enum.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace spdlog {
class logger;
}

namespace vbox_asio {

using std::optional;
using std::string_view;

using aio = asio::io_context;
using bytes_t = std::vector<uint8_t>;

enum class error_code {
    ok = 0,
    not_connected,
    connection_exists,
    connection_lost,
    request_timeout,
    malformed_frame,
    message_id_in_use,
    connect_failed,
    handshake_failed,
    invalid_config,
    operation_failed
};

class status {
public:
    status() = default;

    status(error_code code) : m_code(code) {}

    status(error_code code, std::string error) : m_code(code), m_error(std::move(error)) {}

    status(const std::string& error) : m_code(error_code::operation_failed), m_error(error) {}

    ~status() = default;

    [[nodiscard]] bool failed() const noexcept {
        return m_code != error_code::ok;
    }

    [[nodiscard]] error_code code() const noexcept {
        return m_code;
    }

    [[nodiscard]] std::string error() const {
        if (!failed())
            return {};

        std::string name(magic_enum::enum_name(m_code));
        if (!m_error.has_value())
            return name;

        return name + ": " + m_error.value();
    }

private:
    error_code m_code = error_code::ok;
    optional<std::string> m_error;
};

enum class protocol_version { v1, v2 };

enum class connection_state { disconnected, connecting, connected, reconnecting };

// Request opcodes and response codes share one numbering
enum class command_id : uint8_t {
    acknowledgement = 0x00,
    login = 0x01,
    heartbeat = 0x07,
    toggle_heartbeat = 0x08,
    room_meta_data = 0x1A,
    room_count = 0x1D,
    node_meta_data = 0x1F,
    node_count = 0x24,
    node_status = 0x25,
    toggle_key_status = 0x28,
    key_status = 0x29,
    key_parameters = 0x2B,
    internal_unit_statuses = 0x60,
    node_existence_status = 0xC8
};

// Trailing underscore for C++ keywords (long_, short_)
enum class key_power : uint8_t {
    on = 0x4F,
    off = 0x46,
    long_ = 0x4C,
    short_ = 0x53,
    released = 0x52
};

enum class key_category : uint8_t { undefined = 0, light = 1, fan = 6, boiler = 7 };

enum class led_brightness : uint8_t { off = 0, low = 1, high = 2, max = 3 };

enum class lock_status : uint8_t { unlocked = 0, locked = 1 };

// Outbound request: opcode plus encoded payload
struct request {
    command_id command = command_id::heartbeat;
    bytes_t payload;
    bool expects_response = true;
    optional<command_id> reply_code; // empty = any code carrying the same message id
};

struct generic_unused_response {
    uint8_t code = 0;
    bytes_t payload;
};

struct acknowledgement {};

struct room_count_response {
    uint8_t count = 0;
    std::vector<uint8_t> ids;
};

struct node_count_response {
    uint8_t count = 0;
    std::vector<uint8_t> ids;
};

struct room_meta_data_response {
    uint8_t room_id = 0;
    std::string name;
};

struct node_key {
    uint8_t id = 0;
    uint8_t type = 0;
};

struct node_meta_data_response {
    uint8_t node_id = 0;
    std::array<uint8_t, 8> mac_address{};
    uint8_t total_keys = 0;
    std::vector<node_key> keys;
    lock_status lock = lock_status::unlocked;
    led_brightness led_level = led_brightness::off;
    std::string version;
    uint8_t room_id = 0;

    [[nodiscard]] bool is_locked() const noexcept {
        return lock == lock_status::locked;
    }
};

// V2 layout is not decoded field by field
struct node_meta_data_v2_response {
    uint8_t node_id = 0;
    bytes_t payload;
};

struct key_status_response {
    uint8_t node_id = 0;
    uint8_t key_id = 0;
    key_power power = key_power::off;

    [[nodiscard]] bool is_on() const noexcept {
        return power == key_power::on;
    }

    [[nodiscard]] bool is_off() const noexcept {
        return power == key_power::off;
    }

    [[nodiscard]] bool is_released() const noexcept {
        return power == key_power::released;
    }
};

struct key_parameters_response {
    uint8_t node_id = 0;
    uint8_t key_id = 0;
    key_category category = key_category::undefined;
    uint8_t dimmer_ratio = 0;
    std::string name;
};

struct key_parameters_v2_response {
    uint8_t node_id = 0;
    uint8_t key_id = 0;
    bytes_t payload;
};

struct internal_unit_statuses_response {
    bytes_t payload;
};

using response_body =
    std::variant<generic_unused_response, acknowledgement, room_count_response,
                 room_meta_data_response, node_count_response, node_meta_data_response,
                 node_meta_data_v2_response, key_status_response, key_parameters_response,
                 key_parameters_v2_response, internal_unit_statuses_response>;

// Decoded inbound frame
struct response {
    uint8_t code = 0;
    uint8_t message_id = 0;
    response_body body;

    template <class T>
    [[nodiscard]] const T* get_if() const noexcept {
        return std::get_if<T>(&body);
    }

    template <class T>
    [[nodiscard]] bool is() const noexcept {
        return std::holds_alternative<T>(body);
    }
};

struct connect_config {
    std::string address = "192.168.1.23";
    uint16_t port = 11501;

    optional<std::string> user;
    optional<std::string> password;

    protocol_version version = protocol_version::v2;

    // Reconnection with exponential backoff
    bool should_reconnect = true;
    uint32_t retry_initial_delay_ms = 1000;  // Initial delay in milliseconds
    uint32_t retry_max_delay_ms = 30000;     // Maximum delay cap in milliseconds
    uint32_t retry_max_attempts = 0;         // 0 = unlimited retries

    // Idle heartbeat, 0 = disabled
    std::chrono::milliseconds heartbeat_interval{3000};
    // Payload of the ToggleHeartbeat request sent during the handshake
    bool enable_box_heartbeat = true;
    bool unsolicited_updates = true;

    std::chrono::milliseconds request_timeout{10000};
    std::chrono::milliseconds request_buffer{250};   // minimum gap between frame writes
    std::chrono::milliseconds connect_timeout{10000};
    std::size_t read_buffer_size = 4096;

    bool ignore_ack_logs = false;
};

using listener_id = uint64_t;

using on_key_status_cb = std::function<asio::awaitable<void>(const key_status_response& status)>;
using on_response_cb = std::function<asio::awaitable<void>(const response& r)>;

struct iconnection {
    virtual ~iconnection() = default;

    // Establish the socket and run the handshake (ToggleHeartbeat, then Login)
    [[nodiscard]] virtual asio::awaitable<status> connect(const connect_config& conf) = 0;

    // Close the socket and fail every pending request; idempotent
    virtual void disconnect() noexcept = 0;

    [[nodiscard]] virtual bool is_connected() const noexcept = 0;

    [[nodiscard]] virtual connection_state state() const noexcept = 0;

    // Send and wait for the correlated response, using the configured request timeout
    [[nodiscard]] virtual asio::awaitable<std::pair<response, status>> send(const request& req) = 0;

    [[nodiscard]] virtual asio::awaitable<std::pair<response, status>> send(
        const request& req, std::chrono::milliseconds timeout) = 0;

    // Queue a frame without waiting for any response
    [[nodiscard]] virtual asio::awaitable<status> post(const request& req) = 0;

    // Key-status pushes not correlated to any pending request
    virtual listener_id on_key_status(on_key_status_cb cb) = 0;

    // Every unsolicited response, of any kind
    virtual listener_id on_unsolicited(on_response_cb cb) = 0;

    virtual bool remove_listener(listener_id id) = 0;
};
using iconnection_sptr = std::shared_ptr<iconnection>;

using on_connected_cb = std::function<asio::awaitable<void>(iconnection&)>;
using on_disconnected_cb = std::function<asio::awaitable<void>(iconnection&)>;
using on_error_cb = std::function<asio::awaitable<void>(iconnection&, string_view)>;

[[nodiscard]] iconnection_sptr create_connection(aio& io, const on_connected_cb& connected_cb,
                                                 const on_disconnected_cb& disconnected_cb,
                                                 const on_error_cb& error_cb,
                                                 std::shared_ptr<spdlog::logger> log = {});

} // namespace vbox_asio

// Byte-valued enums span 0..255, wider than magic_enum's default range
template <>
struct magic_enum::customize::enum_range<vbox_asio::command_id> {
    static constexpr int min = 0;
    static constexpr int max = 255;
};

template <>
struct magic_enum::customize::enum_range<vbox_asio::key_power> {
    static constexpr int min = 0;
    static constexpr int max = 255;
};
