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

#include <asio/as_tuple.hpp>
#include <asio/co_spawn.hpp>
#include <asio/connect.hpp>
#include <asio/detached.hpp>
#include <asio/dispatch.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <spdlog/fmt/bin_to_hex.h>
#include <spdlog/spdlog.h>
#include <string>

#include "config.hpp"
#include "event_dispatcher.hpp"
#include "heartbeat.hpp"
#include "interface.hpp"
#include "message_id.hpp"
#include "pending_requests.hpp"
#include "protocol.hpp"
#include "requests.hpp"
#include "responses.hpp"

namespace vbox_asio {

using asio::awaitable;
using asio::use_awaitable;

class connection : public iconnection, public std::enable_shared_from_this<connection> {
public:
    using clock = std::chrono::steady_clock;
    using strand_type = asio::strand<aio::executor_type>;

    connection(aio& io, const on_connected_cb& connected_cb,
               const on_disconnected_cb& disconnected_cb, const on_error_cb& error_cb,
               std::shared_ptr<spdlog::logger> log)
        : m_log(log ? std::move(log) : spdlog::default_logger()), m_strand(asio::make_strand(io)),
          m_socket(m_strand), m_retry_timer(m_strand), m_state(connection_state::disconnected),
          m_epoch(0), m_heartbeat_armed(false), m_session(0), m_dispatcher(m_log),
          m_connected_cb(connected_cb), m_disconnected_cb(disconnected_cb), m_error_cb(error_cb) {}

    connection(const connection&) = delete;
    connection& operator=(const connection&) = delete;

    ~connection() override {
        ++m_epoch;
        if (m_heartbeat) {
            m_heartbeat->pause();
        }
    }

    [[nodiscard]] awaitable<status> connect(const connect_config& conf) override {
        auto expected = connection_state::disconnected;
        if (!m_state.compare_exchange_strong(expected, connection_state::connecting)) {
            co_return status(error_code::connection_exists,
                             fmt::format("already {}", magic_enum::enum_name(expected)));
        }

        const auto epoch = m_epoch.load();
        m_conf = conf;
        m_log->info("connecting to {}", describe(m_conf));

        auto s = co_await do_connect(epoch);
        if (s.failed()) {
            auto connecting = connection_state::connecting;
            if (epoch == m_epoch) {
                m_state.compare_exchange_strong(connecting, connection_state::disconnected);
            }
            co_return s;
        }

        auto connecting = connection_state::connecting;
        if (epoch != m_epoch ||
            !m_state.compare_exchange_strong(connecting, connection_state::connected)) {
            co_return status(error_code::connection_lost, "disconnected while connecting");
        }

        make_heartbeat();
        start_reading();

        auto hs = co_await handshake();
        if (epoch != m_epoch) {
            co_return status(error_code::connection_lost, "disconnected during handshake");
        }
        if (hs.failed()) {
            m_log->error("handshake with {}:{} failed: {}", m_conf.address, m_conf.port, hs.error());
            disconnect();
            co_return status(error_code::handshake_failed, hs.error());
        }

        arm_heartbeat();
        m_log->info("connected to {}:{}", m_conf.address, m_conf.port);

        if (m_connected_cb) {
            co_await m_connected_cb(*this);
        }
        co_return status{};
    }

    void disconnect() noexcept override {
        try {
            // Retires any connect or reconnect still in flight
            ++m_epoch;
            auto prev = m_state.exchange(connection_state::disconnected);
            const auto session = ++m_session;
            m_heartbeat_armed = false;
            {
                std::lock_guard<std::mutex> lock(m_out_mtx);
                m_outbox.clear();
            }

            auto released =
                m_pending.invalidate_all(status(error_code::connection_lost, "disconnected"));

            asio::dispatch(m_strand, [weak = weak_from_this(), session]() {
                if (auto self = weak.lock()) {
                    self->m_retry_timer.cancel();
                    // A connect() that already adopted a new socket owns the session now
                    if (self->m_session != session)
                        return;
                    if (self->m_heartbeat) {
                        self->m_heartbeat->pause();
                    }
                    self->close_socket();
                }
            });

            if (prev != connection_state::disconnected) {
                m_log->info("disconnected from {}:{}, {} pending request(s) released",
                            m_conf.address, m_conf.port, released);
            }
        } catch (const std::exception& e) {
            m_log->error("disconnect: {}", e.what());
        }
    }

    [[nodiscard]] bool is_connected() const noexcept override {
        return m_state == connection_state::connected;
    }

    [[nodiscard]] connection_state state() const noexcept override {
        return m_state;
    }

    [[nodiscard]] awaitable<std::pair<response, status>> send(const request& req) override {
        co_return co_await send(req, m_conf.request_timeout);
    }

    [[nodiscard]] awaitable<std::pair<response, status>> send(
        const request& req, std::chrono::milliseconds timeout) override {
        if (!req.expects_response) {
            auto s = co_await post(req);
            co_return std::make_pair(response{}, s);
        }

        if (!is_connected()) {
            co_return std::make_pair(response{}, status(error_code::not_connected));
        }

        auto id = m_ids.next();
        auto p = m_pending.register_request(m_strand, id, req.reply_code, timeout);
        if (!p) {
            co_return std::make_pair(
                response{}, status(error_code::message_id_in_use,
                                   fmt::format("message id {} is still in flight", id)));
        }

        auto bytes = frame_codec::encode(req, id);
        log_sent(req, id, bytes);
        enqueue(std::move(bytes));

        auto result = co_await m_pending.wait(p);
        if (result.second.code() == error_code::request_timeout) {
            m_log->warn("{} id={} timed out after {}ms", magic_enum::enum_name(req.command), id,
                        timeout.count());
        }
        co_return result;
    }

    [[nodiscard]] awaitable<status> post(const request& req) override {
        if (!is_connected()) {
            co_return status(error_code::not_connected);
        }

        auto id = m_ids.next();
        auto bytes = frame_codec::encode(req, id);
        log_sent(req, id, bytes);
        enqueue(std::move(bytes));
        co_return status{};
    }

    listener_id on_key_status(on_key_status_cb cb) override {
        return m_dispatcher.on_key_status(std::move(cb));
    }

    listener_id on_unsolicited(on_response_cb cb) override {
        return m_dispatcher.on_unsolicited(std::move(cb));
    }

    bool remove_listener(listener_id id) override {
        return m_dispatcher.remove_listener(id);
    }

private:
    /**
     * Resolve and connect a candidate socket under a watchdog, then adopt it as the session
     * socket. A candidate whose epoch was retired by disconnect() is discarded without touching
     * the session socket, which by then may belong to a newer connect().
     */
    awaitable<status> do_connect(uint64_t epoch) {
        auto candidate = std::make_shared<asio::ip::tcp::socket>(m_strand);
        auto timed_out = std::make_shared<bool>(false);
        try {
            asio::ip::tcp::resolver resolver(m_strand);
            auto endpoints = co_await resolver.async_resolve(
                m_conf.address, std::to_string(m_conf.port), use_awaitable);

            if (epoch != m_epoch) {
                co_return status(error_code::connection_lost, "disconnected while connecting");
            }

            asio::steady_timer watchdog(m_strand);
            watchdog.expires_after(m_conf.connect_timeout);
            watchdog.async_wait([candidate, timed_out](const asio::error_code& ec) {
                if (ec)
                    return;
                *timed_out = true;
                asio::error_code ignored;
                candidate->close(ignored);
            });

            co_await asio::async_connect(*candidate, endpoints, use_awaitable);
            watchdog.cancel();
            candidate->set_option(asio::ip::tcp::no_delay(true));
        } catch (const std::system_error& e) {
            auto reason = *timed_out ? std::string("connect timed out") : e.code().message();
            co_return status(error_code::connect_failed,
                             fmt::format("{}:{}: {}", m_conf.address, m_conf.port, reason));
        }

        if (epoch != m_epoch) {
            asio::error_code ignored;
            candidate->close(ignored);
            co_return status(error_code::connection_lost, "disconnected while connecting");
        }

        close_socket();
        m_socket = std::move(*candidate);
        m_splitter.clear();
        {
            std::lock_guard<std::mutex> lock(m_out_mtx);
            m_outbox.clear();
            m_writing = false;
            ++m_session;
        }
        m_last_write = clock::time_point{};
        co_return status{};
    }

    awaitable<status> handshake() {
        auto [ack, s] = co_await send(
            requests::toggle_heartbeat(m_conf.enable_box_heartbeat, m_conf.unsolicited_updates));
        if (s.failed())
            co_return s;

        if (m_conf.user.has_value()) {
            auto [login_ack, ls] = co_await send(
                requests::login(m_conf.user.value(), m_conf.password.value_or("")));
            if (ls.failed())
                co_return ls;
        }

        co_return status{};
    }

    void make_heartbeat() {
        if (m_heartbeat) {
            m_heartbeat->pause();
        }

        m_heartbeat = std::make_shared<heartbeat_scheduler>(
            m_strand, m_conf.heartbeat_interval,
            [this]() -> awaitable<status> {
                auto req = requests::heartbeat();
                req.expects_response = false;
                co_return co_await post(req);
            },
            m_log);
    }

    void arm_heartbeat() {
        m_heartbeat_armed = true;
        asio::dispatch(m_strand, [self = shared_from_this()]() {
            if (self->m_heartbeat_armed && self->m_heartbeat) {
                self->m_heartbeat->restart();
            }
        });
    }

    void start_reading() {
        asio::co_spawn(
            m_strand,
            [self = shared_from_this(), session = m_session.load()]() -> awaitable<void> {
                return self->run(session);
            },
            asio::detached);
    }

    awaitable<void> run(uint64_t session) {
        bytes_t buf(std::max<std::size_t>(m_conf.read_buffer_size, protocol::min_frame_size));

        for (;;) {
            auto [ec, n] =
                co_await m_socket.async_read_some(asio::buffer(buf), asio::as_tuple(use_awaitable));

            if (session != m_session) {
                co_return;
            }

            if (ec) {
                co_await handle_connection_lost(ec.message());
                co_return;
            }

            m_splitter.push_bytes(std::span<const uint8_t>(buf.data(), n));
            while (auto raw = m_splitter.pop()) {
                co_await handle_frame(*raw);
                if (session != m_session)
                    co_return;
            }
        }
    }

    awaitable<void> handle_frame(const bytes_t& raw) {
        m_log->debug("<< {:n}", spdlog::to_hex(raw));

        auto [f, s] = frame_codec::decode(raw);
        if (s.failed()) {
            m_log->warn("dropping frame: {}", s.error());
            co_return;
        }

        if (f.direction != protocol::dir_incoming) {
            m_log->warn("dropping frame with direction {:#04x}", f.direction);
            co_return;
        }

        auto r = response_factory::from_frame(f, m_conf.version);
        log_received(r);

        if (m_pending.resolve(r)) {
            co_return;
        }

        co_await m_dispatcher.dispatch(r);
    }

    awaitable<void> handle_connection_lost(const std::string& reason) {
        const auto epoch = m_epoch.load();
        m_log->warn("connection to {}:{} lost: {}", m_conf.address, m_conf.port, reason);

        m_heartbeat_armed = false;
        if (m_heartbeat) {
            m_heartbeat->pause();
        }
        close_socket();
        m_splitter.clear();

        auto released = m_pending.invalidate_all(status(error_code::connection_lost, reason));
        if (released > 0) {
            m_log->debug("{} pending request(s) released", released);
        }

        const bool reconnect = m_conf.should_reconnect;
        auto current = connection_state::connected;
        if (!m_state.compare_exchange_strong(current, reconnect ? connection_state::reconnecting
                                                                : connection_state::disconnected)) {
            co_return;
        }

        if (m_disconnected_cb) {
            co_await m_disconnected_cb(*this);
        }

        if (epoch != m_epoch) {
            co_return;
        }

        if (!reconnect) {
            if (m_error_cb) {
                co_await m_error_cb(*this, fmt::format("connection lost: {}", reason));
            }
            co_return;
        }

        co_await reconnect_loop(epoch);
    }

    // Runs until reconnected, out of attempts, or its epoch is retired by disconnect()
    awaitable<void> reconnect_loop(uint64_t epoch) {
        uint32_t retry_delay_ms = m_conf.retry_initial_delay_ms;
        uint32_t retry_count = 0;

        for (;;) {
            if (epoch != m_epoch) {
                co_return;
            }

            auto s = co_await do_connect(epoch);
            if (epoch != m_epoch) {
                co_return;
            }

            if (!s.failed()) {
                break;
            }

            retry_count++;
            m_log->warn("reconnect attempt {} failed: {}", retry_count, s.error());

            // Check max attempts (0 = unlimited)
            if (m_conf.retry_max_attempts > 0 && retry_count >= m_conf.retry_max_attempts) {
                auto reconnecting = connection_state::reconnecting;
                if (!m_state.compare_exchange_strong(reconnecting, connection_state::disconnected)) {
                    co_return;
                }
                m_log->error("giving up on {}:{} after {} attempt(s)", m_conf.address, m_conf.port,
                             retry_count);
                if (m_error_cb) {
                    co_await m_error_cb(*this, "max reconnection attempts reached");
                }
                co_return;
            }

            m_retry_timer.expires_after(std::chrono::milliseconds(retry_delay_ms));
            co_await m_retry_timer.async_wait(asio::as_tuple(use_awaitable));

            // Exponential backoff: double delay, cap at max
            retry_delay_ms = std::min(retry_delay_ms * 2, m_conf.retry_max_delay_ms);
        }

        auto reconnecting = connection_state::reconnecting;
        if (!m_state.compare_exchange_strong(reconnecting, connection_state::connected)) {
            co_return;
        }
        start_reading();

        auto hs = co_await handshake();
        if (epoch != m_epoch) {
            co_return;
        }
        if (hs.failed()) {
            m_log->error("handshake after reconnect failed: {}", hs.error());
        }

        if (!is_connected()) {
            co_return;
        }

        arm_heartbeat();
        m_log->info("reconnected to {}:{}", m_conf.address, m_conf.port);

        if (m_connected_cb) {
            co_await m_connected_cb(*this);
        }
    }

    void enqueue(bytes_t bytes) {
        uint64_t session = 0;
        {
            std::lock_guard<std::mutex> lock(m_out_mtx);
            m_outbox.push_back(std::move(bytes));
            if (m_writing)
                return;
            m_writing = true;
            session = m_session;
        }

        asio::co_spawn(
            m_strand,
            [self = shared_from_this(), session]() -> awaitable<void> {
                return self->write_loop(session);
            },
            asio::detached);
    }

    // Single writer per session; frames leave at most one per request_buffer
    awaitable<void> write_loop(uint64_t session) {
        asio::steady_timer pacer(m_strand);

        for (;;) {
            bytes_t next;
            {
                std::lock_guard<std::mutex> lock(m_out_mtx);
                if (session != m_session)
                    co_return;
                if (m_outbox.empty()) {
                    m_writing = false;
                    co_return;
                }
                next = std::move(m_outbox.front());
                m_outbox.pop_front();
            }

            auto ready = m_last_write + m_conf.request_buffer;
            if (m_conf.request_buffer.count() > 0 && clock::now() < ready) {
                pacer.expires_at(ready);
                co_await pacer.async_wait(asio::as_tuple(use_awaitable));
                if (session != m_session)
                    co_return;
            }

            m_log->debug(">> {:n}", spdlog::to_hex(next));
            auto [ec, n] =
                co_await asio::async_write(m_socket, asio::buffer(next), asio::as_tuple(use_awaitable));
            m_last_write = clock::now();

            if (session != m_session)
                co_return;

            if (ec) {
                m_log->error("write failed: {}", ec.message());
                {
                    std::lock_guard<std::mutex> lock(m_out_mtx);
                    m_outbox.clear();
                    m_writing = false;
                }
                // The read loop observes the closed socket and runs the connection-lost path
                close_socket();
                co_return;
            }

            if (m_heartbeat_armed && m_heartbeat) {
                m_heartbeat->restart();
            }
        }
    }

    void close_socket() noexcept {
        asio::error_code ec;
        m_socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        m_socket.close(ec);
    }

    void log_sent(const request& req, uint8_t id, const bytes_t& bytes) {
        auto name = magic_enum::enum_name(req.command);

        switch (req.command) {
        case command_id::login:
            m_log->info("sent {} id={} user={}", name, id, redact(m_conf.user.value_or("")));
            break;
        case command_id::heartbeat:
            m_log->debug("sent {} id={}", name, id);
            break;
        default:
            m_log->info("sent {} id={} payload=[{:n}]", name, id, spdlog::to_hex(req.payload));
            break;
        }
        m_log->trace("frame {:n}", spdlog::to_hex(bytes));
    }

    void log_received(const response& r) {
        const bool quiet = r.is<acknowledgement>() || r.is<generic_unused_response>();
        if (quiet && m_conf.ignore_ack_logs) {
            m_log->debug("received {}", describe(r));
            return;
        }
        m_log->info("received {}", describe(r));
    }

    std::shared_ptr<spdlog::logger> m_log;
    strand_type m_strand;
    asio::ip::tcp::socket m_socket;
    asio::steady_timer m_retry_timer;
    connect_config m_conf;

    std::atomic<connection_state> m_state;
    // Bumped by disconnect(); connect and reconnect attempts from an older epoch stand down
    std::atomic<uint64_t> m_epoch;
    std::atomic<bool> m_heartbeat_armed;
    std::atomic<uint64_t> m_session;

    message_id_allocator m_ids;
    pending_request_table m_pending;
    event_dispatcher m_dispatcher;
    std::shared_ptr<heartbeat_scheduler> m_heartbeat;
    frame_splitter m_splitter;

    std::mutex m_out_mtx;
    std::deque<bytes_t> m_outbox;
    bool m_writing = false;
    clock::time_point m_last_write{};

    on_connected_cb m_connected_cb;
    on_disconnected_cb m_disconnected_cb;
    on_error_cb m_error_cb;
};

inline iconnection_sptr create_connection(aio& io, const on_connected_cb& connected_cb,
                                          const on_disconnected_cb& disconnected_cb,
                                          const on_error_cb& error_cb,
                                          std::shared_ptr<spdlog::logger> log) {
    return std::make_shared<connection>(io, connected_cb, disconnected_cb, error_cb,
                                        std::move(log));
}

} // namespace vbox_asio
