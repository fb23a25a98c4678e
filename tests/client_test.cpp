#include "test_helpers.hpp"

#include <vbox_asio/client.hpp>

using namespace vbox_asio;
using vbox_test::async_process;

struct connection_mock : public iconnection {
    MOCK_METHOD(asio::awaitable<status>, connect, (const connect_config& conf), (override));
    MOCK_METHOD(void, disconnect, (), (noexcept, override));
    MOCK_METHOD(bool, is_connected, (), (const, noexcept, override));
    MOCK_METHOD(connection_state, state, (), (const, noexcept, override));
    MOCK_METHOD((asio::awaitable<std::pair<response, status>>), send, (const request& req),
                (override));
    MOCK_METHOD((asio::awaitable<std::pair<response, status>>), send,
                (const request& req, std::chrono::milliseconds timeout), (override));
    MOCK_METHOD(asio::awaitable<status>, post, (const request& req), (override));
    MOCK_METHOD(listener_id, on_key_status, (on_key_status_cb cb), (override));
    MOCK_METHOD(listener_id, on_unsolicited, (on_response_cb cb), (override));
    MOCK_METHOD(bool, remove_listener, (listener_id id), (override));
};

namespace {

asio::awaitable<std::pair<response, status>> answer(response r) {
    co_return std::make_pair(std::move(r), status{});
}

asio::awaitable<std::pair<response, status>> fail(error_code code) {
    co_return std::make_pair(response{}, status(code));
}

response with_body(command_id code, response_body body) {
    response r;
    r.code = static_cast<uint8_t>(code);
    r.message_id = 1;
    r.body = std::move(body);
    return r;
}

} // namespace

TEST(client, room_count_unwraps_body) {
    auto conn = std::make_shared<connection_mock>();
    client c(conn);

    EXPECT_CALL(*conn, send(testing::Field(&request::command, command_id::room_count)))
        .WillOnce([](const request&) {
            return answer(with_body(command_id::room_count, room_count_response{2, {4, 5}}));
        });

    async_process([&]() -> asio::awaitable<void> {
        auto [rooms, s] = co_await c.get_room_count();
        EXPECT_FALSE(s.failed()) << s.error();
        EXPECT_EQ(2, rooms.count);
        EXPECT_EQ((std::vector<uint8_t>{4, 5}), rooms.ids);
    });
}

TEST(client, unexpected_reply_kind_fails) {
    auto conn = std::make_shared<connection_mock>();
    client c(conn);

    EXPECT_CALL(*conn, send(testing::_)).WillOnce([](const request&) {
        return answer(with_body(command_id::acknowledgement, acknowledgement{}));
    });

    async_process([&]() -> asio::awaitable<void> {
        auto [ks, s] = co_await c.get_key_status(1, 2);
        EXPECT_EQ(error_code::operation_failed, s.code());
        EXPECT_EQ(0, ks.node_id);
    });
}

TEST(client, errors_pass_through) {
    auto conn = std::make_shared<connection_mock>();
    client c(conn);

    EXPECT_CALL(*conn, send(testing::_)).WillOnce([](const request&) {
        return fail(error_code::request_timeout);
    });

    async_process([&]() -> asio::awaitable<void> {
        auto [nodes, s] = co_await c.get_node_count();
        EXPECT_EQ(error_code::request_timeout, s.code());
    });
}

TEST(client, turn_key_on_sends_toggle) {
    auto conn = std::make_shared<connection_mock>();
    client c(conn);
    request sent;

    EXPECT_CALL(*conn, send(testing::_)).WillOnce([&sent](const request& r) {
        sent = r;
        return answer(with_body(command_id::acknowledgement, acknowledgement{}));
    });

    async_process([&]() -> asio::awaitable<void> {
        auto s = co_await c.turn_key_on(3, 1, 75, 600);
        EXPECT_FALSE(s.failed()) << s.error();
    });

    EXPECT_EQ(command_id::toggle_key_status, sent.command);
    EXPECT_EQ((bytes_t{3, 1, 0x4F, 75, 0x02, 0x58}), sent.payload);
    EXPECT_EQ(command_id::acknowledgement, sent.reply_code.value());
}

TEST(client, release_key_power_byte) {
    auto conn = std::make_shared<connection_mock>();
    client c(conn);
    request sent;

    EXPECT_CALL(*conn, send(testing::_)).WillOnce([&sent](const request& r) {
        sent = r;
        return answer(with_body(command_id::acknowledgement, acknowledgement{}));
    });

    async_process([&]() -> asio::awaitable<void> {
        auto s = co_await c.release_key(3, 2);
        EXPECT_FALSE(s.failed()) << s.error();
    });

    ASSERT_EQ(3u, sent.payload.size());
    EXPECT_EQ(0x52, sent.payload[2]);
}

TEST(client, node_meta_data_keeps_both_versions) {
    auto conn = std::make_shared<connection_mock>();
    client c(conn);

    EXPECT_CALL(*conn, send(testing::_)).WillOnce([](const request&) {
        return answer(with_body(command_id::node_meta_data, node_meta_data_v2_response{8, {8, 1}}));
    });

    async_process([&]() -> asio::awaitable<void> {
        auto [r, s] = co_await c.get_node_meta_data(8);
        EXPECT_FALSE(s.failed()) << s.error();
        ASSERT_TRUE(r.is<node_meta_data_v2_response>());
        EXPECT_EQ(8, r.get_if<node_meta_data_v2_response>()->node_id);
    });
}
