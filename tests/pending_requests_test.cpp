#include "test_helpers.hpp"

#include <asio/strand.hpp>
#include <atomic>
#include <thread>
#include <vbox_asio/pending_requests.hpp>

using namespace vbox_asio;
using namespace std::chrono_literals;
using vbox_test::async_process;
using vbox_test::sleep_for;

namespace {

response make_response(command_id code, uint8_t id) {
    response r;
    r.code = static_cast<uint8_t>(code);
    r.message_id = id;
    return r;
}

} // namespace

TEST(pending_request_table, resolve_completes_waiter) {
    pending_request_table table;

    async_process([&]() -> asio::awaitable<void> {
        auto exec = co_await asio::this_coro::executor;
        auto p = table.register_request(exec, 7, command_id::room_count, 1000ms);
        EXPECT_NE(nullptr, p);
        EXPECT_TRUE(table.contains(7));

        asio::co_spawn(
            exec,
            [&]() -> asio::awaitable<void> {
                co_await sleep_for(10ms);
                auto r = make_response(command_id::room_count, 7);
                r.body = room_count_response{3, {}};
                EXPECT_TRUE(table.resolve(r));
            },
            asio::detached);

        auto [r, s] = co_await table.wait(p);
        EXPECT_FALSE(s.failed()) << s.error();
        ASSERT_TRUE(r.is<room_count_response>());
        EXPECT_EQ(3, r.get_if<room_count_response>()->count);
        EXPECT_EQ(0u, table.size());
        co_return;
    });
}

TEST(pending_request_table, wrong_code_does_not_resolve) {
    pending_request_table table;
    asio::io_context ioc;

    auto p = table.register_request(ioc.get_executor(), 3, command_id::key_status, 1000ms);
    ASSERT_NE(nullptr, p);

    EXPECT_FALSE(table.resolve(make_response(command_id::acknowledgement, 3)));
    EXPECT_FALSE(table.resolve(make_response(command_id::key_status, 4)));
    EXPECT_TRUE(table.resolve(make_response(command_id::key_status, 3)));
    EXPECT_FALSE(table.resolve(make_response(command_id::key_status, 3)));
}

TEST(pending_request_table, any_code_when_unconstrained) {
    pending_request_table table;
    asio::io_context ioc;

    auto p = table.register_request(ioc.get_executor(), 3, std::nullopt, 1000ms);
    ASSERT_NE(nullptr, p);
    EXPECT_TRUE(table.resolve(make_response(command_id::node_existence_status, 3)));
}

TEST(pending_request_table, duplicate_id_rejected) {
    pending_request_table table;
    asio::io_context ioc;

    auto p = table.register_request(ioc.get_executor(), 9, std::nullopt, 1000ms);
    ASSERT_NE(nullptr, p);
    EXPECT_EQ(nullptr, table.register_request(ioc.get_executor(), 9, std::nullopt, 1000ms));
    EXPECT_EQ(1u, table.size());
}

TEST(pending_request_table, timeout_fires_within_margin) {
    pending_request_table table;

    async_process([&]() -> asio::awaitable<void> {
        auto exec = co_await asio::this_coro::executor;
        auto start = std::chrono::steady_clock::now();
        auto p = table.register_request(exec, 1, command_id::room_count, 100ms);

        auto [r, s] = co_await table.wait(p);
        auto elapsed = std::chrono::steady_clock::now() - start;

        EXPECT_EQ(error_code::request_timeout, s.code());
        EXPECT_GE(elapsed, 100ms);
        EXPECT_LT(elapsed, 600ms);
        EXPECT_FALSE(table.contains(1));

        // A late response is no longer ours
        EXPECT_FALSE(table.resolve(make_response(command_id::room_count, 1)));
        co_return;
    });
}

TEST(pending_request_table, expire_before_deadline_is_noop) {
    pending_request_table table;
    asio::io_context ioc;

    auto p = table.register_request(ioc.get_executor(), 5, std::nullopt, 10000ms);
    EXPECT_FALSE(table.expire(5));
    EXPECT_TRUE(table.contains(5));
}

TEST(pending_request_table, resolution_wins_over_later_expiry) {
    pending_request_table table;

    async_process([&]() -> asio::awaitable<void> {
        auto exec = co_await asio::this_coro::executor;
        auto p = table.register_request(exec, 2, std::nullopt, 20ms);

        EXPECT_TRUE(table.resolve(make_response(command_id::acknowledgement, 2)));
        co_await sleep_for(40ms);
        EXPECT_FALSE(table.expire(2));

        auto [r, s] = co_await table.wait(p);
        EXPECT_FALSE(s.failed()) << s.error();
        EXPECT_TRUE(r.is<acknowledgement>() || r.is<generic_unused_response>());
        co_return;
    });
}

TEST(pending_request_table, invalidate_all_releases_every_waiter) {
    pending_request_table table;
    int released = 0;

    async_process([&]() -> asio::awaitable<void> {
        auto exec = co_await asio::this_coro::executor;

        for (uint8_t id = 1; id <= 3; ++id) {
            auto p = table.register_request(exec, id, std::nullopt, 10000ms);
            asio::co_spawn(
                exec,
                [&table, &released, p]() -> asio::awaitable<void> {
                    auto [r, s] = co_await table.wait(p);
                    EXPECT_EQ(error_code::connection_lost, s.code());
                    ++released;
                },
                asio::detached);
        }

        co_await sleep_for(10ms);
        EXPECT_EQ(3u, table.invalidate_all(status(error_code::connection_lost, "test")));
        EXPECT_EQ(0u, table.size());
        co_return;
    });

    EXPECT_EQ(3, released);
}

TEST(pending_request_table, wake_not_lost_across_threads) {
    constexpr int rounds = 200;
    pending_request_table table;
    asio::io_context ioc;
    auto strand = asio::make_strand(ioc);
    std::atomic<int> completed{0};
    std::atomic<int> late{0};

    asio::co_spawn(
        ioc,
        [&]() -> asio::awaitable<void> {
            for (int i = 0; i < rounds; ++i) {
                auto id = static_cast<uint8_t>(i % 250 + 1);
                auto p = table.register_request(strand, id, std::nullopt, 2000ms);
                if (!p) {
                    ++late;
                    continue;
                }

                // Resolved on whichever thread picks this up, racing the waiter
                asio::post(ioc, [&table, id]() {
                    table.resolve(make_response(command_id::acknowledgement, id));
                });

                auto start = std::chrono::steady_clock::now();
                auto [r, s] = co_await table.wait(p);
                if (s.failed() || std::chrono::steady_clock::now() - start > 500ms)
                    ++late;
                ++completed;
            }
        },
        asio::detached);

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&ioc]() { ioc.run(); });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(rounds, completed.load());
    EXPECT_EQ(0, late.load());
}
