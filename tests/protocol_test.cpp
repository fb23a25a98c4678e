#include "test_helpers.hpp"

#include <vbox_asio/protocol.hpp>
#include <vbox_asio/requests.hpp>

using namespace vbox_asio;
using vbox_test::reply;

namespace {

std::vector<bytes_t> split_all(frame_splitter& splitter) {
    std::vector<bytes_t> out;
    while (auto f = splitter.pop()) {
        out.push_back(*f);
    }
    return out;
}

} // namespace

TEST(frame_codec, room_count_request_bytes) {
    auto bytes = frame_codec::encode(requests::room_count(), 1);
    bytes_t expected = {0x56, 0x54, 0x55, 0x3E, 0x1D, 0x00, 0x02, 0x01, 0x5D};
    EXPECT_EQ(expected, bytes);
}

TEST(frame_codec, room_count_reply_decodes) {
    bytes_t wire = {0x56, 0x54, 0x55, 0x3C, 0x1D, 0x00, 0x03, 0x01, 0x07, 0x63};
    auto [f, s] = frame_codec::decode(wire);
    ASSERT_FALSE(s.failed()) << s.error();
    EXPECT_EQ(protocol::dir_incoming, f.direction);
    EXPECT_EQ(0x1D, f.command);
    EXPECT_EQ(1, f.message_id);
    EXPECT_EQ(bytes_t{0x07}, f.payload);
}

TEST(frame_codec, request_survives_encode_decode) {
    std::vector<request> all = {
        requests::login("admin", "secret"),
        requests::heartbeat(),
        requests::toggle_heartbeat(true, false),
        requests::room_meta_data(3),
        requests::room_count(),
        requests::node_meta_data(9),
        requests::node_count(),
        requests::node_status(9),
        requests::toggle_key_status(9, 2, key_power::on, 80, 300),
        requests::key_status(9, 2),
        requests::key_parameters(9, 2),
        requests::internal_unit_statuses(),
    };

    uint8_t id = 250;
    for (const auto& r : all) {
        auto [f, s] = frame_codec::decode(frame_codec::encode(r, id));
        ASSERT_FALSE(s.failed()) << magic_enum::enum_name(r.command) << ": " << s.error();
        EXPECT_EQ(static_cast<uint8_t>(r.command), f.command);
        EXPECT_EQ(id, f.message_id);
        EXPECT_EQ(r.payload, f.payload);
        EXPECT_EQ(protocol::dir_outgoing, f.direction);
        id = id == 255 ? 1 : id + 1;
    }
}

TEST(frame_codec, any_flipped_byte_is_rejected) {
    auto good = frame_codec::encode(requests::toggle_key_status(4, 1, key_power::off), 17);
    for (std::size_t i = 0; i < good.size(); ++i) {
        auto bad = good;
        bad[i] ^= 0x01;
        auto [f, s] = frame_codec::decode(bad);
        EXPECT_TRUE(s.failed()) << "byte " << i;
        EXPECT_EQ(error_code::malformed_frame, s.code()) << "byte " << i;
    }
}

TEST(frame_codec, length_must_match_available_bytes) {
    auto good = reply(command_id::key_status, 5, {1, 2, 0x4F});

    auto truncated = good;
    truncated.pop_back();
    EXPECT_EQ(error_code::malformed_frame, frame_codec::decode(truncated).second.code());

    auto extended = good;
    extended.push_back(0x00);
    EXPECT_EQ(error_code::malformed_frame, frame_codec::decode(extended).second.code());

    bytes_t tiny = {0x56, 0x54, 0x55};
    EXPECT_EQ(error_code::malformed_frame, frame_codec::decode(tiny).second.code());
}

TEST(frame_codec, login_payload_is_utf16_with_markers) {
    auto r = requests::login("ab", "c");
    bytes_t expected = {0x0A, 'a', 0x00, 'b', 0x00, 0x0A, 'c', 0x00};
    EXPECT_EQ(expected, r.payload);
    EXPECT_EQ(command_id::acknowledgement, r.reply_code.value());
}

TEST(frame_codec, toggle_key_payload_layout) {
    auto r = requests::toggle_key_status(7, 3, key_power::on, 50, 0x0102);
    bytes_t expected = {7, 3, 0x4F, 50, 0x01, 0x02};
    EXPECT_EQ(expected, r.payload);
}

TEST(text, utf16_round_trip) {
    std::string text = "Living room \xD7\xA1\xD7\x9C\xD7\x95\xD7\x9F \xF0\x9F\x92\xA1";
    EXPECT_EQ(text, decode_utf16le(encode_utf16le(text)));
}

TEST(text, trailing_nuls_and_odd_byte_dropped) {
    bytes_t raw = {'K', 0, 'i', 0, 't', 0, 0, 0, 0, 0, 0x41};
    EXPECT_EQ("Kit", decode_utf16le(raw));
    EXPECT_EQ("", decode_utf16le(bytes_t{}));
}

TEST(frame_splitter, single_byte_feed_matches_whole_feed) {
    bytes_t stream;
    std::vector<bytes_t> frames = {
        reply(command_id::acknowledgement, 1),
        reply(command_id::key_status, 0, {1, 2, 0x4F}),
        reply(command_id::room_count, 2, {3, 1, 2, 3}),
    };
    for (const auto& f : frames) {
        stream.insert(stream.end(), f.begin(), f.end());
    }

    frame_splitter whole;
    whole.push_bytes(stream);
    EXPECT_EQ(frames, split_all(whole));

    frame_splitter bytewise;
    std::vector<bytes_t> out;
    for (auto b : stream) {
        bytewise.push_bytes(std::span<const uint8_t>(&b, 1));
        auto got = split_all(bytewise);
        out.insert(out.end(), got.begin(), got.end());
    }
    EXPECT_EQ(frames, out);
    EXPECT_EQ(0u, bytewise.available_bytes());
}

TEST(frame_splitter, two_frames_in_one_read) {
    auto a = reply(command_id::acknowledgement, 1);
    auto b = reply(command_id::acknowledgement, 2);
    bytes_t both(a);
    both.insert(both.end(), b.begin(), b.end());

    frame_splitter s;
    s.push_bytes(both);
    auto out = split_all(s);
    ASSERT_EQ(2u, out.size());
    EXPECT_EQ(a, out[0]);
    EXPECT_EQ(b, out[1]);
}

TEST(frame_splitter, partial_frame_is_retained) {
    auto a = reply(command_id::room_count, 9, {1, 4});

    frame_splitter s;
    s.push_bytes(std::span<const uint8_t>(a).first(5));
    EXPECT_FALSE(s.pop().has_value());
    EXPECT_EQ(5u, s.available_bytes());

    s.push_bytes(std::span<const uint8_t>(a).subspan(5));
    auto out = s.pop();
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(a, *out);
}

TEST(frame_splitter, leading_garbage_is_dropped) {
    auto a = reply(command_id::acknowledgement, 3);
    bytes_t stream = {0x00, 0x13, 0x56, 0x54, 0x99};
    stream.insert(stream.end(), a.begin(), a.end());

    frame_splitter s;
    s.push_bytes(stream);
    auto out = split_all(s);
    ASSERT_EQ(1u, out.size());
    EXPECT_EQ(a, out[0]);
    EXPECT_EQ(5u, s.dropped_bytes());
}

TEST(frame_splitter, prefix_split_across_reads) {
    auto a = reply(command_id::acknowledgement, 4);
    bytes_t first = {0x11, 0x56, 0x54};

    frame_splitter s;
    s.push_bytes(first);
    EXPECT_FALSE(s.pop().has_value());
    EXPECT_EQ(2u, s.available_bytes());

    s.push_bytes(std::span<const uint8_t>(a).subspan(2));
    auto out = s.pop();
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(a, *out);
}

TEST(frame_splitter, impossible_length_resyncs) {
    // Declared length 1 cannot hold a message id and checksum
    bytes_t broken = {0x56, 0x54, 0x55, 0x3C, 0x00, 0x00, 0x01};
    auto a = reply(command_id::acknowledgement, 6);
    broken.insert(broken.end(), a.begin(), a.end());

    frame_splitter s;
    s.push_bytes(broken);
    auto out = split_all(s);
    ASSERT_EQ(1u, out.size());
    EXPECT_EQ(a, out[0]);
}

TEST(frame_splitter, oversized_length_resyncs) {
    // Declared length 0x4000 is far beyond any frame the box sends
    bytes_t broken = {0x56, 0x54, 0x55, 0x3C, 0x1D, 0x40, 0x00, 0x01};
    auto a = reply(command_id::acknowledgement, 6);
    broken.insert(broken.end(), a.begin(), a.end());

    frame_splitter s;
    s.push_bytes(broken);
    auto out = split_all(s);
    ASSERT_EQ(1u, out.size());
    EXPECT_EQ(a, out[0]);
    EXPECT_EQ(0u, s.available_bytes());
}

TEST(frame_splitter, cut_short_frame_yields_to_next_header) {
    // Announces 0x40 bytes but the box moved on after three
    bytes_t truncated = {0x56, 0x54, 0x55, 0x3C, 0x29, 0x00, 0x40, 0x02, 0x01, 0x02, 0x03};
    auto a = reply(command_id::room_count, 7, {2, 1, 2});
    truncated.insert(truncated.end(), a.begin(), a.end());

    frame_splitter s;
    s.push_bytes(truncated);
    auto out = split_all(s);
    ASSERT_EQ(1u, out.size());
    EXPECT_EQ(a, out[0]);
    EXPECT_EQ(11u, s.dropped_bytes());
}

TEST(frame_splitter, buffer_is_capped) {
    bytes_t junk(frame_splitter::max_buffer_bytes + 100, 0x56);

    frame_splitter s;
    s.push_bytes(junk);
    EXPECT_LE(s.available_bytes(), frame_splitter::max_buffer_bytes);
    EXPECT_FALSE(s.pop().has_value());
}
