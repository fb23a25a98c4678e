#include "test_helpers.hpp"

#include <map>
#include <vbox_asio/config.hpp>

using namespace vbox_asio;
using namespace std::chrono_literals;

namespace {

env_lookup_fn fake_env(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const std::string& name) -> optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end())
            return std::nullopt;
        return it->second;
    };
}

} // namespace

TEST(config, defaults) {
    connect_config conf;
    EXPECT_EQ("192.168.1.23", conf.address);
    EXPECT_EQ(11501, conf.port);
    EXPECT_EQ(protocol_version::v2, conf.version);
    EXPECT_TRUE(conf.should_reconnect);
    EXPECT_EQ(3000ms, conf.heartbeat_interval);
    EXPECT_EQ(10000ms, conf.request_timeout);
    EXPECT_EQ(250ms, conf.request_buffer);
    EXPECT_FALSE(conf.ignore_ack_logs);
}

TEST(config, env_overlay) {
    connect_config conf;
    auto s = load_config_from_env(conf, fake_env({
                                            {"VITREA_VBOX_HOST", "10.0.0.5"},
                                            {"VITREA_VBOX_PORT", "12000"},
                                            {"VITREA_VBOX_USERNAME", "admin"},
                                            {"VITREA_VBOX_PASSWORD", "secret"},
                                            {"VITREA_VBOX_VERSION", "V1"},
                                            {"VITREA_VBOX_SHOULD_RECONNECT", "No"},
                                            {"VITREA_VBOX_REQUEST_TIMEOUT", "2500"},
                                            {"VITREA_VBOX_REQUEST_BUFFER", "0"},
                                            {"VITREA_VBOX_IGNORE_ACK_LOGS", "on"},
                                            {"VITREA_VBOX_HEARTBEAT_INTERVAL", "1000"},
                                        }));
    EXPECT_FALSE(s.failed()) << s.error();
    EXPECT_EQ("10.0.0.5", conf.address);
    EXPECT_EQ(12000, conf.port);
    EXPECT_EQ("admin", conf.user.value());
    EXPECT_EQ("secret", conf.password.value());
    EXPECT_EQ(protocol_version::v1, conf.version);
    EXPECT_FALSE(conf.should_reconnect);
    EXPECT_EQ(2500ms, conf.request_timeout);
    EXPECT_EQ(0ms, conf.request_buffer);
    EXPECT_TRUE(conf.ignore_ack_logs);
    EXPECT_EQ(1000ms, conf.heartbeat_interval);
}

TEST(config, bad_values_keep_defaults) {
    connect_config conf;
    auto s = load_config_from_env(conf, fake_env({
                                            {"VITREA_VBOX_PORT", "abc"},
                                            {"VITREA_VBOX_REQUEST_TIMEOUT", "-5"},
                                            {"VITREA_VBOX_SHOULD_RECONNECT", "maybe"},
                                            {"VITREA_VBOX_HOST", "box.local"},
                                        }));
    EXPECT_EQ(error_code::invalid_config, s.code());
    EXPECT_NE(std::string::npos, s.error().find("VITREA_VBOX_PORT"));
    EXPECT_EQ(11501, conf.port);
    EXPECT_EQ(10000ms, conf.request_timeout);
    EXPECT_TRUE(conf.should_reconnect);
    EXPECT_EQ("box.local", conf.address);
}

TEST(config, unknown_version_is_v2) {
    EXPECT_EQ(protocol_version::v2, parse_protocol_version("v3"));
    EXPECT_EQ(protocol_version::v2, parse_protocol_version(""));
    EXPECT_EQ(protocol_version::v1, parse_protocol_version("1"));
}

TEST(config, booleans) {
    for (auto v : {"1", "true", "TRUE", "yes", "On"}) {
        EXPECT_EQ(true, parse_bool(v)) << v;
    }
    for (auto v : {"0", "false", "No", "off"}) {
        EXPECT_EQ(false, parse_bool(v)) << v;
    }
    EXPECT_FALSE(parse_bool("2").has_value());
}

TEST(config, redaction) {
    EXPECT_EQ("a***z", redact("abcz"));
    EXPECT_EQ("***", redact("ab"));
    EXPECT_EQ("", redact(""));

    connect_config conf;
    conf.user = "admin";
    conf.password = "hunter2";
    auto text = describe(conf);
    EXPECT_EQ(std::string::npos, text.find("hunter2"));
    EXPECT_NE(std::string::npos, text.find("h***2"));
}

TEST(config, numbers_reject_values_outside_the_type) {
    EXPECT_EQ(uint8_t{255}, parse_number<uint8_t>("255"));
    EXPECT_EQ(uint8_t{0}, parse_number<uint8_t>("0"));
    EXPECT_FALSE(parse_number<uint8_t>("300").has_value());
    EXPECT_FALSE(parse_number<uint8_t>("-1").has_value());
    EXPECT_FALSE(parse_number<uint8_t>("12x").has_value());
    EXPECT_FALSE(parse_number<uint8_t>("").has_value());

    EXPECT_EQ(uint16_t{65535}, parse_number<uint16_t>("65535"));
    EXPECT_FALSE(parse_number<uint16_t>("65536").has_value());
}
