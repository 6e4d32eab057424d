#include "testing.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

#include <gtest/gtest.h>

namespace {

using ngdp::config::ClientConfig;

class ConfigTests : public ::testing::Test {
  protected:
    ngdp::Result Load(const std::string& json) {
        const std::string path = tmp.Path() + "/client.json";
        testutil::WriteFile(path, json);
        return cfg.LoadFile(path);
    }

    testutil::TemporaryDirectory tmp;
    ClientConfig cfg;
};

TEST_F(ConfigTests, MinimalConfigUsesDefaults) {
    auto r = Load(R"({"install_dir": "/games/wow", "cdn_hosts": ["level3.blizzard.com"]})");
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(cfg.install_dir, "/games/wow");
    ASSERT_EQ(cfg.cdn_hosts.size(), 1u);
    EXPECT_EQ(cfg.workers, 4);
    EXPECT_EQ(cfg.max_in_flight, 8);
    EXPECT_EQ(cfg.max_attempts, 5);
    EXPECT_EQ(cfg.initial_backoff_ms, 250u);
    EXPECT_EQ(cfg.max_backoff_ms, 8000u);
    EXPECT_EQ(cfg.max_data_file_size, 0x3FFFFFFFu);
    EXPECT_FALSE(cfg.verify_on_read);
    EXPECT_EQ(cfg.log_level, "info");
    EXPECT_EQ(cfg.DataDir(), "/games/wow/Data/data");
    EXPECT_EQ(cfg.ProgressRecordPath(), "/games/wow/.ngdp-install-progress");
}

TEST_F(ConfigTests, ReadsEveryKey) {
    auto r = Load(R"({
        "install_dir": "/srv/install",
        "cdn_hosts": ["a.example", "http://b.example"],
        "cdn_path": "tpr/wow",
        "workers": 2,
        "max_in_flight": 3,
        "max_attempts": 7,
        "initial_backoff_ms": 100,
        "max_backoff_ms": 1000,
        "connect_timeout_s": 5,
        "request_timeout_s": 60,
        "tags": ["windows", "enUS"],
        "max_data_file_size": 1048576,
        "verify_on_read": true,
        "key_file": "/etc/keys.txt",
        "log_level": "debug",
        "progress_file": "/tmp/status.json"
    })");
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(cfg.cdn_hosts.size(), 2u);
    EXPECT_EQ(cfg.cdn_path, "tpr/wow");
    EXPECT_EQ(cfg.workers, 2);
    EXPECT_EQ(cfg.max_in_flight, 3);
    EXPECT_EQ(cfg.max_attempts, 7);
    EXPECT_EQ(cfg.initial_backoff_ms, 100u);
    EXPECT_EQ(cfg.max_backoff_ms, 1000u);
    EXPECT_EQ(cfg.connect_timeout_s, 5u);
    EXPECT_EQ(cfg.request_timeout_s, 60u);
    EXPECT_EQ(cfg.tags, (std::vector<std::string>{"windows", "enUS"}));
    EXPECT_EQ(cfg.max_data_file_size, 1048576u);
    EXPECT_TRUE(cfg.verify_on_read);
    EXPECT_EQ(cfg.key_file, "/etc/keys.txt");
    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_EQ(cfg.progress_file, "/tmp/status.json");
}

TEST_F(ConfigTests, RejectsInvalidConfigs) {
    struct Case {
        std::string json;
        std::string error;
    };
    const std::vector<Case> cases = {
        {"{", "invalid JSON"},
        {"[1, 2]", "root must be JSON object"},
        {R"({"cdn_hosts": ["a"]})", "missing install_dir"},
        {R"({"install_dir": "/x"})", "cdn_hosts"},
        {R"({"install_dir": "/x", "cdn_hosts": "a"})", "array of strings"},
        {R"({"install_dir": "/x", "cdn_hosts": ["a"], "workers": 0})", "must be positive"},
        {R"({"install_dir": "/x", "cdn_hosts": ["a"], "initial_backoff_ms": 10, "max_backoff_ms": 5})",
         "max_backoff_ms"},
        {R"({"install_dir": "/x", "cdn_hosts": ["a"], "max_data_file_size": 30})", "max_data_file_size"},
        {R"({"install_dir": "/x", "cdn_hosts": ["a"], "log_level": "loud"})", "log_level"},
        {R"({"install_dir": "/x", "cdn_hosts": ["a"], "tags": [1]})", "'tags'"},
    };
    for (const auto& c : cases) {
        auto r = Load(c.json);
        EXPECT_FALSE(r.ok) << c.json;
        EXPECT_EQ(r.code, ngdp::ErrorCode::InvalidArgument);
        EXPECT_NE(r.msg.find(c.error), std::string::npos) << c.json << " -> " << r.msg;
    }
}

TEST_F(ConfigTests, MissingFileFails) {
    auto r = cfg.LoadFile(tmp.Path() + "/none.json");
    EXPECT_FALSE(r.ok);
    EXPECT_NE(r.msg.find("cannot open"), std::string::npos);
}

TEST(LogLevelTests, ParsesNames) {
    EXPECT_EQ(ngdp::ParseLogLevel("debug"), ngdp::LogLevel::Debug);
    EXPECT_EQ(ngdp::ParseLogLevel("warn"), ngdp::LogLevel::Warn);
    EXPECT_EQ(ngdp::ParseLogLevel("none"), ngdp::LogLevel::None);
    EXPECT_FALSE(ngdp::ParseLogLevel("verbose").has_value());
}

} // namespace
