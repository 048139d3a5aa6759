#include <gtest/gtest.h>
#include "utils/config.h"
#include "utils/errors.h"

#include <cstdio>
#include <fstream>
#include <map>

using namespace shroud::utils;
using json = nlohmann::json;

namespace {

ProxyConfig::EnvLookup fakeEnv(std::map<std::string, std::string> vars) {
    return [vars](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

} // namespace

class ConfigTest : public ::testing::Test {};

TEST_F(ConfigTest, DefaultsWithoutFileOrEnv) {
    auto cfg = ProxyConfig::load(std::nullopt, fakeEnv({}));
    EXPECT_EQ(cfg.server.port, 3000);
    EXPECT_EQ(cfg.upstream.url, "https://api.openai.com/v1");
    EXPECT_EQ(cfg.inference.backend, "regex");
    EXPECT_EQ(cfg.inference.timeout_ms, 500);
    EXPECT_EQ(cfg.redaction.fail_strategy, "closed");
    EXPECT_TRUE(cfg.redaction.deterministic);
    EXPECT_EQ(cfg.rate_limit.max, 100u);
    EXPECT_EQ(cfg.rate_limit.window_ms, 60000u);
    EXPECT_EQ(cfg.risk.threshold, 100);
    EXPECT_EQ(cfg.risk.window_ms, 3600000);
    EXPECT_EQ(cfg.stream.max_tokens, 20u);
    EXPECT_EQ(cfg.stream.max_delay_ms, 200);
    EXPECT_TRUE(cfg.admin_token.empty());
}

TEST_F(ConfigTest, ReadsFileValues) {
    json file = {
        {"server", {{"port", 8088}}},
        {"redaction", {{"fail_strategy", "OPEN"}, {"deterministic", false}}},
        {"risk", {{"threshold", 40}}},
        {"admin", {{"token", "letmein"}}}
    };
    auto cfg = ProxyConfig::load(file, fakeEnv({}));
    EXPECT_EQ(cfg.server.port, 8088);
    EXPECT_EQ(cfg.redaction.fail_strategy, "open");
    EXPECT_FALSE(cfg.redaction.deterministic);
    EXPECT_EQ(cfg.risk.threshold, 40);
    EXPECT_EQ(cfg.admin_token, "letmein");
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    json file = {{"server", {{"port", 8088}}}, {"rate_limit", {{"max", 5}}}};
    auto cfg = ProxyConfig::load(file, fakeEnv({
        {"PORT", "9090"},
        {"UPSTREAM_API_KEY", "sk-test"},
        {"DETERMINISTIC_REPLACEMENT", "no"}
    }));
    EXPECT_EQ(cfg.server.port, 9090);
    EXPECT_EQ(cfg.rate_limit.max, 5u);
    EXPECT_EQ(cfg.upstream.api_key, "sk-test");
    EXPECT_FALSE(cfg.redaction.deterministic);
}

TEST_F(ConfigTest, InferenceUrlSelectsHttpBackend) {
    auto cfg = ProxyConfig::load(std::nullopt, fakeEnv({{"INFERENCE_URL", "http://localhost:8080/classify"}}));
    EXPECT_EQ(cfg.inference.backend, "http");

    EXPECT_THROW(ProxyConfig::load(std::nullopt, fakeEnv({{"INFERENCE_BACKEND", "http"}})), ConfigError);
}

TEST_F(ConfigTest, ReportsEveryInvalidSetting) {
    try {
        ProxyConfig::load(std::nullopt, fakeEnv({
            {"PORT", "not-a-port"},
            {"SALT", "short"},
            {"FAIL_STRATEGY", "sometimes"},
            {"REDIS_URL", "memcached://localhost"}
        }));
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("PORT"), std::string::npos);
        EXPECT_NE(message.find("SALT"), std::string::npos);
        EXPECT_NE(message.find("FAIL_STRATEGY"), std::string::npos);
        EXPECT_NE(message.find("REDIS_URL"), std::string::npos);
    }
}

TEST_F(ConfigTest, RejectsOutOfRangeIntegers) {
    EXPECT_THROW(ProxyConfig::load(std::nullopt, fakeEnv({{"PORT", "70000"}})), ConfigError);
    EXPECT_THROW(ProxyConfig::load(std::nullopt, fakeEnv({{"RATE_LIMIT_MAX", "0"}})), ConfigError);
    EXPECT_THROW(ProxyConfig::load(std::nullopt, fakeEnv({{"DETERMINISTIC_REPLACEMENT", "maybe"}})), ConfigError);
}

TEST_F(ConfigTest, LoggingSettings) {
    json file = {{"logging", {{"level", "WARNING"}, {"console", false}, {"max_files", 7}}}};
    auto cfg = ProxyConfig::load(file, fakeEnv({{"LOG_FILE", ""}, {"LOG_MAX_FILE_SIZE_MB", "25"}}));
    EXPECT_EQ(cfg.logging.level, "warning");
    EXPECT_FALSE(cfg.logging.console);
    EXPECT_EQ(cfg.logging.file, "");
    EXPECT_EQ(cfg.logging.max_file_size_mb, 25u);
    EXPECT_EQ(cfg.logging.max_files, 7u);

    EXPECT_THROW(ProxyConfig::load(std::nullopt, fakeEnv({{"LOG_LEVEL", "verbose"}})), ConfigError);
    EXPECT_THROW(ProxyConfig::load(std::nullopt, fakeEnv({{"LOG_MAX_FILES", "0"}})), ConfigError);
}

TEST_F(ConfigTest, ParseBool) {
    EXPECT_EQ(parseBool("TRUE"), true);
    EXPECT_EQ(parseBool(" on "), true);
    EXPECT_EQ(parseBool("0"), false);
    EXPECT_EQ(parseBool("Off"), false);
    EXPECT_FALSE(parseBool("2").has_value());
}

TEST_F(ConfigTest, LoadsShippedYaml) {
    auto file = loadConfigFile(std::string(SHROUD_TEST_CONFIG_DIR) + "/shroud.yaml");
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ((*file)["server"]["host"], "0.0.0.0");
    EXPECT_EQ((*file)["server"]["port"], 3000);

    auto cfg = ProxyConfig::load(file, fakeEnv({}));
    EXPECT_EQ(cfg.inference.backend, "regex");
    EXPECT_EQ(cfg.stream.max_tokens, 20u);
}

TEST_F(ConfigTest, LoadsJsonFile) {
    const std::string path = ::testing::TempDir() + "shroud_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"server": {"port": 4000}})";
    }
    auto file = loadConfigFile(path);
    std::remove(path.c_str());

    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(ProxyConfig::load(file, fakeEnv({})).server.port, 4000);
}

TEST_F(ConfigTest, MissingFileIsNullopt) {
    EXPECT_FALSE(loadConfigFile("/nonexistent/shroud.yaml").has_value());
    EXPECT_FALSE(loadConfigFile("/nonexistent/shroud.json").has_value());
}

TEST_F(ConfigTest, SummaryHidesSecrets) {
    auto cfg = ProxyConfig::load(std::nullopt, fakeEnv({{"UPSTREAM_API_KEY", "sk-secret"}, {"ADMIN_TOKEN", "t"}}));
    std::string dumped = cfg.summary().dump();
    EXPECT_EQ(dumped.find("sk-secret"), std::string::npos);
    EXPECT_TRUE(cfg.summary()["upstream"]["api_key_set"].get<bool>());
    EXPECT_TRUE(cfg.summary()["admin_enabled"].get<bool>());
}
