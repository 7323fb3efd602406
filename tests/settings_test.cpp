#include <gtest/gtest.h>

#include <filesystem>
#include <format>
#include <fstream>
#include <map>
#include <optional>
#include <string>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "include/settings.hpp"

using namespace speedwatch;
using json = nlohmann::json;

namespace {

EnvLookup env_of(std::map<std::string, std::string> values) {
    return [values = std::move(values)](std::string_view name) -> std::optional<std::string> {
        auto it = values.find(std::string(name));
        if (it == values.end()) return std::nullopt;
        return it->second;
    };
}

const EnvLookup kNoEnv = env_of({});

json master_doc() {
    return json::parse(R"({
        "mode": "master",
        "telegram": {"bot_token": "123:abc", "chat_ids": [111]},
        "thresholds": {"very_low": 50, "low": 200, "medium": 500, "good": 1000},
        "master": {
            "listen_port": 9090,
            "api_token": "s3cret",
            "node_timeout_minutes": 30,
            "nodes_order": ["fin", "de"],
            "nodes_meta": {
                "de": {"flag": "🇩🇪", "display_name": "Frankfurt"},
                "fin": {"flag": "🇫🇮", "display_name": "Helsinki"},
                "ams": {"flag": "🇳🇱"}
            },
            "recipients": [
                {"chat_id": -100200, "default_language": "ru", "default_view_mode": "detailed"},
                {"chat_id": "555"}
            ],
            "schedule": {"interval_minutes": 15, "send_immediately": false}
        }
    })");
}

}  // namespace

TEST(SettingsTest, ParsesMasterSection) {
    const Settings s = parse_settings(master_doc(), kNoEnv);
    ASSERT_EQ(s.mode, RunMode::Master);
    ASSERT_TRUE(s.master.has_value());

    const MasterSettings& m = *s.master;
    EXPECT_EQ(m.listen_host, "0.0.0.0");
    EXPECT_EQ(m.listen_port, 9090);
    EXPECT_EQ(m.api_token, "s3cret");
    EXPECT_EQ(m.node_timeout, std::chrono::minutes(30));
    EXPECT_EQ(m.schedule.interval, std::chrono::minutes(15));
    EXPECT_FALSE(m.schedule.send_immediately);

    ASSERT_EQ(m.recipients.size(), 2u);
    EXPECT_EQ(m.recipients[0].chat_id, "-100200");
    EXPECT_EQ(m.recipients[0].defaults.language, Language::Ru);
    EXPECT_EQ(m.recipients[0].defaults.view_mode, ViewMode::Detailed);
    EXPECT_EQ(m.recipients[1].chat_id, "555");
    EXPECT_EQ(m.recipients[1].defaults.language, Language::En);
}

TEST(SettingsTest, NodeMetasFollowOrderThenRemainingMeta) {
    const Settings s = parse_settings(master_doc(), kNoEnv);
    const auto metas = s.master->node_metas();
    ASSERT_EQ(metas.size(), 3u);
    EXPECT_EQ(metas[0].node_id, "fin");
    EXPECT_EQ(metas[0].display_name, "Helsinki");
    EXPECT_EQ(metas[1].node_id, "de");
    EXPECT_EQ(metas[2].node_id, "ams");
    EXPECT_EQ(metas[2].display_name, "ams");
    EXPECT_LT(metas[0].order_rank, metas[1].order_rank);
    EXPECT_LT(metas[1].order_rank, metas[2].order_rank);

    const auto policy = s.master->to_policy(s.thresholds);
    EXPECT_EQ(policy.staleness_window, std::chrono::minutes(30));
    EXPECT_EQ(policy.nodes.size(), 3u);
}

TEST(SettingsTest, PreferenceDefaultsPerRecipient) {
    const Settings s = parse_settings(master_doc(), kNoEnv);
    const auto defaults = s.master->preference_defaults();
    EXPECT_EQ(defaults.for_recipient("-100200").language, Language::Ru);
    EXPECT_EQ(defaults.for_recipient("999").language, Language::En);
    EXPECT_EQ(s.master->recipient_ids(), (std::vector<std::string>{"-100200", "555"}));
}

TEST(SettingsTest, LegacyIntervalTurnsOnImmediateSend) {
    json doc = master_doc();
    doc["master"].erase("schedule");
    doc["master"]["aggregation_interval_minutes"] = 45;

    const Settings s = parse_settings(doc, kNoEnv);
    EXPECT_EQ(s.master->schedule.interval, std::chrono::minutes(45));
    EXPECT_TRUE(s.master->schedule.send_immediately);
}

TEST(SettingsTest, RecipientsFallBackToChatIds) {
    json doc = master_doc();
    doc["master"].erase("recipients");
    const Settings s = parse_settings(doc, kNoEnv);
    ASSERT_EQ(s.master->recipients.size(), 1u);
    EXPECT_EQ(s.master->recipients[0].chat_id, "111");
}

TEST(SettingsTest, EnvironmentOverridesBotToken) {
    const Settings s = parse_settings(master_doc(), env_of({{"TELEGRAM_BOT_TOKEN", "999:env"}}));
    EXPECT_EQ(s.telegram.bot_token, "999:env");
}

TEST(SettingsTest, ExcellentDefaultsAboveGood) {
    json doc = master_doc();
    doc["thresholds"]["good"] = 3000;
    const Settings s = parse_settings(doc, kNoEnv);
    EXPECT_GT(s.thresholds.excellent, s.thresholds.good);
}

TEST(SettingsTest, Rejections) {
    auto expect_error = [](json doc, const char* why) {
        EXPECT_THROW((void)parse_settings(doc, kNoEnv), SettingsError) << why;
    };

    json bad_mode = master_doc();
    bad_mode["mode"] = "cluster";
    expect_error(bad_mode, "unknown mode");

    json no_token = master_doc();
    no_token["master"].erase("api_token");
    expect_error(no_token, "missing api token");

    json unordered = master_doc();
    unordered["thresholds"]["low"] = 40;
    expect_error(unordered, "thresholds not increasing");

    json bad_language = master_doc();
    bad_language["master"]["recipients"][0]["default_language"] = "de";
    expect_error(bad_language, "unknown language");

    json bad_level = master_doc();
    bad_level["logging"] = {{"level", "LOUD"}};
    expect_error(bad_level, "unknown log level");

    json wrong_type = master_doc();
    wrong_type["master"]["listen_port"] = "eighty";
    expect_error(wrong_type, "port is a string");

    json no_bot = master_doc();
    no_bot["telegram"].erase("bot_token");
    expect_error(no_bot, "no bot token");
}

TEST(SettingsTest, NodeModeNeedsIdAndUrl) {
    json doc = {{"mode", "node"},
                {"node", {{"node_id", "fin"}, {"master_url", "http://m:8080"}, {"api_token", "t"}}}};
    const Settings s = parse_settings(doc, kNoEnv);
    ASSERT_TRUE(s.node.has_value());
    EXPECT_EQ(s.node->node_id, "fin");
    EXPECT_FALSE(s.master.has_value());

    doc["node"].erase("master_url");
    EXPECT_THROW((void)parse_settings(doc, kNoEnv), SettingsError);
}

TEST(SettingsTest, SpeedtestSection) {
    json doc = {{"mode", "single"},
                {"telegram", {{"bot_token", "x"}, {"chat_ids", {"1"}}}},
                {"speedtest", {{"timeout_sec", 120}, {"retry_count", 2}, {"server_id", 1234}}}};
    const Settings s = parse_settings(doc, kNoEnv);
    EXPECT_EQ(s.speedtest.timeout, std::chrono::seconds(120));
    EXPECT_EQ(s.speedtest.retry_count, 2);
    EXPECT_EQ(s.speedtest.server_id, 1234);
    EXPECT_EQ(s.server.name, "auto");
}

TEST(SettingsTest, ConfigFileLookup) {
    auto explicit_path = find_config_file(std::filesystem::path("/etc/custom.json"), kNoEnv);
    ASSERT_TRUE(explicit_path.has_value());
    EXPECT_EQ(explicit_path->string(), "/etc/custom.json");

    auto from_env = find_config_file(std::nullopt, env_of({{"SPEEDWATCH_CONFIG", "/srv/sw.json"}}));
    ASSERT_TRUE(from_env.has_value());
    EXPECT_EQ(from_env->string(), "/srv/sw.json");
}

TEST(SettingsTest, LoadSettingsReportsMissingFile) {
    EXPECT_THROW((void)load_settings("/nonexistent/speedwatch.json", kNoEnv), SettingsError);
}

TEST(SettingsTest, LoadSettingsAcceptsComments) {
    const auto path = std::filesystem::temp_directory_path() /
                      std::format("speedwatch_settings_{}.json", ::getpid());
    {
        std::ofstream out(path);
        out << R"({
            // node agents only need the master address
            "mode": "node",
            "node": {"node_id": "lv", "master_url": "http://m", "api_token": "t"}
        })";
    }
    const Settings s = load_settings(path, kNoEnv);
    std::filesystem::remove(path);
    ASSERT_TRUE(s.node.has_value());
    EXPECT_EQ(s.node->node_id, "lv");
}
