#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "include/shell_pipe.hpp"
#include "include/speed_test.hpp"

using namespace speedwatch;
using namespace std::chrono_literals;

namespace {

constexpr const char* kOoklaResult =
    R"({"type":"testStart","isp":"Elisa","server":{"id":1}})"
    "\n"
    R"({"type":"result","ping":{"jitter":0.4,"latency":11.25},)"
    R"("download":{"bandwidth":15050000},"upload":{"bandwidth":6000000},)"
    R"("isp":"Elisa","server":{"name":"Telia","location":"Helsinki","country":"Finland"}})"
    "\n";

SpeedtestSettings fast_retry_settings(int retries) {
    SpeedtestSettings s;
    s.retry_count = retries;
    s.retry_delay = 0s;
    s.timeout = 5s;
    return s;
}

const SpeedtestCommand kOokla{"/usr/bin/speedtest", CliFlavor::Ookla};

}  // namespace

TEST(OoklaOutputTest, ParsesResultLine) {
    Measurement m = parse_ookla_output(kOoklaResult);
    ASSERT_TRUE(m.success) << m.error;
    EXPECT_DOUBLE_EQ(m.download_mbps, 120.4);
    EXPECT_DOUBLE_EQ(m.upload_mbps, 48.0);
    EXPECT_DOUBLE_EQ(m.ping_ms, 11.25);
    EXPECT_EQ(m.server_name, "Telia");
    EXPECT_EQ(m.server_location, "Helsinki, Finland");
    EXPECT_EQ(m.isp, "Elisa");
    EXPECT_TRUE(m.error.empty());
}

TEST(OoklaOutputTest, ReportsLogErrors) {
    Measurement m = parse_ookla_output(
        R"({"type":"log","level":"error","message":"Error: Cannot read from socket\nmore"})");
    EXPECT_FALSE(m.success);
    EXPECT_EQ(m.error, "Cannot read from socket");

    Measurement offline = parse_ookla_output(
        R"({"type":"log","level":"error","message":"No servers defined (NoServersException)"})");
    EXPECT_EQ(offline.error, "Server Offline/Changed");
}

TEST(OoklaOutputTest, DetectsRateLimit) {
    Measurement m = parse_ookla_output("[error] Limit reached: too many tests\n");
    EXPECT_FALSE(m.success);
    EXPECT_TRUE(m.rate_limited);
    EXPECT_EQ(m.error, "Rate Limit Reached");
}

TEST(OoklaOutputTest, EmptyAndGarbageOutput) {
    EXPECT_EQ(parse_ookla_output("").error, "No Result Data (Empty Output)");

    Measurement garbage = parse_ookla_output("segmentation fault\n");
    EXPECT_FALSE(garbage.success);
    EXPECT_EQ(garbage.error, "CLI Error: segmentation fault");
}

TEST(SpeedtestCliOutputTest, ParsesBitsPerSecond) {
    Measurement m = parse_speedtest_cli_json(
        R"({"download": 250000000.0, "upload": 50000000.0, "ping": 9.5,)"
        R"( "server": {"sponsor": "Bahnhof", "name": "Stockholm", "country": "Sweden"},)"
        R"( "client": {"isp": "Telia"}})");
    ASSERT_TRUE(m.success) << m.error;
    EXPECT_DOUBLE_EQ(m.download_mbps, 250.0);
    EXPECT_DOUBLE_EQ(m.upload_mbps, 50.0);
    EXPECT_DOUBLE_EQ(m.ping_ms, 9.5);
    EXPECT_EQ(m.server_name, "Bahnhof");
    EXPECT_EQ(m.server_location, "Stockholm, Sweden");
    EXPECT_EQ(m.isp, "Telia");
}

TEST(SpeedtestCliOutputTest, RejectsMissingSpeeds) {
    EXPECT_FALSE(parse_speedtest_cli_json(R"({"ping": 3})").success);
    EXPECT_FALSE(parse_speedtest_cli_json("Cannot retrieve speedtest configuration").success);
    EXPECT_TRUE(parse_speedtest_cli_json("Too many requests").rate_limited);
}

TEST(SpeedtestArgsTest, PerFlavor) {
    EXPECT_EQ(build_speedtest_args(kOokla, std::nullopt),
              (std::vector<std::string>{"/usr/bin/speedtest", "-f", "json", "--accept-license",
                                        "--accept-gdpr"}));
    EXPECT_EQ(build_speedtest_args(kOokla, 1234).back(), "--server-id=1234");

    const SpeedtestCommand cli{"/usr/bin/speedtest-cli", CliFlavor::SpeedtestCli};
    EXPECT_EQ(build_speedtest_args(cli, 77),
              (std::vector<std::string>{"/usr/bin/speedtest-cli", "--json", "--server", "77"}));
}

TEST(SpeedTestRunnerTest, RetriesUntilSuccess) {
    int calls = 0;
    SpeedTestRunner runner(
        fast_retry_settings(3),
        [&](const std::vector<std::string>& args, std::chrono::seconds timeout)
            -> std::expected<std::string, std::string> {
            EXPECT_EQ(args.front(), "/usr/bin/speedtest");
            EXPECT_EQ(timeout, 5s);
            if (++calls < 2) return std::unexpected("Timed out");
            return std::string(kOoklaResult);
        },
        kOokla);

    Measurement m = runner.run();
    EXPECT_TRUE(m.success);
    EXPECT_EQ(calls, 2);
}

TEST(SpeedTestRunnerTest, GivesUpAfterRetryCount) {
    int calls = 0;
    SpeedTestRunner runner(
        fast_retry_settings(3),
        [&](const std::vector<std::string>&, std::chrono::seconds)
            -> std::expected<std::string, std::string> {
            ++calls;
            return std::string(R"({"type":"log","level":"error","message":"Network unreachable"})");
        },
        kOokla);

    Measurement m = runner.run();
    EXPECT_FALSE(m.success);
    EXPECT_EQ(calls, 3);
    EXPECT_NE(m.error.find("Network unreachable"), std::string::npos);
}

TEST(SpeedTestRunnerTest, RateLimitIsNotRetried) {
    int calls = 0;
    SpeedTestRunner runner(
        fast_retry_settings(3),
        [&](const std::vector<std::string>&, std::chrono::seconds)
            -> std::expected<std::string, std::string> {
            ++calls;
            return std::string("Limit reached");
        },
        kOokla);

    Measurement m = runner.run();
    EXPECT_TRUE(m.rate_limited);
    EXPECT_EQ(calls, 1);
}

TEST(RunCommandTest, CapturesOutputOfRealProcess) {
    auto out = run_command({"/bin/sh", "-c", "printf '{\"ok\":true}'"}, 5s);
    ASSERT_TRUE(out.has_value()) << out.error();
    EXPECT_EQ(*out, "{\"ok\":true}");

    EXPECT_FALSE(run_command({"/bin/sh", "-c", "exit 3"}, 5s).has_value());

    auto missing = run_command({"/nonexistent/speedtest"}, 5s);
    ASSERT_FALSE(missing.has_value());
    EXPECT_NE(missing.error().find("Cannot execute"), std::string::npos);
}

TEST(ShellPipeTest, ReadTimesOut) {
    ShellPipe pipe({"/bin/sh", "-c", "sleep 5"});
    auto out = pipe.read_all(300ms);
    EXPECT_FALSE(out.has_value());
}
