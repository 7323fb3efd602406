#include "include/speed_test.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <format>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "include/interrupts.hpp"
#include "include/log.hpp"
#include "include/shell_pipe.hpp"
#include "include/utils.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace speedwatch {

namespace {

std::string sanitize_error(std::string_view msg) {
    auto nl = msg.find('\n');
    if (nl != std::string_view::npos) {
        msg = msg.substr(0, nl);
    }
    msg = trim_sv(msg);
    if (msg.starts_with("Error: ")) {
        msg.remove_prefix(7);
    }
    return std::string(msg);
}

bool is_rate_limit(std::string_view text) {
    return text.find("Limit reached") != std::string_view::npos ||
           text.find("Too many requests") != std::string_view::npos;
}

std::optional<fs::path> search_path(std::string_view name) {
    const char* path_env = std::getenv("PATH");
    if (!path_env) return std::nullopt;

    std::string_view dirs(path_env);
    while (!dirs.empty()) {
        auto sep = dirs.find(':');
        auto dir = dirs.substr(0, sep);
        dirs.remove_prefix(sep == std::string_view::npos ? dirs.size() : sep + 1);
        if (dir.empty()) continue;

        fs::path candidate = fs::path(dir) / name;
        if (::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

CliFlavor flavor_of(const fs::path& path) {
    return path.filename().string().find("speedtest-cli") != std::string::npos
               ? CliFlavor::SpeedtestCli
               : CliFlavor::Ookla;
}

Measurement failure(std::string error) {
    Measurement m;
    m.error = std::move(error);
    return m;
}

}  // namespace

std::optional<SpeedtestCommand> find_speedtest_command(const std::string& configured) {
    if (!configured.empty()) {
        fs::path path = configured;
        if (!path.has_parent_path()) {
            auto found = search_path(configured);
            if (!found) return std::nullopt;
            path = *found;
        }
        return SpeedtestCommand{path, flavor_of(path)};
    }

    for (std::string_view name : {"speedtest", "speedtest-cli"}) {
        if (auto found = search_path(name)) {
            return SpeedtestCommand{*found, flavor_of(*found)};
        }
    }
    return std::nullopt;
}

std::vector<std::string> build_speedtest_args(const SpeedtestCommand& command,
                                              std::optional<int> server_id) {
    std::vector<std::string> args{command.path.string()};
    if (command.flavor == CliFlavor::Ookla) {
        args.insert(args.end(), {"-f", "json", "--accept-license", "--accept-gdpr"});
        if (server_id) args.push_back(std::format("--server-id={}", *server_id));
    } else {
        args.push_back("--json");
        if (server_id) {
            args.push_back("--server");
            args.push_back(std::to_string(*server_id));
        }
    }
    return args;
}

Measurement parse_ookla_output(std::string_view output) {
    Measurement entry;
    std::string last_raw_output;

    std::istringstream ss{std::string(output)};
    std::string line;
    while (std::getline(ss, line)) {
        if (trim_sv(line).empty()) continue;
        last_raw_output = line;

        if (is_rate_limit(line)) {
            entry.rate_limited = true;
            entry.error = "Rate Limit Reached";
            return entry;
        }

        json j = json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object()) continue;

        if (j.contains("error")) {
            entry.error = j["error"].is_string() ? sanitize_error(j["error"].get<std::string>())
                                                 : "Unknown CLI Error";
            continue;
        }

        const std::string type = j.value("type", "");
        if (type == "result") {
            if (!j.contains("download") || !j.contains("upload") || !j["download"].is_object() ||
                !j["upload"].is_object()) {
                entry.error = "Malformed result (missing speed data)";
                continue;
            }

            entry.download_mbps = j["download"].value("bandwidth", 0.0) * 8.0 / 1000000.0;
            entry.upload_mbps = j["upload"].value("bandwidth", 0.0) * 8.0 / 1000000.0;
            entry.ping_ms = j.contains("ping") && j["ping"].is_object()
                                ? j["ping"].value("latency", 0.0)
                                : 0.0;

            if (auto server = j.find("server"); server != j.end() && server->is_object()) {
                entry.server_name = server->value("name", "");
                std::string location = server->value("location", "");
                std::string country = server->value("country", "");
                entry.server_location = country.empty() || location.empty()
                                            ? location + country
                                            : std::format("{}, {}", location, country);
            }
            entry.isp = j.value("isp", "");
            entry.success = true;
            entry.error.clear();
            return entry;
        }

        if (type == "log" && j.value("level", "") == "error") {
            const std::string msg = j.value("message", "Unknown error");
            if (is_rate_limit(msg)) {
                entry.rate_limited = true;
                entry.error = "Rate Limit Reached";
                return entry;
            }
            entry.error = msg.find("No servers defined") != std::string::npos
                              ? "Server Offline/Changed"
                              : sanitize_error(msg);
        }
    }

    if (entry.error.empty()) {
        if (!last_raw_output.empty()) {
            std::string clean_msg = trim(last_raw_output);
            if (clean_msg.length() > 50) clean_msg = clean_msg.substr(0, 47) + "...";
            entry.error = "CLI Error: " + clean_msg;
        } else {
            entry.error = "No Result Data (Empty Output)";
        }
    }
    return entry;
}

Measurement parse_speedtest_cli_json(std::string_view output) {
    if (is_rate_limit(output)) {
        Measurement m = failure("Rate Limit Reached");
        m.rate_limited = true;
        return m;
    }

    auto start = output.find('{');
    if (start == std::string_view::npos) {
        auto text = sanitize_error(output);
        return failure(text.empty() ? "No Result Data (Empty Output)" : "CLI Error: " + text);
    }

    json j = json::parse(output.substr(start), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return failure("Malformed speedtest-cli JSON output");
    }
    if (!j.contains("download") || !j.contains("upload") || !j["download"].is_number() ||
        !j["upload"].is_number()) {
        return failure("Malformed result (missing speed data)");
    }

    Measurement m;
    m.download_mbps = j["download"].get<double>() / 1000000.0;
    m.upload_mbps = j["upload"].get<double>() / 1000000.0;
    m.ping_ms = j.value("ping", 0.0);

    if (auto server = j.find("server"); server != j.end() && server->is_object()) {
        m.server_name = server->value("sponsor", "");
        std::string name = server->value("name", "");
        std::string country = server->value("country", "");
        m.server_location = country.empty() || name.empty() ? name + country
                                                            : std::format("{}, {}", name, country);
    }
    if (auto client = j.find("client"); client != j.end() && client->is_object()) {
        m.isp = client->value("isp", "");
    }
    m.success = true;
    return m;
}

std::expected<std::string, std::string> run_command(const std::vector<std::string>& args,
                                                    std::chrono::seconds timeout) {
    ShellPipe pipe(args);
    auto output = pipe.read_all(timeout);
    if (!output) {
        return std::unexpected(output.error());
    }

    int code = pipe.wait();
    if (code == 127) {
        return std::unexpected(std::format("Cannot execute '{}'", args.front()));
    }
    if (code != 0 && output->find('{') == std::string::npos) {
        auto text = sanitize_error(*output);
        return std::unexpected(text.empty() ? std::format("Exited with code {}", code) : text);
    }
    return output;
}

SpeedTestRunner::SpeedTestRunner(SpeedtestSettings settings, CommandRunner runner,
                                 std::optional<SpeedtestCommand> command)
    : settings_(std::move(settings)), runner_(std::move(runner)), command_(std::move(command)) {
    if (!command_) {
        command_ = find_speedtest_command(settings_.command);
    }
}

Measurement SpeedTestRunner::run() {
    if (!command_) {
        log::error("No speedtest command found. Install the Ookla speedtest CLI or speedtest-cli");
        return failure("No speedtest command found");
    }

    const auto args = build_speedtest_args(*command_, settings_.server_id);
    const int attempts = std::max(1, settings_.retry_count);
    Measurement last = failure("Speedtest not run");

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (g_interrupted) {
            return failure("Interrupted by user");
        }

        log::info("Running speedtest (attempt {}/{}) with {}", attempt, attempts,
                  command_->path.string());

        try {
            auto output = runner_(args, settings_.timeout);
            if (!output) {
                last = failure(output.error());
            } else {
                last = command_->flavor == CliFlavor::Ookla ? parse_ookla_output(*output)
                                                            : parse_speedtest_cli_json(*output);
            }
        } catch (const std::system_error& e) {
            last = failure(e.what());
        }

        if (last.success) {
            log::info("Speedtest done: download {}, upload {}, ping {}",
                      format_speed(last.download_mbps), format_speed(last.upload_mbps),
                      format_ping(last.ping_ms));
            return last;
        }
        if (last.rate_limited) {
            log::warn("Speedtest rate limited; not retrying");
            return last;
        }

        log::warn("Speedtest attempt {} failed: {}", attempt, last.error);
        if (attempt < attempts) {
            if (!interruptible_sleep(settings_.retry_delay)) {
                return failure("Interrupted by user");
            }
        }
    }

    last.error = std::format("All {} speedtest attempts failed. Last error: {}", attempts, last.error);
    log::error("{}", last.error);
    return last;
}

}  // namespace speedwatch
