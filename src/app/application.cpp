/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/application.hpp"

#include <chrono>
#include <filesystem>
#include <format>
#include <print>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "include/config.hpp"
#include "include/digest_dispatcher.hpp"
#include "include/digest_renderer.hpp"
#include "include/http_context.hpp"
#include "include/http_server.hpp"
#include "include/ingest_handler.hpp"
#include "include/interrupts.hpp"
#include "include/messenger.hpp"
#include "include/node_client.hpp"
#include "include/node_state_store.hpp"
#include "include/preference_controller.hpp"
#include "include/preferences.hpp"
#include "include/speed_test.hpp"
#include "include/system_info.hpp"
#include "include/utils.hpp"

namespace fs = std::filesystem;

namespace speedwatch {

std::expected<CliOptions, std::string> parse_cli(std::span<char* const> args) {
    CliOptions options;

    for (std::size_t i = 1; i < args.size(); ++i) {
        std::string_view arg = args[i];

        auto next_value = [&](std::string_view name) -> std::expected<std::string_view, std::string> {
            if (i + 1 >= args.size()) {
                return std::unexpected(std::format("Option '{}' needs a value", name));
            }
            return std::string_view(args[++i]);
        };

        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "-v" || arg == "--version") {
            options.version = true;
        } else if (arg == "-c" || arg == "--config") {
            auto value = next_value(arg);
            if (!value) return std::unexpected(value.error());
            options.config = fs::path(*value);
        } else if (arg.starts_with("--config=")) {
            options.config = fs::path(arg.substr(9));
        } else if (arg == "-l" || arg == "--log-level") {
            auto value = next_value(arg);
            if (!value) return std::unexpected(value.error());
            auto level = log::parse_level(*value);
            if (!level) return std::unexpected(std::format("Unknown log level '{}'", *value));
            options.log_level = *level;
        } else {
            return std::unexpected(std::format("Unknown option '{}'", arg));
        }
    }
    return options;
}

bool should_notify(const Measurement& m, const Thresholds& thresholds, bool send_always) noexcept {
    if (send_always || !m.success) return true;
    return classify(m.download_mbps, m.upload_mbps, m.ping_ms, thresholds) < Tier::Low;
}

void Application::show_help(const std::string& app_name) const {
    std::println("Usage: {} [options]", app_name);
    std::println("");
    std::println("Options:");
    std::println("  -h, --help              Show this help message");
    std::println("  -v, --version           Show version information");
    std::println("  -c, --config <file>     Configuration file (default: ${} or ./{})",
                 Config::CONFIG_ENV, Config::DEFAULT_CONFIG_FILE);
    std::println("  -l, --log-level <lvl>   DEBUG, INFO, WARNING or ERROR");
    std::println("");
    std::println("The run mode (single, node, master) is taken from the configuration file.");
}

void Application::show_version() const {
    std::println("{} v{}", Config::APP_NAME, Config::APP_VERSION);
    std::println("Copyright (c) 2025 Alfie Ardinata");
    std::println("Licensed under the Mozilla Public License 2.0");
}

int Application::run(int argc, char* argv[]) {
    std::string app_name{Config::APP_NAME};
    if (argc > 0) {
        app_name = fs::path(argv[0]).filename().string();
        if (app_name.empty())
            app_name = Config::APP_NAME;
    }

    auto options = parse_cli(std::span<char* const>(argv, static_cast<std::size_t>(argc)));
    if (!options) {
        log::error("{}", options.error());
        show_help(app_name);
        return ExitCode::Fatal;
    }
    if (options->help) {
        show_help(app_name);
        return ExitCode::Ok;
    }
    if (options->version) {
        show_version();
        return ExitCode::Ok;
    }

    try {
        SignalGuard signal_guard;
        HttpContext http_context;

        auto config_path = find_config_file(options->config);
        if (!config_path) {
            throw SettingsError(std::format("No configuration file found (use --config or ${})",
                                            Config::CONFIG_ENV));
        }
        Settings settings = load_settings(*config_path);

        log::configure(log::Options{
            .level = options->log_level.value_or(settings.logging.level),
            .file = settings.logging.file,
            .max_bytes = settings.logging.max_bytes,
            .backup_count = settings.logging.backup_count,
            .console = true,
        });

        log::info("{} v{} started", Config::APP_NAME, Config::APP_VERSION);
        log::info("Configuration: {}", fs::absolute(*config_path).string());
        log::info("Mode: {}", run_mode_name(settings.mode));

        switch (settings.mode) {
            case RunMode::Master:
                return run_master(settings);
            case RunMode::Node:
                return run_node(settings);
            case RunMode::Single:
                return run_single(settings);
        }
        return ExitCode::Fatal;
    } catch (const SettingsError& e) {
        log::error("Configuration error: {}", e.what());
        return ExitCode::Fatal;
    } catch (const std::exception& e) {
        log::error("Fatal error: {}", e.what());
        return ExitCode::Fatal;
    }
}

int Application::run_master(const Settings& settings) {
    const MasterSettings& master = *settings.master;
    const AggregationPolicy policy = master.to_policy(settings.thresholds);

    std::set<std::string, std::less<>> known_nodes;
    for (const auto& meta : policy.nodes) known_nodes.insert(meta.node_id);

    const auto recipients = master.recipient_ids();

    InMemoryNodeStateStore state;
    JsonPreferenceStore preferences(master.preferences_path, master.preference_defaults());
    TelegramMessenger telegram(settings.telegram.bot_token, settings.telegram.api_base);

    DigestDispatcher dispatcher(state, preferences, telegram, policy, recipients);
    DigestScheduler scheduler(dispatcher, master.schedule.interval);

    IngestHandler::AcceptedFn on_accepted;
    if (master.schedule.send_immediately) {
        on_accepted = [&dispatcher](const std::string&) { dispatcher.request_immediate(); };
    }
    IngestHandler ingest(state, master.api_token, known_nodes, std::move(on_accepted));

    HttpServer server(master.listen_host, master.listen_port, master.workers);
    server.route("POST", std::string(Config::REPORT_PATH),
                 [&ingest](const HttpRequest& request) { return ingest.handle(request); });
    server.route("GET", std::string(Config::HEALTH_PATH),
                 [](const HttpRequest&) { return health_reply("master"); });

    PreferenceController controller(preferences, {recipients.begin(), recipients.end()});
    UpdatePoller poller(telegram, controller);

    log::info("Tracking {} configured node(s), {} recipient(s), staleness window {} min",
              policy.nodes.size(), recipients.size(), master.node_timeout.count());
    log::info("Digest every {} min, send immediately: {}", master.schedule.interval.count(),
              master.schedule.send_immediately ? "yes" : "no");

    dispatcher.start();
    scheduler.start();
    server.start();
    poller.start();

    wait_until_interrupted();
    log::info("Shutdown requested");

    server.stop();
    scheduler.stop();
    dispatcher.stop();
    poller.stop();

    log::info("Master stopped");
    return ExitCode::Ok;
}

int Application::run_node(const Settings& settings) {
    const NodeSettings& node = *settings.node;
    log::info("Node {} reporting to {}", node.node_id, report_url(node.master_url));

    SpeedTestRunner runner(settings.speedtest);
    Measurement m = runner.run();
    if (g_interrupted) {
        log::info("Interrupted; no report sent");
        return ExitCode::Ok;
    }
    if (!m.success) {
        log::error("Speedtest failed: {}", m.error);
        return ExitCode::MeasurementFailed;
    }

    NodeClient client(node);
    auto payload = build_report_payload(node, m, SystemInfo::os_summary(), system_now());
    if (auto sent = client.submit(payload); !sent) {
        log::error("{}", sent.error());
        return ExitCode::MeasurementFailed;
    }

    log::info("Node cycle completed");
    return ExitCode::Ok;
}

int Application::run_single(const Settings& settings) {
    SpeedTestRunner runner(settings.speedtest);
    Measurement m = runner.run();
    if (g_interrupted) {
        log::info("Interrupted; no notification sent");
        return ExitCode::Ok;
    }

    if (!should_notify(m, settings.thresholds, settings.telegram.send_always)) {
        log::info("Download {} is above the low threshold; notification skipped",
                  format_speed(m.download_mbps));
        return ExitCode::Ok;
    }

    const std::string hostname = SystemInfo::get_hostname();
    auto resolve = [&hostname](const std::string& value) {
        return value == "auto" ? hostname : value;
    };

    SingleReport report{
        .server_name = resolve(settings.server.name),
        .server_location = settings.server.location == "auto" ? "" : settings.server.location,
        .description = settings.server.description,
        .identifier = resolve(settings.server.identifier),
        .os_info = SystemInfo::os_summary(),
        .measurement = m,
        .generated_at = system_now(),
    };

    const fs::path prefs_path =
        settings.master ? settings.master->preferences_path : fs::path("chat_prefs.json");
    JsonPreferenceStore preferences(prefs_path, PreferenceDefaults{});
    TelegramMessenger telegram(settings.telegram.bot_token, settings.telegram.api_base);

    int failed = 0;
    for (const auto& chat : settings.telegram.chat_ids) {
        const RecipientPref pref = preferences.get_or_default(chat);
        const std::string text =
            Renderer::render_single(report, settings.thresholds, pref.language);
        if (auto sent = telegram.send_message(chat, text); !sent) {
            log::error("Notification to chat {} failed: {}", chat, sent.error());
            ++failed;
        }
    }

    if (!m.success) return ExitCode::MeasurementFailed;
    return failed == 0 ? ExitCode::Ok : ExitCode::Fatal;
}

}  // namespace speedwatch
