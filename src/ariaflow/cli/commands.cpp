// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ariaflow/cli/commands.hpp>
#include <ariaflow/cli/progress_bar.hpp>
#include <ariaflow/core/config.hpp>
#include <ariaflow/core/error.hpp>
#include <ariaflow/core/logging.hpp>
#include <ariaflow/core/units.hpp>
#include <ariaflow/version.hpp>
#include <charconv>
#include <chrono>
#include <iostream>
#include <thread>

using namespace ariaflow::core;

namespace chrono = std::chrono;

namespace ariaflow::cli {

namespace {

constexpr std::size_t FAILURE_LOG_LINES = 5;

// Strict decimal integer >= 1
std::optional<int> parse_count(std::string_view text) noexcept {
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value < 1) {
        return std::nullopt;
    }
    return value;
}

std::vector<std::string> render_rows(const TaskRegistry& registry,
                                     const std::vector<TaskId>& ids,
                                     const ProgressBar& bar,
                                     bool& any_active) {
    std::vector<std::string> rows;
    any_active = false;
    for (TaskId id : ids) {
        auto task = registry.details(id);
        if (!task) {
            continue;
        }
        auto state = task->snapshot.state;
        if (state == TaskState::waiting || state == TaskState::downloading) {
            any_active = true;
        }
        rows.push_back(bar.render(*task));
    }
    return rows;
}

// Sleep one refresh period, waking early on interrupt
void wait_refresh(const std::atomic<bool>& interrupted) {
    constexpr auto slice = chrono::milliseconds(50);
    auto deadline = chrono::steady_clock::now() + CLI_REFRESH_INTERVAL;
    while (!interrupted.load(std::memory_order_relaxed) && chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(slice);
    }
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    auto fail = [&args](std::string message) {
        if (args.error.empty()) {
            args.error = std::move(message);
        }
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        // Options that take a value
        auto value = [&]() -> const char* {
            if (i + 1 < argc) {
                return argv[++i];
            }
            fail("missing value for " + arg);
            return nullptr;
        };
        auto count = [&](std::optional<int>& out) {
            if (const char* v = value()) {
                out = parse_count(v);
                if (!out) {
                    fail("invalid number for " + arg + ": " + v);
                }
            }
        };

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-c" || arg == "--config") {
            if (const char* v = value()) args.config_path = v;
        } else if (arg == "-d" || arg == "--directory") {
            if (const char* v = value()) args.output_dir = v;
        } else if (arg == "-o" || arg == "--output") {
            if (const char* v = value()) args.output_file = v;
        } else if (arg == "-s" || arg == "--split") {
            count(args.split);
        } else if (arg == "-x" || arg == "--max-connection-per-server") {
            count(args.max_connection_per_server);
        } else if (arg == "-t" || arg == "--max-tries") {
            count(args.max_tries);
        } else if (arg == "--retry-wait") {
            count(args.retry_wait);
        } else if (arg == "--limit") {
            if (const char* v = value()) {
                std::string_view limit = v;
                if (to_bytes(limit) == 0 && limit != "0") {
                    fail("invalid rate for --limit: " + std::string(limit));
                }
                args.download_limit = limit;
            }
        } else if (arg == "--referer") {
            if (const char* v = value()) args.referer = v;
        } else if (arg == "--user-agent") {
            if (const char* v = value()) args.user_agent = v;
        } else if (arg == "-H" || arg == "--header") {
            if (const char* v = value()) args.headers.emplace_back(v);
        } else if (arg == "--no-continue") {
            args.no_continue = true;
        } else if (arg == "-e" || arg == "--exec") {
            if (const char* v = value()) args.executable = v;
        } else if (arg == "--extra") {
            if (const char* v = value()) args.extra_args = v;
        } else if (arg.size() > 1 && arg.starts_with('-')) {
            fail("unknown option " + arg);
        } else {
            // URL arguments (no option)
            args.urls.push_back(arg);
        }
    }

    return args;
}

void apply_overrides(Settings& settings, const CliArgs& args) {
    TaskOptions& opt = settings.defaults;

    if (!args.executable.empty()) settings.executable = args.executable;
    if (!args.output_dir.empty()) settings.output_dir = args.output_dir;
    if (args.split) opt.split = *args.split;
    if (args.max_connection_per_server) opt.max_connection_per_server = args.max_connection_per_server;
    if (args.max_tries) opt.max_tries = args.max_tries;
    if (args.retry_wait) opt.retry_wait = args.retry_wait;
    if (!args.download_limit.empty()) opt.max_download_limit = args.download_limit;
    if (!args.referer.empty()) opt.referer = args.referer;
    if (!args.user_agent.empty()) opt.user_agent = args.user_agent;
    if (!args.extra_args.empty()) opt.extra_args = args.extra_args;
    opt.headers.insert(opt.headers.end(), args.headers.begin(), args.headers.end());
    if (args.no_continue) opt.resume = false;

    if (args.verbose) {
        settings.log_level = spdlog::level::debug;
    } else if (args.quiet) {
        settings.log_level = spdlog::level::warn;
    }
}

//=============================================================================
// Commands
//=============================================================================

CliResult run(const CliArgs& args, const std::atomic<bool>& interrupted) noexcept {
    try {
        auto settings = Settings::resolve(args.config_path);
        if (!settings) {
            std::cerr << "Error: Cannot load configuration: " << settings.error().message() << std::endl;
            return std::unexpected(settings.error());
        }
        apply_overrides(*settings, args);
        set_log_level(settings->log_level);

        if (!args.output_file.empty() && args.urls.size() > 1) {
            logger()->warn("--output ignored with {} URLs", args.urls.size());
        }

        TaskRegistry registry(settings->environment());
        std::vector<TaskId> ids;
        int exit_code = 0;

        for (const auto& url : args.urls) {
            TaskConfig config = settings->make_task(url);
            if (args.urls.size() == 1) {
                config.output_name = args.output_file;
            }

            auto id = registry.add(std::move(config));
            if (!id) {
                std::cerr << "Error: Rejected " << url << ": " << id.error().message() << std::endl;
                exit_code = 1;
                continue;
            }
            if (auto ec = registry.dispatch_async(*id, TaskVerb::start)) {
                std::cerr << "Error: Cannot start " << url << ": " << ec.message() << std::endl;
                exit_code = 1;
            }
            ids.push_back(*id);
        }

        ProgressBar bar;
        StatusPanel panel;
        bool any_active = false;

        while (true) {
            if (interrupted.load()) {
                // Let pending starts land so pause reaches their processes
                registry.drain();
                registry.pause_all();
                if (!args.quiet) {
                    panel.draw(render_rows(registry, ids, bar, any_active));
                }
                std::cout << "Interrupted, partial downloads kept" << std::endl;
                return EXIT_INTERRUPTED;
            }

            auto rows = render_rows(registry, ids, bar, any_active);
            if (!args.quiet) {
                panel.draw(rows);
            }
            if (!any_active) {
                break;
            }
            wait_refresh(interrupted);
        }

        registry.drain();
        panel.release();

        for (TaskId id : ids) {
            auto task = registry.details(id);
            if (!task || task->snapshot.state == TaskState::completed) {
                continue;
            }
            exit_code = 1;
            std::cerr << "Task #" << id << " (" << task->config.url << ") "
                      << to_string(task->snapshot.state) << std::endl;
            if (auto lines = registry.log(id, FAILURE_LOG_LINES)) {
                for (const auto& line : *lines) {
                    std::cerr << "  " << line << std::endl;
                }
            }
        }

        return exit_code;
    } catch (const std::exception& e) {
        logger()->error("run failed: {}", e.what());
        return std::unexpected(make_error_code(TaskErrc::invalid_operation));
    }
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "AriaFlow " << program_name << " - aria2c download supervisor\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <URL>...\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help                      Show this help message\n";
    std::cout << "  -v, --version                   Show version information\n";
    std::cout << "  -V, --verbose                   Enable debug diagnostics\n";
    std::cout << "  -q, --quiet                     Quiet mode (no progress panel)\n";
    std::cout << "  -c, --config <FILE>             JSON settings file (default: $" << CONFIG_ENV_VAR << ")\n";
    std::cout << "  -d, --directory <DIR>           Save to specified directory\n";
    std::cout << "  -o, --output <FILE>             Save to specified file (single URL only)\n";
    std::cout << "  -s, --split <N>                 Connections per download (default: " << DEFAULT_SPLIT << ")\n";
    std::cout << "  -x, --max-connection-per-server <N>\n";
    std::cout << "                                  Connections per server (default: split)\n";
    std::cout << "  -t, --max-tries <N>             Retry attempts\n";
    std::cout << "      --retry-wait <SEC>          Seconds between retries\n";
    std::cout << "      --limit <RATE>              Download rate limit, e.g. 2M\n";
    std::cout << "      --referer <URL>             Referer header\n";
    std::cout << "      --user-agent <UA>           User-Agent header\n";
    std::cout << "  -H, --header <LINE>             Extra request header (repeatable)\n";
    std::cout << "      --no-continue               Do not resume partial files\n";
    std::cout << "  -e, --exec <PATH>               Downloader executable (default: " << DEFAULT_EXECUTABLE << ")\n";
    std::cout << "      --extra <ARGS>              Extra downloader arguments\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://example.com/file.zip\n";
    std::cout << "  " << program_name << " -d ~/Downloads -s 8 https://example.com/large.iso\n";
    std::cout << "  " << program_name << " -H 'Cookie: id=1' --limit 2M https://example.com/a.bin\n";
}

void print_version() noexcept {
    std::cout << "AriaFlow " << ariaflow::version.to_string() << std::endl;
    std::cout << "Built " << BUILD_DATE << " " << BUILD_TIME << " with C++23, spdlog, nlohmann_json\n";
}

} // namespace ariaflow::cli
