// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ariaflow/core/settings.hpp>
#include <ariaflow/core/error.hpp>
#include <ariaflow/core/logging.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <fstream>
#include <sstream>

namespace ariaflow::core {

namespace {

template<typename T>
void read_if_present(const nlohmann::json& j, const char* key, T& out) {
    if (j.contains(key) && !j[key].is_null()) {
        out = j[key].get<T>();
    }
}

// Integer key checked against [lo, hi] before narrowing to T
template<typename T>
bool read_integer(const nlohmann::json& j, const char* key, T& out,
                  std::int64_t lo, std::int64_t hi) {
    if (!j.contains(key) || j[key].is_null()) {
        return true;
    }
    if (!j[key].is_number_integer()) {
        return false;
    }
    if (j[key].is_number_unsigned() && j[key].get<std::uint64_t>() > static_cast<std::uint64_t>(hi)) {
        return false;
    }
    const auto value = j[key].get<std::int64_t>();
    if (value < lo || value > hi) {
        return false;
    }
    out = static_cast<T>(value);
    return true;
}

template<typename T>
bool read_integer(const nlohmann::json& j, const char* key, std::optional<T>& out,
                  std::int64_t lo, std::int64_t hi) {
    T value{};
    const bool present = j.contains(key) && !j[key].is_null();
    if (!read_integer(j, key, value, lo, hi)) {
        return false;
    }
    if (present) {
        out = value;
    }
    return true;
}

constexpr std::int64_t INT_MIN_VALUE = std::numeric_limits<int>::min();
constexpr std::int64_t INT_MAX_VALUE = std::numeric_limits<int>::max();
constexpr std::int64_t INT64_MAX_VALUE = std::numeric_limits<std::int64_t>::max();

} // namespace

std::expected<Settings, std::error_code> Settings::from_json(std::string_view text) noexcept {
    try {
        auto j = nlohmann::json::parse(text.begin(), text.end());
        if (!j.is_object()) {
            return std::unexpected(make_error_code(TaskErrc::config_file_error));
        }

        Settings s;
        read_if_present(j, "executable", s.executable);
        read_if_present(j, "output_dir", s.output_dir);

        TaskOptions& opt = s.defaults;
        read_if_present(j, "continue", opt.resume);
        read_if_present(j, "file_allocation", opt.file_allocation);

        std::int64_t grace_ms = s.terminate_grace.count();
        const bool numbers_ok =
            read_integer(j, "split", opt.split, INT_MIN_VALUE, INT_MAX_VALUE) &&
            read_integer(j, "max_connection_per_server", opt.max_connection_per_server, INT_MIN_VALUE, INT_MAX_VALUE) &&
            read_integer(j, "max_tries", opt.max_tries, 0, INT_MAX_VALUE) &&
            read_integer(j, "retry_wait", opt.retry_wait, 0, INT_MAX_VALUE) &&
            read_integer(j, "log_capacity", s.log_capacity, 0, INT64_MAX_VALUE) &&
            read_integer(j, "terminate_grace_ms", grace_ms, 0, INT64_MAX_VALUE);
        if (!numbers_ok) {
            logger()->error("invalid configuration: numeric value out of range");
            return std::unexpected(make_error_code(TaskErrc::config_file_error));
        }
        s.terminate_grace = std::chrono::milliseconds{grace_ms};

        read_if_present(j, "max_download_limit", opt.max_download_limit);
        read_if_present(j, "max_upload_limit", opt.max_upload_limit);
        read_if_present(j, "referer", opt.referer);
        read_if_present(j, "user_agent", opt.user_agent);
        read_if_present(j, "extra_args", opt.extra_args);

        if (j.contains("headers")) {
            const auto& headers = j["headers"];
            if (headers.is_string()) {
                opt.headers.push_back(headers.get<std::string>());
            } else if (headers.is_array()) {
                for (const auto& h : headers) {
                    opt.headers.push_back(h.get<std::string>());
                }
            } else if (!headers.is_null()) {
                return std::unexpected(make_error_code(TaskErrc::config_file_error));
            }
        }

        if (j.contains("log_level") && !j["log_level"].is_null()) {
            auto level = parse_log_level(j["log_level"].get<std::string>());
            if (!level) {
                return std::unexpected(level.error());
            }
            s.log_level = *level;
        }

        if (opt.split < 1 || (opt.max_connection_per_server && *opt.max_connection_per_server < 1)) {
            return std::unexpected(make_error_code(TaskErrc::invalid_config));
        }
        return s;
    } catch (const nlohmann::json::exception& e) {
        logger()->error("invalid configuration: {}", e.what());
        return std::unexpected(make_error_code(TaskErrc::config_file_error));
    } catch (const std::exception& e) {
        logger()->error("invalid configuration: {}", e.what());
        return std::unexpected(make_error_code(TaskErrc::config_file_error));
    }
}

std::expected<Settings, std::error_code> Settings::load(const std::string& path) noexcept {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            logger()->error("cannot open configuration file {}", path);
            return std::unexpected(make_error_code(TaskErrc::config_file_error));
        }
        std::ostringstream content;
        content << file.rdbuf();

        auto settings = from_json(content.str());
        if (settings) {
            logger()->debug("loaded configuration from {}", path);
        }
        return settings;
    } catch (const std::exception& e) {
        logger()->error("cannot read configuration file {}: {}", path, e.what());
        return std::unexpected(make_error_code(TaskErrc::config_file_error));
    }
}

std::expected<Settings, std::error_code> Settings::resolve(const std::string& explicit_path) noexcept {
    if (!explicit_path.empty()) {
        return load(explicit_path);
    }
    const char* env = std::getenv(std::string(CONFIG_ENV_VAR).c_str());
    if (env != nullptr && *env != '\0') {
        return load(env);
    }
    return Settings{};
}

TaskEnvironment Settings::environment() const {
    TaskEnvironment env;
    env.executable = executable;
    env.log_capacity = log_capacity;
    env.terminate_grace = terminate_grace;
    return env;
}

TaskConfig Settings::make_task(std::string url) const {
    TaskConfig config;
    config.url = std::move(url);
    config.output_dir = output_dir;
    config.options = defaults;
    return config;
}

} // namespace ariaflow::core
