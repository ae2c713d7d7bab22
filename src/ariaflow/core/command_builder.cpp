// Copyright (c) 2026 changcheng967. All rights reserved.

#include <ariaflow/core/command_builder.hpp>
#include <ariaflow/core/error.hpp>
#include <cctype>
#include <filesystem>
#include <sstream>

namespace ariaflow::core {

namespace {

std::string trim_copy(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return std::string(s);
}

std::string flag(std::string_view name, std::string_view value) {
    std::string out("--");
    out += name;
    out += '=';
    out += value;
    return out;
}

// Header entries may themselves hold several lines
void append_headers(std::vector<std::string>& argv, const std::vector<std::string>& headers) {
    for (const auto& block : headers) {
        std::istringstream lines(block);
        std::string line;
        while (std::getline(lines, line)) {
            auto header = trim_copy(line);
            if (!header.empty()) {
                argv.push_back(flag("header", header));
            }
        }
    }
}

bool needs_quoting(const std::string& arg) noexcept {
    if (arg.empty()) return true;
    for (char c : arg) {
        if (std::isspace(static_cast<unsigned char>(c)) || c == '\'' || c == '"' || c == '\\') {
            return true;
        }
    }
    return false;
}

} // namespace

std::error_code ensure_output_directory(const std::string& dir) noexcept {
    try {
        std::error_code ec;
        if (std::filesystem::is_directory(dir, ec)) {
            return {};
        }
        std::filesystem::create_directories(dir, ec);
        if (ec || !std::filesystem::is_directory(dir)) {
            return make_error_code(TaskErrc::directory_creation_failed);
        }
        return {};
    } catch (const std::exception&) {
        return make_error_code(TaskErrc::directory_creation_failed);
    }
}

std::expected<std::vector<std::string>, std::error_code>
build_command(std::string_view executable, const TaskConfig& config) noexcept {
    try {
        const TaskOptions& opt = config.options;
        const std::string out_dir = config.resolved_output_dir();

        if (auto ec = ensure_output_directory(out_dir)) {
            return std::unexpected(ec);
        }

        std::vector<std::string> argv;
        argv.reserve(24);
        argv.emplace_back(executable);

        if (opt.resume) {
            argv.emplace_back("-c");
        }

        argv.push_back(flag("file-allocation",
            opt.file_allocation.empty() ? std::string(DEFAULT_FILE_ALLOCATION) : opt.file_allocation));

        const int split = opt.split;
        const int max_conn = opt.max_connection_per_server.value_or(split);
        argv.push_back(flag("split", std::to_string(split)));
        argv.push_back(flag("max-connection-per-server", std::to_string(max_conn)));

        if (opt.max_tries) {
            argv.push_back(flag("max-tries", std::to_string(*opt.max_tries)));
        }
        if (opt.retry_wait) {
            argv.push_back(flag("retry-wait", std::to_string(*opt.retry_wait)));
        }
        if (!opt.max_download_limit.empty()) {
            argv.push_back(flag("max-download-limit", opt.max_download_limit));
        }
        if (!opt.max_upload_limit.empty()) {
            argv.push_back(flag("max-upload-limit", opt.max_upload_limit));
        }
        if (!opt.referer.empty()) {
            argv.push_back(flag("referer", opt.referer));
        }
        if (!opt.user_agent.empty()) {
            argv.push_back(flag("user-agent", opt.user_agent));
        }

        append_headers(argv, opt.headers);

        // Restarting must overwrite the partial file, never create "name.1"
        argv.emplace_back("--allow-overwrite=true");
        argv.emplace_back("--auto-file-renaming=false");

        argv.emplace_back("-d");
        argv.push_back(out_dir);
        if (!config.output_name.empty()) {
            argv.emplace_back("-o");
            argv.push_back(config.output_name);
        }

        if (!opt.extra_args.empty()) {
            auto extra = shell_split(opt.extra_args);
            auto tokens = extra ? std::move(*extra) : whitespace_split(opt.extra_args);
            for (auto& token : tokens) {
                argv.push_back(std::move(token));
            }
        }

        argv.push_back(trim_copy(config.url));
        return argv;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(TaskErrc::invalid_config));
    }
}

std::expected<std::vector<std::string>, std::error_code>
shell_split(std::string_view text) noexcept {
    try {
        enum class Mode { none, single_quote, double_quote };

        std::vector<std::string> tokens;
        std::string current;
        bool in_token = false;
        Mode mode = Mode::none;

        for (std::size_t i = 0; i < text.size(); ++i) {
            const char c = text[i];
            switch (mode) {
                case Mode::none:
                    if (std::isspace(static_cast<unsigned char>(c))) {
                        if (in_token) {
                            tokens.push_back(std::move(current));
                            current.clear();
                            in_token = false;
                        }
                    } else if (c == '\'') {
                        mode = Mode::single_quote;
                        in_token = true;
                    } else if (c == '"') {
                        mode = Mode::double_quote;
                        in_token = true;
                    } else if (c == '\\') {
                        if (i + 1 >= text.size()) {
                            return std::unexpected(make_error_code(TaskErrc::parse_error));
                        }
                        current += text[++i];
                        in_token = true;
                    } else {
                        current += c;
                        in_token = true;
                    }
                    break;

                case Mode::single_quote:
                    if (c == '\'') {
                        mode = Mode::none;
                    } else {
                        current += c;
                    }
                    break;

                case Mode::double_quote:
                    if (c == '"') {
                        mode = Mode::none;
                    } else if (c == '\\' && i + 1 < text.size() &&
                               (text[i + 1] == '"' || text[i + 1] == '\\' ||
                                text[i + 1] == '$' || text[i + 1] == '`')) {
                        current += text[++i];
                    } else {
                        current += c;
                    }
                    break;
            }
        }

        if (mode != Mode::none) {
            return std::unexpected(make_error_code(TaskErrc::parse_error));
        }
        if (in_token) {
            tokens.push_back(std::move(current));
        }
        return tokens;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(TaskErrc::parse_error));
    }
}

std::vector<std::string> whitespace_split(std::string_view text) {
    std::vector<std::string> tokens;
    std::istringstream in{std::string(text)};
    std::string token;
    while (in >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string render_command(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) out += ' ';
        if (!needs_quoting(arg)) {
            out += arg;
            continue;
        }
        out += '\'';
        for (char c : arg) {
            if (c == '\'') {
                out += "'\\''";
            } else {
                out += c;
            }
        }
        out += '\'';
    }
    return out;
}

} // namespace ariaflow::core
