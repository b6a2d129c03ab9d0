#include "shiplot/config/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

namespace shiplot::config {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr const char* kConfigFileName = "shiplot.json";

const std::vector<std::string>& log_levels() {
    static const std::vector<std::string> levels{"trace", "debug", "info", "warn", "error", "critical", "off"};
    return levels;
}

std::vector<std::string> string_list(const json& j, const char* key, std::vector<std::string> fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto& value = j.at(key);
    if (value.is_string()) {
        return {value.get<std::string>()};
    }
    return value.get<std::vector<std::string>>();
}

Result<std::uint16_t> port_value(const json& j, const char* key, std::uint16_t fallback) {
    const auto port = j.value(key, static_cast<std::int64_t>(fallback));
    if (port < 0 || port > 65535) {
        return Err<std::uint16_t>(ErrorCode::Config, std::string(key) + " out of range: " + std::to_string(port));
    }
    return Ok(static_cast<std::uint16_t>(port));
}

} // namespace

const char* mode_name(Mode mode) {
    switch (mode) {
        case Mode::Local: return "local";
        case Mode::Server: return "server";
        case Mode::Client: return "client";
    }
    return "unknown";
}

Mode Config::mode() const {
    if (client.enabled) {
        return Mode::Client;
    }
    if (server.enabled) {
        return Mode::Server;
    }
    return Mode::Local;
}

Result<Config> parse_config(const std::string& text) {
    const json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        return Err<Config>(ErrorCode::Config, "configuration is not valid JSON");
    }
    if (!j.is_object()) {
        return Err<Config>(ErrorCode::Config, "configuration must be a JSON object");
    }

    Config config;
    try {
        const auto max_transfers = j.value("max_transfers", static_cast<std::int64_t>(config.max_transfers));
        if (max_transfers < 0) {
            return Err<Config>(ErrorCode::Config, "max_transfers must not be negative");
        }
        config.max_transfers = static_cast<std::size_t>(max_transfers);

        config.staging_paths = string_list(j, "staging_paths", {});
        config.destination_paths = string_list(j, "destination_paths", {});
        config.plot_suffixes = string_list(j, "plot_suffixes", config.plot_suffixes);

        if (j.contains("server")) {
            const auto& server = j.at("server");
            config.server.enabled = server.value("enabled", config.server.enabled);
            config.server.ip = server.value("ip", config.server.ip);
            auto port = port_value(server, "port", config.server.port);
            if (port.is_error()) {
                return Err<Config>(port.error());
            }
            config.server.port = port.value();
        }

        if (j.contains("client")) {
            const auto& client = j.at("client");
            config.client.enabled = client.value("enabled", config.client.enabled);
            config.client.server_ip = client.value("server_ip", config.client.server_ip);
            auto port = port_value(client, "server_port", config.client.server_port);
            if (port.is_error()) {
                return Err<Config>(port.error());
            }
            config.client.server_port = port.value();
        }

        if (j.contains("log")) {
            const auto& log = j.at("log");
            config.log.level = log.value("level", config.log.level);
            config.log.file = log.value("file", config.log.file);
        }
    } catch (const json::exception& e) {
        return Err<Config>(ErrorCode::Config, std::string("invalid configuration value: ") + e.what());
    }

    return Ok(std::move(config));
}

Result<Config> load_config(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Err<Config>(ErrorCode::Config, "cannot open config file " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto parsed = parse_config(buffer.str());
    if (parsed.is_error()) {
        return Err<Config>(ErrorCode::Config, path.string() + ": " + parsed.error().message);
    }
    spdlog::info("Using config file: {}", path.string());
    return parsed;
}

std::optional<fs::path> find_default_config() {
    std::vector<fs::path> candidates{fs::current_path() / kConfigFileName};
    if (const char* home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        candidates.push_back(fs::path(home) / kConfigFileName);
    }

    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

Result<void> validate(const Config& config) {
    if (config.server.enabled && config.client.enabled) {
        return Err<void>(ErrorCode::Config, "server and client mode cannot both be enabled");
    }

    if (config.plot_suffixes.empty() ||
        std::any_of(config.plot_suffixes.begin(), config.plot_suffixes.end(),
                    [](const std::string& suffix) { return suffix.empty(); })) {
        return Err<void>(ErrorCode::Config, "plot_suffixes must list at least one non-empty suffix");
    }

    const auto& levels = log_levels();
    if (std::find(levels.begin(), levels.end(), config.log.level) == levels.end()) {
        return Err<void>(ErrorCode::Config, "unknown log level '" + config.log.level + "'");
    }

    switch (config.mode()) {
        case Mode::Client:
            if (config.client.server_ip.empty() || config.client.server_port == 0) {
                return Err<void>(ErrorCode::Config, "client mode needs client.server_ip and client.server_port");
            }
            if (config.staging_paths.empty()) {
                return Err<void>(ErrorCode::Config, "client mode needs at least one staging path");
            }
            break;
        case Mode::Server:
            if (config.destination_paths.empty()) {
                return Err<void>(ErrorCode::Config, "server mode needs at least one destination path");
            }
            break;
        case Mode::Local:
            if (config.staging_paths.empty()) {
                return Err<void>(ErrorCode::Config, "at least one staging path is required");
            }
            if (config.destination_paths.empty()) {
                return Err<void>(ErrorCode::Config, "at least one destination path is required");
            }
            break;
    }
    return Ok();
}

} // namespace shiplot::config
