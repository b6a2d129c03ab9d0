/**
 * @file config.hpp
 * @brief Runtime configuration loaded from shiplot.json
 *
 * EXAMPLE FILE:
 * {
 *   "max_transfers": 4,
 *   "staging_paths": ["/mnt/nvme*"],
 *   "destination_paths": ["/mnt/hdd*"],
 *   "server": { "enabled": true, "ip": "0.0.0.0", "port": 9055 },
 *   "log": { "level": "info", "file": "/var/log/shiplot.log" }
 * }
 *
 * A missing key keeps its default. Unknown keys are ignored.
 */

#pragma once

#include "shiplot/core/plot_file.hpp"
#include "shiplot/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace shiplot::config {

struct ServerConfig {
    bool enabled = false;
    std::string ip = "0.0.0.0";
    std::uint16_t port = 0;
};

struct ClientConfig {
    bool enabled = false;
    std::string server_ip;
    std::uint16_t server_port = 0;
};

struct LogConfig {
    std::string level = "info";
    std::string file;  ///< empty = console only
};

/**
 * @brief What the process does with the plots it finds
 *
 * Local:  staging -> local destinations
 * Server: network receiver (and local staging, if any) -> local destinations
 * Client: staging -> remote receiver
 */
enum class Mode {
    Local,
    Server,
    Client
};

const char* mode_name(Mode mode);

struct Config {
    std::size_t max_transfers = 4;  ///< 0 = one per destination
    std::vector<std::string> staging_paths;
    std::vector<std::string> destination_paths;
    std::vector<std::string> plot_suffixes = default_plot_suffixes();
    ServerConfig server;
    ClientConfig client;
    LogConfig log;

    Mode mode() const;
};

/**
 * @brief Parse a JSON document into a Config
 *
 * RETURNS: ErrorCode::Config for malformed JSON or a key of the wrong type
 */
Result<Config> parse_config(const std::string& text);

Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief ./shiplot.json, then $HOME/shiplot.json
 */
std::optional<std::filesystem::path> find_default_config();

/**
 * @brief Reject configurations the service cannot run with
 */
Result<void> validate(const Config& config);

} // namespace shiplot::config
