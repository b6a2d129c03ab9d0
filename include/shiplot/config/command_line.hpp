#pragma once

#include "shiplot/config/config.hpp"
#include "shiplot/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace shiplot::config {

enum class Command {
    Run,
    Version,
    Help
};

/**
 * @brief Parsed `shiplot` arguments; unset options leave the file value alone
 */
struct CommandLine {
    Command command = Command::Help;
    std::optional<std::filesystem::path> config_file;
    std::optional<std::size_t> max_transfers;
    std::vector<std::string> staging_paths;
    std::vector<std::string> destination_paths;
    std::optional<std::string> ip;
    std::optional<std::uint16_t> port;
    std::optional<std::string> server_ip;
    std::optional<std::uint16_t> server_port;
    std::optional<std::string> log_level;
    std::optional<std::string> log_file;
};

/**
 * @brief Parse argv (argv[0] is the program name)
 *
 * RETURNS: ErrorCode::InvalidArgument for an unknown command or option,
 * a missing option value or a malformed number
 */
Result<CommandLine> parse_command_line(const std::vector<std::string>& args);

/**
 * @brief Overlay command-line values on a loaded configuration
 *
 * --port enables server mode, --server HOST:PORT enables client mode, and a
 * repeated list option replaces the file's list rather than extending it.
 */
void apply_overrides(Config& config, const CommandLine& command_line);

std::string usage(const std::string& program);

} // namespace shiplot::config
