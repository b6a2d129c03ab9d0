#include "shiplot/config/command_line.hpp"

#include <charconv>
#include <limits>
#include <sstream>

namespace shiplot::config {
namespace {

template<typename T>
Result<T> parse_number(const std::string& option, const std::string& text) {
    T value{};
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (text.empty() || ec != std::errc() || ptr != end) {
        return Err<T>(ErrorCode::InvalidArgument, "invalid value for " + option + ": '" + text + "'");
    }
    return Ok(value);
}

Result<std::uint16_t> parse_port(const std::string& option, const std::string& text) {
    auto number = parse_number<std::uint32_t>(option, text);
    if (number.is_error()) {
        return Err<std::uint16_t>(number.error());
    }
    if (number.value() > std::numeric_limits<std::uint16_t>::max()) {
        return Err<std::uint16_t>(ErrorCode::InvalidArgument, option + " out of range: " + text);
    }
    return Ok(static_cast<std::uint16_t>(number.value()));
}

} // namespace

Result<CommandLine> parse_command_line(const std::vector<std::string>& args) {
    CommandLine result;
    if (args.size() < 2) {
        return Ok(std::move(result));
    }

    const std::string& command = args[1];
    if (command == "run") {
        result.command = Command::Run;
    } else if (command == "version") {
        result.command = Command::Version;
    } else if (command == "help" || command == "--help" || command == "-h") {
        result.command = Command::Help;
    } else {
        return Err<CommandLine>(ErrorCode::InvalidArgument, "unknown command '" + command + "'");
    }

    for (std::size_t i = 2; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            result.command = Command::Help;
            continue;
        }
        if (result.command != Command::Run) {
            return Err<CommandLine>(ErrorCode::InvalidArgument, "unexpected argument '" + arg + "'");
        }
        if (i + 1 >= args.size()) {
            return Err<CommandLine>(ErrorCode::InvalidArgument, "missing value for " + arg);
        }
        const std::string& value = args[++i];

        if (arg == "--config") {
            result.config_file = value;
        } else if (arg == "--max-transfers") {
            auto number = parse_number<std::size_t>(arg, value);
            if (number.is_error()) {
                return Err<CommandLine>(number.error());
            }
            result.max_transfers = number.value();
        } else if (arg == "--staging") {
            result.staging_paths.push_back(value);
        } else if (arg == "--destination") {
            result.destination_paths.push_back(value);
        } else if (arg == "--ip") {
            result.ip = value;
        } else if (arg == "--port") {
            auto port = parse_port(arg, value);
            if (port.is_error()) {
                return Err<CommandLine>(port.error());
            }
            result.port = port.value();
        } else if (arg == "--server") {
            const auto colon = value.rfind(':');
            if (colon == std::string::npos || colon == 0) {
                return Err<CommandLine>(ErrorCode::InvalidArgument, "--server expects HOST:PORT, got '" + value + "'");
            }
            auto port = parse_port(arg, value.substr(colon + 1));
            if (port.is_error()) {
                return Err<CommandLine>(port.error());
            }
            result.server_ip = value.substr(0, colon);
            result.server_port = port.value();
        } else if (arg == "--log-level") {
            result.log_level = value;
        } else if (arg == "--log-file") {
            result.log_file = value;
        } else {
            return Err<CommandLine>(ErrorCode::InvalidArgument, "unknown option '" + arg + "'");
        }
    }

    return Ok(std::move(result));
}

void apply_overrides(Config& config, const CommandLine& command_line) {
    if (command_line.max_transfers) {
        config.max_transfers = *command_line.max_transfers;
    }
    if (!command_line.staging_paths.empty()) {
        config.staging_paths = command_line.staging_paths;
    }
    if (!command_line.destination_paths.empty()) {
        config.destination_paths = command_line.destination_paths;
    }
    if (command_line.ip) {
        config.server.ip = *command_line.ip;
    }
    if (command_line.port) {
        config.server.enabled = true;
        config.server.port = *command_line.port;
    }
    if (command_line.server_ip) {
        config.client.enabled = true;
        config.client.server_ip = *command_line.server_ip;
        config.client.server_port = command_line.server_port.value_or(0);
    }
    if (command_line.log_level) {
        config.log.level = *command_line.log_level;
    }
    if (command_line.log_file) {
        config.log.file = *command_line.log_file;
    }
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " <command> [options]\n"
        << "\n"
        << "Ship plot files from staging directories to destination volumes.\n"
        << "\n"
        << "Commands:\n"
        << "  run                    Watch staging directories and transfer plots\n"
        << "  version                Show version, build and platform information\n"
        << "\n"
        << "Run options:\n"
        << "  --config FILE          Config file (default ./shiplot.json or $HOME/shiplot.json)\n"
        << "  --max-transfers N      Concurrent transfers, 0 = one per destination (default 4)\n"
        << "  --staging PATTERN      Staging directory or glob, repeatable\n"
        << "  --destination PATTERN  Destination directory or glob, repeatable\n"
        << "  --ip ADDR              Receiver listen address (default 0.0.0.0)\n"
        << "  --port N               Receive plots over TCP on port N\n"
        << "  --server HOST:PORT     Send plots to a remote receiver instead\n"
        << "  --log-level LEVEL      trace, debug, info, warn, error, critical, off\n"
        << "  --log-file FILE        Also write logs to FILE\n";
    return out.str();
}

} // namespace shiplot::config
