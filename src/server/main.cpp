/**
 * shiplot - ship plot files from staging directories to destination volumes
 *
 * Local mode moves plots between local directories. With --port the process
 * also receives plots over TCP; with --server HOST:PORT it sends them to
 * such a receiver instead of writing them locally.
 */

#include "shiplot/config/command_line.hpp"
#include "shiplot/config/config.hpp"
#include "shiplot/core/platform.hpp"
#include "shiplot/core/version.hpp"
#include "shiplot/events/components.hpp"
#include "shiplot/events/event_bus.hpp"
#include "shiplot/server/service.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

void print_version() {
    std::cout << "shiplot " << shiplot::kVersion << "\n";
    std::cout << "- build target: " << shiplot::kBuildTarget << "\n";
    std::cout << "- build date: " << shiplot::kBuildDate << "\n";
    std::cout << "- os type: " << shiplot::platform_name() << "\n";
    std::cout << "- os arch: " << shiplot::architecture_name() << "\n";
}

bool configure_logging(const shiplot::config::LogConfig& log) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!log.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log.file));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::error("Cannot open log file {}: {}", log.file, e.what());
            return false;
        }
    }

    auto logger = std::make_shared<spdlog::logger>("shiplot", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::from_str(log.level));
    return true;
}

int run(const shiplot::config::CommandLine& command_line) {
    using namespace shiplot;

    config::Config config;
    std::optional<std::filesystem::path> config_file = command_line.config_file;
    if (!config_file) {
        config_file = config::find_default_config();
    }
    if (config_file) {
        auto loaded = config::load_config(*config_file);
        if (loaded.is_error()) {
            spdlog::error("{}", loaded.error().to_string());
            return 1;
        }
        config = std::move(loaded.value());
    }
    config::apply_overrides(config, command_line);

    if (auto valid = config::validate(config); valid.is_error()) {
        spdlog::error("{}", valid.error().to_string());
        return 1;
    }
    if (!configure_logging(config.log)) {
        return 1;
    }

    events::EventBus bus;
    events::LoggerComponent logger(bus);
    events::MetricsComponent metrics(bus);

    // Installed before anything starts so an early Ctrl-C still shuts down cleanly
    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);

    server::ShiplotService service(config, bus);
    if (auto started = service.start(); started.is_error()) {
        spdlog::error("Failed to start: {}", started.error().to_string());
        return 1;
    }

    // Block until SIGINT/SIGTERM
    int received = 0;
    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
        if (!ec) {
            received = signal_number;
        }
    });
    signal_context.run();

    spdlog::info("Received {}, shutting down...", received == SIGTERM ? "SIGTERM" : "SIGINT");
    service.stop(received == SIGTERM ? "SIGTERM" : "SIGINT");
    metrics.print_stats();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    const std::vector<std::string> args(argv, argv + argc);
    const std::string program = args.empty() ? "shiplot" : args[0];

    auto parsed = shiplot::config::parse_command_line(args);
    if (parsed.is_error()) {
        spdlog::error("{}", parsed.error().message);
        std::cerr << shiplot::config::usage(program);
        return 1;
    }

    const auto& command_line = parsed.value();
    switch (command_line.command) {
        case shiplot::config::Command::Version:
            print_version();
            return 0;
        case shiplot::config::Command::Run:
            return run(command_line);
        case shiplot::config::Command::Help:
            std::cout << shiplot::config::usage(program);
            return 0;
    }
    return 0;
}
