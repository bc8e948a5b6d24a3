/**
 * NEXTU Hotspot Manager
 * Command line front end: start, stop, restart, status, configure
 */

#include <iostream>
#include <unistd.h>
#include <memory>
#include <string>

#include "core/command_runner.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/process_control.hpp"
#include "infrastructure/config_writer.hpp"
#include "services/lifecycle_orchestrator.hpp"
#include "services/status_reporter.hpp"

// Command line argument parsing
#include <getopt.h>

namespace nextu {

const char* const kDefaultConfigFile = "/etc/nextu-hotspot/hotspot.json";

/**
 * Check if running with required privileges
 */
bool check_root_privileges(const std::string& command) {
    if (geteuid() != 0) {
        std::cerr << "Error: '" << command << "' must be run as root (sudo)" << std::endl;
        std::cerr << "Please run with: sudo nextu-hotspot " << command << std::endl;
        return false;
    }
    return true;
}

/**
 * Print usage information
 */
void print_usage(const char* program_name) {
    std::cout << "NEXTU Mini WiFi Hotspot Manager\n\n";
    std::cout << "Usage: " << program_name << " [OPTIONS] {start|stop|restart|status|configure}\n\n";
    std::cout << "Commands:\n";
    std::cout << "  start                    Start the WiFi hotspot\n";
    std::cout << "  stop                     Stop the WiFi hotspot\n";
    std::cout << "  restart                  Restart the WiFi hotspot\n";
    std::cout << "  status                   Show hotspot status and connected clients\n";
    std::cout << "  configure                Write hostapd.conf and dnsmasq.conf from the configuration\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE        Configuration file path (default: " << kDefaultConfigFile << ")\n";
    std::cout << "  -v, --verbose            Increase verbosity (-v for INFO, -vv for DEBUG)\n";
    std::cout << "  -l, --log-file FILE      Log to file instead of console\n";
    std::cout << "  -j, --json               Print status as JSON\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "  --version                Show version information\n\n";
    std::cout << "Examples:\n";
    std::cout << "  sudo " << program_name << " start               # Bring the hotspot up\n";
    std::cout << "  " << program_name << " status --json            # Machine-readable status\n";
    std::cout << "  sudo " << program_name << " -vv restart         # Restart with debug logging\n";
    std::cout << std::endl;
}

/**
 * Print version information
 */
void print_version() {
    std::cout << "nextu-hotspot v1.0.0" << std::endl;
    std::cout << "Built for Linux (hostapd, dnsmasq, iptables)" << std::endl;
}

/**
 * Parse command line arguments
 */
struct Arguments {
    std::string config_file = kDefaultConfigFile;
    int verbosity = 0;
    std::string log_file;
    bool json = false;
    bool help = false;
    bool version = false;
    std::string command;
};

Arguments parse_arguments(int argc, char* argv[]) {
    Arguments args;

    static struct option long_options[] = {
        {"config",   required_argument, 0, 'c'},
        {"verbose",  no_argument,       0, 'v'},
        {"log-file", required_argument, 0, 'l'},
        {"json",     no_argument,       0, 'j'},
        {"help",     no_argument,       0, 'h'},
        {"version",  no_argument,       0, 0},
        {0, 0, 0, 0}
    };

    int c;
    int option_index = 0;

    while ((c = getopt_long(argc, argv, "c:vl:jh", long_options, &option_index)) != -1) {
        switch (c) {
            case 'c':
                args.config_file = optarg;
                break;
            case 'v':
                args.verbosity++;
                break;
            case 'l':
                args.log_file = optarg;
                break;
            case 'j':
                args.json = true;
                break;
            case 'h':
                args.help = true;
                break;
            case 0:
                if (option_index == 5) { // --version
                    args.version = true;
                }
                break;
            case '?':
                // getopt_long already printed an error message
                exit(1);
                break;
            default:
                std::cerr << "Unknown option: " << c << std::endl;
                exit(1);
        }
    }

    if (optind < argc) {
        args.command = argv[optind++];
    }
    if (optind < argc) {
        std::cerr << "Unexpected argument: " << argv[optind] << std::endl;
        exit(1);
    }

    return args;
}

void print_teardown_errors(const core::TeardownErrors& errors) {
    for (const auto& error : errors) {
        std::cerr << "  warning: " << error.describe() << std::endl;
    }
}

void print_start_summary(const core::HotspotConfig& config, const services::StartReport& report) {
    if (report.leftovers_cleared > 0) {
        std::cout << "Cleared " << report.leftovers_cleared << " leftover resource(s) of an earlier run" << std::endl;
    }
    if (!report.regulatory_applied) {
        std::cout << "Warning: regulatory domain " << config.network.country << " could not be set" << std::endl;
    }

    std::cout << "\n=== Hotspot is ACTIVE ===\n";
    std::cout << "  SSID:      " << config.access_point.ssid << "\n";
    std::cout << "  Password:  " << config.access_point.passphrase << "\n";
    std::cout << "  Gateway:   " << config.gateway_address() << "\n";
    std::cout << "  DHCP:      " << config.host_address(config.dhcp.range_start) << " - "
              << config.host_address(config.dhcp.range_end) << "\n";
    std::cout << "  Internet:  shared via " << config.network.upstream << "\n\n";
    std::cout << "Stop with: sudo nextu-hotspot stop" << std::endl;
}

void print_stop_summary(const services::StopReport& report) {
    if (!report.was_running) {
        std::cout << "Hotspot is not running" << std::endl;
        return;
    }
    print_teardown_errors(report.errors);
    std::cout << "=== Hotspot stopped ===" << std::endl;
}

int run_command(const Arguments& args, std::shared_ptr<const core::HotspotConfig> config) {
    core::SystemCommandRunner runner;
    core::SystemProcessControl processes;

    if (args.command == "configure") {
        infrastructure::DaemonConfigWriter writer(config);
        writer.write_all();
        std::cout << "Hotspot configuration written to " << config->paths.config_dir << "/" << std::endl;
        return 0;
    }

    services::LifecycleOrchestrator orchestrator(config, runner, processes);

    if (args.command == "start") {
        std::cout << "=== Starting NEXTU Hotspot ===" << std::endl;
        auto report = orchestrator.start();
        print_start_summary(*config, report);
        return 0;
    }

    if (args.command == "stop") {
        std::cout << "=== Stopping NEXTU Hotspot ===" << std::endl;
        print_stop_summary(orchestrator.stop());
        return 0;
    }

    if (args.command == "restart") {
        services::StopReport stopped;
        auto report = orchestrator.restart(&stopped);
        print_stop_summary(stopped);
        print_start_summary(*config, report);
        return 0;
    }

    // status
    auto snapshot = orchestrator.status();
    if (args.json) {
        std::cout << services::status_to_json(snapshot).dump(2) << std::endl;
    } else {
        std::cout << services::format_status(snapshot);
    }
    return 0;
}

} // namespace nextu

/**
 * Main entry point
 */
int main(int argc, char* argv[]) {
    using namespace nextu;

    try {
        // Parse command line arguments
        auto args = parse_arguments(argc, argv);

        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }

        if (args.version) {
            print_version();
            return 0;
        }

        if (args.command != "start" && args.command != "stop" && args.command != "restart" &&
            args.command != "status" && args.command != "configure") {
            if (!args.command.empty()) {
                std::cerr << "Unknown command: " << args.command << "\n\n";
            }
            print_usage(argv[0]);
            return 1;
        }

        // Setup logging
        core::LogLevel log_level = core::LogLevel::WARNING;
        if (args.verbosity == 1) {
            log_level = core::LogLevel::INFO;
        } else if (args.verbosity >= 2) {
            log_level = core::LogLevel::DEBUG;
        }

        core::setup_logging(log_level, args.log_file, args.log_file.empty());
        auto logger = core::get_logger("main");

        // Check privileges for anything that changes system state
        if (args.command != "status" && !check_root_privileges(args.command)) {
            return 1;
        }

        // Load configuration
        std::unique_ptr<core::HotspotConfig> config;
        try {
            config = core::HotspotConfig::from_file(args.config_file);
        } catch (const std::exception& e) {
            logger->error("Failed to load configuration",
                         core::LogContext().add("config_file", args.config_file)
                                          .add("error", e.what()));
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }

        // Configuration file may raise the level or name a log file; flags win
        if (args.verbosity == 0 || (args.log_file.empty() && !config->logging.log_file.empty())) {
            const auto level = args.verbosity == 0
                ? core::LoggerManager::string_to_level(config->logging.log_level)
                : log_level;
            const auto log_file = args.log_file.empty() ? config->logging.log_file : args.log_file;
            core::setup_logging(level, log_file, log_file.empty());
        }

        // Validate configuration
        auto problems = config->validation_errors();
        if (!problems.empty()) {
            std::cerr << "Error: invalid configuration in " << args.config_file << std::endl;
            for (const auto& problem : problems) {
                std::cerr << "  - " << problem << std::endl;
            }
            return 1;
        }

        logger->info("Running command",
                     core::LogContext().add("command", args.command).add("config_file", args.config_file));

        std::shared_ptr<const core::HotspotConfig> shared_config(std::move(config));
        return run_command(args, shared_config);

    } catch (const core::HotspotError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return core::exit_code_for(e.code());
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
