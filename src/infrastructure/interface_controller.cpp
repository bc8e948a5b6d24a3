/**
 * Interface Controller Implementation
 * Drives the hotspot interface through `ip`, `iw` and (optionally) `nmcli`
 */

#include "infrastructure/interface_controller.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <thread>

namespace nextu
{
    namespace infrastructure
    {

        namespace
        {
            std::string trim(const std::string &text)
            {
                const auto begin = text.find_first_not_of(" \t\r\n");
                if (begin == std::string::npos)
                {
                    return "";
                }
                const auto end = text.find_last_not_of(" \t\r\n");
                return text.substr(begin, end - begin + 1);
            }

            std::string token_after(const std::string &text, const std::string &marker)
            {
                std::istringstream stream(text);
                std::string token;
                while (stream >> token)
                {
                    if (token == marker)
                    {
                        std::string value;
                        if (stream >> value)
                        {
                            return value;
                        }
                        return "";
                    }
                }
                return "";
            }

            bool reports_missing_device(const std::string &output)
            {
                return output.find("does not exist") != std::string::npos ||
                       output.find("Cannot find device") != std::string::npos;
            }
        }

        bool InterfaceStatus::has_address(const std::string &cidr) const
        {
            return std::find(ipv4_addresses.begin(), ipv4_addresses.end(), cidr) != ipv4_addresses.end();
        }

        InterfaceController::InterfaceController(const std::shared_ptr<const core::HotspotConfig> &config,
                                                 core::CommandRunner &runner)
            : config_(config), runner_(runner), logger_(core::get_logger("InterfaceController"))
        {
            interface_ = config_->network.interface;
            gateway_cidr_ = config_->gateway_cidr();
        }

        void InterfaceController::bind()
        {
            logger_->info("Configuring interface",
                          core::LogContext().add("interface", interface_).add("address", gateway_cidr_));

            if (!exists())
            {
                throw core::HotspotError(core::ErrorCode::InterfaceNotFound, "interface " + interface_,
                                         core::format_command({"ip", "link", "show", "dev", interface_}),
                                         "not found. Is the adapter plugged in?");
            }

            // Converge: a previously bound interface is reset before it is bound again
            if (query().has_address(gateway_cidr_))
            {
                logger_->info("Interface already carries the gateway address, resetting it first",
                              core::LogContext().add("interface", interface_));
                auto leftovers = unbind();
                if (!leftovers.empty())
                {
                    logger_->warning("Interface reset incomplete, binding anyway",
                                     core::LogContext().add("interface", interface_).add("failures", leftovers.size()));
                }
            }

            if (config_->network.release_from_network_manager)
            {
                set_network_manager_managed(false);
            }

            run_best_effort({"ip", "addr", "flush", "dev", interface_}, nullptr);
            run_best_effort({"ip", "link", "set", interface_, "down"}, nullptr);

            // Address first, then link up: the link never comes up without its gateway
            try
            {
                run_required({"ip", "addr", "add", gateway_cidr_, "dev", interface_});
                run_required({"ip", "link", "set", interface_, "up"});
            }
            catch (const core::HotspotError &)
            {
                for (const auto &failure : unbind())
                {
                    logger_->error("Could not undo partial interface setup",
                                   core::LogContext().add("detail", failure.describe()));
                }
                throw;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(config_->supervision.settle_delay_ms));

            logger_->info("Interface configured",
                          core::LogContext().add("interface", interface_).add("address", gateway_cidr_));
        }

        core::TeardownErrors InterfaceController::unbind()
        {
            core::TeardownErrors errors;

            if (!exists())
            {
                logger_->info("Interface is gone, nothing to reset", core::LogContext().add("interface", interface_));
                return errors;
            }

            logger_->info("Resetting interface", core::LogContext().add("interface", interface_));

            run_best_effort({"ip", "addr", "flush", "dev", interface_}, &errors);
            run_best_effort({"ip", "link", "set", interface_, "down"}, &errors);

            if (config_->network.release_from_network_manager)
            {
                set_network_manager_managed(true);
            }

            return errors;
        }

        bool InterfaceController::exists() const
        {
            return run_ip({"link", "show", "dev", interface_}).ok();
        }

        InterfaceStatus InterfaceController::query() const
        {
            InterfaceStatus status;
            status.name = interface_;

            auto link = run_ip({"-o", "link", "show", "dev", interface_});
            if (link.exit_code < 0 || link.exit_code == 127)
            {
                logger_->warning("Cannot query interface state", core::LogContext().add("output", trim(link.output)));
                return status;
            }
            status.queried = true;
            if (!link.ok())
            {
                return status;
            }
            status.found = true;

            // 3: wlan0: <BROADCAST,MULTICAST,UP,LOWER_UP> mtu 1500 ... state UP ... link/ether 00:11:22:33:44:55 ...
            const auto open = link.output.find('<');
            const auto close = link.output.find('>', open);
            if (open != std::string::npos && close != std::string::npos)
            {
                std::istringstream flags(link.output.substr(open + 1, close - open - 1));
                std::string flag;
                while (std::getline(flags, flag, ','))
                {
                    if (flag == "UP")
                    {
                        status.admin_up = true;
                    }
                }
            }
            status.oper_state = token_after(link.output, "state");
            status.mac = token_after(link.output, "link/ether");

            auto addresses = run_ip({"-o", "-4", "addr", "show", "dev", interface_});
            if (addresses.ok())
            {
                std::istringstream lines(addresses.output);
                std::string line;
                while (std::getline(lines, line))
                {
                    auto cidr = token_after(line, "inet");
                    if (!cidr.empty())
                    {
                        status.ipv4_addresses.push_back(cidr);
                    }
                }
            }

            auto info = runner_.run({"iw", "dev", interface_, "info"});
            if (info.ok())
            {
                status.mode = token_after(info.output, "type");
            }

            return status;
        }

        core::CommandResult InterfaceController::run_ip(const std::vector<std::string> &args) const
        {
            std::vector<std::string> argv{"ip"};
            argv.insert(argv.end(), args.begin(), args.end());
            return runner_.run(argv);
        }

        bool InterfaceController::run_best_effort(const std::vector<std::string> &argv, core::TeardownErrors *errors)
        {
            auto result = runner_.run(argv);
            if (result.ok())
            {
                return true;
            }

            logger_->warning("Interface command failed",
                             core::LogContext()
                                 .add("command", core::format_command(argv))
                                 .add("exit_code", result.exit_code)
                                 .add("output", trim(result.output)));
            if (errors)
            {
                errors->push_back(core::TeardownError{"interface " + interface_, core::format_command(argv),
                                                      "exit code " + std::to_string(result.exit_code) + ": " + trim(result.output)});
            }
            return false;
        }

        void InterfaceController::run_required(const std::vector<std::string> &argv)
        {
            auto result = runner_.run(argv);
            if (result.ok())
            {
                return;
            }

            const auto code = reports_missing_device(result.output) ? core::ErrorCode::InterfaceNotFound
                                                                    : core::ErrorCode::CommandFailed;
            throw core::HotspotError(code, "interface " + interface_, core::format_command(argv),
                                     "failed with exit code " + std::to_string(result.exit_code) + ": " + trim(result.output));
        }

        void InterfaceController::set_network_manager_managed(bool managed)
        {
            std::vector<std::string> argv{"nmcli", "device", "set", interface_, "managed", managed ? "yes" : "no"};
            auto result = runner_.run(argv);
            if (result.ok())
            {
                logger_->debug("NetworkManager hand-off", core::LogContext().add("managed", managed ? "yes" : "no"));
                return;
            }
            if (result.exit_code == 127)
            {
                logger_->debug("nmcli not available, skipping NetworkManager hand-off");
                return;
            }

            // NetworkManager is optional on the host, so this never fails an operation
            logger_->warning("NetworkManager hand-off failed",
                             core::LogContext()
                                 .add("command", core::format_command(argv))
                                 .add("output", trim(result.output)));
        }

    } // namespace infrastructure
} // namespace nextu
