/**
 * Daemon Supervisor Implementation
 * Shared start/stop/liveness logic for hostapd and dnsmasq
 */

#include "infrastructure/daemon_supervisor.hpp"
#include "core/command_runner.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/process_control.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <signal.h>
#include <thread>

namespace nextu
{
    namespace infrastructure
    {

        namespace
        {
            // Linux truncates /proc/<pid>/comm to 15 characters
            constexpr size_t kCommLength = 15;

            std::string first_line(const std::string &text)
            {
                auto line = text.substr(0, text.find('\n'));
                while (!line.empty() && (line.back() == '\r' || line.back() == ' '))
                {
                    line.pop_back();
                }
                return line;
            }
        }

        DaemonSupervisor::DaemonSupervisor(const std::string &name,
                                           const std::string &binary,
                                           const std::string &config_file,
                                           const std::string &pid_file,
                                           const core::SupervisionConfig &supervision,
                                           core::CommandRunner &runner,
                                           core::ProcessControl &processes)
            : name_(name), binary_(binary), config_file_(config_file), pid_file_(pid_file),
              supervision_(supervision), runner_(runner), processes_(processes),
              logger_(core::get_logger("DaemonSupervisor." + name))
        {
        }

        pid_t DaemonSupervisor::start()
        {
            logger_->info("Starting daemon",
                          core::LogContext().add("daemon", name_).add("config", config_file_).add("pid_file", pid_file_));

            std::error_code ec;
            if (!std::filesystem::exists(config_file_, ec))
            {
                fail_start("stat " + config_file_,
                           "configuration file " + config_file_ + " is missing (run 'nextu-hotspot configure')");
            }

            if (has_pid_file())
            {
                auto recorded = read_pid();
                if (recorded && processes_.is_alive(*recorded) && owns_process(*recorded))
                {
                    fail_start("kill -0 " + std::to_string(*recorded),
                               "an instance is already running with pid " + std::to_string(*recorded));
                }
                logger_->info("Removing stale pid file", core::LogContext().add("pid_file", pid_file_));
                remove_pid_file();
            }

            const auto argv = launch_command();
            const auto action = core::format_command(argv);
            auto result = runner_.run(argv);
            if (!result.ok())
            {
                cleanup_failed_start();
                fail_start(action, "exited with code " + std::to_string(result.exit_code) +
                                       (result.output.empty() ? "" : ": " + first_line(result.output)));
            }

            for (int attempt = 1; attempt <= supervision_.start_attempts; ++attempt)
            {
                auto pid = read_pid();
                if (pid && processes_.is_alive(*pid))
                {
                    logger_->info("Daemon is running",
                                  core::LogContext().add("daemon", name_).add("pid", *pid).add("attempts", attempt));
                    return *pid;
                }

                logger_->debug("Waiting for daemon pid",
                               core::LogContext().add("daemon", name_).add("attempt", attempt));
                std::this_thread::sleep_for(std::chrono::milliseconds(supervision_.poll_interval_ms));
            }

            // Whatever appeared late must not outlive the failed start
            cleanup_failed_start();
            fail_start(action, "no live process recorded in " + pid_file_ + " after " +
                                   std::to_string(supervision_.start_attempts) + " attempts");
        }

        std::optional<core::TeardownError> DaemonSupervisor::stop(std::optional<pid_t> known_pid)
        {
            std::optional<core::TeardownError> failure;

            auto pid = read_pid();
            if (!pid && known_pid && *known_pid > 0)
            {
                logger_->warning("Pid file missing or unreadable, using the recorded pid",
                                 core::LogContext().add("daemon", name_).add("pid", *known_pid).add("pid_file", pid_file_));
                pid = known_pid;
            }
            if (!pid)
            {
                if (has_pid_file() && !remove_pid_file())
                {
                    failure = core::TeardownError{name_, "rm " + pid_file_, "cannot remove unreadable pid file"};
                }
                logger_->debug("Daemon not running", core::LogContext().add("daemon", name_));
                return failure;
            }

            logger_->info("Stopping daemon", core::LogContext().add("daemon", name_).add("pid", *pid));

            if (!processes_.is_alive(*pid))
            {
                logger_->info("Daemon had already exited", core::LogContext().add("daemon", name_).add("pid", *pid));
            }
            else if (!owns_process(*pid))
            {
                const auto owner = processes_.process_name(*pid);
                logger_->warning("Recorded pid belongs to another program, not signalling it",
                                 core::LogContext().add("daemon", name_).add("pid", *pid).add("owner", owner));
                failure = core::TeardownError{name_, "kill -TERM " + std::to_string(*pid),
                                              "pid " + std::to_string(*pid) + " belongs to '" + owner + "', not signalled"};
            }
            else
            {
                processes_.send_signal(*pid, SIGTERM);
                if (!wait_for_exit(*pid))
                {
                    logger_->warning("Daemon ignored SIGTERM, sending SIGKILL",
                                     core::LogContext().add("daemon", name_).add("pid", *pid));
                    processes_.send_signal(*pid, SIGKILL);
                    if (!wait_for_exit(*pid))
                    {
                        failure = core::TeardownError{name_, "kill -KILL " + std::to_string(*pid),
                                                      "process " + std::to_string(*pid) + " is still alive"};
                    }
                }
            }

            // A stale pid file must never block a later start
            if (!remove_pid_file() && !failure)
            {
                failure = core::TeardownError{name_, "rm " + pid_file_, "cannot remove pid file"};
            }

            if (failure)
            {
                logger_->error("Daemon stop incomplete", core::LogContext().add("daemon", name_).add("detail", failure->detail));
            }
            else
            {
                logger_->info("Daemon stopped", core::LogContext().add("daemon", name_));
            }
            return failure;
        }

        bool DaemonSupervisor::is_running() const
        {
            auto pid = read_pid();
            return pid && processes_.is_alive(*pid);
        }

        std::optional<pid_t> DaemonSupervisor::read_pid() const
        {
            std::ifstream pid_stream(pid_file_);
            long value = 0;
            if (pid_stream && (pid_stream >> value) && value > 0)
            {
                return static_cast<pid_t>(value);
            }
            return std::nullopt;
        }

        bool DaemonSupervisor::has_pid_file() const
        {
            std::error_code ec;
            return std::filesystem::exists(pid_file_, ec);
        }

        DaemonStatus DaemonSupervisor::query() const
        {
            DaemonStatus status;
            status.name = name_;
            status.pid = read_pid();

            if (status.pid)
            {
                status.running = processes_.is_alive(*status.pid);
                status.stale_pid_file = !status.running;
                if (status.running && !owns_process(*status.pid))
                {
                    status.foreign_process = processes_.process_name(*status.pid);
                }
            }
            else if (has_pid_file())
            {
                status.stale_pid_file = true;
            }
            return status;
        }

        bool DaemonSupervisor::owns_process(pid_t pid) const
        {
            const auto actual = processes_.process_name(pid);
            if (actual.empty())
            {
                return true; // cannot tell; the pid file is ours
            }
            auto expected = std::filesystem::path(binary_).filename().string();
            if (expected.size() > kCommLength)
            {
                expected.resize(kCommLength);
            }
            return actual == expected;
        }

        bool DaemonSupervisor::wait_for_exit(pid_t pid) const
        {
            const auto deadline = std::chrono::steady_clock::now() +
                                  std::chrono::milliseconds(supervision_.stop_timeout_ms);
            while (processes_.is_alive(pid))
            {
                const auto now = std::chrono::steady_clock::now();
                if (now >= deadline)
                {
                    return false;
                }
                std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
                    std::chrono::milliseconds(50), deadline - now));
            }
            return true;
        }

        bool DaemonSupervisor::remove_pid_file() const
        {
            std::error_code ec;
            std::filesystem::remove(pid_file_, ec);
            if (ec)
            {
                logger_->warning("Cannot remove pid file",
                                 core::LogContext().add("pid_file", pid_file_).add("error", ec.message()));
                return false;
            }
            return true;
        }

        void DaemonSupervisor::cleanup_failed_start()
        {
            if (auto failure = stop())
            {
                logger_->warning("Cleanup after failed start incomplete",
                                 core::LogContext().add("daemon", name_).add("detail", failure->describe()));
            }
        }

        void DaemonSupervisor::fail_start(const std::string &action, const std::string &detail)
        {
            logger_->error("Daemon failed to start",
                           core::LogContext().add("daemon", name_).add("action", action).add("detail", detail));
            throw core::HotspotError(core::ErrorCode::DaemonStartFailed, name_, action, detail);
        }

    } // namespace infrastructure
} // namespace nextu
