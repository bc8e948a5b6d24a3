#ifndef NEXTU_HOTSPOT_INFRASTRUCTURE_DAEMON_SUPERVISOR_HPP
#define NEXTU_HOTSPOT_INFRASTRUCTURE_DAEMON_SUPERVISOR_HPP

#include <string>
#include <memory>
#include <optional>
#include <vector>
#include <sys/types.h>

#include "core/errors.hpp"

namespace nextu
{
    namespace core
    {
        struct SupervisionConfig;
        class CommandRunner;
        class ProcessControl;
        class Logger;
    }
}

namespace nextu
{
    namespace infrastructure
    {

        /**
         * Live view of one supervised daemon
         */
        struct DaemonStatus
        {
            std::string name;
            bool running = false;
            std::optional<pid_t> pid;       // as recorded in the pid file
            bool stale_pid_file = false;    // pid file present, process gone
            std::string foreign_process;    // pid is alive but belongs to another program
        };

        /**
         * Daemon Supervisor
         * Launches a self-detaching daemon that records its own pid file, polls
         * until the recorded process is live, and stops it again. Subclasses
         * provide the launch command.
         */
        class DaemonSupervisor
        {
        public:
            DaemonSupervisor(const std::string &name,
                             const std::string &binary,
                             const std::string &config_file,
                             const std::string &pid_file,
                             const core::SupervisionConfig &supervision,
                             core::CommandRunner &runner,
                             core::ProcessControl &processes);
            virtual ~DaemonSupervisor() = default;

            /**
             * Launch the daemon and wait (bounded) for a live pid.
             * @return pid of the live daemon
             * @throws core::HotspotError DaemonStartFailed; nothing is left running
             */
            pid_t start();

            /**
             * SIGTERM, wait, SIGKILL if needed; the pid file is removed in every case.
             * @param known_pid pid recorded at start, used when the pid file is gone;
             *        it is signalled only if it is still this daemon
             * @return the failure, if any, for the caller to collect
             */
            std::optional<core::TeardownError> stop(std::optional<pid_t> known_pid = std::nullopt);

            /**
             * True iff the pid file names a pid that is alive right now
             */
            bool is_running() const;

            std::optional<pid_t> read_pid() const;
            bool has_pid_file() const;
            DaemonStatus query() const;

            const std::string &name() const { return name_; }
            const std::string &config_file() const { return config_file_; }
            const std::string &pid_file() const { return pid_file_; }

        protected:
            virtual std::vector<std::string> launch_command() const = 0;

            const std::string &binary() const { return binary_; }

        private:
            bool owns_process(pid_t pid) const;
            bool wait_for_exit(pid_t pid) const;
            bool remove_pid_file() const;
            void cleanup_failed_start();
            [[noreturn]] void fail_start(const std::string &action, const std::string &detail);

            std::string name_;
            std::string binary_;
            std::string config_file_;
            std::string pid_file_;
            const core::SupervisionConfig &supervision_;
            core::CommandRunner &runner_;
            core::ProcessControl &processes_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace infrastructure
} // namespace nextu

#endif // NEXTU_HOTSPOT_INFRASTRUCTURE_DAEMON_SUPERVISOR_HPP
