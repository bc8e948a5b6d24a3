#ifndef NEXTU_HOTSPOT_CORE_COMMAND_RUNNER_HPP
#define NEXTU_HOTSPOT_CORE_COMMAND_RUNNER_HPP

#include <memory>
#include <string>
#include <vector>

namespace nextu
{
    namespace core
    {
        class Logger;

        /**
         * Outcome of one external command
         */
        struct CommandResult
        {
            int exit_code = -1;
            std::string output; // stdout and stderr, interleaved

            bool ok() const { return exit_code == 0; }
        };

        /**
         * Render argv as an operator-readable command line for logs and errors
         */
        std::string format_command(const std::vector<std::string> &argv);

        /**
         * Abstract runner for the external tools the hotspot drives
         * (ip, iw, iptables, sysctl, nmcli, hostapd, dnsmasq)
         */
        class CommandRunner
        {
        public:
            virtual ~CommandRunner() = default;

            /**
             * Run argv[0] with the given arguments and wait for it to exit.
             * Never throws for a failing command; inspect the result instead.
             * @param argv Program and arguments, no shell interpretation
             */
            virtual CommandResult run(const std::vector<std::string> &argv) = 0;
        };

        /**
         * fork/execvp implementation used in production
         */
        class SystemCommandRunner : public CommandRunner
        {
        public:
            SystemCommandRunner();

            CommandResult run(const std::vector<std::string> &argv) override;

        private:
            std::shared_ptr<Logger> logger_;
        };

    } // namespace core
} // namespace nextu

#endif // NEXTU_HOTSPOT_CORE_COMMAND_RUNNER_HPP
