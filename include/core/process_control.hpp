#ifndef NEXTU_HOTSPOT_CORE_PROCESS_CONTROL_HPP
#define NEXTU_HOTSPOT_CORE_PROCESS_CONTROL_HPP

#include <string>
#include <sys/types.h>

namespace nextu
{
    namespace core
    {

        /**
         * Abstract access to the OS process table for daemons this tool did not fork itself
         */
        class ProcessControl
        {
        public:
            virtual ~ProcessControl() = default;

            /**
             * Zero-cost liveness check (signal 0)
             */
            virtual bool is_alive(pid_t pid) const = 0;

            /**
             * Deliver a signal; false if the process is gone or not ours to signal
             */
            virtual bool send_signal(pid_t pid, int signal) = 0;

            /**
             * Short command name of a live process, empty if it cannot be read
             */
            virtual std::string process_name(pid_t pid) const = 0;
        };

        /**
         * kill(2) and /proc based implementation
         */
        class SystemProcessControl : public ProcessControl
        {
        public:
            bool is_alive(pid_t pid) const override;
            bool send_signal(pid_t pid, int signal) override;
            std::string process_name(pid_t pid) const override;
        };

    } // namespace core
} // namespace nextu

#endif // NEXTU_HOTSPOT_CORE_PROCESS_CONTROL_HPP
