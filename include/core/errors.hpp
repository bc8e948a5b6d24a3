#ifndef NEXTU_HOTSPOT_CORE_ERRORS_HPP
#define NEXTU_HOTSPOT_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace nextu
{
    namespace core
    {

        /**
         * Failure taxonomy shared by every hotspot component
         */
        enum class ErrorCode
        {
            AlreadyRunning,
            AlreadyInProgress,
            InterfaceNotFound,
            RegulatoryDomainWarning,
            DaemonStartFailed,
            NatRuleError,
            LeaseTableUnavailable,
            CommandFailed,
            InvalidConfiguration
        };

        std::string to_string(ErrorCode code);

        /**
         * Process exit status the CLI reports for a failed operation
         */
        int exit_code_for(ErrorCode code);

        /**
         * Error raised by a hotspot operation.
         * Carries the resource that failed and the external action attempted,
         * e.g. resource "hostapd", action "hostapd -B -P /var/run/nextu-hostapd.pid ...".
         */
        class HotspotError : public std::runtime_error
        {
        public:
            HotspotError(ErrorCode code, const std::string &resource,
                         const std::string &action, const std::string &detail);

            ErrorCode code() const { return code_; }
            const std::string &resource() const { return resource_; }
            const std::string &action() const { return action_; }
            const std::string &detail() const { return detail_; }

        private:
            static std::string compose(ErrorCode code, const std::string &resource,
                                       const std::string &action, const std::string &detail);

            ErrorCode code_;
            std::string resource_;
            std::string action_;
            std::string detail_;
        };

        /**
         * Non-fatal failure collected while tearing a resource down
         */
        struct TeardownError
        {
            std::string resource;
            std::string action;
            std::string detail;

            std::string describe() const;
        };

        using TeardownErrors = std::vector<TeardownError>;

    } // namespace core
} // namespace nextu

#endif // NEXTU_HOTSPOT_CORE_ERRORS_HPP
