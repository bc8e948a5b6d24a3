#include "core/errors.hpp"

namespace nextu
{
    namespace core
    {

        std::string to_string(ErrorCode code)
        {
            switch (code)
            {
            case ErrorCode::AlreadyRunning:
                return "AlreadyRunning";
            case ErrorCode::AlreadyInProgress:
                return "AlreadyInProgress";
            case ErrorCode::InterfaceNotFound:
                return "InterfaceNotFound";
            case ErrorCode::RegulatoryDomainWarning:
                return "RegulatoryDomainWarning";
            case ErrorCode::DaemonStartFailed:
                return "DaemonStartFailed";
            case ErrorCode::NatRuleError:
                return "NatRuleError";
            case ErrorCode::LeaseTableUnavailable:
                return "LeaseTableUnavailable";
            case ErrorCode::CommandFailed:
                return "CommandFailed";
            case ErrorCode::InvalidConfiguration:
                return "InvalidConfiguration";
            }
            return "Unknown";
        }

        int exit_code_for(ErrorCode code)
        {
            switch (code)
            {
            case ErrorCode::AlreadyRunning:
                return 2;
            case ErrorCode::AlreadyInProgress:
                return 3;
            case ErrorCode::InterfaceNotFound:
                return 4;
            case ErrorCode::DaemonStartFailed:
                return 5;
            case ErrorCode::NatRuleError:
                return 6;
            default:
                return 1;
            }
        }

        HotspotError::HotspotError(ErrorCode code, const std::string &resource,
                                   const std::string &action, const std::string &detail)
            : std::runtime_error(compose(code, resource, action, detail)),
              code_(code), resource_(resource), action_(action), detail_(detail)
        {
        }

        std::string HotspotError::compose(ErrorCode code, const std::string &resource,
                                          const std::string &action, const std::string &detail)
        {
            std::string message = to_string(code) + ": " + resource;
            if (!detail.empty())
            {
                message += " " + detail;
            }
            if (!action.empty())
            {
                message += " (while running: " + action + ")";
            }
            return message;
        }

        std::string TeardownError::describe() const
        {
            std::string text = resource + ": " + detail;
            if (!action.empty())
            {
                text += " (while running: " + action + ")";
            }
            return text;
        }

    } // namespace core
} // namespace nextu
