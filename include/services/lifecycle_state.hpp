#ifndef NEXTU_HOTSPOT_SERVICES_LIFECYCLE_STATE_HPP
#define NEXTU_HOTSPOT_SERVICES_LIFECYCLE_STATE_HPP

#include <string>

namespace nextu
{
    namespace services
    {

        enum class LifecycleState
        {
            Stopped,
            Starting,
            Running,
            Stopping,
            Failed
        };

        inline std::string to_string(LifecycleState state)
        {
            switch (state)
            {
            case LifecycleState::Stopped:
                return "STOPPED";
            case LifecycleState::Starting:
                return "STARTING";
            case LifecycleState::Running:
                return "RUNNING";
            case LifecycleState::Stopping:
                return "STOPPING";
            case LifecycleState::Failed:
                return "FAILED";
            }
            return "UNKNOWN";
        }

    } // namespace services
} // namespace nextu

#endif // NEXTU_HOTSPOT_SERVICES_LIFECYCLE_STATE_HPP
