#ifndef NEXTU_HOTSPOT_INFRASTRUCTURE_HOSTAPD_SUPERVISOR_HPP
#define NEXTU_HOTSPOT_INFRASTRUCTURE_HOSTAPD_SUPERVISOR_HPP

#include <string>
#include <memory>

#include "infrastructure/daemon_supervisor.hpp"

namespace nextu
{
    namespace core
    {
        class HotspotConfig;
    }
}

namespace nextu
{
    namespace infrastructure
    {

        /**
         * Access Point daemon supervisor
         * Runs hostapd detached (-B) with its pid recorded through -P
         */
        class HostapdSupervisor : public DaemonSupervisor
        {
        public:
            HostapdSupervisor(const std::shared_ptr<const core::HotspotConfig> &config,
                              core::CommandRunner &runner,
                              core::ProcessControl &processes);

            // Values hostapd was (or will be) started with, read from its config file
            std::string configured_ssid() const;
            std::string configured_channel() const;

        protected:
            std::vector<std::string> launch_command() const override;

        private:
            std::string read_setting(const std::string &key) const;

            std::shared_ptr<const core::HotspotConfig> config_;
        };

    } // namespace infrastructure
} // namespace nextu

#endif // NEXTU_HOTSPOT_INFRASTRUCTURE_HOSTAPD_SUPERVISOR_HPP
