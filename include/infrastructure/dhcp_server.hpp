#ifndef NEXTU_HOTSPOT_INFRASTRUCTURE_DHCP_SERVER_HPP
#define NEXTU_HOTSPOT_INFRASTRUCTURE_DHCP_SERVER_HPP

#include <string>
#include <memory>
#include <vector>

#include "infrastructure/daemon_supervisor.hpp"
#include "infrastructure/lease_table.hpp"

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
         * DHCP/DNS daemon supervisor
         * Runs dnsmasq for the hotspot interface. dnsmasq binds to the gateway
         * address, so it must only be started once the interface is bound.
         */
        class DnsmasqSupervisor : public DaemonSupervisor
        {
        public:
            DnsmasqSupervisor(const std::shared_ptr<const core::HotspotConfig> &config,
                              core::CommandRunner &runner,
                              core::ProcessControl &processes);

            /**
             * Current leases inside the hotspot subnet.
             * @throws core::HotspotError LeaseTableUnavailable
             */
            std::vector<ClientLease> leases() const;

        protected:
            std::vector<std::string> launch_command() const override;

        private:
            std::shared_ptr<const core::HotspotConfig> config_;
            LeaseTable lease_table_;
        };

    } // namespace infrastructure
} // namespace nextu

#endif // NEXTU_HOTSPOT_INFRASTRUCTURE_DHCP_SERVER_HPP
