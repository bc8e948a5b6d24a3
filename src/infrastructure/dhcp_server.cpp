/**
 * DHCP Server Supervisor Implementation
 * dnsmasq detaches by itself and writes the pid file named on its command line
 */

#include "infrastructure/dhcp_server.hpp"
#include "core/config.hpp"

namespace nextu
{
    namespace infrastructure
    {

        DnsmasqSupervisor::DnsmasqSupervisor(const std::shared_ptr<const core::HotspotConfig> &config,
                                             core::CommandRunner &runner,
                                             core::ProcessControl &processes)
            : DaemonSupervisor("dnsmasq", config->paths.dnsmasq_bin, config->paths.dnsmasq_conf,
                               config->paths.dnsmasq_pid_file, config->supervision, runner, processes),
              config_(config),
              lease_table_(config->paths.lease_file)
        {
        }

        std::vector<std::string> DnsmasqSupervisor::launch_command() const
        {
            return {binary(), "-C", config_file(), "--pid-file=" + pid_file()};
        }

        std::vector<ClientLease> DnsmasqSupervisor::leases() const
        {
            return lease_table_.read(config_->network.subnet);
        }

    } // namespace infrastructure
} // namespace nextu
