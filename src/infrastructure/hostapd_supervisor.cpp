#include "infrastructure/hostapd_supervisor.hpp"
#include "core/config.hpp"

#include <fstream>

namespace nextu
{
    namespace infrastructure
    {

        HostapdSupervisor::HostapdSupervisor(const std::shared_ptr<const core::HotspotConfig> &config,
                                             core::CommandRunner &runner,
                                             core::ProcessControl &processes)
            : DaemonSupervisor("hostapd", config->paths.hostapd_bin, config->paths.hostapd_conf,
                               config->paths.hostapd_pid_file, config->supervision, runner, processes),
              config_(config)
        {
        }

        std::vector<std::string> HostapdSupervisor::launch_command() const
        {
            return {binary(), "-B", "-P", pid_file(), config_file()};
        }

        std::string HostapdSupervisor::configured_ssid() const
        {
            return read_setting("ssid");
        }

        std::string HostapdSupervisor::configured_channel() const
        {
            return read_setting("channel");
        }

        std::string HostapdSupervisor::read_setting(const std::string &key) const
        {
            std::ifstream conf(config_file());
            std::string line;
            const std::string prefix = key + "=";
            while (std::getline(conf, line))
            {
                if (line.compare(0, prefix.size(), prefix) == 0)
                {
                    return line.substr(prefix.size());
                }
            }
            return "";
        }

    } // namespace infrastructure
} // namespace nextu
