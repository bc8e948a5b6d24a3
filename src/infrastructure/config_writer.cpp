/**
 * Daemon Configuration Writer Implementation
 */

#include "infrastructure/config_writer.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace nextu
{
    namespace infrastructure
    {

        DaemonConfigWriter::DaemonConfigWriter(const std::shared_ptr<const core::HotspotConfig> &config)
            : config_(config), logger_(core::get_logger("DaemonConfigWriter"))
        {
        }

        std::string DaemonConfigWriter::render_hostapd() const
        {
            const auto &ap = config_->access_point;
            std::ostringstream conf;

            conf << "# NEXTU hotspot access point configuration\n";
            conf << "# Generated by nextu-hotspot configure\n";
            conf << "interface=" << config_->network.interface << "\n";
            conf << "driver=nl80211\n";
            conf << "ssid=" << ap.ssid << "\n";
            conf << "hw_mode=" << ap.hw_mode << "\n";
            conf << "channel=" << ap.channel << "\n";
            conf << "ieee80211n=1\n";
            conf << "wmm_enabled=1\n";
            conf << "ht_capab=[SHORT-GI-20][SHORT-GI-40]\n";
            conf << "beacon_int=100\n";
            conf << "auth_algs=1\n";
            conf << "wpa=2\n";
            conf << "wpa_key_mgmt=WPA-PSK\n";
            conf << "wpa_passphrase=" << ap.passphrase << "\n";
            conf << "wpa_pairwise=CCMP\n";
            conf << "rsn_pairwise=CCMP\n";
            conf << "max_num_sta=" << ap.max_stations << "\n";
            conf << "wpa_group_rekey=86400\n";
            conf << "ignore_broadcast_ssid=0\n";
            conf << "macaddr_acl=0\n";

            return conf.str();
        }

        std::string DaemonConfigWriter::render_dnsmasq() const
        {
            const auto &dhcp = config_->dhcp;
            std::ostringstream conf;

            conf << "# NEXTU hotspot DHCP/DNS configuration\n";
            conf << "# Generated by nextu-hotspot configure\n";
            conf << "interface=" << config_->network.interface << "\n";
            conf << "bind-interfaces\n";
            conf << "dhcp-range=" << config_->host_address(dhcp.range_start) << ","
                 << config_->host_address(dhcp.range_end) << ",255.255.255.0," << dhcp.lease_time << "\n";
            conf << "dhcp-option=option:router," << config_->gateway_address() << "\n";

            if (!dhcp.dns_servers.empty())
            {
                conf << "dhcp-option=option:dns-server";
                for (const auto &server : dhcp.dns_servers)
                {
                    conf << "," << server;
                }
                conf << "\n";
                for (const auto &server : dhcp.dns_servers)
                {
                    conf << "server=" << server << "\n";
                }
            }

            conf << "dhcp-leasefile=" << config_->paths.lease_file << "\n";

            return conf.str();
        }

        void DaemonConfigWriter::write_all() const
        {
            write_file(config_->paths.hostapd_conf, render_hostapd(), true);
            write_file(config_->paths.dnsmasq_conf, render_dnsmasq(), false);

            logger_->info("Hotspot configuration written",
                          core::LogContext()
                              .add("hostapd", config_->paths.hostapd_conf)
                              .add("dnsmasq", config_->paths.dnsmasq_conf));
        }

        void DaemonConfigWriter::write_file(const std::string &path, const std::string &content, bool owner_only) const
        {
            namespace fs = std::filesystem;

            std::error_code ec;
            const fs::path target(path);
            if (target.has_parent_path())
            {
                fs::create_directories(target.parent_path(), ec);
                if (ec)
                {
                    throw core::HotspotError(core::ErrorCode::CommandFailed, "config directory",
                                             "create " + target.parent_path().string(), ec.message());
                }
            }

            std::ofstream stream(path, std::ios::trunc);
            if (!stream)
            {
                throw core::HotspotError(core::ErrorCode::CommandFailed, "config file", "write " + path,
                                         "cannot open for writing");
            }
            stream << content;
            stream.close();
            if (!stream)
            {
                throw core::HotspotError(core::ErrorCode::CommandFailed, "config file", "write " + path,
                                         "write failed");
            }

            if (owner_only)
            {
                fs::permissions(target, fs::perms::owner_read | fs::perms::owner_write,
                                fs::perm_options::replace, ec);
                if (ec)
                {
                    logger_->warning("Could not restrict permissions",
                                     core::LogContext().add("file", path).add("error", ec.message()));
                }
            }

            logger_->debug("Configuration file written", core::LogContext().add("file", path));
        }

    } // namespace infrastructure
} // namespace nextu
