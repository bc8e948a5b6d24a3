/**
 * Status Reporter Implementation
 */

#include "services/status_reporter.hpp"
#include "services/resource_ledger.hpp"
#include "infrastructure/dhcp_server.hpp"
#include "infrastructure/hostapd_supervisor.hpp"
#include "infrastructure/regulatory_domain.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace nextu
{
    namespace services
    {

        namespace
        {
            void add_drift(std::vector<std::string> &drift, const std::string &message)
            {
                if (std::find(drift.begin(), drift.end(), message) == drift.end())
                {
                    drift.push_back(message);
                }
            }

            bool is_live(const infrastructure::DaemonStatus &daemon)
            {
                return daemon.running && daemon.foreign_process.empty();
            }

            void check_pid_file(std::vector<std::string> &drift, const infrastructure::DaemonStatus &daemon)
            {
                if (daemon.stale_pid_file)
                {
                    if (daemon.pid)
                    {
                        add_drift(drift, daemon.name + " pid file names pid " + std::to_string(*daemon.pid) +
                                             ", which is not running (stale pid file)");
                    }
                    else
                    {
                        add_drift(drift, daemon.name + " pid file is unreadable (stale pid file)");
                    }
                }
                if (!daemon.foreign_process.empty() && daemon.pid)
                {
                    add_drift(drift, daemon.name + " pid file names pid " + std::to_string(*daemon.pid) +
                                         ", which belongs to '" + daemon.foreign_process + "'");
                }
            }

            template <typename Process>
            void check_ledger_process(std::vector<std::string> &drift, const Process *process,
                                      const infrastructure::DaemonStatus &daemon)
            {
                if (!process)
                {
                    return;
                }
                const auto believed = std::to_string(process->pid);
                if (!is_live(daemon))
                {
                    add_drift(drift, "ledger holds " + daemon.name + " pid " + believed + " but the process is not running");
                }
                else if (daemon.pid && *daemon.pid != process->pid)
                {
                    add_drift(drift, "ledger holds " + daemon.name + " pid " + believed +
                                         " but the pid file names " + std::to_string(*daemon.pid));
                }
            }

            std::string daemon_line(const infrastructure::DaemonStatus &daemon)
            {
                if (is_live(daemon))
                {
                    return "RUNNING (PID " + std::to_string(*daemon.pid) + ")";
                }
                if (!daemon.foreign_process.empty())
                {
                    return "STOPPED (pid file names a '" + daemon.foreign_process + "' process)";
                }
                if (daemon.stale_pid_file)
                {
                    return "STOPPED (stale pid file)";
                }
                return "STOPPED";
            }

            nlohmann::json daemon_to_json(const infrastructure::DaemonStatus &daemon)
            {
                nlohmann::json j;
                j["running"] = is_live(daemon);
                j["pid"] = daemon.pid ? nlohmann::json(*daemon.pid) : nlohmann::json(nullptr);
                j["stale_pid_file"] = daemon.stale_pid_file;
                if (!daemon.foreign_process.empty())
                {
                    j["foreign_process"] = daemon.foreign_process;
                }
                return j;
            }
        }

        StatusReporter::StatusReporter(const std::shared_ptr<const core::HotspotConfig> &config,
                                       infrastructure::InterfaceController &interface,
                                       infrastructure::RegulatorySetter &regulatory,
                                       infrastructure::HostapdSupervisor &hostapd,
                                       infrastructure::DnsmasqSupervisor &dnsmasq,
                                       infrastructure::NatManager &nat)
            : config_(config), interface_(interface), regulatory_(regulatory), hostapd_(hostapd),
              dnsmasq_(dnsmasq), nat_(nat), logger_(core::get_logger("StatusReporter"))
        {
        }

        StatusSnapshot StatusReporter::collect(const ResourceLedger *ledger) const
        {
            StatusSnapshot snapshot;

            snapshot.interface = interface_.query();
            snapshot.gateway_cidr = config_->gateway_cidr();
            snapshot.country = regulatory_.current();

            snapshot.hostapd = hostapd_.query();
            snapshot.ssid = hostapd_.configured_ssid();
            snapshot.channel = hostapd_.configured_channel();

            snapshot.dnsmasq = dnsmasq_.query();

            snapshot.nat = nat_.query(config_->network.interface, config_->network.upstream);

            // dnsmasq leaves its lease file behind on exit; those clients are gone
            if (!is_live(snapshot.dnsmasq))
            {
                snapshot.leases = std::vector<infrastructure::ClientLease>{};
            }
            else
            {
                try
                {
                    snapshot.leases = dnsmasq_.leases();
                }
                catch (const core::HotspotError &e)
                {
                    snapshot.lease_error = e.detail();
                    logger_->debug("Lease table unavailable", core::LogContext().add("error", e.what()));
                }
            }

            snapshot.lifecycle = derive_lifecycle(snapshot);
            snapshot.drift = detect_drift(snapshot, ledger);

            if (!snapshot.drift.empty())
            {
                logger_->warning("State drift detected", core::LogContext().add("conditions", snapshot.drift.size()));
            }
            return snapshot;
        }

        LifecycleState StatusReporter::derive_lifecycle(const StatusSnapshot &snapshot)
        {
            if (is_live(snapshot.hostapd))
            {
                return LifecycleState::Running;
            }

            const bool leftovers = is_live(snapshot.dnsmasq) ||
                                   snapshot.hostapd.pid.has_value() || snapshot.hostapd.stale_pid_file ||
                                   snapshot.dnsmasq.pid.has_value() || snapshot.dnsmasq.stale_pid_file ||
                                   snapshot.nat.state == infrastructure::NatState::Active ||
                                   snapshot.interface.has_address(snapshot.gateway_cidr);
            return leftovers ? LifecycleState::Failed : LifecycleState::Stopped;
        }

        std::vector<std::string> StatusReporter::detect_drift(const StatusSnapshot &snapshot, const ResourceLedger *ledger)
        {
            std::vector<std::string> drift;
            const auto &iface = snapshot.interface;
            const bool hostapd_live = is_live(snapshot.hostapd);
            const bool dnsmasq_live = is_live(snapshot.dnsmasq);

            check_pid_file(drift, snapshot.hostapd);
            check_pid_file(drift, snapshot.dnsmasq);

            if (hostapd_live && !dnsmasq_live)
            {
                add_drift(drift, "hostapd is running but dnsmasq is not");
            }
            if (dnsmasq_live && !hostapd_live)
            {
                add_drift(drift, "dnsmasq is running but hostapd is not");
            }

            // Part of the set on a stopped hotspot is someone else's firewall
            if (snapshot.nat.state == infrastructure::NatState::Partial && (hostapd_live || dnsmasq_live))
            {
                const auto present = std::count(snapshot.nat.present.begin(), snapshot.nat.present.end(), true);
                add_drift(drift, "NAT rules partially present (" + std::to_string(present) + " of " +
                                     std::to_string(snapshot.nat.present.size()) + ")");
            }
            if (snapshot.nat.state == infrastructure::NatState::Active && !hostapd_live)
            {
                add_drift(drift, "NAT rules via " + snapshot.nat.upstream + " are installed but hostapd is not running");
            }

            if ((hostapd_live || dnsmasq_live) && iface.queried)
            {
                if (!iface.found)
                {
                    add_drift(drift, "daemons are running but interface " + iface.name + " is missing");
                }
                else
                {
                    if (!iface.has_address(snapshot.gateway_cidr))
                    {
                        add_drift(drift, "interface " + iface.name + " lacks gateway address " + snapshot.gateway_cidr);
                    }
                    if (!iface.admin_up)
                    {
                        add_drift(drift, "interface " + iface.name + " is down while daemons are running");
                    }
                }
            }

            if (!ledger)
            {
                return drift;
            }

            check_ledger_process(drift, ledger->find<AccessPointProcess>(), snapshot.hostapd);
            check_ledger_process(drift, ledger->find<DhcpProcess>(), snapshot.dnsmasq);

            if (const auto *nat = ledger->find<NatRuleSet>())
            {
                if (snapshot.nat.state != infrastructure::NatState::Active)
                {
                    add_drift(drift, "ledger holds NAT rules via " + nat->upstream + " but the firewall reports " +
                                         infrastructure::to_string(snapshot.nat.state));
                }
            }

            if (const auto *binding = ledger->find<InterfaceBinding>())
            {
                if (iface.queried && !iface.found)
                {
                    add_drift(drift, "ledger holds interface " + binding->interface + " but it is missing");
                }
                else if (iface.queried && !iface.has_address(binding->address_cidr))
                {
                    add_drift(drift, "ledger holds " + binding->address_cidr + " on " + binding->interface +
                                         " but the address is not assigned");
                }
            }

            return drift;
        }

        std::string format_status(const StatusSnapshot &snapshot)
        {
            std::ostringstream out;
            const auto &iface = snapshot.interface;

            out << "=== NEXTU Hotspot Status ===\n\n";
            out << "State:     " << to_string(snapshot.lifecycle) << "\n";

            if (!iface.queried)
            {
                out << "Interface: " << iface.name << " (UNKNOWN)\n";
            }
            else if (!iface.found)
            {
                out << "Interface: " << iface.name << " (NOT FOUND)\n";
            }
            else
            {
                out << "Interface: " << iface.name << " (FOUND)\n";
                out << "  Link:    " << (iface.admin_up ? "UP" : "DOWN") << "\n";
                out << "  State:   " << (iface.oper_state.empty() ? "N/A" : iface.oper_state) << "\n";
                out << "  MAC:     " << (iface.mac.empty() ? "N/A" : iface.mac) << "\n";
                out << "  Mode:    " << (iface.mode.empty() ? "N/A" : iface.mode) << "\n";
                out << "  IP:      ";
                if (iface.ipv4_addresses.empty())
                {
                    out << "none";
                }
                for (size_t i = 0; i < iface.ipv4_addresses.size(); ++i)
                {
                    out << (i ? ", " : "") << iface.ipv4_addresses[i];
                }
                out << "\n";
            }
            out << "Country:   " << (snapshot.country.empty() ? "unknown" : snapshot.country) << "\n\n";

            out << "Hostapd:   " << daemon_line(snapshot.hostapd) << "\n";
            if (is_live(snapshot.hostapd))
            {
                out << "  SSID:      " << snapshot.ssid << "\n";
                out << "  Channel:   " << snapshot.channel << "\n";
            }
            out << "DHCP:      " << daemon_line(snapshot.dnsmasq) << "\n";

            switch (snapshot.nat.state)
            {
            case infrastructure::NatState::Active:
                out << "NAT:       ACTIVE (via " << snapshot.nat.upstream << ")\n";
                break;
            case infrastructure::NatState::Partial:
                out << "NAT:       PARTIAL (via " << snapshot.nat.upstream << ")\n";
                break;
            case infrastructure::NatState::Inactive:
                out << "NAT:       INACTIVE\n";
                break;
            case infrastructure::NatState::Unknown:
                out << "NAT:       UNKNOWN (" << snapshot.nat.error << ")\n";
                break;
            }

            out << "\nConnected clients:\n";
            if (!snapshot.leases || snapshot.leases->empty())
            {
                out << "  (none)\n";
            }
            else
            {
                for (const auto &lease : *snapshot.leases)
                {
                    out << "  " << std::left << std::setw(16) << lease.address << " "
                        << std::setw(18) << lease.mac << " "
                        << (lease.hostname.empty() ? "*" : lease.hostname) << "\n";
                }
            }

            if (!snapshot.drift.empty())
            {
                out << "\nDrift:\n";
                for (const auto &entry : snapshot.drift)
                {
                    out << "  - " << entry << "\n";
                }
            }

            return out.str();
        }

        nlohmann::json status_to_json(const StatusSnapshot &snapshot)
        {
            const auto &iface = snapshot.interface;
            nlohmann::json j;

            j["state"] = to_string(snapshot.lifecycle);
            j["interface"] = {
                {"name", iface.name},
                {"queried", iface.queried},
                {"found", iface.found},
                {"admin_up", iface.admin_up},
                {"oper_state", iface.oper_state},
                {"mac", iface.mac},
                {"mode", iface.mode},
                {"ipv4_addresses", iface.ipv4_addresses}};
            j["country"] = snapshot.country;

            j["hostapd"] = daemon_to_json(snapshot.hostapd);
            j["hostapd"]["ssid"] = snapshot.ssid;
            j["hostapd"]["channel"] = snapshot.channel;
            j["dnsmasq"] = daemon_to_json(snapshot.dnsmasq);

            j["nat"] = {
                {"state", infrastructure::to_string(snapshot.nat.state)},
                {"upstream", snapshot.nat.upstream},
                {"rules_present", snapshot.nat.present}};
            if (!snapshot.nat.error.empty())
            {
                j["nat"]["error"] = snapshot.nat.error;
            }

            if (snapshot.leases)
            {
                j["leases"] = nlohmann::json::array();
                for (const auto &lease : *snapshot.leases)
                {
                    j["leases"].push_back({{"expiry", lease.expiry},
                                           {"mac", lease.mac},
                                           {"address", lease.address},
                                           {"hostname", lease.hostname},
                                           {"client_id", lease.client_id}});
                }
            }
            else
            {
                j["leases"] = nullptr;
                j["lease_error"] = snapshot.lease_error;
            }

            j["drift"] = snapshot.drift;
            return j;
        }

    } // namespace services
} // namespace nextu
