#ifndef NEXTU_HOTSPOT_SERVICES_STATUS_REPORTER_HPP
#define NEXTU_HOTSPOT_SERVICES_STATUS_REPORTER_HPP

#include <string>
#include <memory>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>

#include "infrastructure/daemon_supervisor.hpp"
#include "infrastructure/interface_controller.hpp"
#include "infrastructure/lease_table.hpp"
#include "infrastructure/nat_manager.hpp"
#include "services/lifecycle_state.hpp"

namespace nextu
{
    namespace core
    {
        class HotspotConfig;
        class Logger;
    }
    namespace infrastructure
    {
        class RegulatorySetter;
        class HostapdSupervisor;
        class DnsmasqSupervisor;
    }
}

namespace nextu
{
    namespace services
    {
        class ResourceLedger;

        /**
         * Reconciled view of the hotspot, built from live queries only
         */
        struct StatusSnapshot
        {
            infrastructure::InterfaceStatus interface;
            std::string gateway_cidr;
            std::string country; // as reported by the kernel, empty when unknown

            infrastructure::DaemonStatus hostapd;
            std::string ssid;
            std::string channel;

            infrastructure::DaemonStatus dnsmasq;

            infrastructure::NatStatus nat;

            std::optional<std::vector<infrastructure::ClientLease>> leases; // empty optional: table unavailable
            std::string lease_error;

            LifecycleState lifecycle = LifecycleState::Stopped;

            // Disagreements between the ledger, the pid files and live state
            std::vector<std::string> drift;
        };

        /**
         * Status Reporter
         * Queries every subsystem independently. A failing query degrades its
         * field to unknown or unavailable; it never aborts the report.
         */
        class StatusReporter
        {
        public:
            StatusReporter(const std::shared_ptr<const core::HotspotConfig> &config,
                           infrastructure::InterfaceController &interface,
                           infrastructure::RegulatorySetter &regulatory,
                           infrastructure::HostapdSupervisor &hostapd,
                           infrastructure::DnsmasqSupervisor &dnsmasq,
                           infrastructure::NatManager &nat);

            /**
             * @param ledger What the calling orchestrator believes it owns, if anything
             */
            StatusSnapshot collect(const ResourceLedger *ledger = nullptr) const;

            /**
             * Lifecycle state implied by live state alone:
             * Running iff hostapd is live, Failed when leftovers exist without it.
             */
            static LifecycleState derive_lifecycle(const StatusSnapshot &snapshot);

            static std::vector<std::string> detect_drift(const StatusSnapshot &snapshot, const ResourceLedger *ledger);

        private:
            std::shared_ptr<const core::HotspotConfig> config_;
            infrastructure::InterfaceController &interface_;
            infrastructure::RegulatorySetter &regulatory_;
            infrastructure::HostapdSupervisor &hostapd_;
            infrastructure::DnsmasqSupervisor &dnsmasq_;
            infrastructure::NatManager &nat_;
            std::shared_ptr<core::Logger> logger_;
        };

        // Operator report, one section per subsystem
        std::string format_status(const StatusSnapshot &snapshot);

        nlohmann::json status_to_json(const StatusSnapshot &snapshot);

    } // namespace services
} // namespace nextu

#endif // NEXTU_HOTSPOT_SERVICES_STATUS_REPORTER_HPP
