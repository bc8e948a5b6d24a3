#ifndef NEXTU_HOTSPOT_SERVICES_LIFECYCLE_ORCHESTRATOR_HPP
#define NEXTU_HOTSPOT_SERVICES_LIFECYCLE_ORCHESTRATOR_HPP

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <sys/types.h>

#include "core/errors.hpp"
#include "infrastructure/dhcp_server.hpp"
#include "infrastructure/hostapd_supervisor.hpp"
#include "infrastructure/interface_controller.hpp"
#include "infrastructure/nat_manager.hpp"
#include "infrastructure/regulatory_domain.hpp"
#include "services/lifecycle_state.hpp"
#include "services/resource_ledger.hpp"
#include "services/status_reporter.hpp"

namespace nextu
{
    namespace core
    {
        class HotspotConfig;
        class CommandRunner;
        class ProcessControl;
        class Logger;
    }
}

namespace nextu
{
    namespace services
    {

        struct StartReport
        {
            bool regulatory_applied = false;
            pid_t hostapd_pid = 0;
            pid_t dnsmasq_pid = 0;
            size_t nat_rules = 0; // rules this start inserted; pre-existing ones stay untouched
            size_t leftovers_cleared = 0; // entries reclaimed from an earlier run
        };

        struct StopReport
        {
            bool was_running = false; // false when there was nothing to tear down
            size_t released = 0;
            core::TeardownErrors errors;
        };

        /**
         * Hotspot Lifecycle Orchestrator
         * Sequences the resource components for start, tears them down in
         * reverse for stop, and rolls back everything a failed start acquired.
         * Mutating operations hold the system-wide control lock.
         */
        class LifecycleOrchestrator : private ResourceReleaser
        {
        public:
            using StateObserver = std::function<void(LifecycleState)>;

            LifecycleOrchestrator(std::shared_ptr<const core::HotspotConfig> config,
                                  core::CommandRunner &runner,
                                  core::ProcessControl &processes);

            // Order in which start acquires resources; stop releases in reverse
            static const std::vector<ResourceKind> &acquisition_order();

            /**
             * Bring the hotspot up.
             * @throws core::HotspotError AlreadyRunning, AlreadyInProgress,
             *         InterfaceNotFound, DaemonStartFailed, NatRuleError, CommandFailed.
             *         Everything acquired by the attempt has been released before the throw.
             */
            StartReport start();

            /**
             * Tear the hotspot down, best-effort. A stopped hotspot is a no-op.
             * @throws core::HotspotError AlreadyInProgress only
             */
            StopReport stop();

            /**
             * Stop, wait the restart delay, start; the lock is held across both halves.
             * Throws what start() throws.
             */
            StartReport restart(StopReport *stop_report = nullptr);

            StatusSnapshot status() const;

            LifecycleState state() const;

            const ResourceLedger &ledger() const { return ledger_; }

            void set_state_observer(StateObserver observer) { observer_ = std::move(observer); }

        private:
            StartReport start_locked();
            StopReport stop_locked();

            void acquire_step(ResourceKind kind, StartReport &report);
            size_t clear_leftovers();
            void rebuild_ledger_from_live();
            void set_state(LifecycleState state);

            core::TeardownErrors release(const InterfaceBinding &binding) override;
            core::TeardownErrors release(const RegulatoryDomain &domain) override;
            core::TeardownErrors release(const AccessPointProcess &process) override;
            core::TeardownErrors release(const DhcpProcess &process) override;
            core::TeardownErrors release(const NatRuleSet &rules) override;

            std::shared_ptr<const core::HotspotConfig> config_;
            std::shared_ptr<core::Logger> logger_;

            infrastructure::InterfaceController interface_;
            infrastructure::RegulatorySetter regulatory_;
            infrastructure::HostapdSupervisor hostapd_;
            infrastructure::DnsmasqSupervisor dnsmasq_;
            infrastructure::NatManager nat_;
            StatusReporter reporter_;

            ResourceLedger ledger_;
            LifecycleState state_ = LifecycleState::Stopped;
            StateObserver observer_;
        };

    } // namespace services
} // namespace nextu

#endif // NEXTU_HOTSPOT_SERVICES_LIFECYCLE_ORCHESTRATOR_HPP
