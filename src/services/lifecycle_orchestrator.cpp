/**
 * Lifecycle Orchestrator Implementation
 */

#include "services/lifecycle_orchestrator.hpp"
#include "core/config.hpp"
#include "core/control_lock.hpp"
#include "core/logger.hpp"

#include <chrono>
#include <thread>

namespace nextu
{
    namespace services
    {

        LifecycleOrchestrator::LifecycleOrchestrator(std::shared_ptr<const core::HotspotConfig> config,
                                                     core::CommandRunner &runner,
                                                     core::ProcessControl &processes)
            : config_(std::move(config)),
              logger_(core::get_logger("LifecycleOrchestrator")),
              interface_(config_, runner),
              regulatory_(runner),
              hostapd_(config_, runner, processes),
              dnsmasq_(config_, runner, processes),
              nat_(runner),
              reporter_(config_, interface_, regulatory_, hostapd_, dnsmasq_, nat_)
        {
        }

        const std::vector<ResourceKind> &LifecycleOrchestrator::acquisition_order()
        {
            static const std::vector<ResourceKind> order = {
                ResourceKind::RegulatoryDomain,
                ResourceKind::InterfaceBinding,
                ResourceKind::AccessPoint,
                ResourceKind::Dhcp,
                ResourceKind::Nat};
            return order;
        }

        StartReport LifecycleOrchestrator::start()
        {
            core::ControlLock lock(config_->paths.lock_file);
            return start_locked();
        }

        StopReport LifecycleOrchestrator::stop()
        {
            core::ControlLock lock(config_->paths.lock_file);
            return stop_locked();
        }

        StartReport LifecycleOrchestrator::restart(StopReport *stop_report)
        {
            core::ControlLock lock(config_->paths.lock_file);

            logger_->info("Restarting hotspot");
            auto stopped = stop_locked();
            if (stop_report)
            {
                *stop_report = stopped;
            }

            if (stopped.was_running && config_->supervision.restart_delay_ms > 0)
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(config_->supervision.restart_delay_ms));
            }

            return start_locked();
        }

        StatusSnapshot LifecycleOrchestrator::status() const
        {
            return reporter_.collect(ledger_.empty() ? nullptr : &ledger_);
        }

        LifecycleState LifecycleOrchestrator::state() const
        {
            if (state_ == LifecycleState::Starting || state_ == LifecycleState::Stopping)
            {
                return state_;
            }
            if (hostapd_.is_running())
            {
                return LifecycleState::Running;
            }
            // A hotspot this process started whose access point has since died
            if (state_ == LifecycleState::Running || state_ == LifecycleState::Failed)
            {
                return LifecycleState::Failed;
            }
            return LifecycleState::Stopped;
        }

        StartReport LifecycleOrchestrator::start_locked()
        {
            auto hostapd = hostapd_.query();
            if (hostapd.running && hostapd.foreign_process.empty())
            {
                const auto pid = std::to_string(*hostapd.pid);
                logger_->warning("Hotspot is already running", core::LogContext().add("hostapd_pid", pid));
                throw core::HotspotError(core::ErrorCode::AlreadyRunning, "hostapd", "kill -0 " + pid,
                                         "hotspot is already running (hostapd pid " + pid + "); stop it first");
            }

            logger_->info("Starting hotspot",
                          core::LogContext()
                              .add("interface", config_->network.interface)
                              .add("upstream", config_->network.upstream)
                              .add("gateway", config_->gateway_cidr()));

            StartReport report;
            report.leftovers_cleared = clear_leftovers();

            set_state(LifecycleState::Starting);
            try
            {
                for (auto kind : acquisition_order())
                {
                    acquire_step(kind, report);
                }
            }
            catch (const std::exception &e)
            {
                logger_->error("Start failed, rolling back",
                               core::LogContext().add("error", e.what()).add("acquired", ledger_.size()));
                set_state(LifecycleState::Failed);

                for (const auto &failure : ledger_.release_all(*this))
                {
                    logger_->error("Rollback step failed", core::LogContext().add("detail", failure.describe()));
                }
                set_state(LifecycleState::Stopped);
                throw;
            }

            set_state(LifecycleState::Running);
            logger_->info("Hotspot is active",
                          core::LogContext()
                              .add("ssid", config_->access_point.ssid)
                              .add("hostapd_pid", report.hostapd_pid)
                              .add("dnsmasq_pid", report.dnsmasq_pid));
            return report;
        }

        StopReport LifecycleOrchestrator::stop_locked()
        {
            StopReport report;

            if (ledger_.empty())
            {
                rebuild_ledger_from_live();
            }

            if (ledger_.empty())
            {
                logger_->info("Hotspot is already stopped");
                set_state(LifecycleState::Stopped);
                return report;
            }

            logger_->info("Stopping hotspot", core::LogContext().add("resources", ledger_.size()));
            set_state(LifecycleState::Stopping);

            report.was_running = true;
            report.released = ledger_.size();
            report.errors = ledger_.release_all(*this);

            set_state(LifecycleState::Stopped);

            if (report.errors.empty())
            {
                logger_->info("Hotspot stopped");
            }
            else
            {
                logger_->warning("Hotspot stopped with teardown errors",
                                 core::LogContext().add("errors", report.errors.size()));
            }
            return report;
        }

        void LifecycleOrchestrator::acquire_step(ResourceKind kind, StartReport &report)
        {
            const auto &network = config_->network;

            switch (kind)
            {
            case ResourceKind::RegulatoryDomain:
                report.regulatory_applied = regulatory_.apply(network.country);
                if (report.regulatory_applied)
                {
                    ledger_.acquire(RegulatoryDomain{network.country});
                }
                break;

            case ResourceKind::InterfaceBinding:
                interface_.bind();
                ledger_.acquire(InterfaceBinding{network.interface, config_->gateway_cidr()});
                break;

            case ResourceKind::AccessPoint:
                report.hostapd_pid = hostapd_.start();
                ledger_.acquire(AccessPointProcess{report.hostapd_pid, hostapd_.config_file(), hostapd_.pid_file()});
                break;

            case ResourceKind::Dhcp:
                report.dnsmasq_pid = dnsmasq_.start();
                ledger_.acquire(DhcpProcess{report.dnsmasq_pid, dnsmasq_.config_file(), dnsmasq_.pid_file()});
                break;

            case ResourceKind::Nat:
            {
                auto rules = nat_.apply(network.interface, network.upstream);
                report.nat_rules = rules.size();
                ledger_.acquire(NatRuleSet{network.interface, network.upstream, std::move(rules)});
                break;
            }
            }
        }

        size_t LifecycleOrchestrator::clear_leftovers()
        {
            if (ledger_.empty())
            {
                rebuild_ledger_from_live();
            }
            if (ledger_.empty())
            {
                return 0;
            }

            const auto count = ledger_.size();
            logger_->warning("Clearing leftovers of an earlier run", core::LogContext().add("resources", count));
            for (const auto &failure : ledger_.release_all(*this))
            {
                logger_->warning("Leftover not cleared", core::LogContext().add("detail", failure.describe()));
            }
            return count;
        }

        void LifecycleOrchestrator::rebuild_ledger_from_live()
        {
            const auto &network = config_->network;

            const bool hostapd_trace = hostapd_.has_pid_file();
            const bool dnsmasq_trace = dnsmasq_.has_pid_file();
            const auto nat = nat_.query(network.interface, network.upstream);
            // Which rules a crashed run inserted is unknowable from here; only a
            // complete set is reclaimed, so a lone rule the operator owns survives
            const bool nat_trace = nat.state == infrastructure::NatState::Active;
            const auto iface = interface_.query();
            const bool address_trace = iface.has_address(config_->gateway_cidr());

            if (!hostapd_trace && !dnsmasq_trace && !nat_trace && !address_trace)
            {
                return;
            }

            // Same order start would have produced, so release runs in reverse
            if (iface.found)
            {
                ledger_.acquire(InterfaceBinding{network.interface, config_->gateway_cidr()});
            }
            if (hostapd_trace)
            {
                ledger_.acquire(AccessPointProcess{hostapd_.read_pid().value_or(0), hostapd_.config_file(), hostapd_.pid_file()});
            }
            if (dnsmasq_trace)
            {
                ledger_.acquire(DhcpProcess{dnsmasq_.read_pid().value_or(0), dnsmasq_.config_file(), dnsmasq_.pid_file()});
            }
            if (nat_trace || nat.state == infrastructure::NatState::Unknown)
            {
                ledger_.acquire(NatRuleSet{network.interface, network.upstream,
                                           infrastructure::NatManager::rules_for(network.interface, network.upstream)});
            }

            logger_->debug("Ledger rebuilt from live state", core::LogContext().add("resources", ledger_.size()));
        }

        void LifecycleOrchestrator::set_state(LifecycleState state)
        {
            if (state == state_)
            {
                return;
            }
            logger_->debug("Lifecycle transition",
                           core::LogContext().add("from", to_string(state_)).add("to", to_string(state)));
            state_ = state;
            if (observer_)
            {
                observer_(state);
            }
        }

        core::TeardownErrors LifecycleOrchestrator::release(const InterfaceBinding &)
        {
            return interface_.unbind();
        }

        core::TeardownErrors LifecycleOrchestrator::release(const RegulatoryDomain &domain)
        {
            logger_->debug("Regulatory domain left in place", core::LogContext().add("country", domain.country));
            return {};
        }

        core::TeardownErrors LifecycleOrchestrator::release(const AccessPointProcess &process)
        {
            core::TeardownErrors errors;
            if (auto failure = hostapd_.stop(process.pid))
            {
                errors.push_back(*failure);
            }
            return errors;
        }

        core::TeardownErrors LifecycleOrchestrator::release(const DhcpProcess &process)
        {
            core::TeardownErrors errors;
            if (auto failure = dnsmasq_.stop(process.pid))
            {
                errors.push_back(*failure);
            }
            return errors;
        }

        core::TeardownErrors LifecycleOrchestrator::release(const NatRuleSet &rules)
        {
            return nat_.remove(rules.rules);
        }

    } // namespace services
} // namespace nextu
