#include "services/resource_ledger.hpp"
#include "core/logger.hpp"

#include <sstream>

namespace nextu
{
    namespace services
    {

        namespace
        {
            template <class... Ts>
            struct overloaded : Ts...
            {
                using Ts::operator()...;
            };
            template <class... Ts>
            overloaded(Ts...) -> overloaded<Ts...>;
        }

        ResourceKind kind_of(const ResourceHandle &handle)
        {
            return std::visit(overloaded{
                                  [](const InterfaceBinding &) { return ResourceKind::InterfaceBinding; },
                                  [](const RegulatoryDomain &) { return ResourceKind::RegulatoryDomain; },
                                  [](const AccessPointProcess &) { return ResourceKind::AccessPoint; },
                                  [](const DhcpProcess &) { return ResourceKind::Dhcp; },
                                  [](const NatRuleSet &) { return ResourceKind::Nat; }},
                              handle);
        }

        std::string resource_name(ResourceKind kind)
        {
            switch (kind)
            {
            case ResourceKind::RegulatoryDomain:
                return "regulatory domain";
            case ResourceKind::InterfaceBinding:
                return "interface";
            case ResourceKind::AccessPoint:
                return "hostapd";
            case ResourceKind::Dhcp:
                return "dnsmasq";
            case ResourceKind::Nat:
                return "nat";
            }
            return "unknown";
        }

        std::string resource_name(const ResourceHandle &handle)
        {
            return resource_name(kind_of(handle));
        }

        std::string describe(const ResourceHandle &handle)
        {
            std::ostringstream out;
            std::visit(overloaded{
                           [&out](const InterfaceBinding &b) { out << "interface " << b.interface << " bound to " << b.address_cidr; },
                           [&out](const RegulatoryDomain &d) { out << "regulatory domain " << d.country; },
                           [&out](const AccessPointProcess &p) { out << "hostapd pid " << p.pid << " (" << p.pid_file << ")"; },
                           [&out](const DhcpProcess &p) { out << "dnsmasq pid " << p.pid << " (" << p.pid_file << ")"; },
                           [&out](const NatRuleSet &n) { out << n.rules.size() << " NAT rules " << n.hotspot << " -> " << n.upstream; }},
                       handle);
            return out.str();
        }

        void ResourceLedger::acquire(ResourceHandle handle)
        {
            core::get_logger("ResourceLedger")->debug("Resource acquired", core::LogContext().add("resource", describe(handle)));
            entries_.push_back(std::move(handle));
        }

        core::TeardownErrors ResourceLedger::release_all(ResourceReleaser &releaser)
        {
            auto logger = core::get_logger("ResourceLedger");
            core::TeardownErrors errors;

            for (auto it = entries_.rbegin(); it != entries_.rend(); ++it)
            {
                logger->debug("Releasing resource", core::LogContext().add("resource", describe(*it)));
                try
                {
                    auto failures = std::visit([&releaser](const auto &handle) { return releaser.release(handle); }, *it);
                    errors.insert(errors.end(), failures.begin(), failures.end());
                }
                catch (const std::exception &e)
                {
                    errors.push_back(core::TeardownError{resource_name(*it), "release " + describe(*it), e.what()});
                }
            }

            entries_.clear();
            return errors;
        }

    } // namespace services
} // namespace nextu
