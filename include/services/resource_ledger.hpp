#ifndef NEXTU_HOTSPOT_SERVICES_RESOURCE_LEDGER_HPP
#define NEXTU_HOTSPOT_SERVICES_RESOURCE_LEDGER_HPP

#include <string>
#include <variant>
#include <vector>
#include <sys/types.h>

#include "core/errors.hpp"
#include "infrastructure/nat_manager.hpp"

namespace nextu
{
    namespace services
    {

        // Gateway address assigned to the hotspot interface
        struct InterfaceBinding
        {
            std::string interface;
            std::string address_cidr;
        };

        // Regulatory domain set for the radio; nothing to undo
        struct RegulatoryDomain
        {
            std::string country;
        };

        struct AccessPointProcess
        {
            pid_t pid = 0;
            std::string config_path;
            std::string pid_file;
        };

        struct DhcpProcess
        {
            pid_t pid = 0;
            std::string config_path;
            std::string pid_file;
        };

        // Exact rule tuples in place for one hotspot/upstream pair
        struct NatRuleSet
        {
            std::string hotspot;
            std::string upstream;
            std::vector<infrastructure::NatRule> rules;
        };

        using ResourceHandle = std::variant<InterfaceBinding, RegulatoryDomain, AccessPointProcess, DhcpProcess, NatRuleSet>;

        enum class ResourceKind
        {
            RegulatoryDomain,
            InterfaceBinding,
            AccessPoint,
            Dhcp,
            Nat
        };

        ResourceKind kind_of(const ResourceHandle &handle);
        std::string resource_name(ResourceKind kind);
        std::string resource_name(const ResourceHandle &handle);
        std::string describe(const ResourceHandle &handle);

        /**
         * Type-specific teardown for each ledger entry.
         * Implementations return failures instead of throwing.
         */
        class ResourceReleaser
        {
        public:
            virtual ~ResourceReleaser() = default;

            virtual core::TeardownErrors release(const InterfaceBinding &binding) = 0;
            virtual core::TeardownErrors release(const RegulatoryDomain &domain) = 0;
            virtual core::TeardownErrors release(const AccessPointProcess &process) = 0;
            virtual core::TeardownErrors release(const DhcpProcess &process) = 0;
            virtual core::TeardownErrors release(const NatRuleSet &rules) = 0;
        };

        /**
         * Resource Ledger
         * Ordered record of what this orchestrator believes it owns.
         * Entries are appended only after the underlying action succeeded and
         * are released back to front.
         */
        class ResourceLedger
        {
        public:
            void acquire(ResourceHandle handle);

            /**
             * Release every entry in reverse acquisition order.
             * A failing entry does not stop the walk; the ledger is empty afterwards.
             * @return every teardown failure, in the order they occurred
             */
            core::TeardownErrors release_all(ResourceReleaser &releaser);

            const std::vector<ResourceHandle> &entries() const { return entries_; }
            bool empty() const { return entries_.empty(); }
            size_t size() const { return entries_.size(); }
            void clear() { entries_.clear(); }

            template <typename T>
            const T *find() const
            {
                for (const auto &entry : entries_)
                {
                    if (const auto *handle = std::get_if<T>(&entry))
                    {
                        return handle;
                    }
                }
                return nullptr;
            }

            template <typename T>
            bool contains() const
            {
                return find<T>() != nullptr;
            }

        private:
            std::vector<ResourceHandle> entries_;
        };

    } // namespace services
} // namespace nextu

#endif // NEXTU_HOTSPOT_SERVICES_RESOURCE_LEDGER_HPP
