#ifndef NEXTU_HOTSPOT_INFRASTRUCTURE_NAT_MANAGER_HPP
#define NEXTU_HOTSPOT_INFRASTRUCTURE_NAT_MANAGER_HPP

#include <string>
#include <memory>
#include <vector>

#include "core/errors.hpp"

namespace nextu
{
    namespace core
    {
        class CommandRunner;
        class Logger;
    }
}

namespace nextu
{
    namespace infrastructure
    {

        /**
         * One iptables rule, keyed by its exact tuple
         */
        struct NatRule
        {
            std::string table; // "nat" or "filter"
            std::string chain;
            std::vector<std::string> arguments; // match and target

            // iptables argv for operation "-C", "-A" or "-D"
            std::vector<std::string> command(const std::string &operation) const;
            std::string describe() const;

            bool operator==(const NatRule &other) const;
        };

        enum class NatState
        {
            Active,   // all three rules present
            Partial,  // some rules present
            Inactive, // none present
            Unknown   // the firewall could not be queried
        };

        std::string to_string(NatState state);

        struct NatStatus
        {
            NatState state = NatState::Unknown;
            std::string upstream;
            std::vector<bool> present; // per rule, same order as NatManager::rules_for
            std::string error;
        };

        /**
         * NAT/Firewall Manager
         * Internet sharing between the hotspot interface and the upstream interface.
         * Every query is a live iptables check; nothing is cached.
         */
        class NatManager
        {
        public:
            explicit NatManager(core::CommandRunner &runner);

            static std::vector<NatRule> rules_for(const std::string &hotspot_if, const std::string &upstream_if);

            /**
             * Enable IPv4 forwarding and make sure each rule exists.
             * Rules already present are left alone and are not part of the result.
             * @return the rules this call appended, the only ones the caller owns
             * @throws core::HotspotError NatRuleError; rules added by this call are removed first
             */
            std::vector<NatRule> apply(const std::string &hotspot_if, const std::string &upstream_if);

            /**
             * Delete one instance of each rule. Absent rules are not errors.
             */
            core::TeardownErrors remove(const std::vector<NatRule> &rules);

            NatStatus query(const std::string &hotspot_if, const std::string &upstream_if) const;

        private:
            enum class Presence
            {
                Present,
                Absent,
                Unknown
            };

            Presence check(const NatRule &rule, std::string *error = nullptr) const;
            void enable_forwarding();

            core::CommandRunner &runner_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace infrastructure
} // namespace nextu

#endif // NEXTU_HOTSPOT_INFRASTRUCTURE_NAT_MANAGER_HPP
