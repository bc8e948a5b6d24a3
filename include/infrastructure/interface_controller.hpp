#ifndef NEXTU_HOTSPOT_INFRASTRUCTURE_INTERFACE_CONTROLLER_HPP
#define NEXTU_HOTSPOT_INFRASTRUCTURE_INTERFACE_CONTROLLER_HPP

#include <string>
#include <memory>
#include <vector>

#include "core/command_runner.hpp"
#include "core/errors.hpp"

namespace nextu
{
    namespace core
    {
        class HotspotConfig;
        class Logger;
    }
}

namespace nextu
{
    namespace infrastructure
    {

        /**
         * Live view of the hotspot interface
         */
        struct InterfaceStatus
        {
            std::string name;
            bool queried = false; // false when `ip` itself could not be run
            bool found = false;
            bool admin_up = false;
            std::string oper_state; // kernel operstate, e.g. UP, DOWN, DORMANT
            std::string mac;
            std::string mode; // wireless type from `iw dev <if> info`, e.g. AP
            std::vector<std::string> ipv4_addresses; // CIDR notation

            bool has_address(const std::string &cidr) const;
        };

        /**
         * Interface Controller
         * Owns link state and the gateway address of the hotspot interface
         */
        class InterfaceController
        {
        public:
            InterfaceController(const std::shared_ptr<const core::HotspotConfig> &config,
                                core::CommandRunner &runner);

            /**
             * Assign the gateway address and bring the link up.
             * Throws HotspotError(InterfaceNotFound) when the device is absent and
             * HotspotError(CommandFailed) when a required step fails; in the latter
             * case the interface is unbound again before the throw.
             */
            void bind();

            /**
             * Flush addresses, set the link down and hand it back to NetworkManager.
             * Best-effort: every step is attempted, failures are logged and returned.
             */
            core::TeardownErrors unbind();

            bool exists() const;
            InterfaceStatus query() const;

            const std::string &name() const { return interface_; }
            const std::string &gateway_cidr() const { return gateway_cidr_; }

        private:
            core::CommandResult run_ip(const std::vector<std::string> &args) const;
            bool run_best_effort(const std::vector<std::string> &argv, core::TeardownErrors *errors);
            void run_required(const std::vector<std::string> &argv);
            void set_network_manager_managed(bool managed);

            std::shared_ptr<const core::HotspotConfig> config_;
            core::CommandRunner &runner_;
            std::shared_ptr<core::Logger> logger_;

            std::string interface_;
            std::string gateway_cidr_;
        };

    } // namespace infrastructure
} // namespace nextu

#endif // NEXTU_HOTSPOT_INFRASTRUCTURE_INTERFACE_CONTROLLER_HPP
