/**
 * NAT Manager Implementation
 * Masquerading and forwarding rules through iptables
 */

#include "infrastructure/nat_manager.hpp"
#include "core/command_runner.hpp"
#include "core/logger.hpp"

namespace nextu
{
    namespace infrastructure
    {

        namespace
        {
            const char *const kIptables = "iptables";

            std::string first_line(const std::string &text)
            {
                return text.substr(0, text.find('\n'));
            }
        }

        std::vector<std::string> NatRule::command(const std::string &operation) const
        {
            std::vector<std::string> argv{kIptables, "-t", table, operation, chain};
            argv.insert(argv.end(), arguments.begin(), arguments.end());
            return argv;
        }

        std::string NatRule::describe() const
        {
            return core::format_command(command("-A"));
        }

        bool NatRule::operator==(const NatRule &other) const
        {
            return table == other.table && chain == other.chain && arguments == other.arguments;
        }

        std::string to_string(NatState state)
        {
            switch (state)
            {
            case NatState::Active:
                return "ACTIVE";
            case NatState::Partial:
                return "PARTIAL";
            case NatState::Inactive:
                return "INACTIVE";
            case NatState::Unknown:
                return "UNKNOWN";
            }
            return "UNKNOWN";
        }

        NatManager::NatManager(core::CommandRunner &runner)
            : runner_(runner), logger_(core::get_logger("NatManager"))
        {
        }

        std::vector<NatRule> NatManager::rules_for(const std::string &hotspot_if, const std::string &upstream_if)
        {
            return {
                NatRule{"nat", "POSTROUTING", {"-o", upstream_if, "-j", "MASQUERADE"}},
                NatRule{"filter", "FORWARD", {"-i", hotspot_if, "-o", upstream_if, "-j", "ACCEPT"}},
                NatRule{"filter", "FORWARD", {"-i", upstream_if, "-o", hotspot_if, "-m", "state", "--state", "RELATED,ESTABLISHED", "-j", "ACCEPT"}}};
        }

        std::vector<NatRule> NatManager::apply(const std::string &hotspot_if, const std::string &upstream_if)
        {
            logger_->info("Setting up NAT", core::LogContext().add("hotspot", hotspot_if).add("upstream", upstream_if));

            enable_forwarding();

            const auto rules = rules_for(hotspot_if, upstream_if);
            std::vector<NatRule> added;

            for (const auto &rule : rules)
            {
                std::string error;
                auto presence = check(rule, &error);
                if (presence == Presence::Present)
                {
                    logger_->debug("Rule already present", core::LogContext().add("rule", rule.describe()));
                    continue;
                }

                std::string action = core::format_command(rule.command("-C"));
                if (presence == Presence::Absent)
                {
                    const auto argv = rule.command("-A");
                    auto result = runner_.run(argv);
                    if (result.ok())
                    {
                        added.push_back(rule);
                        continue;
                    }
                    action = core::format_command(argv);
                    error = "exit code " + std::to_string(result.exit_code) + ": " + first_line(result.output);
                }

                // Leave the table as it was before this call
                auto cleanup = remove(added);
                for (const auto &failure : cleanup)
                {
                    logger_->error("Could not undo NAT rule", core::LogContext().add("detail", failure.describe()));
                }
                throw core::HotspotError(core::ErrorCode::NatRuleError, "nat", action, error);
            }

            logger_->info("NAT active",
                          core::LogContext().add("upstream", upstream_if).add("rules_added", added.size()));
            return added;
        }

        core::TeardownErrors NatManager::remove(const std::vector<NatRule> &rules)
        {
            core::TeardownErrors errors;

            // One deletion per tuple: a copy someone else inserted stays
            for (const auto &rule : rules)
            {
                std::string error;
                auto presence = check(rule, &error);
                if (presence == Presence::Absent)
                {
                    logger_->debug("Rule already gone", core::LogContext().add("rule", rule.describe()));
                    continue;
                }
                if (presence == Presence::Unknown)
                {
                    errors.push_back(core::TeardownError{"nat", core::format_command(rule.command("-C")), error});
                    continue;
                }

                const auto argv = rule.command("-D");
                auto result = runner_.run(argv);
                if (!result.ok())
                {
                    errors.push_back(core::TeardownError{
                        "nat", core::format_command(argv),
                        "exit code " + std::to_string(result.exit_code) + ": " + first_line(result.output)});
                    continue;
                }
                logger_->debug("Rule removed", core::LogContext().add("rule", rule.describe()));
            }

            for (const auto &error : errors)
            {
                logger_->warning("NAT rule removal failed",
                                 core::LogContext()
                                     .add("code", core::to_string(core::ErrorCode::NatRuleError))
                                     .add("detail", error.describe()));
            }
            return errors;
        }

        NatStatus NatManager::query(const std::string &hotspot_if, const std::string &upstream_if) const
        {
            NatStatus status;
            status.upstream = upstream_if;

            size_t present = 0;
            for (const auto &rule : rules_for(hotspot_if, upstream_if))
            {
                std::string error;
                auto presence = check(rule, &error);
                if (presence == Presence::Unknown)
                {
                    status.state = NatState::Unknown;
                    status.error = error;
                    status.present.clear();
                    return status;
                }
                status.present.push_back(presence == Presence::Present);
                if (presence == Presence::Present)
                {
                    ++present;
                }
            }

            if (present == status.present.size())
            {
                status.state = NatState::Active;
            }
            else if (present > 0)
            {
                status.state = NatState::Partial;
            }
            else
            {
                status.state = NatState::Inactive;
            }
            return status;
        }

        NatManager::Presence NatManager::check(const NatRule &rule, std::string *error) const
        {
            auto result = runner_.run(rule.command("-C"));
            if (result.exit_code == 0)
            {
                return Presence::Present;
            }
            if (result.exit_code == 1)
            {
                return Presence::Absent;
            }
            if (error)
            {
                *error = "cannot query firewall (exit code " + std::to_string(result.exit_code) + "): " + first_line(result.output);
            }
            return Presence::Unknown;
        }

        void NatManager::enable_forwarding()
        {
            const std::vector<std::string> argv{"sysctl", "-w", "net.ipv4.ip_forward=1"};
            auto result = runner_.run(argv);
            if (!result.ok())
            {
                throw core::HotspotError(core::ErrorCode::NatRuleError, "ip forwarding", core::format_command(argv),
                                         "exit code " + std::to_string(result.exit_code) + ": " + first_line(result.output));
            }
            logger_->debug("IPv4 forwarding enabled");
        }

    } // namespace infrastructure
} // namespace nextu
