#include "infrastructure/regulatory_domain.hpp"
#include "core/command_runner.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <sstream>

namespace nextu
{
    namespace infrastructure
    {

        RegulatorySetter::RegulatorySetter(core::CommandRunner &runner)
            : runner_(runner), logger_(core::get_logger("RegulatorySetter"))
        {
        }

        bool RegulatorySetter::apply(const std::string &country_code)
        {
            std::vector<std::string> argv{"iw", "reg", "set", country_code};
            auto result = runner_.run(argv);
            if (!result.ok())
            {
                logger_->warning("Could not set regulatory domain",
                                 core::LogContext()
                                     .add("code", core::to_string(core::ErrorCode::RegulatoryDomainWarning))
                                     .add("country", country_code)
                                     .add("command", core::format_command(argv))
                                     .add("exit_code", result.exit_code));
                return false;
            }

            logger_->info("Regulatory domain set", core::LogContext().add("country", country_code));
            return true;
        }

        std::string RegulatorySetter::current() const
        {
            auto result = runner_.run({"iw", "reg", "get"});
            if (!result.ok())
            {
                return "";
            }

            // "global\ncountry US: DFS-FCC\n..."; the first country line is the global domain
            std::istringstream lines(result.output);
            std::string line;
            while (std::getline(lines, line))
            {
                const auto pos = line.find("country ");
                if (pos != std::string::npos && line.size() >= pos + 10)
                {
                    return line.substr(pos + 8, 2);
                }
            }
            return "";
        }

    } // namespace infrastructure
} // namespace nextu
