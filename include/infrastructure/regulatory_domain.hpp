#ifndef NEXTU_HOTSPOT_INFRASTRUCTURE_REGULATORY_DOMAIN_HPP
#define NEXTU_HOTSPOT_INFRASTRUCTURE_REGULATORY_DOMAIN_HPP

#include <string>
#include <memory>

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
         * Sets the wireless regulatory domain so the country's channels become usable.
         * Failures are warnings only: hostapd reports a rejected channel more precisely.
         */
        class RegulatorySetter
        {
        public:
            explicit RegulatorySetter(core::CommandRunner &runner);

            bool apply(const std::string &country_code);

            // Country currently reported by `iw reg get`, empty when unknown
            std::string current() const;

        private:
            core::CommandRunner &runner_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace infrastructure
} // namespace nextu

#endif // NEXTU_HOTSPOT_INFRASTRUCTURE_REGULATORY_DOMAIN_HPP
