#ifndef NEXTU_HOTSPOT_INFRASTRUCTURE_CONFIG_WRITER_HPP
#define NEXTU_HOTSPOT_INFRASTRUCTURE_CONFIG_WRITER_HPP

#include <string>
#include <memory>

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
         * Daemon Configuration Writer
         * Renders hostapd.conf and dnsmasq.conf from the hotspot configuration
         */
        class DaemonConfigWriter
        {
        public:
            explicit DaemonConfigWriter(const std::shared_ptr<const core::HotspotConfig> &config);

            std::string render_hostapd() const;
            std::string render_dnsmasq() const;

            /**
             * Write both files, creating their directories as needed.
             * hostapd.conf holds the passphrase and is written owner-only.
             * @throws core::HotspotError CommandFailed when a file cannot be written
             */
            void write_all() const;

        private:
            void write_file(const std::string &path, const std::string &content, bool owner_only) const;

            std::shared_ptr<const core::HotspotConfig> config_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace infrastructure
} // namespace nextu

#endif // NEXTU_HOTSPOT_INFRASTRUCTURE_CONFIG_WRITER_HPP
