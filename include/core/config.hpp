#ifndef NEXTU_HOTSPOT_CORE_CONFIG_HPP
#define NEXTU_HOTSPOT_CORE_CONFIG_HPP

#include <string>
#include <vector>
#include <memory>
#include <nlohmann/json.hpp>

namespace nextu
{
    namespace core
    {

        /**
         * Hotspot and upstream interface settings
         */
        struct NetworkConfig
        {
            std::string interface;
            std::string upstream;
            std::string subnet = "192.168.50";
            std::string country = "US";
            bool release_from_network_manager = true;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * hostapd settings
         */
        struct AccessPointConfig
        {
            std::string ssid = "NEXTU-Hotspot";
            std::string passphrase = "nextu2024";
            int channel = 6;
            std::string hw_mode = "g";
            int max_stations = 8;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * dnsmasq settings; range bounds are host numbers inside the /24
         */
        struct DhcpConfig
        {
            int range_start = 10;
            int range_end = 50;
            std::string lease_time = "24h";
            std::vector<std::string> dns_servers = {"8.8.8.8", "8.8.4.4"};

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Control paths and daemon binaries.
         * Empty daemon config paths resolve to files inside config_dir.
         */
        struct PathsConfig
        {
            std::string config_dir = "/etc/nextu-hotspot";
            std::string hostapd_conf;
            std::string dnsmasq_conf;
            std::string hostapd_pid_file = "/var/run/nextu-hostapd.pid";
            std::string dnsmasq_pid_file = "/var/run/nextu-dnsmasq.pid";
            std::string lock_file = "/var/run/nextu-hotspot.lock";
            std::string lease_file = "/var/lib/misc/dnsmasq.leases";
            std::string hostapd_bin = "/usr/sbin/hostapd";
            std::string dnsmasq_bin = "dnsmasq";

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Daemon start/stop timing. Defaults were tuned for slow USB adapters.
         */
        struct SupervisionConfig
        {
            int start_attempts = 10;
            int poll_interval_ms = 500;
            int stop_timeout_ms = 2000;
            int settle_delay_ms = 1000;
            int restart_delay_ms = 2000;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Logging configuration
         */
        struct LoggingConfig
        {
            std::string log_level = "WARNING";
            std::string log_file; // Empty means console output

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Complete hotspot configuration, immutable once loaded
         */
        class HotspotConfig
        {
        public:
            NetworkConfig network;
            AccessPointConfig access_point;
            DhcpConfig dhcp;
            PathsConfig paths;
            SupervisionConfig supervision;
            LoggingConfig logging;

        public:
            HotspotConfig() = default;
            HotspotConfig(const std::string &interface, const std::string &upstream);

            // Factory methods
            static std::unique_ptr<HotspotConfig> from_file(const std::string &config_path);
            static std::unique_ptr<HotspotConfig> from_json(const nlohmann::json &j);

            // Serialization
            nlohmann::json to_json() const;
            void save_to_file(const std::string &config_path) const;

            // Validation
            std::vector<std::string> validation_errors() const;
            bool validate() const;

            // Derived addresses
            std::string gateway_address() const;
            std::string gateway_cidr() const;
            std::string host_address(int host) const;

            void apply_path_defaults();
        };

    } // namespace core
} // namespace nextu

#endif // NEXTU_HOTSPOT_CORE_CONFIG_HPP
