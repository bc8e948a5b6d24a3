#include "core/config.hpp"
#include "core/logger.hpp"
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace nextu
{
    namespace core
    {

        namespace
        {
            bool is_valid_subnet(const std::string &subnet)
            {
                std::istringstream stream(subnet);
                std::string octet;
                int count = 0;
                while (std::getline(stream, octet, '.'))
                {
                    if (octet.empty() || octet.size() > 3)
                    {
                        return false;
                    }
                    for (char c : octet)
                    {
                        if (!std::isdigit(static_cast<unsigned char>(c)))
                        {
                            return false;
                        }
                    }
                    if (std::stoi(octet) > 255)
                    {
                        return false;
                    }
                    ++count;
                }
                return count == 3 && subnet.back() != '.';
            }

            bool is_valid_country(const std::string &country)
            {
                if (country.size() != 2)
                {
                    return false;
                }
                for (char c : country)
                {
                    if (!std::isupper(static_cast<unsigned char>(c)) && !std::isdigit(static_cast<unsigned char>(c)))
                    {
                        return false;
                    }
                }
                return true;
            }
        }

        // NetworkConfig implementation
        void NetworkConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("interface"))
                interface = j["interface"].get<std::string>();
            if (j.contains("upstream"))
                upstream = j["upstream"].get<std::string>();
            if (j.contains("subnet"))
                subnet = j["subnet"].get<std::string>();
            if (j.contains("country"))
                country = j["country"].get<std::string>();
            if (j.contains("release_from_network_manager"))
                release_from_network_manager = j["release_from_network_manager"].get<bool>();
        }

        nlohmann::json NetworkConfig::to_json() const
        {
            return nlohmann::json{
                {"interface", interface},
                {"upstream", upstream},
                {"subnet", subnet},
                {"country", country},
                {"release_from_network_manager", release_from_network_manager}};
        }

        // AccessPointConfig implementation
        void AccessPointConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("ssid"))
                ssid = j["ssid"].get<std::string>();
            if (j.contains("passphrase"))
                passphrase = j["passphrase"].get<std::string>();
            if (j.contains("channel"))
                channel = j["channel"].get<int>();
            if (j.contains("hw_mode"))
                hw_mode = j["hw_mode"].get<std::string>();
            if (j.contains("max_stations"))
                max_stations = j["max_stations"].get<int>();
        }

        nlohmann::json AccessPointConfig::to_json() const
        {
            return nlohmann::json{
                {"ssid", ssid},
                {"passphrase", passphrase},
                {"channel", channel},
                {"hw_mode", hw_mode},
                {"max_stations", max_stations}};
        }

        // DhcpConfig implementation
        void DhcpConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("range_start"))
                range_start = j["range_start"].get<int>();
            if (j.contains("range_end"))
                range_end = j["range_end"].get<int>();
            if (j.contains("lease_time"))
                lease_time = j["lease_time"].get<std::string>();
            if (j.contains("dns_servers"))
                dns_servers = j["dns_servers"].get<std::vector<std::string>>();
        }

        nlohmann::json DhcpConfig::to_json() const
        {
            return nlohmann::json{
                {"range_start", range_start},
                {"range_end", range_end},
                {"lease_time", lease_time},
                {"dns_servers", dns_servers}};
        }

        // PathsConfig implementation
        void PathsConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("config_dir"))
                config_dir = j["config_dir"].get<std::string>();
            if (j.contains("hostapd_conf"))
                hostapd_conf = j["hostapd_conf"].get<std::string>();
            if (j.contains("dnsmasq_conf"))
                dnsmasq_conf = j["dnsmasq_conf"].get<std::string>();
            if (j.contains("hostapd_pid_file"))
                hostapd_pid_file = j["hostapd_pid_file"].get<std::string>();
            if (j.contains("dnsmasq_pid_file"))
                dnsmasq_pid_file = j["dnsmasq_pid_file"].get<std::string>();
            if (j.contains("lock_file"))
                lock_file = j["lock_file"].get<std::string>();
            if (j.contains("lease_file"))
                lease_file = j["lease_file"].get<std::string>();
            if (j.contains("hostapd_bin"))
                hostapd_bin = j["hostapd_bin"].get<std::string>();
            if (j.contains("dnsmasq_bin"))
                dnsmasq_bin = j["dnsmasq_bin"].get<std::string>();
        }

        nlohmann::json PathsConfig::to_json() const
        {
            return nlohmann::json{
                {"config_dir", config_dir},
                {"hostapd_conf", hostapd_conf},
                {"dnsmasq_conf", dnsmasq_conf},
                {"hostapd_pid_file", hostapd_pid_file},
                {"dnsmasq_pid_file", dnsmasq_pid_file},
                {"lock_file", lock_file},
                {"lease_file", lease_file},
                {"hostapd_bin", hostapd_bin},
                {"dnsmasq_bin", dnsmasq_bin}};
        }

        // SupervisionConfig implementation
        void SupervisionConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("start_attempts"))
                start_attempts = j["start_attempts"].get<int>();
            if (j.contains("poll_interval_ms"))
                poll_interval_ms = j["poll_interval_ms"].get<int>();
            if (j.contains("stop_timeout_ms"))
                stop_timeout_ms = j["stop_timeout_ms"].get<int>();
            if (j.contains("settle_delay_ms"))
                settle_delay_ms = j["settle_delay_ms"].get<int>();
            if (j.contains("restart_delay_ms"))
                restart_delay_ms = j["restart_delay_ms"].get<int>();
        }

        nlohmann::json SupervisionConfig::to_json() const
        {
            return nlohmann::json{
                {"start_attempts", start_attempts},
                {"poll_interval_ms", poll_interval_ms},
                {"stop_timeout_ms", stop_timeout_ms},
                {"settle_delay_ms", settle_delay_ms},
                {"restart_delay_ms", restart_delay_ms}};
        }

        // LoggingConfig implementation
        void LoggingConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("log_level"))
                log_level = j["log_level"].get<std::string>();
            if (j.contains("log_file") && !j["log_file"].is_null())
                log_file = j["log_file"].get<std::string>();
        }

        nlohmann::json LoggingConfig::to_json() const
        {
            nlohmann::json j{{"log_level", log_level}};
            if (!log_file.empty())
            {
                j["log_file"] = log_file;
            }
            return j;
        }

        // HotspotConfig implementation
        HotspotConfig::HotspotConfig(const std::string &interface, const std::string &upstream)
        {
            network.interface = interface;
            network.upstream = upstream;
            apply_path_defaults();
        }

        std::unique_ptr<HotspotConfig> HotspotConfig::from_file(const std::string &config_path)
        {
            std::ifstream file(config_path);
            if (!file.is_open())
            {
                throw std::runtime_error("Configuration file not found: " + config_path);
            }

            nlohmann::json j;
            try
            {
                file >> j;
            }
            catch (const nlohmann::json::parse_error &e)
            {
                throw std::runtime_error("Invalid JSON in configuration file: " + std::string(e.what()));
            }

            return from_json(j);
        }

        std::unique_ptr<HotspotConfig> HotspotConfig::from_json(const nlohmann::json &j)
        {
            if (!j.contains("network") || !j["network"].is_object())
            {
                throw std::invalid_argument("network section is required");
            }

            auto config = std::make_unique<HotspotConfig>();

            try
            {
                config->network.from_json(j["network"]);
                if (j.contains("access_point"))
                {
                    config->access_point.from_json(j["access_point"]);
                }
                if (j.contains("dhcp"))
                {
                    config->dhcp.from_json(j["dhcp"]);
                }
                if (j.contains("paths"))
                {
                    config->paths.from_json(j["paths"]);
                }
                if (j.contains("supervision"))
                {
                    config->supervision.from_json(j["supervision"]);
                }
                if (j.contains("logging"))
                {
                    config->logging.from_json(j["logging"]);
                }
            }
            catch (const nlohmann::json::type_error &e)
            {
                throw std::invalid_argument("Wrong value type in configuration: " + std::string(e.what()));
            }

            if (config->network.interface.empty())
            {
                throw std::invalid_argument("network.interface is required");
            }
            if (config->network.upstream.empty())
            {
                throw std::invalid_argument("network.upstream is required");
            }

            config->apply_path_defaults();
            return config;
        }

        nlohmann::json HotspotConfig::to_json() const
        {
            return nlohmann::json{
                {"network", network.to_json()},
                {"access_point", access_point.to_json()},
                {"dhcp", dhcp.to_json()},
                {"paths", paths.to_json()},
                {"supervision", supervision.to_json()},
                {"logging", logging.to_json()}};
        }

        void HotspotConfig::save_to_file(const std::string &config_path) const
        {
            std::ofstream file(config_path);
            if (!file.is_open())
            {
                throw std::runtime_error("Cannot open configuration file for writing: " + config_path);
            }

            file << to_json().dump(4) << "\n";
        }

        std::vector<std::string> HotspotConfig::validation_errors() const
        {
            std::vector<std::string> errors;

            if (network.interface.empty() || network.interface.size() > 15)
            {
                errors.push_back("network.interface must be 1-15 characters");
            }
            if (network.upstream.empty() || network.upstream.size() > 15)
            {
                errors.push_back("network.upstream must be 1-15 characters");
            }
            if (!network.interface.empty() && network.interface == network.upstream)
            {
                errors.push_back("network.interface and network.upstream must differ");
            }
            if (!is_valid_subnet(network.subnet))
            {
                errors.push_back("network.subnet must be three dotted octets, e.g. 192.168.50");
            }
            if (!is_valid_country(network.country))
            {
                errors.push_back("network.country must be a two-letter regulatory code");
            }

            if (access_point.ssid.empty() || access_point.ssid.size() > 32)
            {
                errors.push_back("access_point.ssid must be 1-32 bytes");
            }
            if (access_point.passphrase.size() < 8 || access_point.passphrase.size() > 63)
            {
                errors.push_back("access_point.passphrase must be 8-63 characters");
            }
            if (access_point.channel < 1 || access_point.channel > 14)
            {
                errors.push_back("access_point.channel must be between 1 and 14");
            }
            if (access_point.hw_mode != "a" && access_point.hw_mode != "b" && access_point.hw_mode != "g")
            {
                errors.push_back("access_point.hw_mode must be one of a, b, g");
            }
            if (access_point.max_stations < 1)
            {
                errors.push_back("access_point.max_stations must be positive");
            }

            if (dhcp.range_start < 2 || dhcp.range_end > 254 || dhcp.range_start > dhcp.range_end)
            {
                errors.push_back("dhcp range must satisfy 2 <= range_start <= range_end <= 254");
            }
            if (dhcp.lease_time.empty())
            {
                errors.push_back("dhcp.lease_time cannot be empty");
            }

            if (paths.hostapd_pid_file.empty() || paths.dnsmasq_pid_file.empty() || paths.lock_file.empty())
            {
                errors.push_back("paths: pid files and lock file are required");
            }

            if (supervision.start_attempts < 1)
            {
                errors.push_back("supervision.start_attempts must be at least 1");
            }
            if (supervision.poll_interval_ms < 0 || supervision.stop_timeout_ms < 0 ||
                supervision.settle_delay_ms < 0 || supervision.restart_delay_ms < 0)
            {
                errors.push_back("supervision delays cannot be negative");
            }

            return errors;
        }

        bool HotspotConfig::validate() const
        {
            auto errors = validation_errors();
            if (errors.empty())
            {
                return true;
            }

            auto logger = get_logger("HotspotConfig");
            for (const auto &error : errors)
            {
                logger->error("Configuration validation error", LogContext().add("problem", error));
            }
            return false;
        }

        std::string HotspotConfig::gateway_address() const
        {
            return host_address(1);
        }

        std::string HotspotConfig::gateway_cidr() const
        {
            return gateway_address() + "/24";
        }

        std::string HotspotConfig::host_address(int host) const
        {
            return network.subnet + "." + std::to_string(host);
        }

        void HotspotConfig::apply_path_defaults()
        {
            const std::filesystem::path dir(paths.config_dir);
            if (paths.hostapd_conf.empty())
            {
                paths.hostapd_conf = (dir / "hostapd.conf").string();
            }
            if (paths.dnsmasq_conf.empty())
            {
                paths.dnsmasq_conf = (dir / "dnsmasq.conf").string();
            }
        }

    } // namespace core
} // namespace nextu
