#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "FakeSystem.hpp"
#include "core/config.hpp"
#include "infrastructure/config_writer.hpp"

using namespace nextu;

namespace {

bool has_line(const std::string& text, const std::string& line) {
    std::istringstream lines(text);
    std::string current;
    while (std::getline(lines, current)) {
        if (current == line) {
            return true;
        }
    }
    return false;
}

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    return content.str();
}

} // namespace

// ============================================================================
// Loading
// ============================================================================

TEST(HotspotConfig, FromJson_MinimalUsesDefaults) {
    auto config = core::HotspotConfig::from_json(
        nlohmann::json::parse(R"({"network": {"interface": "wlx00c0ca", "upstream": "eth0"}})"));

    EXPECT_EQ(config->network.subnet, "192.168.50");
    EXPECT_EQ(config->network.country, "US");
    EXPECT_EQ(config->access_point.channel, 6);
    EXPECT_EQ(config->dhcp.range_start, 10);
    EXPECT_EQ(config->dhcp.range_end, 50);
    EXPECT_EQ(config->paths.hostapd_conf, "/etc/nextu-hotspot/hostapd.conf");
    EXPECT_EQ(config->paths.dnsmasq_conf, "/etc/nextu-hotspot/dnsmasq.conf");
    EXPECT_EQ(config->paths.hostapd_pid_file, "/var/run/nextu-hostapd.pid");
    EXPECT_EQ(config->supervision.start_attempts, 10);
    EXPECT_TRUE(config->validate());
}

TEST(HotspotConfig, FromJson_OverridesSections) {
    auto config = core::HotspotConfig::from_json(nlohmann::json::parse(R"({
        "network": {"interface": "wlan-test", "upstream": "eth-test", "subnet": "10.9.9", "country": "DE"},
        "access_point": {"ssid": "Lab", "channel": 11},
        "paths": {"config_dir": "/opt/hotspot"},
        "supervision": {"restart_delay_ms": 0}
    })"));

    EXPECT_EQ(config->network.country, "DE");
    EXPECT_EQ(config->access_point.ssid, "Lab");
    EXPECT_EQ(config->access_point.channel, 11);
    EXPECT_EQ(config->paths.hostapd_conf, "/opt/hotspot/hostapd.conf");
    EXPECT_EQ(config->supervision.restart_delay_ms, 0);
    EXPECT_EQ(config->gateway_address(), "10.9.9.1");
    EXPECT_EQ(config->gateway_cidr(), "10.9.9.1/24");
}

TEST(HotspotConfig, FromJson_RequiresNetworkSection) {
    EXPECT_THROW(core::HotspotConfig::from_json(nlohmann::json::parse(R"({"dhcp": {}})")), std::invalid_argument);
    EXPECT_THROW(core::HotspotConfig::from_json(nlohmann::json::parse(R"({"network": {"interface": "wlan0"}})")),
                 std::invalid_argument);
}

TEST(HotspotConfig, FromJson_WrongTypeIsInvalidArgument) {
    EXPECT_THROW(core::HotspotConfig::from_json(nlohmann::json::parse(
                     R"({"network": {"interface": "wlan0", "upstream": "eth0"}, "access_point": {"channel": "six"}})")),
                 std::invalid_argument);
}

TEST(HotspotConfig, FromFile_MissingOrBrokenFile) {
    test::TempDir dir;
    EXPECT_THROW(core::HotspotConfig::from_file(dir.file("absent.json")), std::runtime_error);

    test::write_file(dir.file("broken.json"), "{ not json");
    EXPECT_THROW(core::HotspotConfig::from_file(dir.file("broken.json")), std::runtime_error);
}

TEST(HotspotConfig, SaveThenLoadKeepsValues) {
    test::TempDir dir;
    core::HotspotConfig original("wlan-test", "eth-test");
    original.access_point.ssid = "Workshop";
    original.dhcp.dns_servers = {"1.1.1.1"};

    original.save_to_file(dir.file("hotspot.json"));
    auto loaded = core::HotspotConfig::from_file(dir.file("hotspot.json"));

    EXPECT_EQ(loaded->access_point.ssid, "Workshop");
    EXPECT_EQ(loaded->dhcp.dns_servers, std::vector<std::string>({"1.1.1.1"}));
    EXPECT_EQ(loaded->network.upstream, "eth-test");
}

// ============================================================================
// Validation
// ============================================================================

TEST(HotspotConfig, Validation_ReportsEachProblem) {
    core::HotspotConfig config("wlan0", "wlan0");
    config.access_point.passphrase = "short";
    config.access_point.channel = 20;
    config.network.subnet = "10.9";

    auto errors = config.validation_errors();

    EXPECT_EQ(errors.size(), 4u);
    EXPECT_FALSE(config.validate());
}

TEST(HotspotConfig, Validation_DhcpRangeBounds) {
    core::HotspotConfig config("wlan0", "eth0");

    config.dhcp.range_start = 1;
    EXPECT_FALSE(config.validate());

    config.dhcp.range_start = 60;
    config.dhcp.range_end = 50;
    EXPECT_FALSE(config.validate());

    config.dhcp.range_start = 2;
    config.dhcp.range_end = 254;
    EXPECT_TRUE(config.validate());
}

TEST(HotspotConfig, Validation_SsidAndCountry) {
    core::HotspotConfig config("wlan0", "eth0");

    config.access_point.ssid = std::string(33, 'x');
    config.network.country = "usa";
    EXPECT_EQ(config.validation_errors().size(), 2u);
}

// ============================================================================
// Daemon configuration files
// ============================================================================

TEST(DaemonConfigWriter, RendersHostapdConfig) {
    test::TempDir dir;
    auto config = test::make_config(dir);
    config->access_point.ssid = "Lab AP";
    config->access_point.channel = 11;

    auto text = infrastructure::DaemonConfigWriter(config).render_hostapd();

    EXPECT_TRUE(has_line(text, "interface=wlan-test"));
    EXPECT_TRUE(has_line(text, "driver=nl80211"));
    EXPECT_TRUE(has_line(text, "ssid=Lab AP"));
    EXPECT_TRUE(has_line(text, "hw_mode=g"));
    EXPECT_TRUE(has_line(text, "channel=11"));
    EXPECT_TRUE(has_line(text, "wpa=2"));
    EXPECT_TRUE(has_line(text, "wpa_passphrase=nextu2024"));
    EXPECT_TRUE(has_line(text, "rsn_pairwise=CCMP"));
    EXPECT_TRUE(has_line(text, "max_num_sta=8"));
}

TEST(DaemonConfigWriter, RendersDnsmasqConfig) {
    test::TempDir dir;
    auto config = test::make_config(dir);

    auto text = infrastructure::DaemonConfigWriter(config).render_dnsmasq();

    EXPECT_TRUE(has_line(text, "interface=wlan-test"));
    EXPECT_TRUE(has_line(text, "bind-interfaces"));
    EXPECT_TRUE(has_line(text, "dhcp-range=10.9.9.10,10.9.9.50,255.255.255.0,24h"));
    EXPECT_TRUE(has_line(text, "dhcp-option=option:router,10.9.9.1"));
    EXPECT_TRUE(has_line(text, "dhcp-option=option:dns-server,8.8.8.8,8.8.4.4"));
    EXPECT_TRUE(has_line(text, "server=8.8.8.8"));
    EXPECT_TRUE(has_line(text, "server=8.8.4.4"));
    EXPECT_TRUE(has_line(text, "dhcp-leasefile=" + config->paths.lease_file));
}

TEST(DaemonConfigWriter, WriteAllCreatesDirectoryAndRestrictsHostapd) {
    test::TempDir dir;
    auto config = test::make_config(dir);
    config->paths.config_dir = dir.file("etc");
    config->paths.hostapd_conf.clear();
    config->paths.dnsmasq_conf.clear();
    config->apply_path_defaults();

    infrastructure::DaemonConfigWriter(config).write_all();

    ASSERT_TRUE(test::file_exists(config->paths.hostapd_conf));
    ASSERT_TRUE(test::file_exists(config->paths.dnsmasq_conf));
    EXPECT_TRUE(has_line(read_file(config->paths.hostapd_conf), "ssid=NEXTU-Hotspot"));

    const auto perms = std::filesystem::status(config->paths.hostapd_conf).permissions();
    EXPECT_EQ(perms & std::filesystem::perms::others_read, std::filesystem::perms::none);
    EXPECT_EQ(perms & std::filesystem::perms::group_read, std::filesystem::perms::none);
}
