#include <gtest/gtest.h>

#include <algorithm>

#include "FakeSystem.hpp"
#include "infrastructure/dhcp_server.hpp"
#include "infrastructure/hostapd_supervisor.hpp"
#include "infrastructure/interface_controller.hpp"
#include "infrastructure/nat_manager.hpp"
#include "infrastructure/regulatory_domain.hpp"
#include "services/resource_ledger.hpp"
#include "services/status_reporter.hpp"

using namespace nextu;
using namespace nextu::services;

namespace {

struct StatusFixture : public ::testing::Test {
    test::TempDir dir;
    test::FakeSystem host;
    std::shared_ptr<core::HotspotConfig> config = test::make_config(dir);

    infrastructure::InterfaceController interface{config, host};
    infrastructure::RegulatorySetter regulatory{host};
    infrastructure::HostapdSupervisor hostapd{config, host, host};
    infrastructure::DnsmasqSupervisor dnsmasq{config, host, host};
    infrastructure::NatManager nat{host};
    StatusReporter reporter{config, interface, regulatory, hostapd, dnsmasq, nat};

    void SetUp() override {
        host.add_interface("wlan-test");
        host.add_interface("eth-test");
        test::write_daemon_configs(config);
    }

    // Everything start would have done, without the orchestrator
    void bring_up() {
        regulatory.apply("US");
        interface.bind();
        hostapd.start();
        dnsmasq.start();
        nat.apply("wlan-test", "eth-test");
    }

    static bool mentions(const std::vector<std::string>& drift, const std::string& text) {
        return std::any_of(drift.begin(), drift.end(),
                           [&](const std::string& entry) { return entry.find(text) != std::string::npos; });
    }

    static bool contains(const std::string& haystack, const std::string& needle) {
        return haystack.find(needle) != std::string::npos;
    }
};

} // namespace

// ============================================================================
// Snapshot
// ============================================================================

TEST_F(StatusFixture, Stopped_EverythingAbsent) {
    auto snapshot = reporter.collect();
    auto text = format_status(snapshot);

    EXPECT_EQ(snapshot.lifecycle, LifecycleState::Stopped);
    EXPECT_TRUE(snapshot.drift.empty());
    EXPECT_TRUE(contains(text, "Interface: wlan-test (FOUND)"));
    EXPECT_TRUE(contains(text, "Hostapd:   STOPPED"));
    EXPECT_TRUE(contains(text, "DHCP:      STOPPED"));
    EXPECT_TRUE(contains(text, "NAT:       INACTIVE"));
    EXPECT_TRUE(contains(text, "  (none)"));
}

TEST_F(StatusFixture, Running_ReportsEverySubsystem) {
    bring_up();
    test::write_file(config->paths.lease_file,
                     "1760800000 aa:bb:cc:dd:ee:01 10.9.9.23 pixel-7 *\n"
                     "1760800000 aa:bb:cc:dd:ee:02 192.168.7.4 elsewhere *\n");

    auto snapshot = reporter.collect();
    auto text = format_status(snapshot);

    EXPECT_EQ(snapshot.lifecycle, LifecycleState::Running);
    EXPECT_TRUE(snapshot.drift.empty());
    EXPECT_EQ(snapshot.country, "US");
    EXPECT_EQ(snapshot.ssid, "NEXTU-Hotspot");
    EXPECT_TRUE(contains(text, "Link:    UP"));
    EXPECT_TRUE(contains(text, "Mode:    AP"));
    EXPECT_TRUE(contains(text, "IP:      10.9.9.1/24"));
    EXPECT_TRUE(contains(text, "Hostapd:   RUNNING (PID " + std::to_string(*snapshot.hostapd.pid) + ")"));
    EXPECT_TRUE(contains(text, "DHCP:      RUNNING (PID"));
    EXPECT_TRUE(contains(text, "NAT:       ACTIVE (via eth-test)"));
    EXPECT_TRUE(contains(text, "10.9.9.23"));
    EXPECT_TRUE(contains(text, "pixel-7"));
    EXPECT_FALSE(contains(text, "192.168.7.4"));
}

TEST_F(StatusFixture, MissingInterfaceIsNotFound) {
    host.unplug("wlan-test");

    auto text = format_status(reporter.collect());

    EXPECT_TRUE(contains(text, "Interface: wlan-test (NOT FOUND)"));
}

TEST_F(StatusFixture, UnreadableLeaseTableDegradesToNone) {
    bring_up();

    auto snapshot = reporter.collect();

    EXPECT_FALSE(snapshot.leases.has_value());
    EXPECT_FALSE(snapshot.lease_error.empty());
    EXPECT_TRUE(contains(format_status(snapshot), "Connected clients:\n  (none)"));
}

TEST_F(StatusFixture, LeftoverLeaseFileOfStoppedDhcpShowsNone) {
    test::write_file(config->paths.lease_file, "1760800000 aa:bb:cc:dd:ee:01 10.9.9.23 pixel-7 *\n");

    auto snapshot = reporter.collect();
    auto text = format_status(snapshot);

    ASSERT_TRUE(snapshot.leases.has_value());
    EXPECT_TRUE(snapshot.leases->empty());
    EXPECT_TRUE(contains(text, "Connected clients:\n  (none)"));
    EXPECT_FALSE(contains(text, "10.9.9.23"));
}

TEST_F(StatusFixture, ForeignRuleOnStoppedHotspotIsNotALeftover) {
    host.firewall.push_back(infrastructure::NatManager::rules_for("wlan-test", "eth-test")[0]);

    auto snapshot = reporter.collect();

    EXPECT_EQ(snapshot.nat.state, infrastructure::NatState::Partial);
    EXPECT_EQ(snapshot.lifecycle, LifecycleState::Stopped);
    EXPECT_TRUE(snapshot.drift.empty());
}

TEST_F(StatusFixture, FirewallWithoutAccessIsUnknown) {
    host.iptables_unavailable = true;

    auto snapshot = reporter.collect();

    EXPECT_EQ(snapshot.nat.state, infrastructure::NatState::Unknown);
    EXPECT_TRUE(contains(format_status(snapshot), "NAT:       UNKNOWN"));
}

// ============================================================================
// Drift
// ============================================================================

TEST_F(StatusFixture, StalePidFileIsDrift) {
    test::write_file(config->paths.hostapd_pid_file, "31337\n");

    auto snapshot = reporter.collect();

    EXPECT_EQ(snapshot.lifecycle, LifecycleState::Failed);
    EXPECT_TRUE(mentions(snapshot.drift, "hostapd pid file names pid 31337"));
    EXPECT_TRUE(contains(format_status(snapshot), "Hostapd:   STOPPED (stale pid file)"));
}

TEST_F(StatusFixture, DeadDaemonHeldByLedgerIsDrift) {
    bring_up();
    ResourceLedger ledger;
    const pid_t pid = *hostapd.read_pid();
    ledger.acquire(AccessPointProcess{pid, hostapd.config_file(), hostapd.pid_file()});
    host.crash(pid);

    auto snapshot = reporter.collect(&ledger);

    EXPECT_TRUE(mentions(snapshot.drift, "ledger holds hostapd pid " + std::to_string(pid)));
    EXPECT_TRUE(mentions(snapshot.drift, "dnsmasq is running but hostapd is not"));
    EXPECT_EQ(snapshot.lifecycle, LifecycleState::Failed);
}

TEST_F(StatusFixture, FlushedFirewallIsDrift) {
    bring_up();
    ResourceLedger ledger;
    ledger.acquire(NatRuleSet{"wlan-test", "eth-test", infrastructure::NatManager::rules_for("wlan-test", "eth-test")});
    host.firewall.erase(host.firewall.begin());

    auto snapshot = reporter.collect(&ledger);

    EXPECT_EQ(snapshot.nat.state, infrastructure::NatState::Partial);
    EXPECT_TRUE(mentions(snapshot.drift, "NAT rules partially present (2 of 3)"));
    EXPECT_TRUE(mentions(snapshot.drift, "ledger holds NAT rules via eth-test but the firewall reports PARTIAL"));
}

TEST_F(StatusFixture, LostGatewayAddressIsDrift) {
    bring_up();
    host.interfaces["wlan-test"].addresses.clear();

    auto snapshot = reporter.collect();

    EXPECT_TRUE(mentions(snapshot.drift, "interface wlan-test lacks gateway address 10.9.9.1/24"));
}

TEST_F(StatusFixture, DriftEntriesAreNotRepeated) {
    bring_up();
    host.unplug("wlan-test");
    ResourceLedger ledger;
    ledger.acquire(InterfaceBinding{"wlan-test", "10.9.9.1/24"});

    auto drift = reporter.collect(&ledger).drift;

    auto sorted = drift;
    std::sort(sorted.begin(), sorted.end());
    EXPECT_EQ(std::adjacent_find(sorted.begin(), sorted.end()), sorted.end());
    EXPECT_TRUE(mentions(drift, "daemons are running but interface wlan-test is missing"));
    EXPECT_TRUE(mentions(drift, "ledger holds interface wlan-test but it is missing"));
}

// ============================================================================
// JSON
// ============================================================================

TEST_F(StatusFixture, JsonCarriesSnapshot) {
    bring_up();

    auto j = status_to_json(reporter.collect());

    EXPECT_EQ(j["state"], "RUNNING");
    EXPECT_EQ(j["interface"]["name"], "wlan-test");
    EXPECT_TRUE(j["interface"]["found"].get<bool>());
    EXPECT_TRUE(j["hostapd"]["running"].get<bool>());
    EXPECT_EQ(j["hostapd"]["ssid"], "NEXTU-Hotspot");
    EXPECT_TRUE(j["dnsmasq"]["running"].get<bool>());
    EXPECT_EQ(j["nat"]["state"], "ACTIVE");
    EXPECT_EQ(j["nat"]["upstream"], "eth-test");
    EXPECT_TRUE(j["leases"].is_null());
    EXPECT_TRUE(j["drift"].empty());
}
