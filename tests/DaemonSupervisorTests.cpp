#include <gtest/gtest.h>

#include <cstdio>

#include "FakeSystem.hpp"
#include "core/errors.hpp"
#include "infrastructure/dhcp_server.hpp"
#include "infrastructure/hostapd_supervisor.hpp"

using namespace nextu;
using namespace nextu::infrastructure;

namespace {

struct SupervisorFixture : public ::testing::Test {
    test::TempDir dir;
    test::FakeSystem host;
    std::shared_ptr<core::HotspotConfig> config = test::make_config(dir);

    void SetUp() override { test::write_daemon_configs(config); }
};

} // namespace

// ============================================================================
// start
// ============================================================================

TEST_F(SupervisorFixture, Start_WaitsForLivePid) {
    HostapdSupervisor hostapd(config, host, host);

    const pid_t pid = hostapd.start();

    EXPECT_TRUE(hostapd.is_running());
    EXPECT_EQ(hostapd.read_pid().value_or(0), pid);
    EXPECT_EQ(host.process_name(pid), "hostapd");
    EXPECT_EQ(host.ran("/usr/sbin/hostapd -B -P " + config->paths.hostapd_pid_file + " " + config->paths.hostapd_conf), 1u);
}

TEST_F(SupervisorFixture, Start_DnsmasqUsesConfigAndPidFile) {
    DnsmasqSupervisor dnsmasq(config, host, host);

    const pid_t pid = dnsmasq.start();

    EXPECT_EQ(host.process_name(pid), "dnsmasq");
    EXPECT_EQ(host.ran("dnsmasq -C " + config->paths.dnsmasq_conf + " --pid-file=" + config->paths.dnsmasq_pid_file), 1u);
}

TEST_F(SupervisorFixture, Start_MissingConfigFileFails) {
    config->paths.hostapd_conf = dir.file("absent.conf");
    HostapdSupervisor hostapd(config, host, host);

    try {
        hostapd.start();
        FAIL() << "expected DaemonStartFailed";
    } catch (const core::HotspotError& e) {
        EXPECT_EQ(e.code(), core::ErrorCode::DaemonStartFailed);
        EXPECT_NE(e.detail().find("configure"), std::string::npos);
    }
    EXPECT_EQ(host.ran("/usr/sbin/hostapd"), 0u);
}

TEST_F(SupervisorFixture, Start_LauncherFailureIsDaemonStartFailed) {
    host.fail_command("/usr/sbin/hostapd", 1, "Could not set channel for kernel driver\nInterface initialization failed");
    HostapdSupervisor hostapd(config, host, host);

    try {
        hostapd.start();
        FAIL() << "expected DaemonStartFailed";
    } catch (const core::HotspotError& e) {
        EXPECT_EQ(e.code(), core::ErrorCode::DaemonStartFailed);
        EXPECT_EQ(e.resource(), "hostapd");
        EXPECT_NE(e.detail().find("Could not set channel"), std::string::npos);
    }
    EXPECT_FALSE(test::file_exists(config->paths.hostapd_pid_file));
}

TEST_F(SupervisorFixture, Start_GivesUpAfterBoundedAttempts) {
    host.daemons_write_pid_files = false;
    HostapdSupervisor hostapd(config, host, host);

    try {
        hostapd.start();
        FAIL() << "expected DaemonStartFailed";
    } catch (const core::HotspotError& e) {
        EXPECT_NE(e.detail().find("after 3 attempts"), std::string::npos);
    }
}

TEST_F(SupervisorFixture, Start_RefusesSecondInstance) {
    HostapdSupervisor hostapd(config, host, host);
    hostapd.start();

    EXPECT_THROW(hostapd.start(), core::HotspotError);
    EXPECT_EQ(host.ran("/usr/sbin/hostapd"), 1u);
}

TEST_F(SupervisorFixture, Start_ReplacesStalePidFile) {
    test::write_file(config->paths.hostapd_pid_file, "99999\n");
    HostapdSupervisor hostapd(config, host, host);

    const pid_t pid = hostapd.start();

    EXPECT_NE(pid, 99999);
    EXPECT_TRUE(hostapd.is_running());
}

// ============================================================================
// stop / liveness
// ============================================================================

TEST_F(SupervisorFixture, Stop_TerminatesAndRemovesPidFile) {
    HostapdSupervisor hostapd(config, host, host);
    const pid_t pid = hostapd.start();

    EXPECT_FALSE(hostapd.stop().has_value());

    EXPECT_FALSE(host.is_alive(pid));
    EXPECT_FALSE(hostapd.has_pid_file());
    EXPECT_FALSE(hostapd.is_running());
}

TEST_F(SupervisorFixture, Stop_EscalatesToSigkill) {
    host.daemons_ignore_sigterm = true;
    DnsmasqSupervisor dnsmasq(config, host, host);
    const pid_t pid = dnsmasq.start();

    EXPECT_FALSE(dnsmasq.stop().has_value());
    EXPECT_FALSE(host.is_alive(pid));
}

TEST_F(SupervisorFixture, Stop_NeverSignalsForeignProcess) {
    const pid_t foreign = host.spawn("sshd");
    test::write_file(config->paths.hostapd_pid_file, std::to_string(foreign) + "\n");
    HostapdSupervisor hostapd(config, host, host);

    auto failure = hostapd.stop();

    ASSERT_TRUE(failure.has_value());
    EXPECT_NE(failure->detail.find("sshd"), std::string::npos);
    EXPECT_TRUE(host.is_alive(foreign));
    EXPECT_FALSE(hostapd.has_pid_file());
}

TEST_F(SupervisorFixture, Stop_WithoutPidFileIsNoop) {
    HostapdSupervisor hostapd(config, host, host);
    EXPECT_FALSE(hostapd.stop().has_value());
}

TEST_F(SupervisorFixture, Stop_UsesRecordedPidWhenPidFileIsGone) {
    HostapdSupervisor hostapd(config, host, host);
    const pid_t pid = hostapd.start();
    std::remove(config->paths.hostapd_pid_file.c_str());

    EXPECT_FALSE(hostapd.stop(pid).has_value());

    EXPECT_FALSE(host.is_alive(pid));
}

TEST_F(SupervisorFixture, Stop_RecordedPidNowOwnedByAnotherProgramIsLeftAlone) {
    const pid_t reused = host.spawn("sshd");
    HostapdSupervisor hostapd(config, host, host);

    auto failure = hostapd.stop(reused);

    ASSERT_TRUE(failure.has_value());
    EXPECT_NE(failure->detail.find("sshd"), std::string::npos);
    EXPECT_TRUE(host.is_alive(reused));
}

TEST_F(SupervisorFixture, Query_StalePidFileIsNotRunning) {
    test::write_file(config->paths.dnsmasq_pid_file, "4242\n");
    DnsmasqSupervisor dnsmasq(config, host, host);

    auto status = dnsmasq.query();

    EXPECT_FALSE(dnsmasq.is_running());
    EXPECT_FALSE(status.running);
    EXPECT_TRUE(status.stale_pid_file);
    EXPECT_EQ(status.pid.value_or(0), 4242);
}

TEST_F(SupervisorFixture, Hostapd_ReadsSsidAndChannelFromConfig) {
    HostapdSupervisor hostapd(config, host, host);

    EXPECT_EQ(hostapd.configured_ssid(), "NEXTU-Hotspot");
    EXPECT_EQ(hostapd.configured_channel(), "6");
}
