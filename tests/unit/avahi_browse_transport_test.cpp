/**
 * avahi_browse_transport_test.cpp - BrowseProcess and AvahiBrowseTransport
 *
 * Small shell scripts stand in for avahi-browse so the real spawn, pipe
 * and exit paths run without avahi-daemon.
 */

#include "discovery/avahi_browse_transport.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "discovery/browse_process.hpp"

using namespace ascot;
using namespace ascot::discovery;

namespace {

class BrowseScriptTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("ascot_browse_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override { std::filesystem::remove_all(dir_); }

    std::string write_script(const std::string &body) {
        auto path = dir_ / "browse.sh";
        {
            std::ofstream out(path);
            out << "#!/bin/sh\n" << body;
        }
        std::filesystem::permissions(path,
                                     std::filesystem::perms::owner_exec | std::filesystem::perms::owner_read |
                                         std::filesystem::perms::owner_write,
                                     std::filesystem::perm_options::add);
        return path.string();
    }

    std::filesystem::path dir_;
};

using BrowseProcessTest = BrowseScriptTest;
using AvahiBrowseTransportTest = BrowseScriptTest;

TEST_F(BrowseProcessTest, MissingExecutableFailsSpawn) {
    BrowseProcess process({(dir_ / "no-such-browser").string()});
    EXPECT_FALSE(process.spawn());
    EXPECT_NE(std::string::npos, process.last_error().find("Failed to execute"));
    EXPECT_FALSE(process.is_running());
}

TEST_F(BrowseProcessTest, EmptyCommandFailsSpawn) {
    BrowseProcess process(std::vector<std::string>{});
    EXPECT_FALSE(process.spawn());
    EXPECT_EQ("Empty browse command", process.last_error());
}

TEST_F(BrowseProcessTest, ReadsLinesThenReportsExit) {
    BrowseProcess process({write_script("echo first\nprintf 'second\\r\\n'\nprintf 'partial'\n")});
    ASSERT_TRUE(process.spawn()) << process.last_error();
    EXPECT_GT(process.pid(), 0);

    std::string line;
    ASSERT_EQ(BrowseProcess::ReadResult::LINE, process.read_line(line, 2000));
    EXPECT_EQ("first", line);
    ASSERT_EQ(BrowseProcess::ReadResult::LINE, process.read_line(line, 2000));
    EXPECT_EQ("second", line);
    ASSERT_EQ(BrowseProcess::ReadResult::LINE, process.read_line(line, 2000));
    EXPECT_EQ("partial", line);
    EXPECT_EQ(BrowseProcess::ReadResult::CLOSED, process.read_line(line, 2000));
    EXPECT_FALSE(process.last_error().empty());
}

TEST_F(BrowseProcessTest, QuietProcessTimesOut) {
    BrowseProcess process({write_script("exec sleep 5\n")});
    ASSERT_TRUE(process.spawn()) << process.last_error();

    std::string line;
    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(BrowseProcess::ReadResult::TIMEOUT, process.read_line(line, 50));
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(40));
    EXPECT_TRUE(process.is_running());

    process.shutdown();
    EXPECT_FALSE(process.is_running());
}

TEST_F(BrowseProcessTest, OverlongLineIsAnError) {
    BrowseProcess process({write_script("head -c 70000 /dev/zero | tr '\\000' 'a'\nexec sleep 5\n")});
    ASSERT_TRUE(process.spawn()) << process.last_error();

    std::string line;
    EXPECT_EQ(BrowseProcess::ReadResult::ERROR, process.read_line(line, 2000));
    EXPECT_NE(std::string::npos, process.last_error().find("exceeds"));
}

TEST_F(BrowseProcessTest, ShutdownKillsProcessIgnoringTerm) {
    BrowseProcess process({write_script("trap '' TERM\nwhile true; do sleep 0.1; done\n")});
    ASSERT_TRUE(process.spawn()) << process.last_error();

    process.shutdown();
    EXPECT_FALSE(process.is_running());
    process.shutdown();
}

TEST_F(AvahiBrowseTransportTest, ParsesRecordsSkipsNoiseAndFailsOnExit) {
    // $4 is the service type the transport passes last
    DiscoveryConfig config;
    config.browse_command = write_script(
        "echo \"Browsing for $4\"\n"
        "echo \"+;eth0;IPv4;lamp;$4;local\"\n"
        "echo \"=;eth0;IPv4;lamp;$4;local;lamp.local;10.0.0.4;8080;\\\"path=/m\\\"\"\n");

    AvahiBrowseTransport transport(config);
    ASSERT_TRUE(transport.start()) << transport.last_error();
    EXPECT_TRUE(transport.is_running());

    BrowseRecord record;
    ASSERT_EQ(IDiscoveryTransport::PollResult::RECORD, transport.poll(record, 2000));
    EXPECT_EQ(BrowseRecord::Kind::ADDED, record.kind);
    EXPECT_EQ("lamp", record.service_name);
    EXPECT_EQ(config.service_type, record.service_type);

    ASSERT_EQ(IDiscoveryTransport::PollResult::RECORD, transport.poll(record, 2000));
    EXPECT_EQ(BrowseRecord::Kind::RESOLVED, record.kind);
    EXPECT_EQ("10.0.0.4", record.address);
    EXPECT_EQ(8080, record.port);
    EXPECT_EQ("/m", record.txt["path"]);

    EXPECT_EQ(IDiscoveryTransport::PollResult::FAILED, transport.poll(record, 2000));
    EXPECT_FALSE(transport.last_error().empty());

    transport.stop();
    EXPECT_FALSE(transport.is_running());
}

TEST_F(AvahiBrowseTransportTest, QuietBrowseTimesOut) {
    DiscoveryConfig config;
    config.browse_command = write_script("exec sleep 5\n");

    AvahiBrowseTransport transport(config);
    ASSERT_TRUE(transport.start()) << transport.last_error();

    BrowseRecord record;
    EXPECT_EQ(IDiscoveryTransport::PollResult::TIMEOUT, transport.poll(record, 50));
}

TEST_F(AvahiBrowseTransportTest, MissingBrowserFailsStart) {
    DiscoveryConfig config;
    config.browse_command = (dir_ / "avahi-browse-missing").string();

    AvahiBrowseTransport transport(config);
    EXPECT_FALSE(transport.start());
    EXPECT_NE(std::string::npos, transport.last_error().find("Failed to execute"));
    EXPECT_FALSE(transport.is_running());
}

TEST_F(AvahiBrowseTransportTest, PollBeforeStartFails) {
    AvahiBrowseTransport transport(DiscoveryConfig{});
    BrowseRecord record;
    EXPECT_EQ(IDiscoveryTransport::PollResult::FAILED, transport.poll(record, 10));
    EXPECT_EQ("Transport not started", transport.last_error());
}

}  // namespace
