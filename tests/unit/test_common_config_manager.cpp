// tests/unit/test_common_config_manager.cpp
#include <gtest/gtest.h>
#include "../../src/common/config_manager.hpp"
#include <arpa/inet.h>
#include <cstdio>
#include <fstream>

using namespace UdpRelay::Common;

class ConfigManagerTest : public ::testing::Test
{
protected:
    RelayOptions options;
    std::string error;
    std::string test_config_file;

    void SetUp() override
    {
        test_config_file = "/tmp/udp_relay_test_config.json";
        std::remove(test_config_file.c_str());

        options.listen = {"eth0@192.168.1.255", "eth1@192.168.2.255"};
        options.ports = {9999};
    }

    void TearDown() override
    {
        std::remove(test_config_file.c_str());
    }

    void createTestConfigFile(const std::string &content)
    {
        std::ofstream file(test_config_file);
        file << content;
        file.close();
    }
};

// ==================== JSON Loading Tests ====================
TEST_F(ConfigManagerTest, LoadFromJsonReplacesPresentKeys)
{
    std::string json_content = R"({
        "interfaces": ["wlan0@10.0.0.255", "eth2@172.16.0.255", "eth3@224.0.0.251"],
        "ports": [5353, 1900],
        "filter": "not host 10.0.0.1",
        "promiscuous": true,
        "timeout_ms": 100,
        "overflow_policy": "drop-newest",
        "log_level": "debug",
        "log_file": "/var/log/udp-relay.log"
    })";

    ASSERT_TRUE(ConfigManager::loadFromJson(json_content, options, error)) << error;

    ASSERT_EQ(options.listen.size(), 3u);
    EXPECT_EQ(options.listen[0], "wlan0@10.0.0.255");
    EXPECT_EQ(options.ports, std::vector<int>({5353, 1900}));
    EXPECT_EQ(options.filter, "not host 10.0.0.1");
    EXPECT_TRUE(options.promiscuous);
    EXPECT_EQ(options.timeout_ms, 100);
    EXPECT_EQ(options.overflow_policy, "drop-newest");
    EXPECT_EQ(options.logging.level, "debug");
    EXPECT_EQ(options.logging.file, "/var/log/udp-relay.log");
}

TEST_F(ConfigManagerTest, LoadFromJsonKeepsAbsentKeys)
{
    ASSERT_TRUE(ConfigManager::loadFromJson(R"({"timeout_ms": 50})", options, error)) << error;

    EXPECT_EQ(options.timeout_ms, 50);
    EXPECT_EQ(options.listen.size(), 2u);
    EXPECT_EQ(options.ports, std::vector<int>({9999}));
    EXPECT_EQ(options.overflow_policy, "drop-oldest");
}

TEST_F(ConfigManagerTest, UnknownKeysAreIgnored)
{
    EXPECT_TRUE(ConfigManager::loadFromJson(R"({"colour": "blue", "ports": [7]})", options, error)) << error;
    EXPECT_EQ(options.ports, std::vector<int>({7}));
}

TEST_F(ConfigManagerTest, MalformedJsonFails)
{
    EXPECT_FALSE(ConfigManager::loadFromJson("{ invalid json }", options, error));
    EXPECT_NE(error.find("invalid configuration"), std::string::npos);
}

TEST_F(ConfigManagerTest, WrongValueTypeFails)
{
    EXPECT_FALSE(ConfigManager::loadFromJson(R"({"ports": "9999"})", options, error));
    EXPECT_FALSE(error.empty());
}

TEST_F(ConfigManagerTest, NonObjectDocumentFails)
{
    EXPECT_FALSE(ConfigManager::loadFromJson("[1, 2, 3]", options, error));
    EXPECT_NE(error.find("object"), std::string::npos);
}

TEST_F(ConfigManagerTest, LoadFromFile)
{
    createTestConfigFile(R"({"interfaces": ["a@1.2.3.255", "b@4.5.6.255"], "ports": [1234]})");

    ASSERT_TRUE(ConfigManager::loadFromJsonFile(test_config_file, options, error)) << error;
    EXPECT_EQ(options.listen[1], "b@4.5.6.255");
    EXPECT_EQ(options.ports, std::vector<int>({1234}));
}

TEST_F(ConfigManagerTest, MissingFileFails)
{
    EXPECT_FALSE(ConfigManager::loadFromJsonFile("/tmp/udp_relay_no_such_file.json", options, error));
    EXPECT_NE(error.find("udp_relay_no_such_file.json"), std::string::npos);
}

TEST_F(ConfigManagerTest, FileErrorNamesTheFile)
{
    createTestConfigFile("{");

    EXPECT_FALSE(ConfigManager::loadFromJsonFile(test_config_file, options, error));
    EXPECT_EQ(error.find(test_config_file), 0u);
}

// ==================== Validation Tests ====================
TEST_F(ConfigManagerTest, ValidOptionsPass)
{
    EXPECT_TRUE(ConfigManager::validate(options, error)) << error;
}

TEST_F(ConfigManagerTest, SingleInterfaceIsRejected)
{
    options.listen = {"eth0@192.168.1.255"};
    EXPECT_FALSE(ConfigManager::validate(options, error));
    EXPECT_NE(error.find("at least two"), std::string::npos);
}

TEST_F(ConfigManagerTest, MissingPortsAreRejected)
{
    options.ports.clear();
    EXPECT_FALSE(ConfigManager::validate(options, error));
    EXPECT_NE(error.find("port"), std::string::npos);
}

TEST_F(ConfigManagerTest, OutOfRangePortIsRejected)
{
    options.ports = {9999, 70000};
    EXPECT_FALSE(ConfigManager::validate(options, error));
    EXPECT_NE(error.find("70000"), std::string::npos);

    options.ports = {0};
    EXPECT_FALSE(ConfigManager::validate(options, error));
}

TEST_F(ConfigManagerTest, NonPositiveTimeoutIsRejected)
{
    options.timeout_ms = 0;
    EXPECT_FALSE(ConfigManager::validate(options, error));
    EXPECT_NE(error.find("timeout"), std::string::npos);
}

TEST_F(ConfigManagerTest, UnknownPolicyAndLevelAreRejected)
{
    options.overflow_policy = "block";
    EXPECT_FALSE(ConfigManager::validate(options, error));
    EXPECT_NE(error.find("block"), std::string::npos);

    options.overflow_policy = "drop-newest";
    options.logging.level = "verbose";
    EXPECT_FALSE(ConfigManager::validate(options, error));
    EXPECT_NE(error.find("verbose"), std::string::npos);
}

// ==================== Listen Spec Tests ====================
TEST_F(ConfigManagerTest, ParseListenSpecs)
{
    std::vector<ListenSpec> specs;
    ASSERT_TRUE(ConfigManager::parseListenSpecs({"eth0@192.168.1.255", " eth1 @ 10.0.0.255"}, specs, error))
        << error;
    ASSERT_EQ(specs.size(), 2u);

    EXPECT_EQ(specs[0].interface, "eth0");
    EXPECT_EQ(specs[0].destination, "192.168.1.255");
    EXPECT_EQ(specs[0].destination_addr, inet_addr("192.168.1.255"));
    EXPECT_EQ(specs[1].interface, "eth1");
    EXPECT_EQ(specs[1].destination, "10.0.0.255");
}

TEST_F(ConfigManagerTest, MalformedListenEntries)
{
    std::vector<ListenSpec> specs;
    const std::vector<std::string> bad = {"eth0", "eth0@", "@10.0.0.255", "a@b@c", "eth0@not-an-ip", "eth0@300.1.1.1"};

    for (const auto &entry : bad)
    {
        EXPECT_FALSE(ConfigManager::parseListenSpecs({entry}, specs, error)) << entry;
        EXPECT_TRUE(specs.empty());
        EXPECT_NE(error.find(entry), std::string::npos) << error;
    }

    ConfigManager::parseListenSpecs({"eth0"}, specs, error);
    EXPECT_EQ(error, "eth0 is invalid. Expected: <interface>@<ipaddr>");
}

TEST_F(ConfigManagerTest, DuplicateInterfaceIsRejected)
{
    std::vector<ListenSpec> specs;
    EXPECT_FALSE(ConfigManager::parseListenSpecs({"eth0@192.168.1.255", "eth1@10.0.0.255", "eth0@172.16.0.255"},
                                                 specs, error));
    EXPECT_TRUE(specs.empty());
    EXPECT_EQ(error, "Can't specify the same interface (eth0) multiple times");
}

// ==================== Derived Value Tests ====================
TEST_F(ConfigManagerTest, OverflowPolicyNames)
{
    OverflowPolicy policy = OverflowPolicy::DROP_OLDEST;

    EXPECT_TRUE(ConfigManager::parseOverflowPolicy("drop-newest", policy));
    EXPECT_EQ(policy, OverflowPolicy::DROP_NEWEST);
    EXPECT_TRUE(ConfigManager::parseOverflowPolicy(" Drop-Oldest ", policy));
    EXPECT_EQ(policy, OverflowPolicy::DROP_OLDEST);
    EXPECT_FALSE(ConfigManager::parseOverflowPolicy("newest", policy));

    EXPECT_EQ(ConfigManager::overflowPolicyToString(OverflowPolicy::DROP_OLDEST), "drop-oldest");
    EXPECT_EQ(ConfigManager::overflowPolicyToString(OverflowPolicy::DROP_NEWEST), "drop-newest");
}

TEST_F(ConfigManagerTest, BuildCaptureFilter)
{
    EXPECT_EQ(ConfigManager::buildCaptureFilter({9999}, ""), "udp and (port 9999)");
    EXPECT_EQ(ConfigManager::buildCaptureFilter({9003, 9004}, ""), "udp and (port 9003 or port 9004)");
    EXPECT_EQ(ConfigManager::buildCaptureFilter({9003, 9004}, "  src net 10.0.0.0/8 "),
              "udp and (port 9003 or port 9004) and (src net 10.0.0.0/8)");
    EXPECT_EQ(ConfigManager::buildCaptureFilter({}, ""), "udp");
}
