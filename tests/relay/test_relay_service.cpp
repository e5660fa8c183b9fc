// tests/relay/test_relay_service.cpp
#include <gtest/gtest.h>
#include "../../src/core/relay/relay_service.hpp"
#include "../common/fake_io.hpp"
#include "../common/test_frames.hpp"
#include <chrono>
#include <map>
#include <thread>

using namespace UdpRelay::Relay;
using namespace UdpRelay::Testing;
using UdpRelay::Common::OverflowPolicy;
using UdpRelay::Common::RelayOptions;

class RelayServiceTest : public ::testing::Test
{
protected:
    struct LegHandles
    {
        FakeCapture *capture;
        FakeSender *sender;
    };

    std::map<std::string, LegHandles> legs;
    std::vector<std::string> opened;
    std::string fail_on;

    std::unique_ptr<RelayService> makeService()
    {
        RelayService::EndpointFactory factory =
            [this](const EndpointConfig &config, InterfaceRegistry &, std::unique_ptr<Endpoint> &endpoint) {
                opened.push_back(config.interface);
                if (config.interface == fail_on)
                {
                    return RelayStatus(RelayError::NO_IPV4_ADDRESS,
                                       "Interface " + config.interface + " has no IPv4 address");
                }

                FakeLeg leg = makeFakeLeg(config);
                legs[config.interface] = LegHandles{leg.capture, leg.sender};
                endpoint = std::move(leg.endpoint);
                return RelayStatus();
            };

        auto registry = std::make_unique<InterfaceRegistry>(
            [](std::vector<InterfaceEntry> &, std::string &) { return true; });
        return std::make_unique<RelayService>(std::move(registry), factory);
    }

    static std::vector<EndpointConfig> configsFor(const std::vector<std::string> &names)
    {
        std::vector<EndpointConfig> configs;
        int subnet = 1;
        for (const auto &name : names)
        {
            std::string destination = "192.168." + std::to_string(subnet++) + ".255";
            configs.push_back(legConfig(name, destination, ip(destination)));
        }
        return configs;
    }

    template <typename Predicate>
    static bool waitFor(Predicate predicate)
    {
        for (int i = 0; i < 400; ++i)
        {
            if (predicate())
            {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return predicate();
    }
};

// ==================== Startup ====================

TEST_F(RelayServiceTest, OpensAndRegistersOneEndpointPerLeg)
{
    auto service = makeService();
    RelayStatus status = service->open(configsFor({"eth0", "eth1", "eth2"}));

    ASSERT_TRUE(status.ok()) << status.message;
    EXPECT_EQ(service->endpointCount(), 3u);
    EXPECT_EQ(service->distributor().targetCount(), 3u);
    EXPECT_NE(service->findEndpoint("eth1"), nullptr);
    EXPECT_EQ(service->findEndpoint("eth9"), nullptr);
}

TEST_F(RelayServiceTest, DuplicateInterfaceCreatesNoEndpoints)
{
    auto service = makeService();
    RelayStatus status = service->open(configsFor({"eth0", "eth1", "eth0"}));

    EXPECT_EQ(status.error, RelayError::DUPLICATE_INTERFACE);
    EXPECT_NE(status.message.find("eth0"), std::string::npos);
    EXPECT_TRUE(opened.empty());
    EXPECT_EQ(service->endpointCount(), 0u);
    EXPECT_EQ(service->distributor().targetCount(), 0u);
}

TEST_F(RelayServiceTest, SetupFailureReleasesEveryLeg)
{
    fail_on = "eth1";
    auto service = makeService();
    RelayStatus status = service->open(configsFor({"eth0", "eth1", "eth2"}));

    EXPECT_EQ(status.error, RelayError::NO_IPV4_ADDRESS);
    EXPECT_EQ(opened.size(), 2u);
    EXPECT_EQ(service->endpointCount(), 0u);
    EXPECT_EQ(service->distributor().targetCount(), 0u);
    EXPECT_FALSE(service->start());
}

TEST_F(RelayServiceTest, BuildsEndpointConfigsFromOptions)
{
    RelayOptions options;
    options.listen = {"eth0@192.168.1.255", "eth1@192.168.2.255"};
    options.ports = {9003, 9004};
    options.filter = "not host 10.0.0.1";
    options.promiscuous = true;
    options.timeout_ms = 500;
    options.overflow_policy = "drop-newest";

    std::vector<EndpointConfig> configs;
    std::string error;
    ASSERT_TRUE(RelayService::buildEndpointConfigs(options, configs, error)) << error;
    ASSERT_EQ(configs.size(), 2u);

    EXPECT_EQ(configs[0].interface, "eth0");
    EXPECT_EQ(configs[0].destination, "192.168.1.255");
    EXPECT_EQ(configs[0].destination_addr, ip("192.168.1.255"));
    EXPECT_EQ(configs[1].interface, "eth1");
    EXPECT_EQ(configs[1].destination_addr, ip("192.168.2.255"));

    for (const auto &config : configs)
    {
        EXPECT_EQ(config.bpf_filter, "udp and (port 9003 or port 9004) and (not host 10.0.0.1)");
        EXPECT_EQ(config.ports, options.ports);
        EXPECT_TRUE(config.promiscuous);
        EXPECT_EQ(config.timeout_ms, 500);
        EXPECT_EQ(config.overflow_policy, OverflowPolicy::DROP_NEWEST);
    }
}

TEST_F(RelayServiceTest, MalformedLegIsRejectedBeforeOpening)
{
    RelayOptions options;
    options.listen = {"eth0", "eth1@192.168.2.255"};
    options.ports = {9999};

    std::vector<EndpointConfig> configs;
    std::string error;
    EXPECT_FALSE(RelayService::buildEndpointConfigs(options, configs, error));
    EXPECT_TRUE(configs.empty());
    EXPECT_NE(error.find("eth0"), std::string::npos);
}

// ==================== Steady state ====================

TEST_F(RelayServiceTest, RelaysAcrossRunningLoops)
{
    auto service = makeService();
    ASSERT_TRUE(service->open(configsFor({"eth0", "eth1", "eth2"})).ok());
    ASSERT_TRUE(service->start());
    EXPECT_TRUE(service->distributor().isSealed());

    legs["eth0"].capture->inject(buildFrame(FrameSpec()));

    EXPECT_TRUE(waitFor([this]() {
        return legs["eth1"].sender->sent().size() == 1 && legs["eth2"].sender->sent().size() == 1;
    }));

    service->stop();
    EXPECT_FALSE(service->isRunning());
    EXPECT_FALSE(service->hasFailed());

    EXPECT_TRUE(legs["eth0"].sender->sent().empty());
    EXPECT_EQ(legs["eth1"].sender->sent()[0].destination(), ip("192.168.2.255"));
    EXPECT_EQ(legs["eth2"].sender->sent()[0].destination(), ip("192.168.3.255"));

    service->logSummary();
}

TEST_F(RelayServiceTest, LostCaptureStopsTheService)
{
    auto service = makeService();
    ASSERT_TRUE(service->open(configsFor({"eth0", "eth1"})).ok());
    ASSERT_TRUE(service->start());

    legs["eth1"].capture->loseHandle();

    EXPECT_TRUE(waitFor([&service]() { return !service->isRunning(); }));
    service->stop();

    EXPECT_TRUE(service->hasFailed());
    RelayStatus failure = service->failure();
    EXPECT_EQ(failure.error, RelayError::CAPTURE_LOST);
    EXPECT_NE(failure.message.find("eth1"), std::string::npos);
}

TEST_F(RelayServiceTest, StartTwiceIsRejected)
{
    auto service = makeService();
    ASSERT_TRUE(service->open(configsFor({"eth0", "eth1"})).ok());
    ASSERT_TRUE(service->start());
    EXPECT_FALSE(service->start());
    service->stop();
}
