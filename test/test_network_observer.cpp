#include <gtest/gtest.h>

#include <fstream>

#include "mocks.hpp"
#include "network/network_observer.hpp"

using models::NetworkTransport;

class SysfsNetworkObserverTest : public ::testing::Test
{
protected:
    void addInterface(const std::string &name, const std::string &operstate, bool wireless = false)
    {
        fs::create_directories(fs::path(dir_.path()) / name);
        std::ofstream(dir_.file(name + "/operstate")) << operstate << "\n";
        if (wireless)
            fs::create_directories(fs::path(dir_.path()) / name / "wireless");
    }

    testing_support::TempDir dir_;
};

TEST_F(SysfsNetworkObserverTest, LoopbackOnlyIsOffline)
{
    addInterface("lo", "unknown");
    network::SysfsNetworkObserver observer(dir_.path());
    auto state = observer.getCurrentState();
    EXPECT_FALSE(state.connected);
    EXPECT_EQ(state.transport, NetworkTransport::None);
}

TEST_F(SysfsNetworkObserverTest, InterfaceMustBeUp)
{
    addInterface("lo", "unknown");
    addInterface("eth0", "down");
    network::SysfsNetworkObserver observer(dir_.path());
    EXPECT_FALSE(observer.getCurrentState().connected);

    addInterface("eth0", "up");
    auto state = observer.getCurrentState();
    EXPECT_TRUE(state.connected);
    EXPECT_EQ(state.transport, NetworkTransport::Ethernet);
}

TEST_F(SysfsNetworkObserverTest, WifiPreferredOverOtherLinks)
{
    addInterface("eth0", "up");
    addInterface("wwan0", "up");
    addInterface("phy0", "up", true);
    network::SysfsNetworkObserver observer(dir_.path());
    auto state = observer.getCurrentState();
    EXPECT_TRUE(state.connected);
    EXPECT_EQ(state.transport, NetworkTransport::Wifi);
}

TEST_F(SysfsNetworkObserverTest, MissingSysfsRootIsOffline)
{
    network::SysfsNetworkObserver observer(dir_.file("nope"));
    EXPECT_FALSE(observer.getCurrentState().connected);
}

TEST(NetworkClassifyTest, InterfaceNames)
{
    using network::SysfsNetworkObserver;
    EXPECT_EQ(SysfsNetworkObserver::classifyInterface("lo", false), NetworkTransport::None);
    EXPECT_EQ(SysfsNetworkObserver::classifyInterface("wlp3s0", false), NetworkTransport::Wifi);
    EXPECT_EQ(SysfsNetworkObserver::classifyInterface("rmnet_data0", false), NetworkTransport::Cellular);
    EXPECT_EQ(SysfsNetworkObserver::classifyInterface("ppp0", false), NetworkTransport::Cellular);
    EXPECT_EQ(SysfsNetworkObserver::classifyInterface("enp0s31f6", false), NetworkTransport::Ethernet);
}
