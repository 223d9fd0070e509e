#include <gtest/gtest.h>

#include "engine/advertiser.hpp"
#include "fakes.hpp"

namespace {

// 按命令前缀返回预设结果，其余成功
class ScriptedRunner : public ProcessRunner {
public:
    Result run(const Options& opt) override {
        const std::string cmd = describe(opt);
        commands.push_back(cmd);
        for (const auto& [prefix, res] : script) {
            if (cmd.rfind(prefix, 0) == 0) return res;
        }
        return {0, ""};
    }

    std::vector<std::pair<std::string, Result>> script;
    std::vector<std::string>                    commands;
};

Instance svc(const std::string& vip) {
    Instance i;
    i.UID       = "uid-1";
    i.Name      = "web";
    i.Namespace = "default";
    i.VIP       = vip;
    return i;
}

} // namespace

TEST(Advertiser, CidrForBothFamilies) {
    EXPECT_EQ(vip_cidr("10.0.0.5"), "10.0.0.5/32");
    EXPECT_EQ(vip_cidr("fd00::5"), "fd00::5/128");
    EXPECT_TRUE(is_ipv6("fd00::5"));
    EXPECT_FALSE(is_ipv6("10.0.0.5"));
}

TEST(Advertiser, ArpAddsAddressAndAnnounces) {
    auto runner = std::make_shared<ScriptedRunner>();
    ArpAdvertiser arp(runner, "eth0");
    auto i = svc("10.0.0.5");
    arp.advertise(i);

    ASSERT_EQ(runner->commands.size(), 2u);
    EXPECT_EQ(runner->commands[0], "ip addr add 10.0.0.5/32 dev eth0");
    EXPECT_EQ(runner->commands[1], "arping -U -c 3 -I eth0 10.0.0.5");
    EXPECT_EQ(i.Interface, "eth0");
    ASSERT_NE(std::any_cast<std::string>(&i.EngineState), nullptr);
    EXPECT_EQ(std::any_cast<std::string>(i.EngineState), "10.0.0.5/32");

    EXPECT_TRUE(arp.withdraw(i));
    EXPECT_EQ(runner->commands.back(), "ip addr del 10.0.0.5/32 dev eth0");
}

TEST(Advertiser, ArpSkipsArpingForIpv6AndToleratesArpingFailure) {
    auto runner = std::make_shared<ScriptedRunner>();
    runner->script.push_back({"arping", {2, "arping: socket: Operation not permitted"}});
    ArpAdvertiser arp(runner, "eth0");

    auto v6 = svc("fd00::5");
    arp.advertise(v6);
    EXPECT_EQ(runner->commands.back(), "ip addr add fd00::5/128 dev eth0");

    auto v4 = svc("10.0.0.5");
    EXPECT_NO_THROW(arp.advertise(v4));
}

TEST(Advertiser, ExistingAddressIsNotAnError) {
    auto runner = std::make_shared<ScriptedRunner>();
    runner->script.push_back({"ip addr add", {2, "RTNETLINK answers: File exists"}});
    runner->script.push_back({"ip addr del", {2, "RTNETLINK answers: Cannot assign requested address"}});
    ArpAdvertiser arp(runner, "eth0");
    auto i = svc("10.0.0.5");
    EXPECT_NO_THROW(arp.advertise(i));
    EXPECT_TRUE(arp.withdraw(i));
}

TEST(Advertiser, AddressFailuresSurface) {
    auto runner = std::make_shared<ScriptedRunner>();
    runner->script.push_back({"ip addr add", {2, "Cannot find device \"eth9\""}});
    runner->script.push_back({"ip addr del", {2, "Operation not permitted"}});
    ArpAdvertiser arp(runner, "eth9");
    auto i = svc("10.0.0.5");
    EXPECT_THROW(arp.advertise(i), std::runtime_error);
    EXPECT_FALSE(arp.withdraw(i));

    ArpAdvertiser no_iface(runner, "");
    EXPECT_THROW(no_iface.advertise(i), std::runtime_error);
}

TEST(Advertiser, WireguardRequiresTunnelInterface) {
    auto runner = std::make_shared<ScriptedRunner>();
    runner->script.push_back({"ip link show wg0", {1, "Device \"wg0\" does not exist."}});
    WireguardAdvertiser wg(runner, "wg0");
    EXPECT_THROW(wg.prepare(EngineParams{}), std::runtime_error);

    WireguardAdvertiser wg1(runner, "wg1");
    EXPECT_NO_THROW(wg1.prepare(EngineParams{}));
    auto i = svc("10.0.0.5");
    wg1.advertise(i);
    EXPECT_EQ(runner->commands.back(), "ip addr add 10.0.0.5/32 dev wg1");
}

TEST(Advertiser, RoutingTableEntries) {
    auto runner = std::make_shared<ScriptedRunner>();
    RoutingTableAdvertiser rt(runner, "eth0", 198, 248);

    auto v4 = svc("10.0.0.5");
    rt.advertise(v4);
    EXPECT_EQ(runner->commands.back(), "ip route replace 10.0.0.5/32 dev eth0 table 198 proto 248");
    EXPECT_TRUE(rt.withdraw(v4));
    EXPECT_EQ(runner->commands.back(), "ip route del 10.0.0.5/32 dev eth0 table 198 proto 248");

    auto v6 = svc("fd00::5");
    rt.advertise(v6);
    EXPECT_EQ(runner->commands.back(), "ip -6 route replace fd00::5/128 dev eth0 table 198 proto 248");

    runner->script.push_back({"ip route replace", {2, "RTNETLINK answers: Network is unreachable"}});
    EXPECT_THROW(rt.advertise(v4), std::runtime_error);
}

TEST(Advertiser, BgpLifecycle) {
    auto runner = std::make_shared<ScriptedRunner>();
    BgpAdvertiser bgp(runner);
    EngineParams params;
    params.Bgp.SourceIP = "10.0.0.2";
    params.Bgp.AS       = 64512;
    params.Bgp.Peers    = {{"10.0.0.1", 64513, "secret"}};

    bgp.prepare(params);
    EXPECT_EQ(runner->commands.at(0), "gobgp global as 64512 router-id 10.0.0.2");
    EXPECT_EQ(runner->commands.at(1), "gobgp neighbor add 10.0.0.1 as 64513");

    auto i = svc("fd00::5");
    bgp.advertise(i);
    EXPECT_EQ(runner->commands.back(), "gobgp global rib add fd00::5/128 -a ipv6");
    EXPECT_TRUE(bgp.withdraw(i));
    EXPECT_EQ(runner->commands.back(), "gobgp global rib del fd00::5/128 -a ipv6");

    bgp.cleanup();
    EXPECT_EQ(runner->commands.back(), "gobgp neighbor del 10.0.0.1");
}

TEST(Advertiser, BgpPrepareNeedsRouterIdentity) {
    auto runner = std::make_shared<ScriptedRunner>();
    BgpAdvertiser bgp(runner);
    EXPECT_THROW(bgp.prepare(EngineParams{}), std::runtime_error);
    EXPECT_TRUE(runner->commands.empty());

    EngineParams params;
    params.Bgp.RouterID  = "10.0.0.2";
    params.Bgp.GobgpPath = "/opt/gobgp/gobgp";
    params.Bgp.Peers     = {{"10.0.0.1", 64513, ""}};
    runner->script.push_back({"/opt/gobgp/gobgp neighbor add", {1, "connection refused"}});
    EXPECT_THROW(bgp.prepare(params), std::runtime_error);
    EXPECT_EQ(runner->commands.front(), "/opt/gobgp/gobgp global as 65000 router-id 10.0.0.2");
}

TEST(Advertiser, NullRunnerIsRejected) {
    EXPECT_THROW(ArpAdvertiser(nullptr, "eth0"), std::invalid_argument);
    EXPECT_THROW(BgpAdvertiser(nullptr), std::invalid_argument);
    EXPECT_THROW(RoutingTableAdvertiser(nullptr, "eth0", 1, 1), std::invalid_argument);
}
