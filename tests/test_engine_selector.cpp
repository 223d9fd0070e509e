#include <gtest/gtest.h>

#include <filesystem>
#include <unistd.h>

#include "engine/engine.hpp"
#include "engine/engine_factory.hpp"
#include "fakes.hpp"

TEST(EngineSelector, NoFlagsSelectsNothing) {
    VipConfig c;
    EXPECT_FALSE(select_engine(c).has_value());
}

TEST(EngineSelector, SingleFlagSelectsThatEngine) {
    {
        VipConfig c;
        c.EnableBGP = true;
        EXPECT_EQ(select_engine(c), EngineKind::Bgp);
    }
    {
        VipConfig c;
        c.EnableARP = true;
        EXPECT_EQ(select_engine(c), EngineKind::Arp);
    }
    {
        VipConfig c;
        c.EnableWireguard = true;
        EXPECT_EQ(select_engine(c), EngineKind::Wireguard);
    }
    {
        VipConfig c;
        c.EnableRoutingTable = true;
        EXPECT_EQ(select_engine(c), EngineKind::RoutingTable);
    }
}

TEST(EngineSelector, PriorityOrderWhenSeveralFlagsSet) {
    VipConfig c;
    c.EnableRoutingTable = true;
    c.EnableWireguard    = true;
    EXPECT_EQ(select_engine(c), EngineKind::Wireguard);
    c.EnableARP = true;
    EXPECT_EQ(select_engine(c), EngineKind::Arp);
    c.EnableBGP = true;
    EXPECT_EQ(select_engine(c), EngineKind::Bgp);
}

TEST(EngineSelector, Names) {
    EXPECT_STREQ(engine_name(EngineKind::Bgp), "bgp");
    EXPECT_STREQ(engine_name(EngineKind::Arp), "arp");
    EXPECT_STREQ(engine_name(EngineKind::Wireguard), "wireguard");
    EXPECT_STREQ(engine_name(EngineKind::RoutingTable), "routing_table");
}

/*---------------- 引擎与租约后端构造 ----------------*/
namespace {

struct FactoryRig {
    VipConfig                          config;
    fakes::FakeClusterApi              client;
    InstanceRegistry                   registry;
    Metrics                            metrics;
    std::shared_ptr<fakes::FakeRunner> runner = std::make_shared<fakes::FakeRunner>();

    EngineContext context(const std::string& ns) {
        return EngineContext{config, &client, registry, metrics, runner, ns};
    }
};

LeaseRecord holder(const std::string& who) {
    LeaseRecord r;
    r.HolderIdentity       = who;
    r.LeaseDurationSeconds = 5;
    return r;
}

} // namespace

TEST(EngineFactory, KubernetesLeasesLiveInLeaseNamespace) {
    FactoryRig rig;
    auto ctx   = rig.context("vip-system");
    auto locks = make_lock_factory(ctx);

    auto lock = locks("plndr-svcs-lock-web");
    ASSERT_TRUE(lock->create(holder("node-a")));
    EXPECT_EQ(rig.client.lease_names(), std::vector<std::string>{"vip-system/plndr-svcs-lock-web"});
}

TEST(EngineFactory, FileLeasesLiveInLeaseDir) {
    FactoryRig rig;
    const auto dir = std::filesystem::temp_directory_path() /
                     ("vipkeeper-factory-" + std::to_string(::getpid()));
    rig.config.LeaderElectionType = VIPKEEPER_LEADER_ELECTION_FILE;
    rig.config.LeaseDir           = dir.string();
    auto ctx = rig.context("unused");

    auto lock = make_lock_factory(ctx)("plndr-svcs-lock-web");
    EXPECT_TRUE(lock->create(holder("node-a")));
    EXPECT_TRUE(std::filesystem::exists(dir / "plndr-svcs-lock-web.json"));
    lock.reset();
    std::filesystem::remove_all(dir);
}

TEST(EngineFactory, EtcdCannotServePerServiceLeases) {
    FactoryRig rig;
    rig.config.LeaderElectionType = VIPKEEPER_LEADER_ELECTION_ETCD;
    auto ctx   = rig.context("kube-system");
    auto locks = make_lock_factory(ctx);
    EXPECT_THROW(locks("plndr-svcs-lock-web"), std::runtime_error);
}

TEST(EngineFactory, ElectionTimingFromConfig) {
    VipConfig c;
    c.NodeName      = "node-a";
    c.LeaseDuration = 15;
    c.RenewDeadline = 10;
    c.RetryPeriod   = 2;
    auto opt = election_options(c);
    EXPECT_EQ(opt.identity, "node-a");
    EXPECT_EQ(opt.lease_duration, std::chrono::seconds(15));
    EXPECT_EQ(opt.renew_deadline, std::chrono::seconds(10));
    EXPECT_EQ(opt.retry_period, std::chrono::seconds(2));
}

TEST(EngineFactory, BuildsEveryEngineKind) {
    FactoryRig rig;
    rig.config.Interface = "eth0";
    auto ctx = rig.context("kube-system");
    for (auto kind : {EngineKind::Bgp, EngineKind::Arp, EngineKind::Wireguard, EngineKind::RoutingTable}) {
        auto engine = make_default_engine(kind, ctx);
        ASSERT_NE(engine, nullptr);
        EXPECT_EQ(engine->name(), engine_name(kind));
    }
}
