#include <gtest/gtest.h>

#include "mirror/traffic_mirror.hpp"
#include "fakes.hpp"

TEST(TrafficMirror, DisabledWithoutDestination) {
    auto runner = std::make_shared<fakes::FakeRunner>();
    TrafficMirror m(runner, "eth0", "");
    EXPECT_FALSE(m.enabled());
    m.start();
    EXPECT_TRUE(m.stop());
    EXPECT_TRUE(runner->commands().empty());
}

TEST(TrafficMirror, StartThenStopIsNetNoOp) {
    auto runner = std::make_shared<fakes::FakeRunner>();
    TrafficMirror m(runner, "eth0", "mirror0");

    const auto before = runner->qdiscs();
    m.start();
    EXPECT_EQ(runner->qdiscs(), (std::set<std::string>{"eth0:ingress", "eth0:root"}));
    EXPECT_TRUE(runner->ran(
        "tc filter add dev eth0 parent ffff: protocol all u32 match u32 0 0 action mirred egress mirror dev mirror0"));

    EXPECT_TRUE(m.stop());
    EXPECT_EQ(runner->qdiscs(), before);

    // 再来一轮结果相同
    m.start();
    EXPECT_TRUE(m.stop());
    EXPECT_EQ(runner->qdiscs(), before);
}

TEST(TrafficMirror, StartFailureRollsBack) {
    auto runner = std::make_shared<fakes::FakeRunner>();
    runner->fail_on.push_back("handle 1: root");
    TrafficMirror m(runner, "eth0", "mirror0");

    EXPECT_THROW(m.start(), std::runtime_error);
    EXPECT_TRUE(runner->qdiscs().empty());
}

TEST(TrafficMirror, StopWithoutStartReportsFailure) {
    auto runner = std::make_shared<fakes::FakeRunner>();
    TrafficMirror m(runner, "eth0", "mirror0");
    EXPECT_FALSE(m.stop());
}
