#include <gtest/gtest.h>

#include "manager/annotations.hpp"
#include "fakes.hpp"

using namespace std::chrono_literals;

namespace {

std::map<std::string, std::string> complete() {
    return {
        {"vip.io/node-asn", "64512"},
        {"vip.io/src-ip", "10.0.0.9"},
        {"vip.io/peer-ip", "10.0.0.1,10.0.0.2"},
        {"vip.io/peer-asn", "64513"},
        {"vip.io/bgp-pass", "s3cret"},
    };
}

} // namespace

TEST(BgpAnnotations, CompleteSetOverridesBase) {
    BgpConfig bgp;
    bgp.GobgpPath = "/usr/local/bin/gobgp";
    ASSERT_TRUE(parse_bgp_annotations(complete(), "vip.io", bgp));

    EXPECT_EQ(bgp.AS, 64512u);
    EXPECT_EQ(bgp.SourceIP, "10.0.0.9");
    EXPECT_EQ(bgp.RouterID, "10.0.0.9");
    EXPECT_EQ(bgp.GobgpPath, "/usr/local/bin/gobgp");
    ASSERT_EQ(bgp.Peers.size(), 2u);
    EXPECT_EQ(bgp.Peers[0].Address, "10.0.0.1");
    EXPECT_EQ(bgp.Peers[0].AS, 64513u);
    EXPECT_EQ(bgp.Peers[0].Password, "s3cret");
}

TEST(BgpAnnotations, MissingKeyLeavesConfigUntouched) {
    auto a = complete();
    a.erase("vip.io/peer-asn");
    BgpConfig bgp;
    bgp.AS = 65000;
    EXPECT_FALSE(parse_bgp_annotations(a, "vip.io", bgp));
    EXPECT_EQ(bgp.AS, 65000u);
    EXPECT_TRUE(bgp.Peers.empty());

    auto blank = complete();
    blank["vip.io/peer-ip"] = " , ";
    EXPECT_FALSE(parse_bgp_annotations(blank, "vip.io", bgp));
}

TEST(BgpAnnotations, WrongPrefixIsIgnored) {
    BgpConfig bgp;
    EXPECT_FALSE(parse_bgp_annotations(complete(), "other.io", bgp));
}

TEST(BgpAnnotations, BadAsnThrows) {
    auto a = complete();
    a["vip.io/node-asn"] = "64512x";
    BgpConfig bgp;
    EXPECT_THROW(parse_bgp_annotations(a, "vip.io", bgp), std::runtime_error);

    a["vip.io/node-asn"] = "99999999999";
    EXPECT_THROW(parse_bgp_annotations(a, "vip.io", bgp), std::runtime_error);
}

TEST(BgpAnnotations, WaitPollsUntilComplete) {
    fakes::FakeClusterApi client;
    auto partial = complete();
    partial.erase("vip.io/src-ip");
    client.annotations = partial;

    StopSource stop;
    std::optional<BgpConfig> result;
    std::thread t([&] {
        result = wait_for_bgp_annotations(&client, "node-a", "vip.io", BgpConfig{}, stop.token(), 10ms);
    });
    // 注解不全时持续轮询，直到被停止
    EXPECT_TRUE(fakes::eventually([&] { return client.annotation_reads.load() >= 3; }));
    stop.request_stop();
    t.join();
    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(client.last_node, "node-a");
}

TEST(BgpAnnotations, WaitReturnsImmediatelyWhenPresent) {
    fakes::FakeClusterApi client;
    client.annotations = complete();
    StopSource stop;
    auto bgp = wait_for_bgp_annotations(&client, "node-a", "vip.io", BgpConfig{}, stop.token(), 10ms);
    ASSERT_TRUE(bgp.has_value());
    EXPECT_EQ(bgp->Peers.size(), 2u);
    EXPECT_EQ(client.annotation_reads.load(), 1);
}

TEST(BgpAnnotations, WaitPropagatesReadErrors) {
    fakes::FakeClusterApi client;
    client.annotation_error = "forbidden";
    StopSource stop;
    EXPECT_THROW(wait_for_bgp_annotations(&client, "node-a", "vip.io", BgpConfig{}, stop.token(), 10ms),
                 std::runtime_error);
    EXPECT_THROW(wait_for_bgp_annotations(nullptr, "node-a", "vip.io", BgpConfig{}, stop.token(), 10ms),
                 std::runtime_error);
}
