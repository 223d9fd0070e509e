#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "election/leader_elector.hpp"
#include "fakes.hpp"

using namespace std::chrono_literals;
using fakes::MemoryLeaseLock;
using fakes::MemoryLeaseStore;

namespace {

LeaderElector::Options opts(const std::string& id) {
    LeaderElector::Options o;
    o.identity       = id;
    o.lease_duration = 2s;
    o.renew_deadline = 1s;
    o.retry_period   = 1s;
    return o;
}

std::unique_ptr<LeaseLock> lock_on(const std::shared_ptr<MemoryLeaseStore>& store) {
    return std::make_unique<MemoryLeaseLock>(store);
}

} // namespace

TEST(LeaderElector, RejectsBadOptions) {
    auto store = std::make_shared<MemoryLeaseStore>();
    EXPECT_THROW({ LeaderElector e(nullptr, opts("a")); }, std::invalid_argument);
    EXPECT_THROW({ LeaderElector e(lock_on(store), opts("")); }, std::invalid_argument);

    auto o = opts("a");
    o.renew_deadline = o.lease_duration;
    EXPECT_THROW({ LeaderElector e(lock_on(store), o); }, std::invalid_argument);
}

TEST(LeaderElector, AcquiresThenReleasesOnStop) {
    auto store = std::make_shared<MemoryLeaseStore>();
    LeaderElector a(lock_on(store), opts("node-a"));
    std::atomic<int> started{0};
    std::atomic<int> stopped{0};
    a.set_become_leader_callback([&] { ++started; });
    a.set_lose_leader_callback([&] { ++stopped; });

    StopSource stop;
    std::thread t([&] { EXPECT_TRUE(a.run_once(stop.token())); });
    ASSERT_TRUE(fakes::eventually([&] { return started.load() == 1; }));
    EXPECT_EQ(store->snapshot()->HolderIdentity, "node-a");

    stop.request_stop();
    t.join();
    EXPECT_EQ(stopped.load(), 1);
    EXPECT_FALSE(a.is_leader());
    ASSERT_TRUE(store->snapshot().has_value());
    EXPECT_TRUE(store->snapshot()->HolderIdentity.empty());
}

TEST(LeaderElector, OnlyOneHolderAtATime) {
    auto store = std::make_shared<MemoryLeaseStore>();
    LeaderElector a(lock_on(store), opts("node-a"));
    LeaderElector b(lock_on(store), opts("node-b"));

    EXPECT_TRUE(a.try_acquire_or_renew());
    EXPECT_FALSE(b.try_acquire_or_renew());
    EXPECT_TRUE(a.try_acquire_or_renew());   // 续约
    EXPECT_FALSE(b.try_acquire_or_renew());
    EXPECT_EQ(store->snapshot()->HolderIdentity, "node-a");
    EXPECT_EQ(store->snapshot()->LeaseTransitions, 0);
}

TEST(LeaderElector, ReleasedLeaseIsTakenImmediately) {
    auto store = std::make_shared<MemoryLeaseStore>();
    LeaderElector a(lock_on(store), opts("node-a"));
    LeaderElector b(lock_on(store), opts("node-b"));

    StopSource stop;
    std::thread t([&] { a.run_once(stop.token()); });
    ASSERT_TRUE(fakes::eventually([&] { return a.is_leader(); }));
    EXPECT_FALSE(b.try_acquire_or_renew());

    stop.request_stop();
    t.join();

    EXPECT_TRUE(b.try_acquire_or_renew());
    EXPECT_EQ(store->snapshot()->HolderIdentity, "node-b");
    EXPECT_EQ(store->snapshot()->LeaseTransitions, 1);
}

TEST(LeaderElector, ExpiredLeaseIsTakenOver) {
    auto store = std::make_shared<MemoryLeaseStore>();
    LeaseRecord dead;
    dead.HolderIdentity       = "node-dead";
    dead.LeaseDurationSeconds = 2;
    dead.ResourceVersion      = "7";
    store->record  = dead;
    store->version = 7;

    LeaderElector b(lock_on(store), opts("node-b"));
    EXPECT_FALSE(b.try_acquire_or_renew());
    std::this_thread::sleep_for(2100ms);
    EXPECT_TRUE(b.try_acquire_or_renew());
    EXPECT_EQ(store->snapshot()->HolderIdentity, "node-b");
}

TEST(LeaderElector, LosesLeadershipWhenRenewFails) {
    auto store = std::make_shared<MemoryLeaseStore>();
    LeaderElector a(lock_on(store), opts("node-a"));
    std::atomic<int> stopped{0};
    a.set_lose_leader_callback([&] { ++stopped; });

    StopSource stop;
    std::atomic<bool> returned{false};
    std::thread t([&] {
        a.run_once(stop.token());
        returned = true;
    });
    ASSERT_TRUE(fakes::eventually([&] { return a.is_leader(); }));

    store->fail = true;
    EXPECT_TRUE(fakes::eventually([&] { return returned.load(); }, 6s));
    EXPECT_EQ(stopped.load(), 1);
    EXPECT_FALSE(a.is_leader());
    stop.request_stop();
    t.join();
}

TEST(LeaderElector, BecomeLeaderFailureReleasesAndPropagates) {
    auto store = std::make_shared<MemoryLeaseStore>();
    LeaderElector a(lock_on(store), opts("node-a"));
    a.set_become_leader_callback([] { throw std::runtime_error("advertise failed"); });

    StopSource stop;
    EXPECT_THROW(a.run_once(stop.token()), std::runtime_error);
    EXPECT_FALSE(a.is_leader());
    EXPECT_TRUE(store->snapshot()->HolderIdentity.empty());
}

TEST(LeaderElector, StopBeforeAcquireReturnsFalse) {
    auto store = std::make_shared<MemoryLeaseStore>();
    store->fail = true;
    LeaderElector a(lock_on(store), opts("node-a"));
    bool started = false;
    a.set_become_leader_callback([&] { started = true; });

    StopSource stop;
    stop.request_stop();
    EXPECT_FALSE(a.run_once(stop.token()));
    EXPECT_FALSE(started);
}
