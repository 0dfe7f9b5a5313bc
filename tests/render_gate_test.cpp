/*
 * Tests for the render gate
 *
 * - with peers every sample passes, live or not
 * - live mode drops at once when nobody is connected
 * - non-live mode blocks until a peer arrives or unlock() is called
 * - flush-on-unlock policy and unlock_stop() re-arming
 * - unlock() immediately followed by unlock_stop() still wakes the waiter
 */

#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <thread>

#include "core/render_gate.h"
#include "mocks/fake_transport.h"

namespace websink {
namespace test {

using namespace std::chrono_literals;

class RenderGateTest : public ::testing::Test {
protected:
    void add_peer(const std::string& id) {
        auto transport = std::make_shared<FakeTransport>(id, TrackInfo{}, FailStep::None);
        ASSERT_TRUE(registry_.insert(id, std::make_shared<PeerSession>(id, transport)));
    }

    // Wait until a producer is parked in admit()
    bool wait_until_blocked() {
        auto deadline = std::chrono::steady_clock::now() + 2s;
        while (!gate_.is_waiting()) {
            if (std::chrono::steady_clock::now() > deadline) return false;
            std::this_thread::sleep_for(1ms);
        }
        return true;
    }

    std::future<GateDecision> admit_async() {
        return std::async(std::launch::async, [this]() { return gate_.admit(); });
    }

    UnblockSignal signal_;
    SessionRegistry registry_{signal_};
    RenderGate gate_{registry_, signal_};
};

TEST_F(RenderGateTest, PassesWhenPeersPresent) {
    add_peer("a");
    gate_.configure(false, false);
    EXPECT_EQ(gate_.admit(), GateDecision::Pass);

    gate_.configure(true, false);
    EXPECT_EQ(gate_.admit(), GateDecision::Pass);
}

TEST_F(RenderGateTest, LiveModeDropsWithoutPeers) {
    gate_.configure(true, false);

    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(gate_.admit(), GateDecision::Drop);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 500ms);
    EXPECT_FALSE(gate_.is_waiting());
}

TEST_F(RenderGateTest, BlocksUntilPeerArrives) {
    gate_.configure(false, false);

    auto result = admit_async();
    ASSERT_TRUE(wait_until_blocked());
    EXPECT_EQ(result.wait_for(50ms), std::future_status::timeout);

    add_peer("a");

    ASSERT_EQ(result.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(result.get(), GateDecision::Pass);
    EXPECT_FALSE(gate_.is_waiting());
}

TEST_F(RenderGateTest, StaysBlockedWhenSizeDropsToZero) {
    gate_.configure(false, false);
    add_peer("a");
    registry_.remove("a");

    auto result = admit_async();
    ASSERT_TRUE(wait_until_blocked());

    // A size-changed event for an empty registry must not release the producer
    signal_.send(UnblockEvent::size_changed(0));
    EXPECT_EQ(result.wait_for(100ms), std::future_status::timeout);

    gate_.unlock();
    ASSERT_EQ(result.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(result.get(), GateDecision::Shutdown);
}

TEST_F(RenderGateTest, UnlockReleasesWaiterWithoutDelivery) {
    gate_.configure(false, false);

    auto result = admit_async();
    ASSERT_TRUE(wait_until_blocked());

    gate_.unlock();

    ASSERT_EQ(result.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(result.get(), GateDecision::Shutdown);
}

TEST_F(RenderGateTest, AdmitAfterUnlockDoesNotBlock) {
    gate_.configure(false, false);
    gate_.unlock();

    EXPECT_EQ(gate_.admit(), GateDecision::Shutdown);
    EXPECT_TRUE(gate_.is_unlocked());
}

TEST_F(RenderGateTest, FlushOnUnlockDeliversWhenPeersPresent) {
    gate_.configure(false, true);

    auto result = admit_async();
    ASSERT_TRUE(wait_until_blocked());

    add_peer("a");
    gate_.unlock();

    ASSERT_EQ(result.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(result.get(), GateDecision::Pass);
}

TEST_F(RenderGateTest, FlushOnUnlockWithoutPeersStillShutsDown) {
    gate_.configure(false, true);

    auto result = admit_async();
    ASSERT_TRUE(wait_until_blocked());
    gate_.unlock();

    ASSERT_EQ(result.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(result.get(), GateDecision::Shutdown);
}

TEST_F(RenderGateTest, UnlockStopRearmsBlocking) {
    gate_.configure(false, false);
    gate_.unlock();
    EXPECT_EQ(gate_.admit(), GateDecision::Shutdown);

    gate_.unlock_stop();
    EXPECT_FALSE(gate_.is_unlocked());

    auto result = admit_async();
    ASSERT_TRUE(wait_until_blocked());
    EXPECT_EQ(result.wait_for(50ms), std::future_status::timeout);

    add_peer("a");
    ASSERT_EQ(result.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(result.get(), GateDecision::Pass);
}

TEST_F(RenderGateTest, UnlockThenUnlockStopStillReleasesWaiter) {
    gate_.configure(false, false);

    for (int i = 0; i < 100; i++) {
        auto result = admit_async();
        ASSERT_TRUE(wait_until_blocked());

        gate_.unlock();
        gate_.unlock_stop();

        ASSERT_EQ(result.wait_for(2s), std::future_status::ready) << "iteration " << i;
        EXPECT_EQ(result.get(), GateDecision::Shutdown);
        EXPECT_FALSE(gate_.is_unlocked());
    }
}

TEST_F(RenderGateTest, StaleUnlockDoesNotReleaseLaterWaiter) {
    gate_.configure(false, false);
    gate_.unlock();
    gate_.unlock_stop();

    // The force-unblock from before this admit() started must not count
    auto result = admit_async();
    ASSERT_TRUE(wait_until_blocked());
    EXPECT_EQ(result.wait_for(100ms), std::future_status::timeout);

    add_peer("a");
    ASSERT_EQ(result.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(result.get(), GateDecision::Pass);
}

TEST(GateDecisionTest, Names) {
    EXPECT_STREQ(gate_decision_name(GateDecision::Pass), "pass");
    EXPECT_STREQ(gate_decision_name(GateDecision::Drop), "drop");
    EXPECT_STREQ(gate_decision_name(GateDecision::Shutdown), "shutdown");
}

} // namespace test
} // namespace websink
