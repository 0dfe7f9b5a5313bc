/*
 * Tests for the peer connection factory
 *
 * - a successful admission registers the peer and returns the answer
 * - a failure at any negotiation step leaves no registry entry and
 *   closes the transport exactly once
 * - duplicate ids are rejected without touching the existing peer
 * - the state observer removes terminal peers exactly once, closing the
 *   transport from inside its own state callback
 */

#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <regex>
#include <set>
#include <thread>

#include "core/peer_factory.h"
#include "core/sink_errors.h"
#include "mocks/fake_transport.h"

namespace websink {
namespace test {

using namespace std::chrono_literals;

class PeerFactoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.transport.ice_servers = {"stun:stun.example.org:3478"};
        factory_ = std::make_unique<PeerFactory>(backend_, registry_, track_, options_);
    }

    FakeBackend backend_;
    UnblockSignal signal_;
    SessionRegistry registry_{signal_};
    DistributionTrack track_{registry_, TrackInfo{}};
    FactoryOptions options_;
    std::unique_ptr<PeerFactory> factory_;
};

TEST_F(PeerFactoryTest, AdmitRegistersPeerAndReturnsAnswer) {
    SessionDescription offer = make_offer();
    Admission admission = factory_->admit(offer);

    auto transport = backend_.transport(admission.peer_id);
    ASSERT_NE(transport, nullptr);

    EXPECT_EQ(admission.answer.type, "answer");
    EXPECT_EQ(admission.answer.sdp, transport->answer_sdp());
    EXPECT_EQ(admission.negotiated_codec, "video/H264");
    EXPECT_EQ(transport->remote().sdp, offer.sdp);
    EXPECT_EQ(transport->track().mime_type, "video/H264");

    EXPECT_EQ(registry_.count(), 1u);
    EXPECT_TRUE(registry_.contains(admission.peer_id));
    EXPECT_FALSE(transport->is_closed());
}

TEST_F(PeerFactoryTest, PassesTransportConfigToBackend) {
    factory_->admit(make_offer());
    auto config = backend_.last_config();
    ASSERT_EQ(config.ice_servers.size(), 1u);
    EXPECT_EQ(config.ice_servers[0], "stun:stun.example.org:3478");
}

TEST_F(PeerFactoryTest, IdsAreDistinctUuids) {
    std::regex uuid("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    std::set<std::string> ids;
    for (int i = 0; i < 20; i++) {
        std::string id = factory_->admit(make_offer()).peer_id;
        EXPECT_TRUE(std::regex_match(id, uuid)) << id;
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 20u);
    EXPECT_EQ(registry_.count(), 20u);
}

TEST_F(PeerFactoryTest, CreateFailureRegistersNothing) {
    backend_.fail_next(FailStep::Create);
    try {
        factory_->admit(make_offer());
        FAIL() << "expected NegotiationError";
    } catch (const NegotiationError& e) {
        EXPECT_EQ(e.stage(), "create peer connection");
        EXPECT_EQ(e.cause(), "no more ports");
    }
    EXPECT_EQ(registry_.count(), 0u);
}

TEST_F(PeerFactoryTest, EveryNegotiationFailureRollsBack) {
    const std::vector<std::pair<FailStep, std::string>> cases = {
        {FailStep::SetRemote, "set remote description"},
        {FailStep::CreateAnswer, "create answer"},
        {FailStep::Gathering, "ICE gathering"},
        {FailStep::GatheringTimeout, "ICE gathering"},
        {FailStep::EmptyAnswer, "local description"},
    };

    for (const auto& [step, stage] : cases) {
        backend_.fail_next(step);
        size_t before = backend_.created();
        try {
            factory_->admit(make_offer());
            ADD_FAILURE() << "expected NegotiationError for stage " << stage;
        } catch (const NegotiationError& e) {
            EXPECT_EQ(e.stage(), stage);
        }

        ASSERT_EQ(backend_.created(), before + 1);
        auto transport = backend_.transports().back();
        EXPECT_EQ(registry_.count(), 0u) << stage;
        EXPECT_FALSE(registry_.contains(transport->id())) << stage;
        EXPECT_EQ(transport->close_calls(), 1) << stage;
    }
}

TEST_F(PeerFactoryTest, FailedAdmissionDoesNotDisturbOtherPeers) {
    Admission good = factory_->admit(make_offer("good"));

    backend_.fail_next(FailStep::SetRemote);
    EXPECT_THROW(factory_->admit(make_offer("bad")), NegotiationError);

    EXPECT_EQ(registry_.count(), 1u);
    EXPECT_TRUE(registry_.contains(good.peer_id));
    EXPECT_FALSE(backend_.transport(good.peer_id)->is_closed());
}

TEST_F(PeerFactoryTest, DuplicateIdIsRejected) {
    factory_->set_id_generator([]() { return std::string("fixed-id"); });

    Admission first = factory_->admit(make_offer());
    EXPECT_EQ(first.peer_id, "fixed-id");
    auto first_transport = backend_.transports().back();

    try {
        factory_->admit(make_offer());
        FAIL() << "expected DuplicateIdError";
    } catch (const DuplicateIdError& e) {
        EXPECT_EQ(e.peer_id(), "fixed-id");
    }

    auto second_transport = backend_.transports().back();
    EXPECT_NE(first_transport, second_transport);
    EXPECT_EQ(second_transport->close_calls(), 1);
    EXPECT_EQ(second_transport->gathering_waits(), 0);

    EXPECT_EQ(registry_.count(), 1u);
    EXPECT_FALSE(first_transport->is_closed());
}

TEST_F(PeerFactoryTest, NonTerminalStateIsRecorded) {
    Admission admission = factory_->admit(make_offer());
    auto transport = backend_.transport(admission.peer_id);

    transport->fire_state(PeerState::Connecting);
    transport->fire_state(PeerState::Connected);

    auto session = registry_.find(admission.peer_id);
    ASSERT_NE(session, nullptr);
    EXPECT_EQ(session->state(), PeerState::Connected);
    EXPECT_FALSE(transport->is_closed());
}

TEST_F(PeerFactoryTest, TerminalStatesRemoveAndCloseOnce) {
    for (PeerState terminal : {PeerState::Disconnected, PeerState::Failed, PeerState::Closed}) {
        Admission admission = factory_->admit(make_offer());
        auto transport = backend_.transport(admission.peer_id);
        auto session = registry_.find(admission.peer_id);

        transport->fire_state(PeerState::Connected);
        transport->fire_state(terminal);
        transport->fire_state(terminal);
        transport->fire_state(PeerState::Closed);

        EXPECT_FALSE(registry_.contains(admission.peer_id)) << peer_state_name(terminal);
        EXPECT_EQ(transport->close_calls(), 1) << peer_state_name(terminal);
        EXPECT_TRUE(session->is_closed());
    }
    EXPECT_EQ(registry_.count(), 0u);
}

TEST_F(PeerFactoryTest, TerminalStateClosesFromInsideStateCallback) {
    Admission admission = factory_->admit(make_offer());
    auto transport = backend_.transport(admission.peer_id);

    EXPECT_TRUE(transport->fire_state(PeerState::Connected));
    EXPECT_TRUE(transport->fire_state(PeerState::Failed));

    EXPECT_TRUE(transport->closed_from_callback());
    EXPECT_EQ(transport->close_calls(), 1);
    EXPECT_FALSE(registry_.contains(admission.peer_id));

    // The Closed notification that follows close() is not reported
    EXPECT_FALSE(transport->fire_state(PeerState::Closed));
    EXPECT_EQ(transport->state_reports(), 2);
    EXPECT_EQ(transport->close_calls(), 1);
}

TEST_F(PeerFactoryTest, ConcurrentTerminalNotificationsCloseOnce) {
    Admission admission = factory_->admit(make_offer());
    auto transport = backend_.transport(admission.peer_id);

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i++) {
        threads.emplace_back([&transport, i]() {
            transport->fire_state(i % 2 ? PeerState::Failed : PeerState::Disconnected);
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(registry_.count(), 0u);
    EXPECT_EQ(transport->close_calls(), 1);
}

TEST_F(PeerFactoryTest, PeerFailingDuringNegotiationIsRolledBack) {
    backend_.hold_gathering(true);
    auto result = std::async(std::launch::async, [this]() { return factory_->admit(make_offer()); });

    // Wait for the admission to reach the gathering step
    auto deadline = std::chrono::steady_clock::now() + 2s;
    std::shared_ptr<FakeTransport> transport;
    while (!transport || transport->gathering_waits() == 0) {
        ASSERT_LT(std::chrono::steady_clock::now(), deadline);
        std::this_thread::sleep_for(1ms);
        auto all = backend_.transports();
        if (!all.empty()) transport = all.back();
    }

    transport->fire_state(PeerState::Failed);
    EXPECT_EQ(registry_.count(), 0u);

    transport->hold_gathering(false);
    EXPECT_THROW(result.get(), NegotiationError);

    EXPECT_EQ(registry_.count(), 0u);
    EXPECT_EQ(transport->close_calls(), 1);
}

TEST_F(PeerFactoryTest, GatheringTimeoutFailsAdmission) {
    FactoryOptions options;
    options.gathering_timeout = 50ms;
    PeerFactory factory(backend_, registry_, track_, options);

    backend_.hold_gathering(true);
    try {
        factory.admit(make_offer());
        FAIL() << "expected NegotiationError";
    } catch (const NegotiationError& e) {
        EXPECT_EQ(e.stage(), "ICE gathering");
    }

    EXPECT_EQ(registry_.count(), 0u);
    EXPECT_EQ(backend_.transports().back()->close_calls(), 1);
}

TEST_F(PeerFactoryTest, ConcurrentAdmissionsAreIndependent) {
    std::vector<std::future<Admission>> results;
    for (int i = 0; i < 8; i++) {
        results.push_back(std::async(std::launch::async, [this, i]() {
            return factory_->admit(make_offer("peer" + std::to_string(i)));
        }));
    }

    std::set<std::string> ids;
    for (auto& result : results) {
        Admission admission = result.get();
        EXPECT_EQ(admission.answer.sdp, backend_.transport(admission.peer_id)->answer_sdp());
        ids.insert(admission.peer_id);
    }
    EXPECT_EQ(ids.size(), 8u);
    EXPECT_EQ(registry_.count(), 8u);
}

} // namespace test
} // namespace websink
