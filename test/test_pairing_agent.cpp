#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "config.h"
#include "fake_adapter.h"
#include "pairing_agent.h"
#include "settings.h"

using pairing_agent::Clock;
using pairing_agent::PairingAgent;

namespace {

const char* PEER_A = "/org/bluez/hci0/dev_AA_AA_AA_AA_AA_AA";
const char* PEER_B = "/org/bluez/hci0/dev_BB_BB_BB_BB_BB_BB";

class PairingAgentTest : public ::testing::Test {
protected:
    PairingAgentTest() : settings_(settings::defaults()), agent_(adapter_, queue_, settings_) {}

    events::Responder recorder(const std::string& tag) {
        return [this, tag](bool accept) { answers_.push_back(tag + (accept ? ":yes" : ":no")); };
    }

    void confirm(const char* peer, const std::string& tag) {
        agent_.on_confirmation_request({peer, 123456, recorder(tag), Clock::now()});
    }

    FakeAdapter              adapter_;
    event_queue::EventQueue  queue_;
    Settings                 settings_;
    PairingAgent             agent_;
    std::vector<std::string> answers_;
};

} // namespace

TEST_F(PairingAgentTest, RegistersWithNoInputNoOutput) {
    agent_.start();
    EXPECT_EQ(adapter_.agent_calls, 1);
    EXPECT_EQ(adapter_.last_capability, AGENT_CAPABILITY);
    EXPECT_TRUE(agent_.registered());
}

TEST_F(PairingAgentTest, RegistrationFailureLeavesUnregistered) {
    adapter_.agent_errors.push_back({"org.bluez.Error.AlreadyExists", "taken"});
    agent_.start();
    EXPECT_FALSE(agent_.registered());
}

TEST_F(PairingAgentTest, ReleaseRegistersAgain) {
    agent_.start();
    agent_.on_released();
    EXPECT_EQ(adapter_.agent_calls, 2);
    EXPECT_TRUE(agent_.registered());
}

TEST_F(PairingAgentTest, ConfirmationAcceptedAndPeerTrusted) {
    confirm(PEER_A, "a");
    EXPECT_EQ(answers_, (std::vector<std::string>{"a:yes"}));
    ASSERT_EQ(adapter_.trusted.size(), 1u);
    EXPECT_EQ(adapter_.trusted[0], std::make_pair(std::string(PEER_A), true));
    EXPECT_EQ(agent_.pending_count(), 0u);
    EXPECT_EQ(agent_.stats().accepted, 1u);
    EXPECT_EQ(agent_.stats().late, 0u);
}

TEST_F(PairingAgentTest, AuthorizationRequestsAccepted) {
    agent_.on_authorization_request({PEER_A, "", recorder("auth"), Clock::now()});
    agent_.on_authorization_request({PEER_A, "00001812-0000-1000-8000-00805f9b34fb", recorder("hid"), Clock::now()});
    agent_.on_authorization_request({PEER_A, "0000180f-0000-1000-8000-00805f9b34fb", recorder("bat"), Clock::now()});
    EXPECT_EQ(answers_, (std::vector<std::string>{"auth:yes", "hid:yes", "bat:yes"}));
    EXPECT_EQ(adapter_.trusted.size(), 3u);
}

TEST_F(PairingAgentTest, AnswerWaitsForTrust) {
    adapter_.defer_trust = true;
    confirm(PEER_A, "a");
    EXPECT_TRUE(answers_.empty());
    EXPECT_EQ(agent_.pending_count(), 1u);
    EXPECT_EQ(queue_.timer_count(), 1u);  // deadline armed

    adapter_.release_trust(0);
    EXPECT_EQ(answers_, (std::vector<std::string>{"a:yes"}));
    EXPECT_EQ(agent_.pending_count(), 0u);
}

TEST_F(PairingAgentTest, AnswersKeepArrivalOrder) {
    adapter_.defer_trust = true;
    confirm(PEER_A, "first");
    confirm(PEER_B, "second");

    adapter_.release_trust(1);
    EXPECT_TRUE(answers_.empty());
    adapter_.release_trust(0);
    EXPECT_EQ(answers_, (std::vector<std::string>{"first:yes", "second:yes"}));
}

TEST_F(PairingAgentTest, TrustFailureStillAccepts) {
    adapter_.trust_errors.push_back({"org.bluez.Error.Failed", "no such device"});
    confirm(PEER_A, "a");
    EXPECT_EQ(answers_, (std::vector<std::string>{"a:yes"}));
    EXPECT_EQ(agent_.stats().trust_failures, 1u);
}

TEST_F(PairingAgentTest, DeadlineForcesAnswer) {
    adapter_.defer_trust = true;
    confirm(PEER_A, "a");

    agent_.on_deadline(Clock::now());
    EXPECT_TRUE(answers_.empty()) << "answered before the deadline";

    agent_.on_deadline(Clock::now() + std::chrono::milliseconds(settings_.pairing_deadline_ms + 50));
    EXPECT_EQ(answers_, (std::vector<std::string>{"a:yes"}));
    EXPECT_EQ(agent_.stats().forced, 1u);
    EXPECT_EQ(agent_.stats().late, 1u);

    // The late trust reply finds nothing to answer.
    adapter_.release_trust(0);
    EXPECT_EQ(answers_.size(), 1u);
}

TEST_F(PairingAgentTest, ForcedAnswerLeadsDeadline) {
    adapter_.defer_trust = true;
    confirm(PEER_A, "a");

    auto lead = std::chrono::milliseconds(settings_.pairing_deadline_ms - PAIRING_ANSWER_MARGIN_MS);
    agent_.on_deadline(Clock::now() + lead);
    EXPECT_EQ(answers_, (std::vector<std::string>{"a:yes"}));
    EXPECT_EQ(agent_.stats().forced, 1u);
    EXPECT_EQ(agent_.stats().late, 0u);
}

TEST_F(PairingAgentTest, CancelDropsPending) {
    adapter_.defer_trust = true;
    confirm(PEER_A, "a");
    agent_.on_cancel();
    EXPECT_EQ(agent_.pending_count(), 0u);
    EXPECT_EQ(agent_.stats().cancelled, 1u);

    adapter_.release_trust(0);
    EXPECT_TRUE(answers_.empty());
}

TEST_F(PairingAgentTest, DisconnectDropsThatPeersRequests) {
    adapter_.defer_trust = true;
    confirm(PEER_A, "a");
    confirm(PEER_B, "b");
    adapter_.release_trust(1);

    agent_.on_request_disconnect_cleanup(PEER_A);
    EXPECT_EQ(answers_, (std::vector<std::string>{"b:yes"}));
    EXPECT_EQ(agent_.pending_count(), 0u);
}

TEST(PairingAgent, HidUuidRecognised) {
    EXPECT_TRUE(pairing_agent::is_hid_uuid("00001812-0000-1000-8000-00805F9B34FB"));
    EXPECT_TRUE(pairing_agent::is_hid_uuid("1812"));
    EXPECT_FALSE(pairing_agent::is_hid_uuid("0000180f-0000-1000-8000-00805f9b34fb"));
}
