#include <catch2/catch_test_macros.hpp>
#include "helpers/test_network.hpp"
#include <string_view>
using namespace mist::protocol;
using namespace mist::protocol::test_helpers;
using enums::LinkPhase;
using enums::SessionRole;
using enums::SessionState;
using enums::SignalingState;
namespace {
    std::vector<LinkPhase> PhasesFor(const TestNode& node, const PeerKey& peer) {
        std::vector<LinkPhase> phases;
        for (const auto& [key, phase] : node.events->transport_changes) {
            if (key == peer) {
                phases.push_back(phase);
            }
        }
        return phases;
    }
}
TEST_CASE("StateTransitions - Session lifecycle", "[boundaries][session]") {
    TestNetwork net;
    auto alice = CreateNode(net, "alice");
    auto bob = CreateNode(net, "bob");
    StartNode(net, alice);
    StartNode(net, bob);
    REQUIRE(alice->Sessions().StateOf(bob.Key()) == SessionState::NoSession);
    REQUIRE_FALSE(alice->Sessions().RoleOf(bob.Key()).has_value());
    EstablishSession(net, alice, bob);
    REQUIRE(alice->Sessions().StateOf(bob.Key()) == SessionState::Established);
    REQUIRE(bob->Sessions().StateOf(alice.Key()) == SessionState::EstablishedAwaitingFirstMessage);
    REQUIRE(alice->Sessions().RoleOf(bob.Key()) == SessionRole::Initiator);
    REQUIRE(bob->Sessions().RoleOf(alice.Key()) == SessionRole::Responder);
    REQUIRE(enums::IsEstablished(bob->Sessions().StateOf(alice.Key())));
    REQUIRE(alice->SendPlaintext(bob.Key(), Bytes("first")));
    net.Settle();
    REQUIRE(bob->Sessions().StateOf(alice.Key()) == SessionState::Established);
    REQUIRE(bob->RemoveFriend(alice.Key()).IsOk());
    REQUIRE(bob->Sessions().StateOf(alice.Key()) == SessionState::NoSession);
    REQUIRE_FALSE(enums::IsEstablished(SessionState::HandshakeSent));
    REQUIRE_FALSE(enums::IsEstablished(SessionState::HandshakeReceived));
}
TEST_CASE("StateTransitions - Direct link lifecycle", "[boundaries][transport]") {
    TestNetwork net;
    auto alice = CreateNode(net, "alice");
    auto bob = CreateNode(net, "bob");
    StartNode(net, alice);
    StartNode(net, bob);
    EstablishSession(net, alice, bob);
    REQUIRE(alice->Router().PhaseOf(bob.Key()) == LinkPhase::Idle);
    alice->ConnectDirect(bob.Key());
    net.Settle();
    REQUIRE(PhasesFor(alice, bob.Key()) == std::vector<LinkPhase>{LinkPhase::Negotiating, LinkPhase::Open});
    REQUIRE(bob->Router().PhaseOf(alice.Key()) == LinkPhase::Open);
    net.network->CloseAll("interface down");
    net.Settle();
    REQUIRE(PhasesFor(alice, bob.Key()) == std::vector<LinkPhase>{
        LinkPhase::Negotiating, LinkPhase::Open, LinkPhase::Closed});
    REQUIRE(bob->Router().PhaseOf(alice.Key()) == LinkPhase::Closed);
    alice->ConnectDirect(bob.Key());
    net.Settle();
    REQUIRE(PhasesFor(alice, bob.Key()) == std::vector<LinkPhase>{
        LinkPhase::Negotiating, LinkPhase::Open, LinkPhase::Closed, LinkPhase::Negotiating, LinkPhase::Open});
    REQUIRE(net.network->OpenChannelCount() == 2);
}
TEST_CASE("StateTransitions - Signaling across start and shutdown", "[boundaries][signaling]") {
    TestNetwork net;
    auto alice = CreateNode(net, "alice");
    REQUIRE(alice->Signaling().State() == SignalingState::Disconnected);
    StartNode(net, alice);
    REQUIRE(alice.events->signaling_states == std::vector<SignalingState>{
        SignalingState::Connecting, SignalingState::Connected});
    REQUIRE(alice->Shutdown().IsOk());
    REQUIRE(alice->Signaling().State() == SignalingState::Disconnected);
    REQUIRE(net.broker->ConnectedClientCount() == 0);
    SECTION("Shutdown twice") {
        REQUIRE(alice->Shutdown().IsOk());
        REQUIRE(alice->Signaling().State() == SignalingState::Disconnected);
    }
    SECTION("Start again") {
        StartNode(net, alice);
        REQUIRE(alice->Signaling().IsConnected());
        REQUIRE(alice.events->signaling_states.back() == SignalingState::Connected);
        REQUIRE(net.broker->ConnectedClientCount() == 1);
    }
}
TEST_CASE("StateTransitions - Nothing leaves a stopped node", "[boundaries][orchestrator]") {
    TestNetwork net;
    auto alice = CreateNode(net, "alice");
    auto bob = CreateNode(net, "bob");
    StartNode(net, alice);
    StartNode(net, bob);
    EstablishSession(net, alice, bob);
    REQUIRE(alice->Shutdown().IsOk());
    net.Settle();
    net.broker->ClearPublished();
    REQUIRE_FALSE(alice->SendPlaintext(bob.Key(), Bytes("after shutdown")));
    net.Settle();
    REQUIRE(net.broker->Published().empty());
    REQUIRE(bob.events->messages.empty());
}
TEST_CASE("StateTransitions - State names", "[boundaries]") {
    REQUIRE(std::string_view(enums::ToString(SessionState::EstablishedAwaitingFirstMessage)) ==
            "EstablishedAwaitingFirstMessage");
    REQUIRE(std::string_view(enums::ToString(SessionRole::Responder)) == "Responder");
    REQUIRE(std::string_view(enums::ToString(LinkPhase::Negotiating)) == "Negotiating");
    REQUIRE(std::string_view(enums::ToString(SignalingState::Reconnecting)) == "Reconnecting");
    REQUIRE(std::string_view(enums::ToString(static_cast<SessionState>(42))) == "UNKNOWN");
}
