#include <catch2/catch_test_macros.hpp>
#include "helpers/test_network.hpp"
#include "mist/signaling/addresses.hpp"
#include <fmt/core.h>
using namespace mist::protocol;
using namespace mist::protocol::test_helpers;
using enums::EnvelopeType;
using enums::LinkPhase;
using enums::TrustOrigin;
namespace {
    size_t CountPublished(const TestNetwork& net, const EnvelopeType type) {
        size_t count = 0;
        for (const auto& message : net.broker->Published()) {
            auto decoded = signaling::EnvelopeCodec::Decode(message.payload);
            if (decoded.IsOk() && decoded.Unwrap().Type() == type) {
                count++;
            }
        }
        return count;
    }

    struct Pair {
        TestNode alice;
        TestNode bob;
    };

    Pair StartPair(TestNetwork& net) {
        Pair pair{CreateNode(net, "alice"), CreateNode(net, "bob")};
        StartNode(net, pair.alice);
        StartNode(net, pair.bob);
        return pair;
    }
}
TEST_CASE("Workflow - Hello and hi over the relay", "[integration][workflow]") {
    TestNetwork net;
    auto [alice, bob] = StartPair(net);
    EstablishSession(net, alice, bob);
    REQUIRE(alice.events->friends_added.size() == 1);
    REQUIRE(alice.events->friends_added[0].first == bob.Key());
    REQUIRE(alice.events->friends_added[0].second == TrustOrigin::DirectVerification);
    REQUIRE(bob->Sessions().StateOf(alice.Key()) == enums::SessionState::EstablishedAwaitingFirstMessage);
    net.broker->ClearPublished();
    REQUIRE(alice->SendPlaintext(bob.Key(), Bytes("hello")));
    net.Settle();
    REQUIRE(bob.events->TextsFrom(alice.Key()) == std::vector<std::string>{"hello"});
    REQUIRE(bob->Sessions().StateOf(alice.Key()) == enums::SessionState::Established);
    REQUIRE(bob->SendPlaintext(alice.Key(), Bytes("hi")));
    net.Settle();
    REQUIRE(alice.events->TextsFrom(bob.Key()) == std::vector<std::string>{"hi"});
    REQUIRE(CountPublished(net, EnvelopeType::RelayedCiphertext) == 2);
    REQUIRE(net.broker->PublishedTo(signaling::InboxAddress("", bob.Key())).size() == 1);
    REQUIRE(alice.events->rejections.empty());
    REQUIRE(bob.events->rejections.empty());
}
TEST_CASE("Workflow - The responder waits for the first message", "[integration][workflow]") {
    TestNetwork net;
    auto [alice, bob] = StartPair(net);
    EstablishSession(net, alice, bob);
    REQUIRE_FALSE(bob->SendPlaintext(alice.Key(), Bytes("too early")));
    REQUIRE(bob.events->rehandshakes.empty());
    net.Settle();
    REQUIRE(alice.events->messages.empty());
    REQUIRE(alice->SendPlaintext(bob.Key(), Bytes("first")));
    net.Settle();
    REQUIRE(bob->SendPlaintext(alice.Key(), Bytes("now me")));
    net.Settle();
    REQUIRE(alice.events->TextsFrom(bob.Key()) == std::vector<std::string>{"now me"});
}
TEST_CASE("Workflow - Long conversation keeps order", "[integration][workflow]") {
    TestNetwork net;
    auto [alice, bob] = StartPair(net);
    EstablishSession(net, alice, bob);
    std::vector<std::string> expected_at_bob;
    std::vector<std::string> expected_at_alice;
    for (int round = 0; round < 10; ++round) {
        const auto question = fmt::format("question {}", round);
        const auto answer = fmt::format("answer {}", round);
        REQUIRE(alice->SendPlaintext(bob.Key(), Bytes(question)));
        REQUIRE(alice->SendPlaintext(bob.Key(), Bytes(question + " again")));
        net.Settle();
        REQUIRE(bob->SendPlaintext(alice.Key(), Bytes(answer)));
        net.Settle();
        expected_at_bob.push_back(question);
        expected_at_bob.push_back(question + " again");
        expected_at_alice.push_back(answer);
    }
    REQUIRE(bob.events->TextsFrom(alice.Key()) == expected_at_bob);
    REQUIRE(alice.events->TextsFrom(bob.Key()) == expected_at_alice);
}
TEST_CASE("Workflow - Direct link carries the conversation", "[integration][workflow][transport]") {
    TestNetwork net;
    auto [alice, bob] = StartPair(net);
    EstablishSession(net, alice, bob);
    alice->ConnectDirect(bob.Key());
    net.Settle();
    REQUIRE(alice->Router().PhaseOf(bob.Key()) == LinkPhase::Open);
    REQUIRE(bob->Router().PhaseOf(alice.Key()) == LinkPhase::Open);
    REQUIRE(net.network->OpenChannelCount() == 2);
    REQUIRE(alice.events->transport_changes.back() == std::make_pair(bob.Key(), LinkPhase::Open));
    net.broker->ClearPublished();
    REQUIRE(alice->SendPlaintext(bob.Key(), Bytes("hello")));
    net.Settle();
    REQUIRE(bob->SendPlaintext(alice.Key(), Bytes("hi")));
    net.Settle();
    REQUIRE(bob.events->TextsFrom(alice.Key()) == std::vector<std::string>{"hello"});
    REQUIRE(alice.events->TextsFrom(bob.Key()) == std::vector<std::string>{"hi"});
    REQUIRE(CountPublished(net, EnvelopeType::RelayedCiphertext) == 0);
    SECTION("Losing the link falls back to the relay") {
        net.network->CloseAll("wifi changed");
        net.Settle();
        REQUIRE(alice->Router().PhaseOf(bob.Key()) == LinkPhase::Closed);
        REQUIRE(alice->SendPlaintext(bob.Key(), Bytes("still here")));
        net.Settle();
        REQUIRE(bob.events->TextsFrom(alice.Key()).back() == "still here");
        REQUIRE(CountPublished(net, EnvelopeType::RelayedCiphertext) == 1);
    }
}
TEST_CASE("Workflow - Eager connect opens links at boot", "[integration][workflow][transport]") {
    TestNetwork net;
    auto [alice, bob] = StartPair(net);
    EstablishSession(net, alice, bob);
    REQUIRE(alice->SendPlaintext(bob.Key(), Bytes("before restart")));
    net.Settle();
    auto alice_store = alice.store;
    alice.node.reset();
    net.Settle();
    auto config = FastNodeConfig();
    config.transport.eager_connect = true;
    auto restarted = CreateNode(net, "alice-restarted", alice_store, config);
    StartNode(net, restarted);
    REQUIRE(restarted->Router().PhaseOf(bob.Key()) == LinkPhase::Open);
    REQUIRE(restarted->SendPlaintext(bob.Key(), Bytes("after restart")));
    net.Settle();
    REQUIRE(bob.events->TextsFrom(restarted.Key()) == std::vector<std::string>{"before restart", "after restart"});
}
TEST_CASE("Workflow - Strangers cannot open sessions", "[integration][workflow]") {
    TestNetwork net;
    auto [alice, bob] = StartPair(net);
    auto carol = CreateNode(net, "carol");
    StartNode(net, carol);
    REQUIRE(carol->AddFriend(bob.Key(), bob->PublicBundle(), "bob", TrustOrigin::SharedLink).IsOk());
    net.Settle();
    REQUIRE(carol->Sessions().HasSession(bob.Key()));
    REQUIRE_FALSE(bob->Sessions().HasSession(carol.Key()));
    REQUIRE_FALSE(bob->Contacts().Contains(carol.Key()));
    REQUIRE(carol->SendPlaintext(bob.Key(), Bytes("let me in")));
    REQUIRE(carol->SendTyping(bob.Key(), true).IsOk());
    net.Settle();
    REQUIRE(bob.events->messages.empty());
    REQUIRE(bob.events->rejections.empty());
    REQUIRE(bob.events->typing.empty());
    REQUIRE(bob.events->friends_added.empty());
}
TEST_CASE("Workflow - Lost session asks for a new handshake", "[integration][workflow]") {
    TestNetwork net;
    auto [alice, bob] = StartPair(net);
    EstablishSession(net, alice, bob);
    REQUIRE(alice->SendPlaintext(bob.Key(), Bytes("hello")));
    net.Settle();
    REQUIRE(bob->Sessions().RemovePeer(alice.Key()).Unwrap());
    REQUIRE(alice->SendPlaintext(bob.Key(), Bytes("are you there")));
    net.Settle();
    REQUIRE(bob.events->rehandshakes == std::vector<PeerKey>{alice.Key()});
    REQUIRE_FALSE(bob->SendPlaintext(alice.Key(), Bytes("lost you")));
    REQUIRE(bob.events->rehandshakes.size() == 2);
    SECTION("Removing the friend entirely") {
        REQUIRE(alice->RemoveFriend(bob.Key()).IsOk());
        REQUIRE_FALSE(alice->Sessions().HasSession(bob.Key()));
        REQUIRE_FALSE(alice->Contacts().Contains(bob.Key()));
        REQUIRE_FALSE(alice->SendPlaintext(bob.Key(), Bytes("gone")));
        REQUIRE(alice.events->rehandshakes.empty());
    }
}
TEST_CASE("Workflow - Presence and typing reach contacts", "[integration][workflow]") {
    TestNetwork net;
    auto [alice, bob] = StartPair(net);
    EstablishSession(net, alice, bob);
    REQUIRE(alice->SendTyping(bob.Key(), true).IsOk());
    REQUIRE(alice->SendTyping(bob.Key(), false).IsOk());
    net.Settle();
    REQUIRE(bob.events->typing == std::vector<std::pair<PeerKey, bool>>{{alice.Key(), true}, {alice.Key(), false}});
    REQUIRE(alice->Shutdown().IsOk());
    REQUIRE(alice->Shutdown().IsOk());
    net.Settle();
    REQUIRE(bob.events->presence == std::vector<std::pair<PeerKey, bool>>{{alice.Key(), false}});
    REQUIRE_FALSE(alice->Signaling().IsConnected());
    SECTION("Coming back online is announced") {
        StartNode(net, alice);
        REQUIRE(bob.events->presence.back() == std::make_pair(alice.Key(), true));
    }
}
TEST_CASE("Workflow - Identity reset starts over", "[integration][workflow]") {
    TestNetwork net;
    auto [alice, bob] = StartPair(net);
    EstablishSession(net, alice, bob);
    const auto old_key = alice.Key();
    std::optional<bool> ready;
    REQUIRE(alice->ResetIdentity([&ready](const Result<Unit, ProtocolFailure>& outcome) {
        ready = outcome.IsOk();
    }).IsOk());
    net.Settle();
    REQUIRE(ready.value_or(false));
    REQUIRE(alice.Key() != old_key);
    REQUIRE(alice->Sessions().SessionCount() == 0);
    REQUIRE(alice->Contacts().Size() == 0);
    REQUIRE(alice->Signaling().IsConnected());
    REQUIRE(alice->Signaling().SelfPublicKey() == alice.Key());
    REQUIRE(alice.store->List(storage::kSessionsNamespace).Unwrap().empty());
    SECTION("The new identity can befriend the old peer again") {
        SeedContact(bob, alice, TrustOrigin::DirectVerification);
        REQUIRE(alice->AddFriend(bob.Key(), bob->PublicBundle(), "bob", TrustOrigin::DirectVerification).IsOk());
        net.Settle();
        REQUIRE(alice->SendPlaintext(bob.Key(), Bytes("new me")));
        net.Settle();
        REQUIRE(bob.events->TextsFrom(alice.Key()) == std::vector<std::string>{"new me"});
    }
}
