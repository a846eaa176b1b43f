#include <catch2/catch_test_macros.hpp>
#include "helpers/test_network.hpp"
#include "mist/signaling/addresses.hpp"
#include "mist/signaling/signaling_channel.hpp"
using namespace mist::protocol;
using namespace mist::protocol::signaling;
using namespace mist::protocol::test_helpers;
using interfaces::Millis;
namespace proto = mist::proto::protocol;
namespace {
    struct Peer {
        std::vector<uint8_t> key = crypto::SodiumInterop::GetRandomBytes(32);
        std::unique_ptr<SignalingChannel> channel;
        std::vector<SignalingEnvelope> received;
        std::vector<SignalingState> states;
        std::optional<Result<Unit, ProtocolFailure>> connect_outcome;
    };

    std::unique_ptr<Peer> MakePeer(TestNetwork& net, const std::string& name) {
        auto peer = std::make_unique<Peer>();
        peer->channel = std::make_unique<SignalingChannel>(
            net.loop, net.broker->CreateClient(name), FastNodeConfig().signaling);
        auto* raw = peer.get();
        peer->channel->SetStateHandler([raw](SignalingState state) { raw->states.push_back(state); });
        peer->channel->Subscribe(std::nullopt, [raw](const SignalingEnvelope& envelope) {
            raw->received.push_back(envelope);
        });
        return peer;
    }

    void BeginConnect(Peer& peer) {
        peer.connect_outcome.reset();
        peer.channel->Connect(peer.key, [&peer](Result<Unit, ProtocolFailure> outcome) {
            peer.connect_outcome = std::move(outcome);
        });
    }

    void ConnectPeer(TestNetwork& net, Peer& peer) {
        BeginConnect(peer);
        net.Settle();
        REQUIRE(peer.connect_outcome.has_value());
        REQUIRE(peer.connect_outcome->IsOk());
    }

    proto::PresencePayload Presence(const bool online) {
        proto::PresencePayload presence;
        presence.set_online(online);
        return presence;
    }
}
TEST_CASE("SignalingChannel - Connects and subscribes its addresses", "[signaling][channel]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    TestNetwork net;
    auto alice = MakePeer(net, "alice");
    REQUIRE(alice->channel->State() == SignalingState::Disconnected);
    BeginConnect(*alice);
    REQUIRE(alice->channel->State() == SignalingState::Connecting);
    REQUIRE_FALSE(alice->connect_outcome.has_value());
    net.Settle();
    REQUIRE(alice->connect_outcome.has_value());
    REQUIRE(alice->connect_outcome->IsOk());
    REQUIRE(alice->channel->IsConnected());
    REQUIRE(alice->channel->AttemptCount() == 1);
    REQUIRE(alice->channel->SelfPublicKey() == alice->key);
    REQUIRE(alice->states == std::vector<SignalingState>{SignalingState::Connecting, SignalingState::Connected});
    REQUIRE(net.broker->ConnectedClientCount() == 1);
    SECTION("A second connect completes immediately") {
        BeginConnect(*alice);
        net.Settle();
        REQUIRE(alice->connect_outcome->IsOk());
        REQUIRE(net.broker->ConnectAttemptCount() == 1);
    }
    SECTION("Binding another identity is refused") {
        std::optional<Result<Unit, ProtocolFailure>> outcome;
        const auto other = crypto::SodiumInterop::GetRandomBytes(32);
        alice->channel->Connect(other, [&outcome](Result<Unit, ProtocolFailure> result) {
            outcome = std::move(result);
        });
        net.Settle();
        REQUIRE(outcome.has_value());
        REQUIRE(outcome->IsErrAnd([](const ProtocolFailure& f) { return f.type == ProtocolFailureType::InvalidState; }));
    }
    SECTION("Disconnect returns to the initial state") {
        alice->channel->Disconnect();
        REQUIRE(alice->channel->State() == SignalingState::Disconnected);
        REQUIRE(net.broker->ConnectedClientCount() == 0);
        auto sent = alice->channel->Send(Presence(true), std::nullopt);
        REQUIRE(sent.IsErrAnd([](const ProtocolFailure& f) { return f.type == ProtocolFailureType::SignalingUnavailable; }));
    }
}
TEST_CASE("SignalingChannel - Connect input validation", "[signaling][channel]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    TestNetwork net;
    auto alice = MakePeer(net, "alice");
    std::optional<Result<Unit, ProtocolFailure>> outcome;
    const std::vector<uint8_t> short_key(31, 0x42);
    alice->channel->Connect(short_key, [&outcome](Result<Unit, ProtocolFailure> result) {
        outcome = std::move(result);
    });
    REQUIRE_FALSE(outcome.has_value());
    net.Settle();
    REQUIRE(outcome.has_value());
    REQUIRE(outcome->IsErrAnd([](const ProtocolFailure& f) { return f.type == ProtocolFailureType::InvalidInput; }));
    REQUIRE(alice->channel->State() == SignalingState::Disconnected);
    REQUIRE(net.broker->ConnectAttemptCount() == 0);
}
TEST_CASE("SignalingChannel - Bounded retries with exponential backoff", "[signaling][channel][retry]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    TestNetwork net;
    net.broker->SetAvailable(false);
    auto alice = MakePeer(net, "alice");
    BeginConnect(*alice);
    net.Settle();
    REQUIRE(net.broker->ConnectAttemptCount() == 1);
    REQUIRE(alice->channel->State() == SignalingState::Connecting);
    net.Advance(Millis(99));
    REQUIRE(net.broker->ConnectAttemptCount() == 1);
    net.Advance(Millis(1));
    REQUIRE(net.broker->ConnectAttemptCount() == 2);
    net.Advance(Millis(199));
    REQUIRE(net.broker->ConnectAttemptCount() == 2);
    REQUIRE_FALSE(alice->connect_outcome.has_value());
    net.Advance(Millis(1));
    REQUIRE(net.broker->ConnectAttemptCount() == 3);
    REQUIRE(alice->connect_outcome.has_value());
    REQUIRE(alice->connect_outcome->IsErrAnd([](const ProtocolFailure& f) {
        return f.type == ProtocolFailureType::SignalingUnavailable;
    }));
    REQUIRE(alice->channel->State() == SignalingState::Disconnected);
    net.Advance(Millis(10'000));
    REQUIRE(net.broker->ConnectAttemptCount() == 3);
    SECTION("A later connect starts a fresh series") {
        net.broker->SetAvailable(true);
        ConnectPeer(net, *alice);
        REQUIRE(alice->channel->AttemptCount() == 1);
        REQUIRE(net.broker->ConnectAttemptCount() == 4);
    }
}
TEST_CASE("SignalingChannel - Hanging connects time out", "[signaling][channel][retry]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    TestNetwork net;
    net.broker->SetConnectsHang(true);
    auto alice = MakePeer(net, "alice");
    BeginConnect(*alice);
    net.Settle();
    REQUIRE(net.broker->ConnectAttemptCount() == 1);
    net.Advance(Millis(1'000));
    REQUIRE(net.broker->ConnectAttemptCount() == 1);
    net.Advance(Millis(100));
    REQUIRE(net.broker->ConnectAttemptCount() == 2);
    net.Advance(Millis(2'199));
    REQUIRE(net.broker->ConnectAttemptCount() == 3);
    REQUIRE_FALSE(alice->connect_outcome.has_value());
    net.Advance(Millis(1));
    REQUIRE(alice->connect_outcome.has_value());
    REQUIRE(alice->connect_outcome->IsErr());
    REQUIRE(alice->connect_outcome->UnwrapErr().type == ProtocolFailureType::SignalingUnavailable);
    REQUIRE(alice->channel->State() == SignalingState::Disconnected);
}
TEST_CASE("SignalingChannel - Disconnect while connecting fails the pending connect", "[signaling][channel]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    TestNetwork net;
    net.broker->SetConnectsHang(true);
    auto alice = MakePeer(net, "alice");
    BeginConnect(*alice);
    std::optional<Result<Unit, ProtocolFailure>> shared;
    alice->channel->Connect(alice->key, [&shared](Result<Unit, ProtocolFailure> result) {
        shared = std::move(result);
    });
    net.Settle();
    alice->channel->Disconnect();
    REQUIRE(alice->connect_outcome.has_value());
    REQUIRE(shared.has_value());
    REQUIRE(alice->connect_outcome->IsErr());
    REQUIRE(shared->IsErr());
    net.Advance(Millis(10'000));
    REQUIRE(net.broker->ConnectAttemptCount() == 1);
    REQUIRE(alice->channel->State() == SignalingState::Disconnected);
}
TEST_CASE("SignalingChannel - Reconnects indefinitely after a lost connection", "[signaling][channel][retry]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    TestNetwork net;
    auto alice = MakePeer(net, "alice");
    auto bob = MakePeer(net, "bob");
    ConnectPeer(net, *alice);
    ConnectPeer(net, *bob);
    REQUIRE(alice->channel->JoinGroup("lobby").IsOk());
    net.broker->SetAvailable(false);
    net.broker->DropAllConnections("broker restart");
    net.Settle();
    REQUIRE(alice->channel->State() == SignalingState::Reconnecting);
    REQUIRE(alice->states.back() == SignalingState::Reconnecting);
    // retries at +100, +200, +400, +800, +1600
    net.Advance(Millis(1'600));
    REQUIRE(net.broker->ConnectAttemptCount() == 2 + 2 * 5);
    REQUIRE(alice->channel->State() == SignalingState::Reconnecting);
    net.broker->SetAvailable(true);
    net.Advance(Millis(800));
    REQUIRE(alice->channel->IsConnected());
    REQUIRE(bob->channel->IsConnected());
    REQUIRE(alice->states == std::vector<SignalingState>{
        SignalingState::Connecting, SignalingState::Connected,
        SignalingState::Reconnecting, SignalingState::Connected});
    SECTION("Inbox and groups are resubscribed") {
        proto::TypingPayload typing;
        typing.set_is_typing(true);
        REQUIRE(bob->channel->Send(typing, std::span<const uint8_t>(alice->key)).IsOk());
        REQUIRE(bob->channel->JoinGroup("lobby").IsOk());
        REQUIRE(bob->channel->SendToGroup("lobby", Presence(true)).IsOk());
        net.Settle();
        REQUIRE(alice->received.size() == 2);
        REQUIRE(alice->received[0].Type() == EnvelopeType::Typing);
        REQUIRE(alice->received[1].Type() == EnvelopeType::Presence);
    }
}
TEST_CASE("SignalingChannel - Inbox, broadcast and group delivery", "[signaling][channel]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    TestNetwork net;
    auto alice = MakePeer(net, "alice");
    auto bob = MakePeer(net, "bob");
    ConnectPeer(net, *alice);
    ConnectPeer(net, *bob);
    SECTION("Inbox") {
        proto::TypingPayload typing;
        typing.set_is_typing(true);
        REQUIRE(alice->channel->Send(typing, std::span<const uint8_t>(bob->key)).IsOk());
        net.Settle();
        REQUIRE(alice->received.empty());
        REQUIRE(bob->received.size() == 1);
        const auto& envelope = bob->received.front();
        REQUIRE(envelope.from == alice->key);
        REQUIRE(envelope.to.has_value());
        REQUIRE(*envelope.to == bob->key);
        REQUIRE(envelope.timestamp_ms == net.clock->WallClockMs());
        REQUIRE(std::get<proto::TypingPayload>(envelope.payload).is_typing());
        REQUIRE(net.broker->PublishedTo(InboxAddress("", bob->key)).size() == 1);
    }
    SECTION("Broadcast skips the sender") {
        REQUIRE(alice->channel->Send(Presence(true), std::nullopt).IsOk());
        net.Settle();
        REQUIRE(alice->received.empty());
        REQUIRE(bob->received.size() == 1);
        REQUIRE_FALSE(bob->received.front().to.has_value());
        REQUIRE(net.broker->PublishedTo(BroadcastAddress("")).size() == 1);
    }
    SECTION("Groups") {
        REQUIRE(alice->channel->JoinGroup("team-7").IsOk());
        REQUIRE(alice->channel->JoinGroup("team-7").IsOk());
        REQUIRE(bob->channel->JoinGroup("team-7").IsOk());
        REQUIRE(alice->channel->Groups().size() == 1);
        REQUIRE(alice->channel->SendToGroup("team-7", Presence(false)).IsOk());
        net.Settle();
        REQUIRE(bob->received.size() == 1);
        REQUIRE(bob->channel->LeaveGroup("team-7").IsOk());
        REQUIRE(bob->channel->LeaveGroup("team-7").IsOk());
        REQUIRE(alice->channel->SendToGroup("team-7", Presence(true)).IsOk());
        net.Settle();
        REQUIRE(bob->received.size() == 1);
        REQUIRE(alice->channel->JoinGroup("bad/group").IsErrAnd([](const ProtocolFailure& f) {
            return f.type == ProtocolFailureType::InvalidInput;
        }));
        REQUIRE(alice->channel->SendToGroup("", Presence(true)).IsErr());
    }
    SECTION("Invalid sends") {
        const std::vector<uint8_t> short_key(16, 1);
        REQUIRE(alice->channel->Send(Presence(true), std::span<const uint8_t>(short_key)).IsErrAnd(
            [](const ProtocolFailure& f) { return f.type == ProtocolFailureType::InvalidInput; }));
        proto::TransportOfferPayload offer;
        offer.set_sdp("v=0");
        REQUIRE(alice->channel->Send(offer, std::span<const uint8_t>(bob->key)).IsErrAnd(
            [](const ProtocolFailure& f) { return f.type == ProtocolFailureType::InvalidInput; }));
        REQUIRE(net.broker->Published().empty());
    }
}
TEST_CASE("SignalingChannel - Type filtered subscriptions", "[signaling][channel]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    TestNetwork net;
    auto alice = MakePeer(net, "alice");
    auto bob = MakePeer(net, "bob");
    ConnectPeer(net, *alice);
    ConnectPeer(net, *bob);
    int presence_count = 0;
    const auto id = bob->channel->Subscribe(EnvelopeType::Presence, [&presence_count](const SignalingEnvelope&) {
        presence_count++;
    });
    proto::TypingPayload typing;
    REQUIRE(alice->channel->Send(typing, std::span<const uint8_t>(bob->key)).IsOk());
    REQUIRE(alice->channel->Send(Presence(true), std::span<const uint8_t>(bob->key)).IsOk());
    net.Settle();
    REQUIRE(presence_count == 1);
    REQUIRE(bob->received.size() == 2);
    REQUIRE(bob->channel->Unsubscribe(id));
    REQUIRE_FALSE(bob->channel->Unsubscribe(id));
    REQUIRE(alice->channel->Send(Presence(false), std::span<const uint8_t>(bob->key)).IsOk());
    net.Settle();
    REQUIRE(presence_count == 1);
    REQUIRE(bob->received.size() == 3);
}
TEST_CASE("SignalingChannel - Ping is answered with a pong", "[signaling][channel]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    TestNetwork net;
    auto alice = MakePeer(net, "alice");
    auto bob = MakePeer(net, "bob");
    ConnectPeer(net, *alice);
    ConnectPeer(net, *bob);
    std::vector<std::string> pongs;
    alice->channel->Subscribe(EnvelopeType::Pong, [&pongs](const SignalingEnvelope& envelope) {
        pongs.push_back(std::get<proto::PongPayload>(envelope.payload).nonce());
    });
    proto::PingPayload ping;
    ping.set_nonce("n-1");
    REQUIRE(alice->channel->Send(ping, std::span<const uint8_t>(bob->key)).IsOk());
    net.Settle();
    REQUIRE(pongs == std::vector<std::string>{"n-1"});
    REQUIRE(bob->received.size() == 1);
    REQUIRE(bob->received.front().Type() == EnvelopeType::Ping);
    SECTION("Broadcast pings are not answered") {
        REQUIRE(alice->channel->Send(ping, std::nullopt).IsOk());
        net.Settle();
        REQUIRE(pongs.size() == 1);
        REQUIRE(bob->received.size() == 2);
    }
}
TEST_CASE("SignalingChannel - Foreign and malformed envelopes are dropped", "[signaling][channel]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    TestNetwork net;
    auto bob = MakePeer(net, "bob");
    ConnectPeer(net, *bob);
    auto raw = net.broker->CreateClient("mallory");
    std::optional<bool> raw_connected;
    raw->Connect([&raw_connected](Result<Unit, ProtocolFailure> outcome) { raw_connected = outcome.IsOk(); });
    net.Settle();
    REQUIRE(raw_connected.value_or(false));
    const auto inbox = InboxAddress("", bob->key);
    SECTION("Addressed to another key") {
        SignalingEnvelope envelope;
        envelope.from = crypto::SodiumInterop::GetRandomBytes(32);
        envelope.to = crypto::SodiumInterop::GetRandomBytes(32);
        envelope.payload = Presence(true);
        envelope.timestamp_ms = net.clock->WallClockMs();
        REQUIRE(raw->Publish(inbox, EnvelopeCodec::Encode(envelope).Unwrap()).IsOk());
        net.Settle();
        REQUIRE(bob->received.empty());
    }
    SECTION("Claiming to come from ourselves") {
        SignalingEnvelope envelope;
        envelope.from = bob->key;
        envelope.to = bob->key;
        envelope.payload = Presence(true);
        REQUIRE(raw->Publish(inbox, EnvelopeCodec::Encode(envelope).Unwrap()).IsOk());
        net.Settle();
        REQUIRE(bob->received.empty());
    }
    SECTION("Not JSON") {
        REQUIRE(raw->Publish(inbox, "{not json").IsOk());
        REQUIRE(raw->Publish(inbox, R"({"type":"teleport","from":"AA==","payload":{}})").IsOk());
        net.Settle();
        REQUIRE(bob->received.empty());
        REQUIRE(bob->channel->IsConnected());
    }
    SECTION("A well formed envelope still arrives") {
        SignalingEnvelope envelope;
        envelope.from = crypto::SodiumInterop::GetRandomBytes(32);
        envelope.to = bob->key;
        envelope.payload = Presence(true);
        REQUIRE(raw->Publish(inbox, EnvelopeCodec::Encode(envelope).Unwrap()).IsOk());
        net.Settle();
        REQUIRE(bob->received.size() == 1);
        REQUIRE(bob->received.front().from == envelope.from);
    }
}
TEST_CASE("SignalingChannel - Namespace prefix", "[signaling][channel]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    TestNetwork net;
    auto config = FastNodeConfig().signaling;
    config.namespace_prefix = "mist/";
    SignalingChannel channel(net.loop, net.broker->CreateClient("alice"), config);
    const auto key = crypto::SodiumInterop::GetRandomBytes(32);
    std::optional<bool> connected;
    channel.Connect(key, [&connected](Result<Unit, ProtocolFailure> outcome) { connected = outcome.IsOk(); });
    net.Settle();
    REQUIRE(connected.value_or(false));
    REQUIRE(channel.Send(Presence(true), std::nullopt).IsOk());
    REQUIRE(net.broker->PublishedTo("mist/broadcast").size() == 1);
    REQUIRE(net.broker->PublishedTo("broadcast").empty());
}
