#include <catch2/catch_test_macros.hpp>
#include "helpers/test_network.hpp"
#include "mist/signaling/addresses.hpp"
#include <algorithm>
using namespace mist::protocol;
using namespace mist::protocol::test_helpers;
using enums::TrustOrigin;
namespace {
    /// Raw broker client that publishes envelopes under any sender key.
    class Injector {
    public:
        explicit Injector(TestNetwork& net) : net_(net), client_(net.broker->CreateClient("mallory")) {
            std::optional<bool> connected;
            client_->Connect([&connected](const Result<Unit, ProtocolFailure>& outcome) {
                connected = outcome.IsOk();
            });
            net_.Settle();
            REQUIRE(connected.value_or(false));
        }

        void Send(const PeerKey& from, const PeerKey& to, signaling::EnvelopePayload payload) {
            signaling::SignalingEnvelope envelope;
            envelope.from = from;
            envelope.to = to;
            envelope.payload = std::move(payload);
            envelope.timestamp_ms = net_.clock->WallClockMs();
            auto encoded = signaling::EnvelopeCodec::Encode(envelope);
            REQUIRE(encoded.IsOk());
            Publish(to, encoded.Unwrap());
        }

        void Publish(const PeerKey& to, const std::string& wire) {
            REQUIRE(client_->Publish(signaling::InboxAddress("", to), wire).IsOk());
            net_.Settle();
        }

    private:
        TestNetwork& net_;
        std::unique_ptr<signaling::MemoryPubSubTransport> client_;
    };

    proto::protocol::RelayedCiphertextPayload Relayed(const std::string& bytes) {
        proto::protocol::RelayedCiphertextPayload payload;
        payload.set_ciphertext(bytes);
        return payload;
    }

    bool RejectedWith(const TestNode& node, const PeerKey& peer, const ProtocolFailureType type) {
        const std::pair<PeerKey, ProtocolFailureType> expected{peer, type};
        return std::find(node.events->rejections.begin(), node.events->rejections.end(), expected) !=
               node.events->rejections.end();
    }
}
TEST_CASE("Attacks - Handshake-init naming another identity", "[security][attacks]") {
    TestNetwork net;
    auto alice = CreateNode(net, "alice");
    auto bob = CreateNode(net, "bob");
    auto mallory = CreateNode(net, "mallory-node");
    StartNode(net, alice);
    StartNode(net, bob);
    StartNode(net, mallory);
    SeedContact(bob, alice, TrustOrigin::DirectVerification);
    auto genuine = alice->Sessions().InitiateHandshake(bob.Key(), bob->PublicBundle());
    REQUIRE(genuine.IsOk());
    auto spoofed = genuine.Unwrap().ToPayload();
    REQUIRE(mallory->Signaling().Send(spoofed, std::span<const uint8_t>(bob.Key())).IsOk());
    net.Settle();
    REQUIRE_FALSE(bob->Sessions().HasSession(alice.Key()));
    REQUIRE_FALSE(bob->Sessions().HasSession(mallory.Key()));
    REQUIRE(bob.events->friends_added.empty());
    REQUIRE(bob.events->rejections.empty());
}
TEST_CASE("Attacks - Malformed ciphertext from a contact", "[security][attacks]") {
    TestNetwork net;
    auto alice = CreateNode(net, "alice");
    auto bob = CreateNode(net, "bob");
    StartNode(net, alice);
    StartNode(net, bob);
    EstablishSession(net, alice, bob);
    Injector mallory(net);
    mallory.Send(alice.Key(), bob.Key(), Relayed(std::string("\xFF\xFF\xFF\xFF", 4)));
    REQUIRE(RejectedWith(bob, alice.Key(), ProtocolFailureType::Decode));
    REQUIRE(bob.events->messages.empty());
    REQUIRE(alice->SendPlaintext(bob.Key(), Bytes("still fine")));
    net.Settle();
    REQUIRE(bob.events->TextsFrom(alice.Key()) == std::vector<std::string>{"still fine"});
}
TEST_CASE("Attacks - Tampered and replayed relayed ciphertext", "[security][attacks]") {
    TestNetwork net;
    auto alice = CreateNode(net, "alice");
    auto bob = CreateNode(net, "bob");
    StartNode(net, alice);
    StartNode(net, bob);
    EstablishSession(net, alice, bob);
    net.broker->ClearPublished();
    net.broker->DropNextPublishes(1);
    REQUIRE(alice->SendPlaintext(bob.Key(), Bytes("genuine")));
    net.Settle();
    REQUIRE(bob.events->messages.empty());
    const auto captured = net.broker->PublishedTo(signaling::InboxAddress("", bob.Key()));
    REQUIRE(captured.size() == 1);
    const std::string wire = captured[0].payload;
    auto decoded = signaling::EnvelopeCodec::Decode(wire);
    REQUIRE(decoded.IsOk());
    const auto& relayed = std::get<proto::protocol::RelayedCiphertextPayload>(decoded.Unwrap().payload);
    proto::protocol::RatchetMessage message;
    REQUIRE(message.ParseFromString(relayed.ciphertext()));
    (*message.mutable_ciphertext())[0] ^= 0x01;
    Injector mallory(net);
    mallory.Send(alice.Key(), bob.Key(), Relayed(message.SerializeAsString()));
    REQUIRE(RejectedWith(bob, alice.Key(), ProtocolFailureType::DecryptionFailed));
    REQUIRE(bob->Sessions().StateOf(alice.Key()) == enums::SessionState::EstablishedAwaitingFirstMessage);
    mallory.Publish(bob.Key(), wire);
    REQUIRE(bob.events->TextsFrom(alice.Key()) == std::vector<std::string>{"genuine"});
    REQUIRE(bob->Sessions().StateOf(alice.Key()) == enums::SessionState::Established);
    const auto rejections_before_replay = bob.events->rejections.size();
    mallory.Publish(bob.Key(), wire);
    REQUIRE(bob.events->rejections.size() == rejections_before_replay + 1);
    REQUIRE(bob.events->TextsFrom(alice.Key()).size() == 1);
    REQUIRE(bob->SendPlaintext(alice.Key(), Bytes("got it")));
    net.Settle();
    REQUIRE(alice.events->TextsFrom(bob.Key()) == std::vector<std::string>{"got it"});
}
TEST_CASE("Attacks - Made-up trust code", "[security][attacks][trust]") {
    TestNetwork net;
    auto alice = CreateNode(net, "alice");
    auto bob = CreateNode(net, "bob");
    auto carol = CreateNode(net, "carol");
    StartNode(net, alice);
    StartNode(net, bob);
    StartNode(net, carol);
    const auto verification = bob->IssueVerification().Unwrap();
    const std::string guess = verification.verification_code() == "123456" ? "654321" : "123456";
    REQUIRE(carol->AddFriend(bob.Key(), bob->PublicBundle(), "bob", TrustOrigin::DirectVerification, guess).IsOk());
    net.Settle();
    REQUIRE_FALSE(bob->Sessions().HasSession(carol.Key()));
    REQUIRE_FALSE(bob->Contacts().Contains(carol.Key()));
    REQUIRE(bob.events->friends_added.empty());
    SECTION("The real code still works afterwards") {
        REQUIRE(alice->AddFriendFromVerification(verification, "bob").IsOk());
        net.Settle();
        REQUIRE(bob->Sessions().HasSession(alice.Key()));
        REQUIRE(bob.events->friends_added == std::vector<std::pair<PeerKey, TrustOrigin>>{
            {alice.Key(), TrustOrigin::DirectVerification}});
    }
}
TEST_CASE("Attacks - Prekey bundle responses", "[security][attacks]") {
    TestNetwork net;
    auto alice = CreateNode(net, "alice");
    auto bob = CreateNode(net, "bob");
    auto carol = CreateNode(net, "carol");
    StartNode(net, alice);
    StartNode(net, bob);
    StartNode(net, carol);
    // bob is away, so only forged answers reach alice.
    REQUIRE(bob->Shutdown().IsOk());
    net.Settle();
    REQUIRE(alice->AddFriend(bob.Key(), std::nullopt, "bob", TrustOrigin::SharedLink).IsOk());
    net.Settle();
    Injector mallory(net);
    SECTION("Bad signature") {
        proto::protocol::PrekeyBundlePayload forged;
        *forged.mutable_bundle() = bob->PublicBundle();
        (*forged.mutable_bundle()->mutable_signed_prekey_signature())[0] ^= 0x01;
        mallory.Send(bob.Key(), alice.Key(), forged);
        REQUIRE(RejectedWith(alice, bob.Key(), ProtocolFailureType::SignatureInvalid));
        REQUIRE_FALSE(alice->Sessions().HasSession(bob.Key()));
        REQUIRE(alice.events->friends_added.empty());
    }
    SECTION("Bundle of another identity") {
        proto::protocol::PrekeyBundlePayload swapped;
        *swapped.mutable_bundle() = carol->PublicBundle();
        mallory.Send(bob.Key(), alice.Key(), swapped);
        REQUIRE_FALSE(alice->Sessions().HasSession(bob.Key()));
        REQUIRE_FALSE(alice->Sessions().HasSession(carol.Key()));
        REQUIRE(alice.events->rejections.empty());
        proto::protocol::PrekeyBundlePayload genuine;
        *genuine.mutable_bundle() = bob->PublicBundle();
        mallory.Send(bob.Key(), alice.Key(), genuine);
        REQUIRE(alice->Sessions().HasSession(bob.Key()));
        REQUIRE(alice.events->friends_added == std::vector<std::pair<PeerKey, TrustOrigin>>{
            {bob.Key(), TrustOrigin::SharedLink}});
    }
    SECTION("Unsolicited bundle") {
        proto::protocol::PrekeyBundlePayload unsolicited;
        *unsolicited.mutable_bundle() = carol->PublicBundle();
        REQUIRE(carol->Signaling().Send(unsolicited, std::span<const uint8_t>(alice.Key())).IsOk());
        net.Settle();
        REQUIRE_FALSE(alice->Sessions().HasSession(carol.Key()));
        REQUIRE_FALSE(alice->Contacts().Contains(carol.Key()));
    }
}
TEST_CASE("Attacks - Traffic from unknown keys leaves no trace", "[security][attacks][transport]") {
    TestNetwork net;
    auto alice = CreateNode(net, "alice");
    StartNode(net, alice);
    Injector mallory(net);
    for (int i = 0; i < 20; ++i) {
        const PeerKey stranger = crypto::SodiumInterop::GetRandomBytes(32);
        mallory.Send(stranger, alice.Key(), Relayed("\x01\x02"));
        proto::protocol::TransportOfferPayload offer;
        offer.set_negotiation_id("n" + std::to_string(i));
        offer.set_sdp("offer");
        mallory.Send(stranger, alice.Key(), offer);
    }
    REQUIRE(alice->Router().LinkCount() == 0);
    REQUIRE(net.network->CreatedChannelCount() == 0);
    REQUIRE(alice.events->rejections.empty());
    REQUIRE(alice.events->transport_changes.empty());
}
