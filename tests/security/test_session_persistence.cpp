#include <catch2/catch_test_macros.hpp>
#include "helpers/test_network.hpp"
#include <filesystem>
using namespace mist::protocol;
using namespace mist::protocol::test_helpers;
using enums::TrustOrigin;
namespace {
    struct ScopedDirectory {
        std::filesystem::path path = std::filesystem::temp_directory_path() /
            ("mist-node-" + utilities::ToUrlSafeBase64(crypto::SodiumInterop::GetRandomBytes(8)));
        ~ScopedDirectory() {
            std::error_code ec;
            std::filesystem::remove_all(path, ec);
        }
    };

    TestNode Restart(TestNetwork& net, TestNode& node, const std::string& name) {
        auto store = node.store;
        node.node.reset();
        net.Settle();
        auto restarted = CreateNode(net, name, store);
        StartNode(net, restarted);
        return restarted;
    }
}
TEST_CASE("Persistence - Conversation continues after a restart", "[security][persistence]") {
    TestNetwork net;
    auto alice = CreateNode(net, "alice");
    auto bob = CreateNode(net, "bob");
    StartNode(net, alice);
    StartNode(net, bob);
    EstablishSession(net, alice, bob);
    REQUIRE(alice->SendPlaintext(bob.Key(), Bytes("one")));
    net.Settle();
    REQUIRE(bob->SendPlaintext(alice.Key(), Bytes("two")));
    net.Settle();
    const auto alice_key = alice.Key();
    auto restarted = Restart(net, alice, "alice-again");
    REQUIRE(restarted.Key() == alice_key);
    REQUIRE(restarted->Contacts().Contains(bob.Key()));
    REQUIRE(restarted->Sessions().StateOf(bob.Key()) == enums::SessionState::Established);
    REQUIRE(restarted->SendPlaintext(bob.Key(), Bytes("three")));
    net.Settle();
    REQUIRE(bob->SendPlaintext(restarted.Key(), Bytes("four")));
    net.Settle();
    REQUIRE(bob.events->TextsFrom(alice_key) == std::vector<std::string>{"one", "three"});
    REQUIRE(restarted.events->TextsFrom(bob.Key()) == std::vector<std::string>{"four"});
    REQUIRE(restarted.events->rejections.empty());
}
TEST_CASE("Persistence - Unconfirmed handshake is resent after a restart", "[security][persistence]") {
    TestNetwork net;
    auto alice = CreateNode(net, "alice");
    auto bob = CreateNode(net, "bob");
    StartNode(net, alice);
    StartNode(net, bob);
    SeedContact(bob, alice, TrustOrigin::DirectVerification);
    net.broker->DropNextPublishes(1);
    REQUIRE(alice->AddFriend(bob.Key(), bob->PublicBundle(), "bob", TrustOrigin::DirectVerification).IsOk());
    net.Settle();
    REQUIRE_FALSE(bob->Sessions().HasSession(alice.Key()));
    REQUIRE(alice.store->List(storage::kHandshakesNamespace).Unwrap().size() == 1);
    auto restarted = Restart(net, alice, "alice-again");
    REQUIRE(bob->Sessions().RoleOf(restarted.Key()) == enums::SessionRole::Responder);
    REQUIRE(restarted->SendPlaintext(bob.Key(), Bytes("made it")));
    net.Settle();
    REQUIRE(bob.events->TextsFrom(restarted.Key()) == std::vector<std::string>{"made it"});
    REQUIRE(bob->SendPlaintext(restarted.Key(), Bytes("ack")));
    net.Settle();
    REQUIRE(restarted.events->TextsFrom(bob.Key()) == std::vector<std::string>{"ack"});
    REQUIRE(restarted.store->List(storage::kHandshakesNamespace).Unwrap().empty());
}
TEST_CASE("Persistence - Corrupt session record is discarded at restart", "[security][persistence]") {
    TestNetwork net;
    auto alice = CreateNode(net, "alice");
    auto bob = CreateNode(net, "bob");
    StartNode(net, alice);
    StartNode(net, bob);
    EstablishSession(net, alice, bob);
    REQUIRE(alice->SendPlaintext(bob.Key(), Bytes("hello")));
    net.Settle();
    auto store = alice.store;
    alice.node.reset();
    net.Settle();
    const auto names = store->List(storage::kSessionsNamespace).Unwrap();
    REQUIRE(names.size() == 1);
    REQUIRE(store->Put(storage::kSessionsNamespace, names[0], Bytes("not a session")).IsOk());
    auto restarted = CreateNode(net, "alice-again", store);
    StartNode(net, restarted);
    REQUIRE_FALSE(restarted->Sessions().HasSession(bob.Key()));
    REQUIRE(restarted->Contacts().Contains(bob.Key()));
    REQUIRE(store->List(storage::kSessionsNamespace).Unwrap().empty());
    REQUIRE_FALSE(restarted->SendPlaintext(bob.Key(), Bytes("lost")));
    REQUIRE(restarted.events->rehandshakes == std::vector<PeerKey>{bob.Key()});
    SECTION("Ciphertext for the dropped session asks for a new handshake") {
        REQUIRE(bob->SendPlaintext(restarted.Key(), Bytes("hi")));
        net.Settle();
        REQUIRE(restarted.events->rehandshakes.size() == 2);
        REQUIRE(restarted.events->messages.empty());
    }
    SECTION("A fresh handshake recovers") {
        REQUIRE(bob->RemoveFriend(restarted.Key()).IsOk());
        SeedContact(bob, restarted, TrustOrigin::DirectVerification);
        REQUIRE(restarted->AddFriend(bob.Key(), bob->PublicBundle(), "bob", TrustOrigin::DirectVerification).IsOk());
        net.Settle();
        REQUIRE(restarted->SendPlaintext(bob.Key(), Bytes("back")));
        net.Settle();
        REQUIRE(bob.events->TextsFrom(restarted.Key()).back() == "back");
    }
}
TEST_CASE("Persistence - Failed write while decrypting", "[security][persistence][storage]") {
    TestNetwork net;
    auto alice = CreateNode(net, "alice");
    auto bob = CreateNode(net, "bob");
    StartNode(net, alice);
    StartNode(net, bob);
    EstablishSession(net, alice, bob);
    REQUIRE(alice->SendPlaintext(bob.Key(), Bytes("first")));
    net.Settle();
    bob.store->SetWritesFailing(true);
    REQUIRE(alice->SendPlaintext(bob.Key(), Bytes("unsaved")));
    net.Settle();
    REQUIRE(bob.events->rejections == std::vector<std::pair<PeerKey, ProtocolFailureType>>{
        {alice.Key(), ProtocolFailureType::Storage}});
    REQUIRE(bob.events->TextsFrom(alice.Key()) == std::vector<std::string>{"first"});
    bob.store->SetWritesFailing(false);
    REQUIRE(alice->SendPlaintext(bob.Key(), Bytes("saved")));
    net.Settle();
    REQUIRE(bob.events->TextsFrom(alice.Key()) == std::vector<std::string>{"first", "saved"});
}
TEST_CASE("Persistence - Data directory keeps the identity", "[security][persistence][storage]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    TestNetwork net;
    ScopedDirectory directory;
    auto config = FastNodeConfig();
    config.storage.data_directory = directory.path;
    const auto open = [&net, &config](const std::string& client) {
        auto created = SessionOrchestrator::Create(
            net.loop, config, net.broker->CreateClient(client), net.network->CreateFactory(),
            std::make_shared<RecordingEventHandler>(), nullptr);
        REQUIRE(created.IsOk());
        return std::move(created).Unwrap();
    };
    auto first = open("first-run");
    const PeerKey key = first->SelfPublicKey();
    const auto bundle = first->PublicBundle();
    first.reset();
    net.Settle();
    REQUIRE(std::filesystem::exists(directory.path / std::string(storage::kIdentityNamespace)));
    auto second = open("second-run");
    REQUIRE(second->SelfPublicKey() == key);
    REQUIRE(second->PublicBundle().signed_prekey() == bundle.signed_prekey());
}
