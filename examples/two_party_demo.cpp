/**
 * @file two_party_demo.cpp
 * @brief Two nodes befriend each other and talk over the relay, then over a direct link
 *
 * Usage: mist_two_party_demo [node-config.json]
 */

#include "mist/configuration/node_config.hpp"
#include "mist/crypto/sodium_interop.hpp"
#include "mist/orchestrator/session_orchestrator.hpp"
#include "mist/runtime/clock.hpp"
#include "mist/runtime/event_loop.hpp"
#include "mist/signaling/memory_broker.hpp"
#include "mist/transport/loopback_direct_channel.hpp"
#include "mist/utilities/key_encoding.hpp"

#include <iostream>
#include <memory>
#include <string>

using namespace mist::protocol;

namespace {

class PrintingEventHandler final : public interfaces::ISessionEventHandler {
public:
    explicit PrintingEventHandler(std::string name) : name_(std::move(name)) {}

    void OnFriendAdded(const std::vector<uint8_t>& peer, const enums::TrustOrigin trust_origin) override {
        std::cout << "   [" << name_ << "] friend added: " << utilities::ToUrlSafeBase64(peer).substr(0, 12)
                  << " (" << enums::ToString(trust_origin) << ")" << std::endl;
    }

    void OnMessageDecrypted(const std::vector<uint8_t>& /*peer*/, const std::vector<uint8_t>& plaintext) override {
        std::cout << "   [" << name_ << "] received: " << std::string(plaintext.begin(), plaintext.end())
                  << std::endl;
    }

    void OnTransportStateChanged(const std::vector<uint8_t>& /*peer*/, const enums::LinkPhase phase) override {
        std::cout << "   [" << name_ << "] direct link " << enums::ToString(phase) << std::endl;
    }

    void OnSignalingStateChanged(const enums::SignalingState state) override {
        std::cout << "   [" << name_ << "] signaling " << enums::ToString(state) << std::endl;
    }

    void OnMessageRejected(const std::vector<uint8_t>& /*peer*/, const ProtocolFailure& failure) override {
        std::cerr << "   [" << name_ << "] rejected: " << failure.message << std::endl;
    }

    void OnRehandshakeRequired(const std::vector<uint8_t>& /*peer*/) override {
        std::cerr << "   [" << name_ << "] session lost, handshake again" << std::endl;
    }

    void OnPresence(const std::vector<uint8_t>& /*peer*/, bool /*online*/) override {}
    void OnTyping(const std::vector<uint8_t>& /*peer*/, bool /*is_typing*/) override {}

private:
    std::string name_;
};

std::unique_ptr<orchestrator::SessionOrchestrator> CreateNode(
    runtime::EventLoop& loop,
    const configuration::NodeConfig& config,
    signaling::MemoryBroker& broker,
    transport::LoopbackNetwork& network,
    const std::string& name) {
    auto created = orchestrator::SessionOrchestrator::Create(
        loop, config, broker.CreateClient(name), network.CreateFactory(),
        std::make_shared<PrintingEventHandler>(name), nullptr);
    if (created.IsErr()) {
        std::cerr << "Failed to create " << name << ": " << created.UnwrapErr().message << std::endl;
        return nullptr;
    }
    return std::move(created).Unwrap();
}

bool Send(orchestrator::SessionOrchestrator& from, const std::vector<uint8_t>& to, const std::string& text) {
    const auto bytes = utilities::BytesOf(text);
    if (!from.SendPlaintext(to, bytes)) {
        std::cerr << "Failed to send \"" << text << "\"" << std::endl;
        return false;
    }
    return true;
}

}

int main(int argc, char* argv[]) {
    std::cout << "=== Mist - Two Party Demo ===" << std::endl;
    std::cout << std::endl;

    auto config = configuration::NodeConfig::Default();
    if (argc > 1) {
        auto loaded = configuration::LoadNodeConfig(argv[1]);
        if (loaded.IsErr()) {
            std::cerr << "Failed to load " << argv[1] << ": " << loaded.UnwrapErr().message << std::endl;
            return 1;
        }
        config = std::move(loaded).Unwrap();
    }
    // Both nodes live in this process; a shared data directory would give them one identity.
    config.storage.data_directory.clear();
    configuration::ApplyLoggingConfig(config.logging);

    if (auto initialized = crypto::SodiumInterop::Initialize(); initialized.IsErr()) {
        std::cerr << "Failed to initialize libsodium: " << initialized.UnwrapErr().message << std::endl;
        return 1;
    }

    auto clock = std::make_shared<runtime::ManualClock>();
    runtime::EventLoop loop(clock);
    auto broker = signaling::MemoryBroker::Create(loop);
    auto network = transport::LoopbackNetwork::Create(loop);

    std::cout << "1. Starting alice and bob..." << std::endl;
    auto alice = CreateNode(loop, config, *broker, *network, "alice");
    auto bob = CreateNode(loop, config, *broker, *network, "bob");
    if (!alice || !bob) {
        return 1;
    }
    bool started = true;
    const auto on_ready = [&started](const Result<Unit, ProtocolFailure>& outcome) {
        if (outcome.IsErr()) {
            std::cerr << "Signaling failed: " << outcome.UnwrapErr().message << std::endl;
            started = false;
        }
    };
    alice->Start(on_ready);
    bob->Start(on_ready);
    loop.RunUntilIdle();
    if (!started) {
        return 1;
    }
    std::cout << std::endl;

    std::cout << "2. Verifying face to face..." << std::endl;
    auto verification = bob->IssueVerification();
    if (verification.IsErr()) {
        std::cerr << "Failed to issue a code: " << verification.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   bob shows code " << verification.Unwrap().verification_code() << std::endl;
    if (auto added = alice->AddFriendFromVerification(verification.Unwrap(), "bob"); added.IsErr()) {
        std::cerr << "Failed to add bob: " << added.UnwrapErr().message << std::endl;
        return 1;
    }
    loop.RunUntilIdle();
    std::cout << std::endl;

    std::cout << "3. Talking over the relay..." << std::endl;
    if (!Send(*alice, bob->SelfPublicKey(), "hello")) {
        return 1;
    }
    loop.RunUntilIdle();
    if (!Send(*bob, alice->SelfPublicKey(), "hi")) {
        return 1;
    }
    loop.RunUntilIdle();
    std::cout << std::endl;

    std::cout << "4. Opening a direct link..." << std::endl;
    alice->ConnectDirect(bob->SelfPublicKey());
    loop.RunUntilIdle();
    if (!Send(*alice, bob->SelfPublicKey(), "this one skipped the relay")) {
        return 1;
    }
    loop.RunUntilIdle();
    std::cout << std::endl;

    std::cout << "5. Shutting down..." << std::endl;
    const auto alice_down = alice->Shutdown();
    const auto bob_down = bob->Shutdown();
    loop.RunUntilIdle();
    if (alice_down.IsErr() || bob_down.IsErr()) {
        std::cerr << "Shutdown failed" << std::endl;
        return 1;
    }

    std::cout << std::endl;
    std::cout << "=== Demo completed successfully ===" << std::endl;
    return 0;
}
