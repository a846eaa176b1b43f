#pragma once

#include "mist/interfaces/i_session_event_handler.hpp"
#include <string>
#include <utility>
#include <vector>

namespace mist::protocol::test_helpers {
    using PeerKey = std::vector<uint8_t>;

    /// Keeps every event it is told about, in arrival order.
    class RecordingEventHandler final : public interfaces::ISessionEventHandler {
    public:
        struct Message {
            PeerKey peer;
            std::string text;
        };

        void OnFriendAdded(const PeerKey& peer, const enums::TrustOrigin trust_origin) override {
            friends_added.emplace_back(peer, trust_origin);
        }

        void OnMessageDecrypted(const PeerKey& peer, const std::vector<uint8_t>& plaintext) override {
            messages.push_back({peer, std::string(plaintext.begin(), plaintext.end())});
        }

        void OnTransportStateChanged(const PeerKey& peer, const enums::LinkPhase phase) override {
            transport_changes.emplace_back(peer, phase);
        }

        void OnSignalingStateChanged(const enums::SignalingState state) override {
            signaling_states.push_back(state);
        }

        void OnMessageRejected(const PeerKey& peer, const ProtocolFailure& failure) override {
            rejections.emplace_back(peer, failure.type);
        }

        void OnRehandshakeRequired(const PeerKey& peer) override {
            rehandshakes.push_back(peer);
        }

        void OnPresence(const PeerKey& peer, const bool online) override {
            presence.emplace_back(peer, online);
        }

        void OnTyping(const PeerKey& peer, const bool is_typing) override {
            typing.emplace_back(peer, is_typing);
        }

        [[nodiscard]] std::vector<std::string> TextsFrom(const PeerKey& peer) const {
            std::vector<std::string> texts;
            for (const auto& message : messages) {
                if (message.peer == peer) {
                    texts.push_back(message.text);
                }
            }
            return texts;
        }

        std::vector<std::pair<PeerKey, enums::TrustOrigin>> friends_added;
        std::vector<Message> messages;
        std::vector<std::pair<PeerKey, enums::LinkPhase>> transport_changes;
        std::vector<enums::SignalingState> signaling_states;
        std::vector<std::pair<PeerKey, ProtocolFailureType>> rejections;
        std::vector<PeerKey> rehandshakes;
        std::vector<std::pair<PeerKey, bool>> presence;
        std::vector<std::pair<PeerKey, bool>> typing;
    };
}
