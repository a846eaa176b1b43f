#include "mist/protocol/ratchet_session.hpp"
#include "mist/protocol/constants.hpp"
#include "mist/crypto/aes_gcm.hpp"
#include "mist/crypto/hkdf.hpp"
#include "mist/crypto/sodium_interop.hpp"
#include "mist/crypto/sodium_secure_memory_handle.hpp"
#include "mist/utilities/key_encoding.hpp"
#include "mist/core/logging.hpp"
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <fmt/core.h>
#include <algorithm>
#include <limits>
#include <string>
#include <utility>

namespace mist::protocol {
    using crypto::AesGcm;
    using crypto::Hkdf;
    using crypto::SodiumInterop;
    using mist::proto::protocol::RatchetMessage;
    using mist::proto::protocol::RatchetState;

    namespace {
        // Skipped keys kept across all chains before the oldest are evicted
        constexpr int kMaxStoredSkippedKeys = static_cast<int>(2 * kMaxSkippedMessageKeys);

        void WipeBytes(std::vector<uint8_t>& bytes) {
            auto _wipe = SodiumInterop::SecureWipe(std::span<uint8_t>(bytes));
            (void) _wipe;
        }

        std::vector<uint8_t> BytesFromString(const std::string& value) {
            return {value.begin(), value.end()};
        }

        std::span<const uint8_t> SpanOf(const std::string& value) {
            return {reinterpret_cast<const uint8_t*>(value.data()), value.size()};
        }

        void AppendUint32(std::vector<uint8_t>& out, const uint32_t value) {
            out.push_back(static_cast<uint8_t>(value >> 24));
            out.push_back(static_cast<uint8_t>(value >> 16));
            out.push_back(static_cast<uint8_t>(value >> 8));
            out.push_back(static_cast<uint8_t>(value));
        }

        Result<std::vector<uint8_t>, ProtocolFailure> SerializeDeterministic(
            const google::protobuf::Message& message) {
            std::string output;
            {
                google::protobuf::io::StringOutputStream stream(&output);
                google::protobuf::io::CodedOutputStream coded_out(&stream);
                coded_out.SetSerializationDeterministic(true);
                if (!message.SerializeToCodedStream(&coded_out) || coded_out.HadError()) {
                    return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                        ProtocolFailure::Encode("Failed to serialize protobuf deterministically"));
                }
            }
            return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(
                std::vector<uint8_t>(output.begin(), output.end()));
        }

        /// HMAC over the deterministic encoding of the state with state_hmac cleared.
        Result<std::vector<uint8_t>, ProtocolFailure> ComputeStateMac(const RatchetState& state) {
            RatchetState mac_state = state;
            mac_state.clear_state_hmac();
            auto mac_key_result = Hkdf::DeriveKeyBytes(
                SpanOf(state.root_key()), kHmacBytes, {}, kStateHmacInfo);
            if (mac_key_result.IsErr()) {
                return mac_key_result;
            }
            auto mac_key = std::move(mac_key_result).Unwrap();
            auto serialized_result = SerializeDeterministic(mac_state);
            if (serialized_result.IsErr()) {
                WipeBytes(mac_key);
                return serialized_result;
            }
            auto serialized = std::move(serialized_result).Unwrap();
            auto mac = SodiumInterop::HmacSha256(mac_key, serialized);
            WipeBytes(serialized);
            WipeBytes(mac_key);
            return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(mac));
        }

        /// (root key, chain key) = HKDF(salt = root, ikm = dh)
        Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, ProtocolFailure> KdfRoot(
            std::span<const uint8_t> root_key,
            std::span<const uint8_t> dh_output) {
            using KdfResult = Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, ProtocolFailure>;
            auto okm_result = Hkdf::DeriveKeyBytes(dh_output, kKdfRootOutputBytes, root_key, kRatchetInfo);
            if (okm_result.IsErr()) {
                return KdfResult::Err(okm_result.UnwrapErr());
            }
            auto okm = std::move(okm_result).Unwrap();
            std::vector<uint8_t> new_root(okm.begin(), okm.begin() + kRootKeyBytes);
            std::vector<uint8_t> chain_key(okm.begin() + kRootKeyBytes, okm.end());
            WipeBytes(okm);
            return KdfResult::Ok(std::make_pair(std::move(new_root), std::move(chain_key)));
        }

        /// (message key, next chain key)
        std::pair<std::vector<uint8_t>, std::vector<uint8_t>> KdfChain(std::span<const uint8_t> chain_key) {
            const uint8_t message_seed[] = {kMessageKeySeed};
            const uint8_t chain_seed[] = {kChainKeySeed};
            return {SodiumInterop::HmacSha256(chain_key, message_seed),
                    SodiumInterop::HmacSha256(chain_key, chain_seed)};
        }

        std::vector<uint8_t> BuildIdentityBinding(
            std::span<const uint8_t> local_identity,
            std::span<const uint8_t> peer_identity) {
            std::vector<uint8_t> binding(kAssociatedDataLabel.begin(), kAssociatedDataLabel.end());
            const bool local_first = utilities::CompareKeys(local_identity, peer_identity) <= 0;
            const auto first = local_first ? local_identity : peer_identity;
            const auto second = local_first ? peer_identity : local_identity;
            binding.insert(binding.end(), first.begin(), first.end());
            binding.insert(binding.end(), second.begin(), second.end());
            return binding;
        }

        std::vector<uint8_t> BuildMessageAssociatedData(
            const RatchetState& state,
            const std::string& dh_public,
            const uint32_t prev_chain_count,
            const uint32_t message_number) {
            std::vector<uint8_t> ad = BytesFromString(state.associated_data());
            ad.insert(ad.end(), dh_public.begin(), dh_public.end());
            AppendUint32(ad, prev_chain_count);
            AppendUint32(ad, message_number);
            return ad;
        }

        Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, ProtocolFailure> GenerateRatchetKeyPair() {
            using PairResult = Result<std::pair<std::vector<uint8_t>, std::vector<uint8_t>>, ProtocolFailure>;
            auto pair_result = SodiumInterop::GenerateX25519KeyPair(kPurposeRatchetX25519);
            if (pair_result.IsErr()) {
                return PairResult::Err(pair_result.UnwrapErr());
            }
            auto [handle, public_key] = std::move(pair_result).Unwrap();
            auto secret = handle.ReadBytes();
            if (secret.IsErr()) {
                return PairResult::Err(ProtocolFailure::FromSodiumFailure(secret.UnwrapErr()));
            }
            return PairResult::Ok(std::make_pair(std::move(secret).Unwrap(), std::move(public_key)));
        }

        std::optional<std::vector<uint8_t>> TakeSkippedKey(
            RatchetState& state,
            const std::string& dh_public,
            const uint32_t message_number) {
            auto* skipped = state.mutable_skipped_message_keys();
            for (int i = 0; i < skipped->size(); ++i) {
                const auto& entry = skipped->Get(i);
                if (entry.message_number() == message_number && entry.dh_public() == dh_public) {
                    auto key = BytesFromString(entry.message_key());
                    skipped->DeleteSubrange(i, 1);
                    return key;
                }
            }
            return std::nullopt;
        }

        /// Advances the receiving chain to until, storing the keys passed over.
        Result<Unit, ProtocolFailure> SkipMessageKeys(RatchetState& state, const uint32_t until) {
            auto* recv = state.mutable_recv_chain();
            if (recv->chain_key().empty()) {
                return Result<Unit, ProtocolFailure>::Ok(unit);
            }
            if (until > recv->message_number() &&
                until - recv->message_number() > kMaxSkippedMessageKeys) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::DecryptionFailed(fmt::format(
                        "Message skips {} keys (limit {})",
                        until - recv->message_number(), kMaxSkippedMessageKeys)));
            }
            while (recv->message_number() < until) {
                auto [message_key, next_chain] = KdfChain(SpanOf(recv->chain_key()));
                auto* entry = state.add_skipped_message_keys();
                entry->set_dh_public(state.dh_remote_public());
                entry->set_message_number(recv->message_number());
                entry->set_message_key(message_key.data(), message_key.size());
                recv->set_chain_key(next_chain.data(), next_chain.size());
                recv->set_message_number(recv->message_number() + 1);
                WipeBytes(message_key);
                WipeBytes(next_chain);
            }
            const int overflow = state.skipped_message_keys_size() - kMaxStoredSkippedKeys;
            if (overflow > 0) {
                state.mutable_skipped_message_keys()->DeleteSubrange(0, overflow);
            }
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }

        Result<Unit, ProtocolFailure> DhRatchetStep(RatchetState& state, const std::string& remote_public) {
            state.set_previous_send_count(state.send_chain().message_number());
            state.set_dh_remote_public(remote_public);

            auto dh_recv = SodiumInterop::ComputeX25519(
                SpanOf(state.dh_local_private()), SpanOf(remote_public), "ratchet-recv");
            if (dh_recv.IsErr()) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::DecryptionFailed(dh_recv.UnwrapErr().message));
            }
            auto dh_recv_bytes = std::move(dh_recv).Unwrap();
            auto recv_kdf = KdfRoot(SpanOf(state.root_key()), dh_recv_bytes);
            WipeBytes(dh_recv_bytes);
            if (recv_kdf.IsErr()) {
                return Result<Unit, ProtocolFailure>::Err(recv_kdf.UnwrapErr());
            }
            auto [root_after_recv, recv_chain] = std::move(recv_kdf).Unwrap();
            state.mutable_recv_chain()->set_chain_key(recv_chain.data(), recv_chain.size());
            state.mutable_recv_chain()->set_message_number(0);
            WipeBytes(recv_chain);

            auto pair_result = GenerateRatchetKeyPair();
            if (pair_result.IsErr()) {
                WipeBytes(root_after_recv);
                return Result<Unit, ProtocolFailure>::Err(pair_result.UnwrapErr());
            }
            auto [local_private, local_public] = std::move(pair_result).Unwrap();
            auto dh_send = SodiumInterop::ComputeX25519(local_private, SpanOf(remote_public), "ratchet-send");
            if (dh_send.IsErr()) {
                WipeBytes(root_after_recv);
                WipeBytes(local_private);
                return Result<Unit, ProtocolFailure>::Err(dh_send.UnwrapErr());
            }
            auto dh_send_bytes = std::move(dh_send).Unwrap();
            auto send_kdf = KdfRoot(root_after_recv, dh_send_bytes);
            WipeBytes(dh_send_bytes);
            WipeBytes(root_after_recv);
            if (send_kdf.IsErr()) {
                WipeBytes(local_private);
                return Result<Unit, ProtocolFailure>::Err(send_kdf.UnwrapErr());
            }
            auto [root_after_send, send_chain] = std::move(send_kdf).Unwrap();
            state.set_root_key(root_after_send.data(), root_after_send.size());
            state.mutable_send_chain()->set_chain_key(send_chain.data(), send_chain.size());
            state.mutable_send_chain()->set_message_number(0);
            state.set_dh_local_private(local_private.data(), local_private.size());
            state.set_dh_local_public(local_public.data(), local_public.size());
            WipeBytes(root_after_send);
            WipeBytes(send_chain);
            WipeBytes(local_private);
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }

        Result<std::vector<uint8_t>, ProtocolFailure> OpenMessage(
            const RatchetState& state,
            std::vector<uint8_t>& message_key,
            const RatchetMessage& message) {
            const auto ad = BuildMessageAssociatedData(
                state, message.dh_public(), message.prev_chain_count(), message.message_number());
            auto plaintext = AesGcm::Decrypt(message_key, SpanOf(message.nonce()), SpanOf(message.ciphertext()), ad);
            WipeBytes(message_key);
            return plaintext;
        }

        Result<Unit, ProtocolFailure> ValidateMessage(const RatchetMessage& message) {
            if (message.dh_public().size() != kX25519PublicKeyBytes) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::DecryptionFailed("Ratchet header key must be 32 bytes"));
            }
            if (message.nonce().size() != kAesGcmNonceBytes) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::DecryptionFailed("Message nonce must be 12 bytes"));
            }
            if (message.ciphertext().size() < kAesGcmTagBytes) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::DecryptionFailed("Ciphertext shorter than the authentication tag"));
            }
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }
    }

    RatchetSession::RatchetSession(RatchetState state)
        : state_(std::move(state)) {
    }

    RatchetSession::~RatchetSession() {
        state_.clear_root_key();
        state_.clear_dh_local_private();
        state_.clear_skipped_message_keys();
    }

    Result<std::unique_ptr<RatchetSession>, ProtocolFailure> RatchetSession::InitInitiator(
        std::span<const uint8_t> shared_secret,
        std::span<const uint8_t> peer_signed_prekey_public,
        std::span<const uint8_t> local_identity_public,
        std::span<const uint8_t> peer_identity_public) {
        using SessionResult = Result<std::unique_ptr<RatchetSession>, ProtocolFailure>;
        if (shared_secret.size() != kSharedSecretBytes) {
            return SessionResult::Err(ProtocolFailure::InvalidInput("Shared secret must be 32 bytes"));
        }
        if (peer_signed_prekey_public.size() != kX25519PublicKeyBytes) {
            return SessionResult::Err(ProtocolFailure::InvalidInput("Peer signed prekey must be 32 bytes"));
        }

        auto pair_result = GenerateRatchetKeyPair();
        if (pair_result.IsErr()) {
            return SessionResult::Err(pair_result.UnwrapErr());
        }
        auto [local_private, local_public] = std::move(pair_result).Unwrap();
        auto dh = SodiumInterop::ComputeX25519(local_private, peer_signed_prekey_public, "ratchet-init");
        if (dh.IsErr()) {
            WipeBytes(local_private);
            return SessionResult::Err(dh.UnwrapErr());
        }
        auto dh_bytes = std::move(dh).Unwrap();
        auto kdf = KdfRoot(shared_secret, dh_bytes);
        WipeBytes(dh_bytes);
        if (kdf.IsErr()) {
            WipeBytes(local_private);
            return SessionResult::Err(kdf.UnwrapErr());
        }
        auto [root_key, send_chain] = std::move(kdf).Unwrap();

        RatchetState state;
        state.set_version(kProtocolVersion);
        state.set_is_initiator(true);
        state.set_root_key(root_key.data(), root_key.size());
        state.set_dh_local_private(local_private.data(), local_private.size());
        state.set_dh_local_public(local_public.data(), local_public.size());
        state.set_dh_remote_public(peer_signed_prekey_public.data(), peer_signed_prekey_public.size());
        state.mutable_send_chain()->set_chain_key(send_chain.data(), send_chain.size());
        state.mutable_recv_chain();
        const auto binding = BuildIdentityBinding(local_identity_public, peer_identity_public);
        state.set_associated_data(binding.data(), binding.size());
        WipeBytes(root_key);
        WipeBytes(send_chain);
        WipeBytes(local_private);

        return SessionResult::Ok(std::unique_ptr<RatchetSession>(new RatchetSession(std::move(state))));
    }

    Result<std::unique_ptr<RatchetSession>, ProtocolFailure> RatchetSession::InitResponder(
        std::span<const uint8_t> shared_secret,
        std::span<const uint8_t> signed_prekey_private,
        std::span<const uint8_t> signed_prekey_public,
        std::optional<std::span<const uint8_t>> peer_ephemeral_public,
        std::span<const uint8_t> local_identity_public,
        std::span<const uint8_t> peer_identity_public) {
        using SessionResult = Result<std::unique_ptr<RatchetSession>, ProtocolFailure>;
        if (shared_secret.size() != kSharedSecretBytes) {
            return SessionResult::Err(ProtocolFailure::InvalidInput("Shared secret must be 32 bytes"));
        }
        if (signed_prekey_private.size() != kX25519PrivateKeyBytes ||
            signed_prekey_public.size() != kX25519PublicKeyBytes) {
            return SessionResult::Err(ProtocolFailure::InvalidInput("Signed prekey pair has invalid sizes"));
        }
        if (peer_ephemeral_public.has_value() && peer_ephemeral_public->size() != kX25519PublicKeyBytes) {
            return SessionResult::Err(ProtocolFailure::InvalidInput("Peer ephemeral key must be 32 bytes"));
        }

        RatchetState state;
        state.set_version(kProtocolVersion);
        state.set_is_initiator(false);
        state.set_root_key(shared_secret.data(), shared_secret.size());
        state.set_dh_local_private(signed_prekey_private.data(), signed_prekey_private.size());
        state.set_dh_local_public(signed_prekey_public.data(), signed_prekey_public.size());
        state.mutable_send_chain();
        state.mutable_recv_chain();
        if (peer_ephemeral_public.has_value()) {
            state.set_peer_handshake_ephemeral(peer_ephemeral_public->data(), peer_ephemeral_public->size());
        }
        const auto binding = BuildIdentityBinding(local_identity_public, peer_identity_public);
        state.set_associated_data(binding.data(), binding.size());
        return SessionResult::Ok(std::unique_ptr<RatchetSession>(new RatchetSession(std::move(state))));
    }

    Result<Unit, ProtocolFailure> RatchetSession::ValidateState(const RatchetState& state) {
        if (state.version() != kProtocolVersion) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Decode(fmt::format("Unsupported ratchet state version {}", state.version())));
        }
        if (state.root_key().size() != kRootKeyBytes ||
            state.dh_local_private().size() != kX25519PrivateKeyBytes ||
            state.dh_local_public().size() != kX25519PublicKeyBytes) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Invalid ratchet key material sizes"));
        }
        if (!state.dh_remote_public().empty() && state.dh_remote_public().size() != kX25519PublicKeyBytes) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Invalid remote ratchet key size"));
        }
        for (const auto* chain : {&state.send_chain(), &state.recv_chain()}) {
            if (!chain->chain_key().empty() && chain->chain_key().size() != kChainKeyBytes) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::Decode("Invalid chain key size"));
            }
        }
        for (const auto& skipped : state.skipped_message_keys()) {
            if (skipped.message_key().size() != kMessageKeyBytes ||
                skipped.dh_public().size() != kX25519PublicKeyBytes) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::Decode("Invalid skipped message key entry"));
            }
        }
        if (state.state_hmac().size() != kHmacBytes) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Ratchet state MAC missing"));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<std::unique_ptr<RatchetSession>, ProtocolFailure> RatchetSession::Deserialize(
        std::span<const uint8_t> bytes) {
        using SessionResult = Result<std::unique_ptr<RatchetSession>, ProtocolFailure>;
        RatchetState state;
        if (bytes.empty() || !state.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
            return SessionResult::Err(ProtocolFailure::Decode("Failed to parse ratchet state"));
        }
        if (auto valid = ValidateState(state); valid.IsErr()) {
            return SessionResult::Err(valid.UnwrapErr());
        }
        auto expected_result = ComputeStateMac(state);
        if (expected_result.IsErr()) {
            return SessionResult::Err(expected_result.UnwrapErr());
        }
        const auto expected = std::move(expected_result).Unwrap();
        auto equal = SodiumInterop::ConstantTimeEquals(expected, SpanOf(state.state_hmac()));
        if (equal.IsErr() || !equal.Unwrap()) {
            return SessionResult::Err(ProtocolFailure::Decode("Ratchet state MAC verification failed"));
        }
        return SessionResult::Ok(std::unique_ptr<RatchetSession>(new RatchetSession(std::move(state))));
    }

    Result<std::vector<uint8_t>, ProtocolFailure> RatchetSession::Serialize() const {
        std::lock_guard<std::mutex> guard(lock_);
        RatchetState copy = state_;
        auto mac_result = ComputeStateMac(copy);
        if (mac_result.IsErr()) {
            return mac_result;
        }
        const auto mac = std::move(mac_result).Unwrap();
        copy.set_state_hmac(mac.data(), mac.size());
        auto serialized = SerializeDeterministic(copy);
        copy.clear_root_key();
        copy.clear_dh_local_private();
        return serialized;
    }

    Result<RatchetMessage, ProtocolFailure> RatchetSession::Encrypt(std::span<const uint8_t> plaintext) {
        std::lock_guard<std::mutex> guard(lock_);
        if (plaintext.size() > kMaxPlaintextBytes) {
            return Result<RatchetMessage, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(fmt::format(
                    "Plaintext of {} bytes exceeds limit {}", plaintext.size(), kMaxPlaintextBytes)));
        }
        if (state_.send_chain().chain_key().empty()) {
            return Result<RatchetMessage, ProtocolFailure>::Err(
                ProtocolFailure::RoleOrderingViolation("No sending chain before the first inbound message"));
        }
        if (state_.send_chain().message_number() == std::numeric_limits<uint32_t>::max()) {
            return Result<RatchetMessage, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("Sending chain exhausted"));
        }

        auto [message_key, next_chain] = KdfChain(SpanOf(state_.send_chain().chain_key()));
        const uint32_t message_number = state_.send_chain().message_number();
        const auto nonce = SodiumInterop::GetRandomBytes(kAesGcmNonceBytes);
        const auto ad = BuildMessageAssociatedData(
            state_, state_.dh_local_public(), state_.previous_send_count(), message_number);

        auto sealed = AesGcm::Encrypt(message_key, nonce, plaintext, ad);
        WipeBytes(message_key);
        if (sealed.IsErr()) {
            WipeBytes(next_chain);
            return Result<RatchetMessage, ProtocolFailure>::Err(sealed.UnwrapErr());
        }
        const auto ciphertext = std::move(sealed).Unwrap();

        RatchetMessage message;
        message.set_dh_public(state_.dh_local_public());
        message.set_prev_chain_count(state_.previous_send_count());
        message.set_message_number(message_number);
        message.set_nonce(nonce.data(), nonce.size());
        message.set_ciphertext(ciphertext.data(), ciphertext.size());

        state_.mutable_send_chain()->set_chain_key(next_chain.data(), next_chain.size());
        state_.mutable_send_chain()->set_message_number(message_number + 1);
        state_.set_state_counter(state_.state_counter() + 1);
        WipeBytes(next_chain);
        return Result<RatchetMessage, ProtocolFailure>::Ok(std::move(message));
    }

    Result<std::vector<uint8_t>, ProtocolFailure> RatchetSession::Decrypt(const RatchetMessage& message) {
        using PlaintextResult = Result<std::vector<uint8_t>, ProtocolFailure>;
        std::lock_guard<std::mutex> guard(lock_);
        if (auto valid = ValidateMessage(message); valid.IsErr()) {
            return PlaintextResult::Err(valid.UnwrapErr());
        }

        RatchetState working = state_;
        if (auto skipped_key = TakeSkippedKey(working, message.dh_public(), message.message_number())) {
            auto plaintext = OpenMessage(working, *skipped_key, message);
            if (plaintext.IsErr()) {
                return plaintext;
            }
            working.set_has_received(true);
            working.set_state_counter(working.state_counter() + 1);
            state_ = std::move(working);
            return plaintext;
        }

        if (message.dh_public() != working.dh_remote_public()) {
            if (auto skipped = SkipMessageKeys(working, message.prev_chain_count()); skipped.IsErr()) {
                return PlaintextResult::Err(skipped.UnwrapErr());
            }
            if (auto stepped = DhRatchetStep(working, message.dh_public()); stepped.IsErr()) {
                return PlaintextResult::Err(stepped.UnwrapErr());
            }
        }
        if (working.recv_chain().chain_key().empty()) {
            return PlaintextResult::Err(ProtocolFailure::DecryptionFailed("No receiving chain for message"));
        }
        if (message.message_number() < working.recv_chain().message_number()) {
            return PlaintextResult::Err(ProtocolFailure::DecryptionFailed(fmt::format(
                "Message {} already received or too old", message.message_number())));
        }
        if (auto skipped = SkipMessageKeys(working, message.message_number()); skipped.IsErr()) {
            return PlaintextResult::Err(skipped.UnwrapErr());
        }

        auto [message_key, next_chain] = KdfChain(SpanOf(working.recv_chain().chain_key()));
        working.mutable_recv_chain()->set_chain_key(next_chain.data(), next_chain.size());
        working.mutable_recv_chain()->set_message_number(message.message_number() + 1);
        WipeBytes(next_chain);

        auto plaintext = OpenMessage(working, message_key, message);
        if (plaintext.IsErr()) {
            return PlaintextResult::Err(ProtocolFailure::DecryptionFailed(plaintext.UnwrapErr().message));
        }
        working.set_has_received(true);
        working.set_state_counter(working.state_counter() + 1);
        state_ = std::move(working);
        return plaintext;
    }

    bool RatchetSession::CanSend() const {
        std::lock_guard<std::mutex> guard(lock_);
        return !state_.send_chain().chain_key().empty();
    }

    bool RatchetSession::HasReceived() const {
        std::lock_guard<std::mutex> guard(lock_);
        return state_.has_received();
    }

    bool RatchetSession::IsInitiator() const {
        std::lock_guard<std::mutex> guard(lock_);
        return state_.is_initiator();
    }

    uint64_t RatchetSession::StateCounter() const {
        std::lock_guard<std::mutex> guard(lock_);
        return state_.state_counter();
    }

    std::optional<std::vector<uint8_t>> RatchetSession::PeerHandshakeEphemeral() const {
        std::lock_guard<std::mutex> guard(lock_);
        if (state_.peer_handshake_ephemeral().empty()) {
            return std::nullopt;
        }
        return BytesFromString(state_.peer_handshake_ephemeral());
    }
}
