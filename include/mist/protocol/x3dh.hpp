#pragma once
#include "mist/core/result.hpp"
#include "mist/core/failures.hpp"
#include "mist/identity/identity_keys.hpp"
#include "protocol/envelope.pb.h"
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace mist::protocol {

/**
 * @brief X3DH key agreement between a local identity and a peer prekey bundle.
 *
 * DH1 = DH(IK_a, SPK_b), DH2 = DH(EK_a, IK_b), DH3 = DH(EK_a, SPK_b) and, when
 * a one-time prekey is used, DH4 = DH(EK_a, OPK_b). The shared secret is
 * HKDF-SHA256(0xFF * 32 || DH1 || DH2 || DH3 [|| DH4]) truncated to 32 bytes.
 * Identity keys are Ed25519 and enter the DH through their X25519 form.
 */
class X3dh {
public:
    struct InitiatorAgreement {
        std::vector<uint8_t> shared_secret;
        std::vector<uint8_t> ephemeral_public;
        std::vector<uint8_t> peer_signed_prekey_public;
        uint32_t signed_prekey_id = 0;
        std::optional<uint32_t> used_one_time_prekey_id;
    };

    /// Verifies the bundle signature first; fails with SignatureInvalid.
    /// The first one-time prekey of the bundle is used when present.
    [[nodiscard]] static Result<InitiatorAgreement, ProtocolFailure> InitiatorAgree(
        const identity::IdentityKeys& local_identity,
        const proto::protocol::PrekeyBundle& peer_bundle);

    /// Does not consume the one-time prekey; the caller does so once the
    /// session has been stored.
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> ResponderAgree(
        const identity::IdentityKeys& local_identity,
        std::span<const uint8_t> peer_identity_ed25519,
        std::span<const uint8_t> peer_ephemeral_public,
        uint32_t signed_prekey_id,
        std::optional<uint32_t> one_time_prekey_id);

private:
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> DeriveSharedSecret(
        std::vector<uint8_t>& dh_concat);

    X3dh() = delete;
};

}
