#pragma once
#include "mist/core/result.hpp"
#include "mist/core/failures.hpp"
#include "mist/enums/trust_origin.hpp"
#include "mist/interfaces/i_record_store.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <vector>

namespace mist::protocol::contacts {
using enums::TrustOrigin;

struct ContactRecord {
    std::vector<uint8_t> public_key;
    std::string display_name;
    TrustOrigin trust_origin = TrustOrigin::SharedLink;
    int64_t established_at_ms = 0;
};

/**
 * @brief Peer public key -> trust metadata, persisted under "contacts".
 *
 * A record is created the first time a handshake with that key completes and
 * is never overwritten by a later handshake. Display name and trust origin
 * change only through the explicit update calls.
 */
class ContactDirectory {
public:
    enum class AddOutcome : uint8_t {
        Created,
        AlreadyExists
    };

    explicit ContactDirectory(interfaces::IRecordStore& store);

    /// Loads every stored contact. Undecodable records are skipped and logged.
    [[nodiscard]] Result<size_t, ProtocolFailure> Restore();

    [[nodiscard]] Result<AddOutcome, ProtocolFailure> AddIfAbsent(ContactRecord record);

    [[nodiscard]] std::optional<ContactRecord> Find(std::span<const uint8_t> public_key) const;
    [[nodiscard]] bool Contains(std::span<const uint8_t> public_key) const;
    [[nodiscard]] std::vector<ContactRecord> All() const;
    [[nodiscard]] size_t Size() const;

    [[nodiscard]] Result<Unit, ProtocolFailure> UpdateDisplayName(
        std::span<const uint8_t> public_key,
        std::string display_name);

    /// Only shared-link -> direct-verification is an upgrade; other transitions are no-ops.
    [[nodiscard]] Result<bool, ProtocolFailure> UpgradeTrustOrigin(
        std::span<const uint8_t> public_key,
        TrustOrigin origin);

    /// Ok(false) when no such contact existed.
    [[nodiscard]] Result<bool, ProtocolFailure> Remove(std::span<const uint8_t> public_key);

    /// Drops every contact and its stored record.
    [[nodiscard]] Result<Unit, ProtocolFailure> Clear();

private:
    [[nodiscard]] Result<Unit, ProtocolFailure> PersistLocked(const ContactRecord& record);

    interfaces::IRecordStore& store_;
    std::map<std::vector<uint8_t>, ContactRecord> contacts_;
    mutable std::shared_mutex lock_;
};

}
