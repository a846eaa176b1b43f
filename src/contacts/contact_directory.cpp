#include "mist/contacts/contact_directory.hpp"
#include "mist/protocol/constants.hpp"
#include "mist/storage/record_store.hpp"
#include "mist/utilities/key_encoding.hpp"
#include "mist/core/logging.hpp"
#include "protocol/records.pb.h"
#include <mutex>

namespace mist::protocol::contacts {

namespace {
    proto::protocol::TrustOrigin ToProto(const TrustOrigin origin) {
        return origin == TrustOrigin::DirectVerification
            ? proto::protocol::TRUST_ORIGIN_DIRECT_VERIFICATION
            : proto::protocol::TRUST_ORIGIN_SHARED_LINK;
    }

    Result<TrustOrigin, ProtocolFailure> FromProto(const proto::protocol::TrustOrigin origin) {
        switch (origin) {
            case proto::protocol::TRUST_ORIGIN_DIRECT_VERIFICATION:
                return Result<TrustOrigin, ProtocolFailure>::Ok(TrustOrigin::DirectVerification);
            case proto::protocol::TRUST_ORIGIN_SHARED_LINK:
                return Result<TrustOrigin, ProtocolFailure>::Ok(TrustOrigin::SharedLink);
            default:
                return Result<TrustOrigin, ProtocolFailure>::Err(
                    ProtocolFailure::Decode("Contact record has no trust origin"));
        }
    }

    std::vector<uint8_t> KeyOf(std::span<const uint8_t> public_key) {
        return {public_key.begin(), public_key.end()};
    }
}

ContactDirectory::ContactDirectory(interfaces::IRecordStore& store)
    : store_(store) {
}

Result<size_t, ProtocolFailure> ContactDirectory::Restore() {
    auto keys_result = store_.List(storage::kContactsNamespace);
    if (keys_result.IsErr()) {
        return Result<size_t, ProtocolFailure>::Err(keys_result.UnwrapErr());
    }
    std::unique_lock lock(lock_);
    contacts_.clear();
    for (const auto& key : keys_result.Unwrap()) {
        proto::protocol::ContactRecord stored;
        auto found = storage::GetMessage(store_, storage::kContactsNamespace, key, stored);
        if (found.IsErr() || !found.Unwrap()) {
            MIST_LOG_WARN("Skipping unreadable contact record {}", key);
            continue;
        }
        auto origin = FromProto(stored.trust_origin());
        if (origin.IsErr() || stored.public_key().size() != kEd25519PublicKeyBytes) {
            MIST_LOG_WARN("Skipping invalid contact record {}", key);
            continue;
        }
        ContactRecord record;
        record.public_key.assign(stored.public_key().begin(), stored.public_key().end());
        record.display_name = stored.display_name();
        record.trust_origin = origin.Unwrap();
        record.established_at_ms = stored.established_at_ms();
        contacts_.emplace(record.public_key, std::move(record));
    }
    MIST_LOG_INFO("Restored {} contacts", contacts_.size());
    return Result<size_t, ProtocolFailure>::Ok(contacts_.size());
}

Result<Unit, ProtocolFailure> ContactDirectory::PersistLocked(const ContactRecord& record) {
    proto::protocol::ContactRecord stored;
    stored.set_public_key(record.public_key.data(), record.public_key.size());
    stored.set_display_name(record.display_name);
    stored.set_trust_origin(ToProto(record.trust_origin));
    stored.set_established_at_ms(record.established_at_ms);
    return storage::PutMessage(store_, storage::kContactsNamespace,
                               utilities::ToUrlSafeBase64(record.public_key), stored);
}

Result<ContactDirectory::AddOutcome, ProtocolFailure> ContactDirectory::AddIfAbsent(ContactRecord record) {
    if (record.public_key.size() != kEd25519PublicKeyBytes) {
        return Result<AddOutcome, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Contact public key must be 32 bytes"));
    }
    std::unique_lock lock(lock_);
    if (contacts_.count(record.public_key) > 0) {
        return Result<AddOutcome, ProtocolFailure>::Ok(AddOutcome::AlreadyExists);
    }
    if (auto persisted = PersistLocked(record); persisted.IsErr()) {
        return Result<AddOutcome, ProtocolFailure>::Err(persisted.UnwrapErr());
    }
    MIST_LOG_INFO("Added contact {} ({})", logging::ShortKey(record.public_key),
                  enums::ToString(record.trust_origin));
    contacts_.emplace(record.public_key, std::move(record));
    return Result<AddOutcome, ProtocolFailure>::Ok(AddOutcome::Created);
}

std::optional<ContactRecord> ContactDirectory::Find(std::span<const uint8_t> public_key) const {
    std::shared_lock lock(lock_);
    const auto it = contacts_.find(KeyOf(public_key));
    if (it == contacts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ContactDirectory::Contains(std::span<const uint8_t> public_key) const {
    std::shared_lock lock(lock_);
    return contacts_.count(KeyOf(public_key)) > 0;
}

std::vector<ContactRecord> ContactDirectory::All() const {
    std::shared_lock lock(lock_);
    std::vector<ContactRecord> all;
    all.reserve(contacts_.size());
    for (const auto& [key, record] : contacts_) {
        all.push_back(record);
    }
    return all;
}

size_t ContactDirectory::Size() const {
    std::shared_lock lock(lock_);
    return contacts_.size();
}

Result<Unit, ProtocolFailure> ContactDirectory::UpdateDisplayName(
    std::span<const uint8_t> public_key,
    std::string display_name) {
    std::unique_lock lock(lock_);
    const auto it = contacts_.find(KeyOf(public_key));
    if (it == contacts_.end()) {
        return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::UnknownSender("No such contact"));
    }
    ContactRecord updated = it->second;
    updated.display_name = std::move(display_name);
    if (auto persisted = PersistLocked(updated); persisted.IsErr()) {
        return persisted;
    }
    it->second = std::move(updated);
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<bool, ProtocolFailure> ContactDirectory::UpgradeTrustOrigin(
    std::span<const uint8_t> public_key,
    const TrustOrigin origin) {
    std::unique_lock lock(lock_);
    const auto it = contacts_.find(KeyOf(public_key));
    if (it == contacts_.end()) {
        return Result<bool, ProtocolFailure>::Err(ProtocolFailure::UnknownSender("No such contact"));
    }
    if (origin != TrustOrigin::DirectVerification ||
        it->second.trust_origin == TrustOrigin::DirectVerification) {
        return Result<bool, ProtocolFailure>::Ok(false);
    }
    ContactRecord updated = it->second;
    updated.trust_origin = TrustOrigin::DirectVerification;
    if (auto persisted = PersistLocked(updated); persisted.IsErr()) {
        return Result<bool, ProtocolFailure>::Err(persisted.UnwrapErr());
    }
    it->second = std::move(updated);
    MIST_LOG_INFO("Contact {} upgraded to direct verification", logging::ShortKey(public_key));
    return Result<bool, ProtocolFailure>::Ok(true);
}

Result<bool, ProtocolFailure> ContactDirectory::Remove(std::span<const uint8_t> public_key) {
    std::unique_lock lock(lock_);
    const auto it = contacts_.find(KeyOf(public_key));
    if (it == contacts_.end()) {
        return Result<bool, ProtocolFailure>::Ok(false);
    }
    if (auto removed = store_.Remove(storage::kContactsNamespace, utilities::ToUrlSafeBase64(public_key));
        removed.IsErr()) {
        return Result<bool, ProtocolFailure>::Err(removed.UnwrapErr());
    }
    contacts_.erase(it);
    return Result<bool, ProtocolFailure>::Ok(true);
}

Result<Unit, ProtocolFailure> ContactDirectory::Clear() {
    std::unique_lock lock(lock_);
    for (const auto& [key, record] : contacts_) {
        if (auto removed = store_.Remove(storage::kContactsNamespace, utilities::ToUrlSafeBase64(key));
            removed.IsErr()) {
            return removed;
        }
    }
    contacts_.clear();
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

}
