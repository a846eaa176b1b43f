#include "mist/identity/identity_store.hpp"
#include "mist/storage/record_store.hpp"
#include "mist/core/logging.hpp"

namespace mist::protocol::identity {

Result<Unit, ProtocolFailure> SaveIdentity(
    interfaces::IRecordStore& store,
    const IdentityKeys& identity) {
    auto record = identity.ToRecord();
    if (record.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(record.UnwrapErr());
    }
    auto message = std::move(record).Unwrap();
    auto put = storage::PutMessage(store, storage::kIdentityNamespace, storage::kIdentityRecordKey, message);
    message.clear_ed25519_secret();
    message.clear_signed_pre_key_private();
    message.clear_one_time_pre_keys();
    return put;
}

Result<IdentityKeys, ProtocolFailure> LoadOrCreateIdentity(
    interfaces::IRecordStore& store,
    const uint32_t one_time_key_count,
    const int64_t now_ms) {
    proto::protocol::IdentityRecord record;
    auto found = storage::GetMessage(store, storage::kIdentityNamespace, storage::kIdentityRecordKey, record);
    if (found.IsErr()) {
        return Result<IdentityKeys, ProtocolFailure>::Err(found.UnwrapErr());
    }
    if (found.Unwrap()) {
        auto restored = IdentityKeys::FromRecord(record);
        record.clear_ed25519_secret();
        record.clear_signed_pre_key_private();
        record.clear_one_time_pre_keys();
        if (restored.IsOk()) {
            MIST_LOG_INFO("Restored identity {}",
                          logging::ShortKey(restored.Unwrap().GetIdentityEd25519PublicCopy()));
        }
        return restored;
    }

    auto created = IdentityKeys::Create(one_time_key_count, now_ms);
    if (created.IsErr()) {
        return created;
    }
    auto identity = std::move(created).Unwrap();
    if (auto saved = SaveIdentity(store, identity); saved.IsErr()) {
        return Result<IdentityKeys, ProtocolFailure>::Err(saved.UnwrapErr());
    }
    return Result<IdentityKeys, ProtocolFailure>::Ok(std::move(identity));
}

}
