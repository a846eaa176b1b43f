#pragma once
#include "mist/identity/identity_keys.hpp"
#include "mist/interfaces/i_record_store.hpp"
#include <cstdint>

namespace mist::protocol::identity {

[[nodiscard]] Result<Unit, ProtocolFailure> SaveIdentity(
    interfaces::IRecordStore& store,
    const IdentityKeys& identity);

/// Restores identity/self, or generates and stores a fresh identity when none exists.
[[nodiscard]] Result<IdentityKeys, ProtocolFailure> LoadOrCreateIdentity(
    interfaces::IRecordStore& store,
    uint32_t one_time_key_count,
    int64_t now_ms);

}
