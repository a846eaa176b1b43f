#pragma once
#include "mist/core/result.hpp"
#include "mist/core/failures.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mist::protocol::interfaces {

/// Durable key/value records grouped by namespace ("sessions", "contacts", "identity").
/// A successful Put is durable before it returns.
class IRecordStore {
public:
    virtual ~IRecordStore() = default;

    [[nodiscard]] virtual Result<Unit, ProtocolFailure> Put(
        std::string_view record_namespace,
        std::string_view key,
        std::span<const uint8_t> value) = 0;

    /// Ok(nullopt) when the record does not exist.
    [[nodiscard]] virtual Result<std::optional<std::vector<uint8_t>>, ProtocolFailure> Get(
        std::string_view record_namespace,
        std::string_view key) const = 0;

    /// Removing a missing record succeeds.
    [[nodiscard]] virtual Result<Unit, ProtocolFailure> Remove(
        std::string_view record_namespace,
        std::string_view key) = 0;

    [[nodiscard]] virtual Result<std::vector<std::string>, ProtocolFailure> List(
        std::string_view record_namespace) const = 0;

    [[nodiscard]] virtual Result<Unit, ProtocolFailure> Flush() = 0;
};

}
