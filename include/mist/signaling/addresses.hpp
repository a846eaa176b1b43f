#pragma once
#include "mist/core/result.hpp"
#include "mist/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mist::protocol::signaling {

inline constexpr std::string_view kInboxSegment = "inbox/";
inline constexpr std::string_view kBroadcastSegment = "broadcast";
inline constexpr std::string_view kGroupSegment = "group/";

/// "<prefix>inbox/<url-safe base64 of key, no padding>"
[[nodiscard]] std::string InboxAddress(std::string_view prefix, std::span<const uint8_t> public_key);
[[nodiscard]] std::string BroadcastAddress(std::string_view prefix);
[[nodiscard]] std::string GroupAddress(std::string_view prefix, std::string_view group_id);

/// Group ids are restricted to [A-Za-z0-9_-], 1..64 characters.
[[nodiscard]] Result<Unit, ProtocolFailure> ValidateGroupId(std::string_view group_id);

/// Recovers the key from an inbox address. InvalidInput for any other address.
[[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> ParseInboxAddress(
    std::string_view prefix,
    std::string_view address);

}
