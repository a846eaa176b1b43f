#include "mist/signaling/addresses.hpp"
#include "mist/protocol/constants.hpp"
#include "mist/utilities/key_encoding.hpp"
#include <fmt/core.h>

namespace mist::protocol::signaling {
    namespace {
        constexpr size_t kMaxGroupIdChars = 64;
    }

    std::string InboxAddress(std::string_view prefix, std::span<const uint8_t> public_key) {
        return fmt::format("{}{}{}", prefix, kInboxSegment, utilities::ToUrlSafeBase64(public_key));
    }

    std::string BroadcastAddress(std::string_view prefix) {
        return fmt::format("{}{}", prefix, kBroadcastSegment);
    }

    std::string GroupAddress(std::string_view prefix, std::string_view group_id) {
        return fmt::format("{}{}{}", prefix, kGroupSegment, group_id);
    }

    Result<Unit, ProtocolFailure> ValidateGroupId(std::string_view group_id) {
        if (group_id.empty() || group_id.size() > kMaxGroupIdChars) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Group id must be 1 to 64 characters"));
        }
        for (const char c : group_id) {
            const bool allowed = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                                 (c >= '0' && c <= '9') || c == '_' || c == '-';
            if (!allowed) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::InvalidInput(fmt::format("Group id contains '{}'", c)));
            }
        }
        return Result<Unit, ProtocolFailure>::Ok(Unit{});
    }

    Result<std::vector<uint8_t>, ProtocolFailure> ParseInboxAddress(
        std::string_view prefix,
        std::string_view address) {
        if (!address.starts_with(prefix)) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Address is outside the configured namespace"));
        }
        address.remove_prefix(prefix.size());
        if (!address.starts_with(kInboxSegment)) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Not an inbox address"));
        }
        address.remove_prefix(kInboxSegment.size());
        auto key = utilities::FromUrlSafeBase64(address);
        if (key.IsErr() || key.Unwrap().size() != kEd25519PublicKeyBytes) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Inbox address does not name a public key"));
        }
        return key;
    }
}
