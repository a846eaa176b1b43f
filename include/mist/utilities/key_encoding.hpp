#pragma once
#include "mist/core/result.hpp"
#include "mist/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace mist::protocol::utilities {
using protocol::Result;
using protocol::ProtocolFailure;

/// Public keys travel as raw bytes; these helpers produce the two textual forms used on the wire.
using PublicKeyBytes = std::vector<uint8_t>;

/// Standard alphabet with padding (envelope "from"/"to" and binary payload fields).
[[nodiscard]] std::string ToBase64(std::span<const uint8_t> bytes);
[[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> FromBase64(std::string_view text);

/// URL-safe alphabet without padding (signaling addresses and storage keys).
[[nodiscard]] std::string ToUrlSafeBase64(std::span<const uint8_t> bytes);
[[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> FromUrlSafeBase64(std::string_view text);

[[nodiscard]] inline std::vector<uint8_t> BytesOf(std::string_view text) {
    return {text.begin(), text.end()};
}

[[nodiscard]] inline std::span<const uint8_t> SpanOf(const std::string& bytes) {
    return {reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size()};
}

/// Lexicographic (unsigned byte-wise) ordering of two public keys.
[[nodiscard]] int CompareKeys(std::span<const uint8_t> lhs, std::span<const uint8_t> rhs) noexcept;
}
