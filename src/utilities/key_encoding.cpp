#include "mist/utilities/key_encoding.hpp"

#include <sodium.h>

#include <algorithm>

namespace mist::protocol::utilities {

namespace {
    std::string Encode(std::span<const uint8_t> bytes, const int variant) {
        const size_t encoded_len = sodium_base64_ENCODED_LEN(bytes.size(), variant);
        std::string output(encoded_len, '\0');
        sodium_bin2base64(output.data(), encoded_len, bytes.data(), bytes.size(), variant);
        output.resize(encoded_len - 1);
        return output;
    }

    Result<std::vector<uint8_t>, ProtocolFailure> Decode(std::string_view text, const int variant) {
        std::vector<uint8_t> output(text.size() * 3 / 4 + 3);
        size_t decoded_len = 0;
        if (sodium_base642bin(output.data(), output.size(),
                              text.data(), text.size(),
                              nullptr, &decoded_len, nullptr, variant) != 0) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Invalid base64 text"));
        }
        output.resize(decoded_len);
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(output));
    }
}

std::string ToBase64(std::span<const uint8_t> bytes) {
    return Encode(bytes, sodium_base64_VARIANT_ORIGINAL);
}

Result<std::vector<uint8_t>, ProtocolFailure> FromBase64(std::string_view text) {
    return Decode(text, sodium_base64_VARIANT_ORIGINAL);
}

std::string ToUrlSafeBase64(std::span<const uint8_t> bytes) {
    return Encode(bytes, sodium_base64_VARIANT_URLSAFE_NO_PADDING);
}

Result<std::vector<uint8_t>, ProtocolFailure> FromUrlSafeBase64(std::string_view text) {
    return Decode(text, sodium_base64_VARIANT_URLSAFE_NO_PADDING);
}

int CompareKeys(std::span<const uint8_t> lhs, std::span<const uint8_t> rhs) noexcept {
    const auto [lhs_it, rhs_it] = std::mismatch(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
    if (lhs_it == lhs.end() && rhs_it == rhs.end()) {
        return 0;
    }
    if (lhs_it == lhs.end()) {
        return -1;
    }
    if (rhs_it == rhs.end()) {
        return 1;
    }
    return *lhs_it < *rhs_it ? -1 : 1;
}

}
