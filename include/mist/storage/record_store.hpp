#pragma once
#include "mist/interfaces/i_record_store.hpp"
#include <google/protobuf/message_lite.h>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace mist::protocol::storage {
using interfaces::IRecordStore;

inline constexpr std::string_view kSessionsNamespace = "sessions";
inline constexpr std::string_view kHandshakesNamespace = "handshakes";
inline constexpr std::string_view kContactsNamespace = "contacts";
inline constexpr std::string_view kIdentityNamespace = "identity";
inline constexpr std::string_view kIdentityRecordKey = "self";

/// Namespaces and keys are restricted to [A-Za-z0-9_-] so they map onto file names.
[[nodiscard]] Result<Unit, ProtocolFailure> ValidateRecordName(std::string_view name);

[[nodiscard]] Result<Unit, ProtocolFailure> PutMessage(
    IRecordStore& store,
    std::string_view record_namespace,
    std::string_view key,
    const google::protobuf::MessageLite& message);

/// Ok(false) when the record is absent; Decode failure when it does not parse.
[[nodiscard]] Result<bool, ProtocolFailure> GetMessage(
    const IRecordStore& store,
    std::string_view record_namespace,
    std::string_view key,
    google::protobuf::MessageLite& message);

/**
 * @brief One file per record under <root>/<namespace>/<key>.pb
 *
 * Each Put writes <key>.pb.tmp and renames it over the record, so a crash
 * leaves either the old or the new record on disk.
 */
class FileRecordStore final : public IRecordStore {
public:
    [[nodiscard]] static Result<std::unique_ptr<FileRecordStore>, ProtocolFailure> Open(
        std::filesystem::path root);

    Result<Unit, ProtocolFailure> Put(
        std::string_view record_namespace,
        std::string_view key,
        std::span<const uint8_t> value) override;
    Result<std::optional<std::vector<uint8_t>>, ProtocolFailure> Get(
        std::string_view record_namespace,
        std::string_view key) const override;
    Result<Unit, ProtocolFailure> Remove(
        std::string_view record_namespace,
        std::string_view key) override;
    Result<std::vector<std::string>, ProtocolFailure> List(
        std::string_view record_namespace) const override;
    Result<Unit, ProtocolFailure> Flush() override;

    [[nodiscard]] const std::filesystem::path& Root() const noexcept { return root_; }

private:
    explicit FileRecordStore(std::filesystem::path root) : root_(std::move(root)) {}

    [[nodiscard]] std::filesystem::path RecordPath(std::string_view record_namespace, std::string_view key) const;

    std::filesystem::path root_;
    mutable std::mutex lock_;
};

class MemoryRecordStore final : public IRecordStore {
public:
    Result<Unit, ProtocolFailure> Put(
        std::string_view record_namespace,
        std::string_view key,
        std::span<const uint8_t> value) override;
    Result<std::optional<std::vector<uint8_t>>, ProtocolFailure> Get(
        std::string_view record_namespace,
        std::string_view key) const override;
    Result<Unit, ProtocolFailure> Remove(
        std::string_view record_namespace,
        std::string_view key) override;
    Result<std::vector<std::string>, ProtocolFailure> List(
        std::string_view record_namespace) const override;
    Result<Unit, ProtocolFailure> Flush() override;

    /// While set, Put and Remove fail with a Storage failure.
    void SetWritesFailing(bool failing);
    [[nodiscard]] size_t FlushCount() const;

private:
    using RecordKey = std::pair<std::string, std::string>;

    std::map<RecordKey, std::vector<uint8_t>> records_;
    bool writes_failing_ = false;
    size_t flush_count_ = 0;
    mutable std::mutex lock_;
};

}
