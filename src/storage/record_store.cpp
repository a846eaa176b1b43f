#include "mist/storage/record_store.hpp"
#include "mist/core/logging.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>

namespace mist::protocol::storage {

namespace {
    constexpr std::string_view kRecordExtension = ".pb";
    constexpr std::string_view kTempExtension = ".pb.tmp";
}

Result<Unit, ProtocolFailure> ValidateRecordName(std::string_view name) {
    if (name.empty()) {
        return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidInput("Record name is empty"));
    }
    for (const char c : name) {
        const bool allowed = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                             (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!allowed) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(fmt::format("Invalid character in record name '{}'", name)));
        }
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<Unit, ProtocolFailure> PutMessage(
    IRecordStore& store,
    std::string_view record_namespace,
    std::string_view key,
    const google::protobuf::MessageLite& message) {
    std::string bytes;
    if (!message.SerializeToString(&bytes)) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Encode(fmt::format("Failed to encode {}/{}", record_namespace, key)));
    }
    return store.Put(record_namespace, key,
                     std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size()));
}

Result<bool, ProtocolFailure> GetMessage(
    const IRecordStore& store,
    std::string_view record_namespace,
    std::string_view key,
    google::protobuf::MessageLite& message) {
    auto get_result = store.Get(record_namespace, key);
    if (get_result.IsErr()) {
        return Result<bool, ProtocolFailure>::Err(get_result.UnwrapErr());
    }
    const auto bytes = std::move(get_result).Unwrap();
    if (!bytes.has_value()) {
        return Result<bool, ProtocolFailure>::Ok(false);
    }
    if (!message.ParseFromArray(bytes->data(), static_cast<int>(bytes->size()))) {
        return Result<bool, ProtocolFailure>::Err(
            ProtocolFailure::Decode(fmt::format("Failed to decode {}/{}", record_namespace, key)));
    }
    return Result<bool, ProtocolFailure>::Ok(true);
}

// ============================================================================
// FileRecordStore
// ============================================================================

Result<std::unique_ptr<FileRecordStore>, ProtocolFailure> FileRecordStore::Open(std::filesystem::path root) {
    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) {
        return Result<std::unique_ptr<FileRecordStore>, ProtocolFailure>::Err(
            ProtocolFailure::Storage(fmt::format("Cannot create {}: {}", root.string(), ec.message())));
    }
    MIST_LOG_DEBUG("Opened record store at {}", root.string());
    return Result<std::unique_ptr<FileRecordStore>, ProtocolFailure>::Ok(
        std::unique_ptr<FileRecordStore>(new FileRecordStore(std::move(root))));
}

std::filesystem::path FileRecordStore::RecordPath(std::string_view record_namespace, std::string_view key) const {
    return root_ / std::string(record_namespace) / (std::string(key) + std::string(kRecordExtension));
}

Result<Unit, ProtocolFailure> FileRecordStore::Put(
    std::string_view record_namespace,
    std::string_view key,
    std::span<const uint8_t> value) {
    if (auto valid = ValidateRecordName(record_namespace); valid.IsErr()) {
        return valid;
    }
    if (auto valid = ValidateRecordName(key); valid.IsErr()) {
        return valid;
    }
    std::lock_guard<std::mutex> guard(lock_);
    const auto path = RecordPath(record_namespace, key);
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Storage(fmt::format("Cannot create {}: {}", path.parent_path().string(), ec.message())));
    }
    auto tmp = path;
    tmp.replace_extension(kTempExtension);
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Storage(fmt::format("Cannot open {} for writing", tmp.string())));
        }
        ofs.write(reinterpret_cast<const char*>(value.data()), static_cast<std::streamsize>(value.size()));
        ofs.flush();
        if (!ofs) {
            std::filesystem::remove(tmp, ec);
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Storage(fmt::format("Write to {} failed", tmp.string())));
        }
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::error_code remove_ec;
        std::filesystem::remove(tmp, remove_ec);
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Storage(fmt::format("Rename to {} failed: {}", path.string(), ec.message())));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<std::optional<std::vector<uint8_t>>, ProtocolFailure> FileRecordStore::Get(
    std::string_view record_namespace,
    std::string_view key) const {
    using GetResult = Result<std::optional<std::vector<uint8_t>>, ProtocolFailure>;
    if (auto valid = ValidateRecordName(record_namespace); valid.IsErr()) {
        return GetResult::Err(valid.UnwrapErr());
    }
    if (auto valid = ValidateRecordName(key); valid.IsErr()) {
        return GetResult::Err(valid.UnwrapErr());
    }
    std::lock_guard<std::mutex> guard(lock_);
    const auto path = RecordPath(record_namespace, key);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return GetResult::Ok(std::nullopt);
    }
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        return GetResult::Err(ProtocolFailure::Storage(fmt::format("Cannot open {}", path.string())));
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    if (ifs.bad()) {
        return GetResult::Err(ProtocolFailure::Storage(fmt::format("Read of {} failed", path.string())));
    }
    return GetResult::Ok(std::move(bytes));
}

Result<Unit, ProtocolFailure> FileRecordStore::Remove(
    std::string_view record_namespace,
    std::string_view key) {
    if (auto valid = ValidateRecordName(record_namespace); valid.IsErr()) {
        return valid;
    }
    if (auto valid = ValidateRecordName(key); valid.IsErr()) {
        return valid;
    }
    std::lock_guard<std::mutex> guard(lock_);
    const auto path = RecordPath(record_namespace, key);
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::Storage(fmt::format("Cannot remove {}: {}", path.string(), ec.message())));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<std::vector<std::string>, ProtocolFailure> FileRecordStore::List(std::string_view record_namespace) const {
    using ListResult = Result<std::vector<std::string>, ProtocolFailure>;
    if (auto valid = ValidateRecordName(record_namespace); valid.IsErr()) {
        return ListResult::Err(valid.UnwrapErr());
    }
    std::lock_guard<std::mutex> guard(lock_);
    const auto dir = root_ / std::string(record_namespace);
    std::vector<std::string> keys;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return ListResult::Ok(std::move(keys));
    }
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& path = it->path();
        // Leftover <key>.pb.tmp files have extension ".tmp" and are skipped
        if (path.extension() == kRecordExtension) {
            keys.push_back(path.stem().string());
        }
    }
    if (ec) {
        return ListResult::Err(ProtocolFailure::Storage(fmt::format("Cannot list {}: {}", dir.string(), ec.message())));
    }
    std::sort(keys.begin(), keys.end());
    return ListResult::Ok(std::move(keys));
}

Result<Unit, ProtocolFailure> FileRecordStore::Flush() {
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

// ============================================================================
// MemoryRecordStore
// ============================================================================

Result<Unit, ProtocolFailure> MemoryRecordStore::Put(
    std::string_view record_namespace,
    std::string_view key,
    std::span<const uint8_t> value) {
    std::lock_guard<std::mutex> guard(lock_);
    if (writes_failing_) {
        return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::Storage("Record store is failing writes"));
    }
    records_[RecordKey{std::string(record_namespace), std::string(key)}] =
        std::vector<uint8_t>(value.begin(), value.end());
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<std::optional<std::vector<uint8_t>>, ProtocolFailure> MemoryRecordStore::Get(
    std::string_view record_namespace,
    std::string_view key) const {
    std::lock_guard<std::mutex> guard(lock_);
    const auto it = records_.find(RecordKey{std::string(record_namespace), std::string(key)});
    if (it == records_.end()) {
        return Result<std::optional<std::vector<uint8_t>>, ProtocolFailure>::Ok(std::nullopt);
    }
    return Result<std::optional<std::vector<uint8_t>>, ProtocolFailure>::Ok(it->second);
}

Result<Unit, ProtocolFailure> MemoryRecordStore::Remove(
    std::string_view record_namespace,
    std::string_view key) {
    std::lock_guard<std::mutex> guard(lock_);
    if (writes_failing_) {
        return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::Storage("Record store is failing writes"));
    }
    records_.erase(RecordKey{std::string(record_namespace), std::string(key)});
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

Result<std::vector<std::string>, ProtocolFailure> MemoryRecordStore::List(std::string_view record_namespace) const {
    std::lock_guard<std::mutex> guard(lock_);
    std::vector<std::string> keys;
    for (const auto& [record_key, value] : records_) {
        if (record_key.first == record_namespace) {
            keys.push_back(record_key.second);
        }
    }
    return Result<std::vector<std::string>, ProtocolFailure>::Ok(std::move(keys));
}

Result<Unit, ProtocolFailure> MemoryRecordStore::Flush() {
    std::lock_guard<std::mutex> guard(lock_);
    ++flush_count_;
    return Result<Unit, ProtocolFailure>::Ok(unit);
}

void MemoryRecordStore::SetWritesFailing(const bool failing) {
    std::lock_guard<std::mutex> guard(lock_);
    writes_failing_ = failing;
}

size_t MemoryRecordStore::FlushCount() const {
    std::lock_guard<std::mutex> guard(lock_);
    return flush_count_;
}

}
