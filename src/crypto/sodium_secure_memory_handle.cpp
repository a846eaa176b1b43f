#include "mist/crypto/sodium_secure_memory_handle.hpp"
#include "mist/crypto/sodium_interop.hpp"

#include <cstring>

namespace mist::protocol::crypto {

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::Allocate(size_t size) {
    if (!SodiumInterop::IsInitialized()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed("libsodium is not initialized"));
    }
    if (size == 0) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::AllocationFailed("Cannot allocate zero-sized secure memory"));
    }
    void* ptr = SodiumInterop::AllocateSecure(size);
    if (ptr == nullptr) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::AllocationFailed(
                "Failed to allocate " + std::to_string(size) + " bytes of secure memory"));
    }
    return Result<SecureMemoryHandle, SodiumFailure>::Ok(SecureMemoryHandle(ptr, size));
}

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::FromBytes(
    std::span<const uint8_t> bytes) {
    auto handle_result = Allocate(bytes.size());
    if (handle_result.IsErr()) {
        return handle_result;
    }
    auto handle = std::move(handle_result).Unwrap();
    if (auto write_result = handle.Write(bytes); write_result.IsErr()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(write_result.UnwrapErr());
    }
    return Result<SecureMemoryHandle, SodiumFailure>::Ok(std::move(handle));
}

SecureMemoryHandle::~SecureMemoryHandle() {
    Release();
}

SecureMemoryHandle::SecureMemoryHandle(SecureMemoryHandle&& other) noexcept
    : ptr_(other.ptr_)
    , size_(other.size_) {
    other.ptr_ = nullptr;
    other.size_ = 0;
}

SecureMemoryHandle& SecureMemoryHandle::operator=(SecureMemoryHandle&& other) noexcept {
    if (this != &other) {
        Release();
        ptr_ = other.ptr_;
        size_ = other.size_;
        other.ptr_ = nullptr;
        other.size_ = 0;
    }
    return *this;
}

void SecureMemoryHandle::Release() noexcept {
    if (ptr_ != nullptr) {
        SodiumInterop::FreeSecure(ptr_);
        ptr_ = nullptr;
        size_ = 0;
    }
}

Result<Unit, SodiumFailure> SecureMemoryHandle::Write(std::span<const uint8_t> data) {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation("Handle has been disposed"));
    }
    if (data.size() > size_) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall(
                "Data exceeds secure buffer (data: " + std::to_string(data.size()) +
                ", buffer: " + std::to_string(size_) + ")"));
    }
    std::memcpy(ptr_, data.data(), data.size());
    if (data.size() < size_) {
        sodium_memzero(static_cast<uint8_t*>(ptr_) + data.size(), size_ - data.size());
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, SodiumFailure> SecureMemoryHandle::ReadBytes() const {
    if (IsInvalid()) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation("Handle has been disposed"));
    }
    std::vector<uint8_t> copy(size_);
    std::memcpy(copy.data(), ptr_, size_);
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(copy));
}

} // namespace mist::protocol::crypto
