#pragma once

#include "mist/core/result.hpp"
#include "mist/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>
#include <vector>

namespace mist::protocol::crypto {

/**
 * @brief Owning handle over sodium_malloc'd memory for long-lived secrets
 *
 * The memory is guard-paged, locked and zeroed on release. Move-only.
 * Identity and prekey secret keys live in these handles; per-message keys are
 * plain vectors wiped with SodiumInterop::SecureWipe.
 */
class SecureMemoryHandle {
public:
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    /// Allocates a handle of exactly bytes.size() and copies the bytes into it.
    static Result<SecureMemoryHandle, SodiumFailure> FromBytes(std::span<const uint8_t> bytes);

    ~SecureMemoryHandle();

    SecureMemoryHandle() noexcept : ptr_(nullptr), size_(0) {}

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    /// Copies the whole secret out. The caller wipes the copy.
    Result<std::vector<uint8_t>, SodiumFailure> ReadBytes() const;

    template<typename F>
    auto WithReadAccess(F&& func) const -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;
        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Handle has been disposed"));
        }
        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(
            std::span<const uint8_t>(static_cast<const uint8_t*>(ptr_), size_)));
    }

    [[nodiscard]] bool IsInvalid() const noexcept {
        return ptr_ == nullptr;
    }

    [[nodiscard]] size_t Size() const noexcept {
        return size_;
    }

private:
    SecureMemoryHandle(void* ptr, size_t size) noexcept
        : ptr_(ptr), size_(size) {}

    void Release() noexcept;

    void* ptr_;
    size_t size_;
};

} // namespace mist::protocol::crypto
