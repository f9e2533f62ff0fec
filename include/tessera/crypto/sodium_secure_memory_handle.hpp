#pragma once

#include "tessera/core/result.hpp"
#include "tessera/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>
#include <vector>

namespace tessera::protocol::crypto {

/**
 * @brief RAII wrapper for libsodium secure memory
 *
 * Owns a block obtained from sodium_malloc: guard-paged, locked in RAM and
 * zeroed on free. Move-only; the destructor always releases the block.
 *
 * @code
 * auto handle = SecureMemoryHandle::FromBytes(secret).Unwrap();
 * auto shared = handle.WithReadAccess([&](std::span<const uint8_t> sk) { ... });
 * @endcode
 */
class SecureMemoryHandle {
public:
    /**
     * @brief Allocate secure memory
     *
     * @param size Number of bytes to allocate (must be non-zero)
     */
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    /**
     * @brief Allocate a handle of exactly `data.size()` bytes and copy `data` in
     */
    static Result<SecureMemoryHandle, SodiumFailure> FromBytes(std::span<const uint8_t> data);

    ~SecureMemoryHandle();

    SecureMemoryHandle() noexcept : ptr_(nullptr), size_(0) {}

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    /**
     * @brief Write data to secure memory; remaining bytes are zeroed
     */
    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    /**
     * @brief Copy the whole block into `output` (must be >= Size())
     */
    Result<Unit, SodiumFailure> Read(std::span<uint8_t> output) const;

    /**
     * @brief Copy the first `size` bytes into a new vector
     *
     * The caller is responsible for wiping the returned copy.
     */
    Result<std::vector<uint8_t>, SodiumFailure> ReadBytes(size_t size) const;

    /**
     * @brief Run `func` over a read-only view of the block without copying it out
     */
    template<typename F>
    auto WithReadAccess(F&& func) const -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;
        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Handle has been disposed"));
        }
        std::span<const uint8_t> secure_span(static_cast<const uint8_t*>(ptr_), size_);
        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(secure_span));
    }

    template<typename F>
    auto WithWriteAccess(F&& func) -> Result<std::invoke_result_t<F, std::span<uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<uint8_t>>;
        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Handle has been disposed"));
        }
        std::span<uint8_t> secure_span(static_cast<uint8_t*>(ptr_), size_);
        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(secure_span));
    }

    /**
     * @brief Release the block now instead of at destruction
     */
    void Reset() noexcept;

    [[nodiscard]] bool IsInvalid() const noexcept {
        return ptr_ == nullptr;
    }

    [[nodiscard]] size_t Size() const noexcept {
        return size_;
    }

private:
    SecureMemoryHandle(void* ptr, size_t size) noexcept
        : ptr_(ptr), size_(size) {}

    void* ptr_;
    size_t size_;
};

} // namespace tessera::protocol::crypto
