/**
 * ChunkVault - Content digests built on libsodium.
 *
 * Digests are BLAKE2b-256 (crypto_generichash) rendered as 64 lowercase hex
 * characters. Identical byte sequences always produce identical digests.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <span>
#include <string>
#include <string_view>

#include <sodium.h>

namespace chunkvault::crypto
{

    void ensure_sodium_init();

    /// Incremental digest; feed any number of buffers, then call finish() once.
    class Hasher
    {
    public:
        Hasher();

        void update(std::span<const std::byte> data);

        std::string finish();

        std::uint64_t bytes_hashed() const noexcept { return bytes_hashed_; }

    private:
        crypto_generichash_state state_{};
        std::uint64_t bytes_hashed_{0};
        bool finished_{false};
    };

    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

    // Case-insensitive comparison of two hex digests.
    bool digests_equal(std::string_view lhs, std::string_view rhs) noexcept;

    std::string normalize_digest(std::string_view digest);

    bool is_well_formed_digest(std::string_view digest) noexcept;

    // Hex string of `byte_count` bytes from the libsodium CSPRNG; used for identifiers.
    std::string random_hex(std::size_t byte_count);

} // namespace chunkvault::crypto
