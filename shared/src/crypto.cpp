#include "chunkvault/crypto.hpp"

#include <array>
#include <cctype>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace chunkvault::crypto
{

    namespace
    {

        constexpr std::size_t kDigestBytes = crypto_generichash_BYTES;

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::string to_hex(std::span<const unsigned char> data)
        {
            static constexpr char kHexDigits[] = "0123456789abcdef";
            std::string result;
            result.resize(data.size() * 2);
            for (std::size_t i = 0; i < data.size(); ++i)
            {
                const auto byte = data[i];
                result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
                result[2 * i + 1] = kHexDigits[byte & 0x0F];
            }
            return result;
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

    } // namespace

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    Hasher::Hasher()
    {
        ensure_initialized_once();
        if (crypto_generichash_init(&state_, nullptr, 0, kDigestBytes) != 0)
        {
            throw std::runtime_error("crypto_generichash_init failed");
        }
    }

    void Hasher::update(std::span<const std::byte> data)
    {
        if (finished_)
        {
            throw std::logic_error("Hasher already finished");
        }
        if (data.empty())
        {
            return;
        }
        if (crypto_generichash_update(&state_, reinterpret_cast<const unsigned char *>(data.data()), data.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_update failed");
        }
        bytes_hashed_ += data.size();
    }

    std::string Hasher::finish()
    {
        if (finished_)
        {
            throw std::logic_error("Hasher already finished");
        }
        std::array<unsigned char, kDigestBytes> digest{};
        if (crypto_generichash_final(&state_, digest.data(), digest.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_final failed");
        }
        finished_ = true;
        return to_hex(digest);
    }

    std::string hash_bytes(std::span<const std::byte> data)
    {
        ensure_initialized_once();
        std::array<unsigned char, kDigestBytes> digest{};
        if (crypto_generichash(digest.data(), digest.size(),
                               reinterpret_cast<const unsigned char *>(data.data()), data.size(), nullptr, 0) != 0)
        {
            throw std::runtime_error("crypto_generichash failed");
        }
        return to_hex(digest);
    }

    std::string hash_stream(std::istream &input)
    {
        Hasher hasher;
        std::vector<std::byte> buffer(64 * 1024);
        while (input)
        {
            input.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(input.gcount());
            if (read_count > 0)
            {
                hasher.update(std::span<const std::byte>(buffer.data(), read_count));
            }
        }
        return hasher.finish();
    }

    std::string hash_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open file for hashing: " + path.string());
        }
        return hash_stream(file);
    }

    bool digests_equal(std::string_view lhs, std::string_view rhs) noexcept
    {
        if (lhs.size() != rhs.size())
        {
            return false;
        }
        for (std::size_t i = 0; i < lhs.size(); ++i)
        {
            const auto a = std::tolower(static_cast<unsigned char>(lhs[i]));
            const auto b = std::tolower(static_cast<unsigned char>(rhs[i]));
            if (a != b)
            {
                return false;
            }
        }
        return true;
    }

    std::string normalize_digest(std::string_view digest)
    {
        std::string result(digest);
        for (auto &ch : result)
        {
            ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }
        return result;
    }

    bool is_well_formed_digest(std::string_view digest) noexcept
    {
        if (digest.size() != kDigestBytes * 2)
        {
            return false;
        }
        for (const char ch : digest)
        {
            if (!std::isxdigit(static_cast<unsigned char>(ch)))
            {
                return false;
            }
        }
        return true;
    }

    std::string random_hex(std::size_t byte_count)
    {
        ensure_initialized_once();
        std::vector<unsigned char> bytes(byte_count);
        randombytes_buf(bytes.data(), bytes.size());
        return to_hex(bytes);
    }

} // namespace chunkvault::crypto
