#include "s3up/crypto.hpp"

#include <mutex>
#include <stdexcept>

#include <sodium.h>

namespace s3up::crypto
{

    namespace
    {

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
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

    Digest sha256(std::string_view data)
    {
        ensure_initialized_once();
        Digest digest{};
        if (crypto_hash_sha256(digest.data(), reinterpret_cast<const unsigned char *>(data.data()), data.size()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256 failed");
        }
        return digest;
    }

    std::string sha256_hex(std::string_view data)
    {
        return to_hex(sha256(data));
    }

    Digest hmac_sha256(std::span<const unsigned char> key, std::string_view data)
    {
        ensure_initialized_once();
        crypto_auth_hmacsha256_state state;
        if (crypto_auth_hmacsha256_init(&state, key.data(), key.size()) != 0)
        {
            throw std::runtime_error("crypto_auth_hmacsha256_init failed");
        }
        if (crypto_auth_hmacsha256_update(&state, reinterpret_cast<const unsigned char *>(data.data()), data.size()) != 0)
        {
            throw std::runtime_error("crypto_auth_hmacsha256_update failed");
        }
        Digest mac{};
        if (crypto_auth_hmacsha256_final(&state, mac.data()) != 0)
        {
            throw std::runtime_error("crypto_auth_hmacsha256_final failed");
        }
        return mac;
    }

    Digest hmac_sha256(std::string_view key, std::string_view data)
    {
        return hmac_sha256(std::span<const unsigned char>(reinterpret_cast<const unsigned char *>(key.data()), key.size()),
                           data);
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

} // namespace s3up::crypto
