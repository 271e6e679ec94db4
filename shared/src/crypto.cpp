#include "nimbus/crypto.hpp"

#include <cstring>
#include <mutex>
#include <stdexcept>

#include <sodium.h>

#include "nimbus/encoding/base64.hpp"

namespace nimbus::crypto
{

    static_assert(kKeyBytes == crypto_aead_chacha20poly1305_IETF_KEYBYTES);
    static_assert(kKeyBytes == crypto_secretbox_KEYBYTES);
    static_assert(kChunkNonceBytes == crypto_aead_chacha20poly1305_IETF_NPUBBYTES);
    static_assert(kChunkTagBytes == crypto_aead_chacha20poly1305_IETF_ABYTES);
    static_assert(kSaltBytes == crypto_pwhash_SALTBYTES);

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

        const unsigned char *as_uchar(std::span<const std::byte> data)
        {
            return reinterpret_cast<const unsigned char *>(data.data());
        }

        std::array<unsigned char, 8> offset_bytes(std::uint64_t offset)
        {
            std::array<unsigned char, 8> bytes{};
            for (std::size_t i = 0; i < bytes.size(); ++i)
            {
                bytes[i] = static_cast<unsigned char>((offset >> (8 * i)) & 0xFF);
            }
            return bytes;
        }

    } // namespace

    SecretKey::~SecretKey()
    {
        sodium_memzero(bytes_.data(), bytes_.size());
    }

    SecretKey SecretKey::random()
    {
        ensure_initialized_once();
        SecretKey key;
        randombytes_buf(key.bytes_.data(), key.bytes_.size());
        return key;
    }

    SecretKey SecretKey::from_bytes(std::span<const std::byte> bytes)
    {
        if (bytes.size() != kKeyBytes)
        {
            throw std::invalid_argument("Key material has the wrong length");
        }
        SecretKey key;
        std::memcpy(key.bytes_.data(), bytes.data(), kKeyBytes);
        return key;
    }

    bool SecretKey::operator==(const SecretKey &other) const noexcept
    {
        return sodium_memcmp(bytes_.data(), other.bytes_.data(), kKeyBytes) == 0;
    }

    KdfLimits KdfLimits::interactive()
    {
        return {crypto_pwhash_OPSLIMIT_INTERACTIVE, crypto_pwhash_MEMLIMIT_INTERACTIVE};
    }

    KdfLimits KdfLimits::minimum()
    {
        return {crypto_pwhash_OPSLIMIT_MIN, crypto_pwhash_MEMLIMIT_MIN};
    }

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    std::string hash_password(std::string_view password)
    {
        ensure_initialized_once();
        std::string hash;
        hash.resize(crypto_pwhash_STRBYTES);
        if (crypto_pwhash_str(hash.data(), password.data(), password.size(), crypto_pwhash_OPSLIMIT_INTERACTIVE,
                              crypto_pwhash_MEMLIMIT_INTERACTIVE) != 0)
        {
            throw std::runtime_error("crypto_pwhash_str failed");
        }
        hash.resize(std::strlen(hash.c_str()));
        return hash;
    }

    bool verify_password(std::string_view password, std::string_view password_hash)
    {
        ensure_initialized_once();
        const std::string hash_string(password_hash);
        return crypto_pwhash_str_verify(hash_string.c_str(), password.data(), password.size()) == 0;
    }

    std::vector<std::byte> random_bytes(std::size_t count)
    {
        ensure_initialized_once();
        std::vector<std::byte> bytes(count);
        randombytes_buf(bytes.data(), bytes.size());
        return bytes;
    }

    std::string random_id(std::size_t bytes)
    {
        return encoding::encode_hex(random_bytes(bytes));
    }

    SecretKey derive_password_key(std::string_view password, std::span<const std::byte> salt, const KdfLimits &limits)
    {
        ensure_initialized_once();
        if (salt.size() != kSaltBytes)
        {
            throw std::invalid_argument("Password salt has the wrong length");
        }
        SecretKey key;
        if (crypto_pwhash(key.data(), key.size(), password.data(), password.size(), as_uchar(salt),
                          static_cast<unsigned long long>(limits.opslimit), limits.memlimit,
                          crypto_pwhash_ALG_ARGON2ID13) != 0)
        {
            throw std::runtime_error("crypto_pwhash failed");
        }
        return key;
    }

    std::vector<std::byte> wrap_key(const SecretKey &key_encryption_key, const SecretKey &key)
    {
        ensure_initialized_once();
        std::vector<std::byte> wrapped(crypto_secretbox_NONCEBYTES + crypto_secretbox_MACBYTES + kKeyBytes);
        auto *nonce = reinterpret_cast<unsigned char *>(wrapped.data());
        randombytes_buf(nonce, crypto_secretbox_NONCEBYTES);
        if (crypto_secretbox_easy(nonce + crypto_secretbox_NONCEBYTES, key.data(), key.size(), nonce,
                                  key_encryption_key.data()) != 0)
        {
            throw std::runtime_error("crypto_secretbox_easy failed");
        }
        return wrapped;
    }

    std::optional<SecretKey> unwrap_key(const SecretKey &key_encryption_key, std::span<const std::byte> wrapped)
    {
        ensure_initialized_once();
        if (wrapped.size() != crypto_secretbox_NONCEBYTES + crypto_secretbox_MACBYTES + kKeyBytes)
        {
            return std::nullopt;
        }
        const auto *nonce = as_uchar(wrapped);
        SecretKey key;
        if (crypto_secretbox_open_easy(key.data(), nonce + crypto_secretbox_NONCEBYTES,
                                       wrapped.size() - crypto_secretbox_NONCEBYTES, nonce,
                                       key_encryption_key.data()) != 0)
        {
            return std::nullopt;
        }
        return key;
    }

    ChunkNonce chunk_nonce(std::uint64_t offset) noexcept
    {
        ChunkNonce nonce{};
        const auto bytes = offset_bytes(offset);
        for (std::size_t i = 0; i < bytes.size(); ++i)
        {
            nonce[i] = static_cast<std::byte>(bytes[i]);
        }
        return nonce;
    }

    std::vector<std::byte> seal_chunk(const SecretKey &key, std::uint64_t offset, std::span<const std::byte> plaintext)
    {
        ensure_initialized_once();
        const auto nonce = chunk_nonce(offset);
        const auto ad = offset_bytes(offset);
        std::vector<std::byte> ciphertext(plaintext.size() + kChunkTagBytes);
        unsigned long long written = 0;
        if (crypto_aead_chacha20poly1305_ietf_encrypt(reinterpret_cast<unsigned char *>(ciphertext.data()), &written,
                                                      as_uchar(plaintext), plaintext.size(), ad.data(), ad.size(),
                                                      nullptr, reinterpret_cast<const unsigned char *>(nonce.data()),
                                                      key.data()) != 0)
        {
            throw std::runtime_error("crypto_aead_chacha20poly1305_ietf_encrypt failed");
        }
        ciphertext.resize(static_cast<std::size_t>(written));
        return ciphertext;
    }

    std::optional<std::vector<std::byte>> open_chunk(const SecretKey &key, std::uint64_t offset,
                                                     std::span<const std::byte> ciphertext)
    {
        ensure_initialized_once();
        if (ciphertext.size() < kChunkTagBytes)
        {
            return std::nullopt;
        }
        const auto nonce = chunk_nonce(offset);
        const auto ad = offset_bytes(offset);
        std::vector<std::byte> plaintext(ciphertext.size() - kChunkTagBytes);
        unsigned long long written = 0;
        if (crypto_aead_chacha20poly1305_ietf_decrypt(reinterpret_cast<unsigned char *>(plaintext.data()), &written,
                                                      nullptr, as_uchar(ciphertext), ciphertext.size(), ad.data(),
                                                      ad.size(), reinterpret_cast<const unsigned char *>(nonce.data()),
                                                      key.data()) != 0)
        {
            return std::nullopt;
        }
        plaintext.resize(static_cast<std::size_t>(written));
        return plaintext;
    }

    ChunkTag tag_of(std::span<const std::byte> ciphertext)
    {
        if (ciphertext.size() < kChunkTagBytes)
        {
            throw std::invalid_argument("Ciphertext shorter than its authentication tag");
        }
        ChunkTag tag{};
        std::memcpy(tag.data(), ciphertext.data() + ciphertext.size() - kChunkTagBytes, kChunkTagBytes);
        return tag;
    }

    std::string aggregate_mac(const SecretKey &key, std::span<const ChunkTag> tags)
    {
        ensure_initialized_once();
        crypto_generichash_state state;
        if (crypto_generichash_init(&state, key.data(), key.size(), kMacBytes) != 0)
        {
            throw std::runtime_error("crypto_generichash_init failed");
        }
        for (const auto &tag : tags)
        {
            if (crypto_generichash_update(&state, reinterpret_cast<const unsigned char *>(tag.data()), tag.size()) != 0)
            {
                throw std::runtime_error("crypto_generichash_update failed");
            }
        }
        std::array<std::byte, kMacBytes> digest{};
        if (crypto_generichash_final(&state, reinterpret_cast<unsigned char *>(digest.data()), digest.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_final failed");
        }
        return encoding::encode_hex(digest);
    }

    bool constant_time_equals(std::string_view lhs, std::string_view rhs) noexcept
    {
        if (lhs.size() != rhs.size())
        {
            return false;
        }
        return sodium_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
    }

} // namespace nimbus::crypto
