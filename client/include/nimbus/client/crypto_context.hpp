#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "nimbus/client/node.hpp"
#include "nimbus/crypto.hpp"

namespace nimbus::client
{

    struct AuthGrant;

    struct FileKey
    {
        crypto::SecretKey key;
        std::string wrapped; // base64, safe to hand to the authority
    };

    // Per-session key material. The master key never leaves this object unwrapped.
    class CryptoContext
    {
    public:
        explicit CryptoContext(crypto::SecretKey master_key);

        // Derives the password key from the grant's salt and limits and unwraps the master key.
        // Throws AuthError(InvalidCredentials) when the password does not open it.
        static CryptoContext unlock(std::string_view password, const AuthGrant &grant);

        FileKey generate_file_key() const;

        // Throws IntegrityError when the node's key was not wrapped by this master key.
        crypto::SecretKey derive_file_key(const Node &node) const;
        crypto::SecretKey unwrap_file_key(std::string_view wrapped) const;

        std::vector<std::byte> encrypt_chunk(const crypto::SecretKey &key, std::uint64_t offset,
                                             std::span<const std::byte> plaintext) const;

        // Throws IntegrityError on tag mismatch or truncated input.
        std::vector<std::byte> decrypt_chunk(const crypto::SecretKey &key, std::uint64_t offset,
                                             std::span<const std::byte> ciphertext) const;

    private:
        crypto::SecretKey master_key_;
    };

} // namespace nimbus::client
