#include "nimbus/client/crypto_context.hpp"

#include <stdexcept>
#include <utility>

#include "nimbus/client/errors.hpp"
#include "nimbus/client/remote_authority.hpp"
#include "nimbus/encoding/base64.hpp"

namespace nimbus::client
{

    CryptoContext::CryptoContext(crypto::SecretKey master_key)
        : master_key_(std::move(master_key)) {}

    CryptoContext CryptoContext::unlock(std::string_view password, const AuthGrant &grant)
    {
        std::vector<std::byte> salt;
        std::vector<std::byte> wrapped;
        try
        {
            salt = encoding::decode_base64(grant.salt);
            wrapped = encoding::decode_base64(grant.wrapped_master_key);
        }
        catch (const std::invalid_argument &ex)
        {
            throw AuthError(AuthError::Reason::InvalidCredentials, std::string("Malformed key material: ") + ex.what());
        }
        if (salt.size() != crypto::kSaltBytes)
        {
            throw AuthError(AuthError::Reason::InvalidCredentials, "Malformed key material: bad salt length");
        }
        const auto password_key = crypto::derive_password_key(password, salt, grant.limits);
        auto master = crypto::unwrap_key(password_key, wrapped);
        if (!master)
        {
            throw AuthError(AuthError::Reason::InvalidCredentials, "Password does not unlock the account key");
        }
        return CryptoContext(std::move(*master));
    }

    FileKey CryptoContext::generate_file_key() const
    {
        auto key = crypto::SecretKey::random();
        auto wrapped = encoding::encode_base64(crypto::wrap_key(master_key_, key));
        return FileKey{std::move(key), std::move(wrapped)};
    }

    crypto::SecretKey CryptoContext::derive_file_key(const Node &node) const
    {
        if (node.type != NodeType::File)
        {
            throw std::invalid_argument("Only files carry a content key");
        }
        return unwrap_file_key(node.content_key);
    }

    crypto::SecretKey CryptoContext::unwrap_file_key(std::string_view wrapped) const
    {
        std::vector<std::byte> bytes;
        try
        {
            bytes = encoding::decode_base64(wrapped);
        }
        catch (const std::invalid_argument &)
        {
            throw IntegrityError("File key is not valid base64");
        }
        auto key = crypto::unwrap_key(master_key_, bytes);
        if (!key)
        {
            throw IntegrityError("File key cannot be unwrapped with the session master key");
        }
        return std::move(*key);
    }

    std::vector<std::byte> CryptoContext::encrypt_chunk(const crypto::SecretKey &key, std::uint64_t offset,
                                                        std::span<const std::byte> plaintext) const
    {
        return crypto::seal_chunk(key, offset, plaintext);
    }

    std::vector<std::byte> CryptoContext::decrypt_chunk(const crypto::SecretKey &key, std::uint64_t offset,
                                                        std::span<const std::byte> ciphertext) const
    {
        auto plaintext = crypto::open_chunk(key, offset, ciphertext);
        if (!plaintext)
        {
            throw IntegrityError("Chunk at offset " + std::to_string(offset) + " failed authentication");
        }
        return std::move(*plaintext);
    }

} // namespace nimbus::client
