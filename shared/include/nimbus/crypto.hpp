/**
 * Nimbus - Crypto primitives built on libsodium.
 *
 * Chunk encryption uses ChaCha20-Poly1305 (IETF) with a nonce derived from the
 * plaintext offset of the chunk, so any chunk can be sealed or opened
 * independently of the others. Key wrapping uses crypto_secretbox and the
 * password key is derived with Argon2id.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace nimbus::crypto
{

    inline constexpr std::size_t kKeyBytes = 32;
    inline constexpr std::size_t kChunkNonceBytes = 12;
    inline constexpr std::size_t kChunkTagBytes = 16;
    inline constexpr std::size_t kSaltBytes = 16;
    inline constexpr std::size_t kMacBytes = 32;

    using ChunkNonce = std::array<std::byte, kChunkNonceBytes>;
    using ChunkTag = std::array<std::byte, kChunkTagBytes>;

    // Key material that is wiped from memory when it goes out of scope.
    class SecretKey
    {
    public:
        SecretKey() = default;
        SecretKey(const SecretKey &other) = default;
        SecretKey &operator=(const SecretKey &other) = default;
        ~SecretKey();

        static SecretKey random();
        static SecretKey from_bytes(std::span<const std::byte> bytes);

        const unsigned char *data() const noexcept { return bytes_.data(); }
        unsigned char *data() noexcept { return bytes_.data(); }
        constexpr std::size_t size() const noexcept { return kKeyBytes; }

        bool operator==(const SecretKey &other) const noexcept;

    private:
        std::array<unsigned char, kKeyBytes> bytes_{};
    };

    struct KdfLimits
    {
        std::uint64_t opslimit{};
        std::size_t memlimit{};

        static KdfLimits interactive();
        static KdfLimits minimum();
    };

    void ensure_sodium_init();

    std::string hash_password(std::string_view password);

    bool verify_password(std::string_view password, std::string_view password_hash);

    std::vector<std::byte> random_bytes(std::size_t count);

    // Random identifier rendered as lowercase hex.
    std::string random_id(std::size_t bytes = 16);

    SecretKey derive_password_key(std::string_view password, std::span<const std::byte> salt, const KdfLimits &limits);

    // Returns nonce || secretbox(key).
    std::vector<std::byte> wrap_key(const SecretKey &key_encryption_key, const SecretKey &key);

    std::optional<SecretKey> unwrap_key(const SecretKey &key_encryption_key, std::span<const std::byte> wrapped);

    ChunkNonce chunk_nonce(std::uint64_t offset) noexcept;

    std::vector<std::byte> seal_chunk(const SecretKey &key, std::uint64_t offset, std::span<const std::byte> plaintext);

    // std::nullopt when the tag does not authenticate the ciphertext for this key and offset.
    std::optional<std::vector<std::byte>> open_chunk(const SecretKey &key, std::uint64_t offset,
                                                     std::span<const std::byte> ciphertext);

    ChunkTag tag_of(std::span<const std::byte> ciphertext);

    // Keyed BLAKE2b over the chunk tags in plan order, rendered as hex.
    std::string aggregate_mac(const SecretKey &key, std::span<const ChunkTag> tags);

    bool constant_time_equals(std::string_view lhs, std::string_view rhs) noexcept;

} // namespace nimbus::crypto
