#pragma once

#include <cstdint>
#include <vector>

#include "nimbus/crypto.hpp"

namespace nimbus::client
{

    // One plaintext segment of a transfer. The nonce is derived from offset.
    struct ChunkSpec
    {
        std::uint64_t index{};
        std::uint64_t offset{};
        std::uint64_t length{};
        crypto::ChunkNonce nonce{};
    };

    // Byte range of a chunk inside the encrypted representation of its file.
    struct EncryptedRange
    {
        std::uint64_t offset{};
        std::uint64_t length{};
    };

    using ChunkPlan = std::vector<ChunkSpec>;

    // Contiguous plan covering total_bytes. Empty for a zero-byte file.
    // Throws std::invalid_argument when chunk_size is zero.
    ChunkPlan make_chunk_plan(std::uint64_t total_bytes, std::uint64_t chunk_size);

    // True when the entries are ordered, contiguous, non-overlapping and sum to total_bytes.
    bool plan_is_valid(const ChunkPlan &plan, std::uint64_t total_bytes) noexcept;

    // The file was sealed in segment_size pieces, each followed by its tag. chunk must start on a
    // segment boundary and may span several segments.
    EncryptedRange encrypted_range(const ChunkSpec &chunk, std::uint64_t segment_size);

    // Size of the encrypted representation for a file of total_bytes split into chunk_size segments.
    std::uint64_t encrypted_size(std::uint64_t total_bytes, std::uint64_t chunk_size);

} // namespace nimbus::client
