#include "nimbus/client/chunk_plan.hpp"

#include <algorithm>
#include <stdexcept>

namespace nimbus::client
{

    ChunkPlan make_chunk_plan(std::uint64_t total_bytes, std::uint64_t chunk_size)
    {
        if (chunk_size == 0)
        {
            throw std::invalid_argument("Chunk size must be positive");
        }
        ChunkPlan plan;
        plan.reserve(static_cast<std::size_t>((total_bytes + chunk_size - 1) / chunk_size));
        std::uint64_t offset = 0;
        std::uint64_t index = 0;
        while (offset < total_bytes)
        {
            const auto length = std::min(chunk_size, total_bytes - offset);
            plan.push_back(ChunkSpec{
                .index = index,
                .offset = offset,
                .length = length,
                .nonce = crypto::chunk_nonce(offset),
            });
            offset += length;
            ++index;
        }
        return plan;
    }

    bool plan_is_valid(const ChunkPlan &plan, std::uint64_t total_bytes) noexcept
    {
        std::uint64_t expected_offset = 0;
        for (std::size_t i = 0; i < plan.size(); ++i)
        {
            const auto &chunk = plan[i];
            if (chunk.index != i || chunk.offset != expected_offset || chunk.length == 0 ||
                chunk.nonce != crypto::chunk_nonce(chunk.offset))
            {
                return false;
            }
            expected_offset += chunk.length;
        }
        return expected_offset == total_bytes;
    }

    EncryptedRange encrypted_range(const ChunkSpec &chunk, std::uint64_t segment_size)
    {
        if (segment_size == 0 || chunk.offset % segment_size != 0)
        {
            throw std::invalid_argument("Chunk does not start on an encryption segment boundary");
        }
        const auto first_segment = chunk.offset / segment_size;
        const auto segments = (chunk.length + segment_size - 1) / segment_size;
        return EncryptedRange{
            .offset = chunk.offset + first_segment * crypto::kChunkTagBytes,
            .length = chunk.length + segments * crypto::kChunkTagBytes,
        };
    }

    std::uint64_t encrypted_size(std::uint64_t total_bytes, std::uint64_t chunk_size)
    {
        if (chunk_size == 0)
        {
            throw std::invalid_argument("Chunk size must be positive");
        }
        const auto chunks = (total_bytes + chunk_size - 1) / chunk_size;
        return total_bytes + chunks * crypto::kChunkTagBytes;
    }

} // namespace nimbus::client
