#include "chanmux/transfer/chunker.hpp"
#include <algorithm>
#include <limits>

namespace chanmux::transfer {

TransferResult Chunker::split(std::span<const std::uint8_t> payload,
                              std::int64_t chunk_size,
                              std::vector<Chunk>& chunks) {
    auto payload_size = static_cast<std::int64_t>(payload.size());
    
    if (chunk_size <= 0 || chunk_size > payload_size ||
        chunk_size > std::numeric_limits<std::uint32_t>::max()) {
        return TransferResult(
            TransferError::INVALID_CHUNK_SIZE,
            "Invalid chunk size (was " + std::to_string(chunk_size) + ").",
            chunk_size
        );
    }
    
    auto chunk_count = (payload_size + chunk_size - 1) / chunk_size;
    if (chunk_count > std::numeric_limits<std::uint32_t>::max()) {
        return TransferResult(
            TransferError::INVALID_CHUNK_SIZE,
            "Invalid chunk size (was " + std::to_string(chunk_size) + ").",
            chunk_size
        );
    }
    
    std::vector<Chunk> result;
    result.reserve(static_cast<size_t>(chunk_count));
    
    std::uint32_t identifier = 0;
    for (std::int64_t offset = 0; offset < payload_size; offset += chunk_size) {
        auto length = std::min(chunk_size, payload_size - offset);
        auto slice = payload.subspan(static_cast<size_t>(offset), static_cast<size_t>(length));
        
        result.push_back(Chunk{identifier++, std::vector<std::uint8_t>(slice.begin(), slice.end())});
    }
    
    chunks = std::move(result);
    return TransferResult(TransferError::SUCCESS);
}

std::vector<std::uint8_t> Chunker::reassemble(const std::vector<Chunk>& chunks) {
    std::vector<const Chunk*> ordered;
    ordered.reserve(chunks.size());
    
    size_t total_size = 0;
    for (const auto& chunk : chunks) {
        ordered.push_back(&chunk);
        total_size += chunk.data.size();
    }
    
    std::sort(ordered.begin(), ordered.end(), [](const Chunk* a, const Chunk* b) {
        return a->identifier < b->identifier;
    });
    
    std::vector<std::uint8_t> payload;
    payload.reserve(total_size);
    for (const auto* chunk : ordered) {
        payload.insert(payload.end(), chunk->data.begin(), chunk->data.end());
    }
    
    return payload;
}

}
