#pragma once

#include "transfer_types.hpp"
#include <span>
#include <vector>
#include <cstdint>

namespace chanmux::transfer {

class Chunker {
public:
    // Splits payload into ceil(len / chunk_size) chunks with identifiers 0..n-1.
    // Fails with INVALID_CHUNK_SIZE (value = chunk_size) when chunk_size <= 0
    // or chunk_size > payload.size(); chunks is left untouched in that case.
    static TransferResult split(std::span<const std::uint8_t> payload,
                                std::int64_t chunk_size,
                                std::vector<Chunk>& chunks);
    
    // Concatenates chunk data in ascending identifier order, whatever the input order.
    static std::vector<std::uint8_t> reassemble(const std::vector<Chunk>& chunks);
};

}
