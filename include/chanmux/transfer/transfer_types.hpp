#pragma once

#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace chanmux::transfer {

// Contiguous slice of the payload. Identifiers are assigned from 0 in split order.
struct Chunk {
    std::uint32_t identifier = 0;
    std::vector<std::uint8_t> data;
};

using ChunkPtr = std::shared_ptr<const Chunk>;

struct TransferMetadata {
    std::string name;
    std::uint32_t chunk_size = 0;
    std::uint32_t chunk_count = 0;
};

// Opaque per-channel configuration, correlated to a registered channel by identifier
struct ChannelConfig {
    std::string channel_identifier;
    std::vector<std::uint8_t> config;
};

enum class TransferState {
    IDLE,
    HANDSHAKE_PENDING,
    CHANNELS_READY,
    TRANSFERRING,
    COMPLETE,
    FAILED
};

enum class TransferError {
    SUCCESS = 0,
    INVALID_CHUNK_SIZE,
    DUPLICATE_CHANNEL_IDENTIFIER,
    NO_CHANNELS_REGISTERED,
    UNKNOWN_CHANNEL_IDENTIFIER,
    INVALID_DESTINATION,
    CHANNEL_FAILURE,
    FILE_READ_ERROR,
    FILE_WRITE_ERROR,
    INVALID_STATE
};

struct TransferResult {
    TransferError error;
    std::string message;
    std::int64_t value;  // offending value, e.g. the rejected chunk size
    
    TransferResult(TransferError err = TransferError::SUCCESS, std::string msg = "", std::int64_t val = 0)
        : error(err), message(std::move(msg)), value(val) {}
    
    bool success() const { return error == TransferError::SUCCESS; }
    operator bool() const { return success(); }
};

const char* to_string(TransferState state);
const char* to_string(TransferError error);

}
