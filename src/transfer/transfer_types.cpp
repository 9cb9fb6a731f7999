#include "chanmux/transfer/transfer_types.hpp"

namespace chanmux::transfer {

const char* to_string(TransferState state) {
    switch (state) {
        case TransferState::IDLE: return "idle";
        case TransferState::HANDSHAKE_PENDING: return "handshake-pending";
        case TransferState::CHANNELS_READY: return "channels-ready";
        case TransferState::TRANSFERRING: return "transferring";
        case TransferState::COMPLETE: return "complete";
        case TransferState::FAILED: return "failed";
    }
    return "unknown";
}

const char* to_string(TransferError error) {
    switch (error) {
        case TransferError::SUCCESS: return "success";
        case TransferError::INVALID_CHUNK_SIZE: return "invalid chunk size";
        case TransferError::DUPLICATE_CHANNEL_IDENTIFIER: return "duplicate channel identifier";
        case TransferError::NO_CHANNELS_REGISTERED: return "no channels registered";
        case TransferError::UNKNOWN_CHANNEL_IDENTIFIER: return "unknown channel identifier";
        case TransferError::INVALID_DESTINATION: return "invalid destination";
        case TransferError::CHANNEL_FAILURE: return "channel failure";
        case TransferError::FILE_READ_ERROR: return "file read error";
        case TransferError::FILE_WRITE_ERROR: return "file write error";
        case TransferError::INVALID_STATE: return "invalid state";
    }
    return "unknown";
}

}
