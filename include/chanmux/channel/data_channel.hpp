#pragma once

#include "chanmux/transfer/transfer_types.hpp"
#include "bootstrap_channel.hpp"
#include <string>
#include <functional>
#include <mutex>
#include <cstdint>

namespace chanmux::channel {

// Capability set every transport exposes to the engines. Several concrete
// channel types may take part in the same transfer.
class DataChannel {
public:
    using ChunkHandler = std::function<void(transfer::Chunk)>;
    using AckHandler = std::function<void(std::uint32_t)>;
    
    explicit DataChannel(std::string identifier) : identifier_(std::move(identifier)) {}
    virtual ~DataChannel() = default;
    
    DataChannel(const DataChannel&) = delete;
    DataChannel& operator=(const DataChannel&) = delete;
    
    const std::string& identifier() const { return identifier_; }
    
    // Publishes this channel's ChannelConfig through the bootstrap channel and
    // returns once the remote end has initialized as receiver.
    virtual transfer::TransferResult init_sender(BootstrapChannel& bootstrap) = 0;
    virtual transfer::TransferResult init_receiver(const transfer::ChannelConfig& config) = 0;
    
    // Both return false when the channel cannot carry traffic (closed, not initialized).
    virtual bool send_chunk(const transfer::Chunk& chunk) = 0;
    virtual bool send_ack(std::uint32_t chunk_identifier) = 0;
    
    virtual void close() = 0;
    
    // Replacing a handler blocks until a call of the previous one in progress
    // on another thread has returned; once it returns, the old handler is
    // never invoked again. Must not be called from inside a handler.
    void set_chunk_handler(ChunkHandler handler) {
        std::lock_guard<std::mutex> lock(chunk_handler_mutex_);
        chunk_handler_ = std::move(handler);
    }
    
    void set_ack_handler(AckHandler handler) {
        std::lock_guard<std::mutex> lock(ack_handler_mutex_);
        ack_handler_ = std::move(handler);
    }

protected:
    void notify_chunk(transfer::Chunk chunk) {
        std::lock_guard<std::mutex> lock(chunk_handler_mutex_);
        if (chunk_handler_) {
            chunk_handler_(std::move(chunk));
        }
    }
    
    void notify_ack(std::uint32_t chunk_identifier) {
        std::lock_guard<std::mutex> lock(ack_handler_mutex_);
        if (ack_handler_) {
            ack_handler_(chunk_identifier);
        }
    }

private:
    std::string identifier_;
    
    std::mutex chunk_handler_mutex_;
    ChunkHandler chunk_handler_;
    std::mutex ack_handler_mutex_;
    AckHandler ack_handler_;
};

}
