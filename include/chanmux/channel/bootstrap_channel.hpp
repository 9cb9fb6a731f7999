#pragma once

#include "chanmux/transfer/transfer_types.hpp"
#include <functional>
#include <mutex>

namespace chanmux::channel {

// The single control link carrying transfer metadata and per-channel
// configuration before any data channel starts.
class BootstrapChannel {
public:
    using MetadataHandler = std::function<void(const transfer::TransferMetadata&)>;
    using ChannelConfigHandler = std::function<void(const transfer::ChannelConfig&)>;
    
    virtual ~BootstrapChannel() = default;
    
    virtual transfer::TransferResult init_sender() = 0;
    virtual transfer::TransferResult init_receiver() = 0;
    
    virtual transfer::TransferResult send_metadata(const transfer::TransferMetadata& metadata) = 0;
    // May be called concurrently by every data channel of a transfer.
    virtual transfer::TransferResult send_channel_config(const transfer::ChannelConfig& config) = 0;
    
    virtual void close() = 0;
    
    // Handlers must be installed before init_receiver(). Replacing one waits
    // for a call already running on another thread, as DataChannel does.
    void set_metadata_handler(MetadataHandler handler) {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        metadata_handler_ = std::move(handler);
    }
    
    void set_channel_config_handler(ChannelConfigHandler handler) {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        channel_config_handler_ = std::move(handler);
    }

protected:
    void notify_metadata(const transfer::TransferMetadata& metadata) {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        if (metadata_handler_) {
            metadata_handler_(metadata);
        }
    }
    
    void notify_channel_config(const transfer::ChannelConfig& config) {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        if (channel_config_handler_) {
            channel_config_handler_(config);
        }
    }

private:
    std::mutex handler_mutex_;
    MetadataHandler metadata_handler_;
    ChannelConfigHandler channel_config_handler_;
};

}
