#include "chanmux/channel/loopback_channel.hpp"
#include "chanmux/core/logger.hpp"

namespace chanmux::channel {

LoopbackDataChannel::Pair LoopbackDataChannel::create_pair(boost::asio::io_context& io_context,
                                                           const std::string& identifier) {
    auto link = std::make_shared<Link>();
    auto sender = std::make_shared<LoopbackDataChannel>(PrivateTag{}, io_context, identifier, link);
    auto receiver = std::make_shared<LoopbackDataChannel>(PrivateTag{}, io_context, identifier, link);
    sender->peer_ = receiver;
    receiver->peer_ = sender;
    return {sender, receiver};
}

LoopbackDataChannel::LoopbackDataChannel(PrivateTag, boost::asio::io_context& io_context, std::string identifier,
                                         std::shared_ptr<Link> link)
    : DataChannel(std::move(identifier))
    , io_context_(io_context)
    , link_(std::move(link))
    , dropped_count_(0) {
}

transfer::TransferResult LoopbackDataChannel::init_sender(BootstrapChannel& bootstrap) {
    transfer::ChannelConfig config;
    config.channel_identifier = identifier();
    config.config = {'l', 'o', 'o', 'p', 'b', 'a', 'c', 'k'};
    
    auto result = bootstrap.send_channel_config(config);
    if (!result) {
        return transfer::TransferResult(transfer::TransferError::CHANNEL_FAILURE,
                                        "Failed to publish configuration: " + result.message);
    }
    
    std::unique_lock<std::mutex> lock(link_->mutex);
    link_->ready_cv.wait(lock, [this]() { return link_->receiver_ready || link_->closed; });
    
    if (!link_->receiver_ready) {
        return transfer::TransferResult(transfer::TransferError::CHANNEL_FAILURE,
                                        "Loopback channel " + identifier() + " closed before the receiver was ready");
    }
    
    LOG_DEBUG("Loopback channel {} ready", identifier());
    return transfer::TransferResult(transfer::TransferError::SUCCESS);
}

transfer::TransferResult LoopbackDataChannel::init_receiver(const transfer::ChannelConfig& config) {
    {
        std::lock_guard<std::mutex> lock(link_->mutex);
        if (link_->closed) {
            return transfer::TransferResult(transfer::TransferError::CHANNEL_FAILURE,
                                            "Loopback channel " + identifier() + " is closed");
        }
        link_->receiver_ready = true;
    }
    link_->ready_cv.notify_all();
    
    LOG_DEBUG("Loopback channel {} initialized as receiver ({} config bytes)", identifier(), config.config.size());
    return transfer::TransferResult(transfer::TransferError::SUCCESS);
}

bool LoopbackDataChannel::send_chunk(const transfer::Chunk& chunk) {
    if (!can_send()) {
        return false;
    }
    
    if (drop_filter_ && drop_filter_(chunk)) {
        dropped_count_++;
        LOG_DEBUG("Loopback channel {} dropped chunk {}", identifier(), chunk.identifier);
        return true;
    }
    
    boost::asio::post(io_context_, [peer = peer_, link = link_, chunk]() {
        auto receiver = peer.lock();
        if (!receiver) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(link->mutex);
            if (link->closed) {
                return;
            }
        }
        receiver->notify_chunk(chunk);
    });
    return true;
}

bool LoopbackDataChannel::send_ack(std::uint32_t chunk_identifier) {
    if (!can_send()) {
        return false;
    }
    
    if (ack_drop_filter_ && ack_drop_filter_(chunk_identifier)) {
        dropped_count_++;
        LOG_DEBUG("Loopback channel {} dropped acknowledgment {}", identifier(), chunk_identifier);
        return true;
    }
    
    boost::asio::post(io_context_, [peer = peer_, link = link_, chunk_identifier]() {
        auto sender = peer.lock();
        if (!sender) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(link->mutex);
            if (link->closed) {
                return;
            }
        }
        sender->notify_ack(chunk_identifier);
    });
    return true;
}

void LoopbackDataChannel::close() {
    {
        std::lock_guard<std::mutex> lock(link_->mutex);
        if (link_->closed) {
            return;
        }
        link_->closed = true;
    }
    link_->ready_cv.notify_all();
    LOG_DEBUG("Loopback channel {} closed", identifier());
}

bool LoopbackDataChannel::is_ready() const {
    std::lock_guard<std::mutex> lock(link_->mutex);
    return link_->receiver_ready && !link_->closed;
}

bool LoopbackDataChannel::can_send() const {
    return is_ready();
}

LoopbackBootstrapChannel::Pair LoopbackBootstrapChannel::create_pair(boost::asio::io_context& io_context) {
    auto link = std::make_shared<Link>(io_context);
    auto sender = std::make_shared<LoopbackBootstrapChannel>(PrivateTag{}, link);
    auto receiver = std::make_shared<LoopbackBootstrapChannel>(PrivateTag{}, link);
    link->receiving_end = receiver;
    return {sender, receiver};
}

LoopbackBootstrapChannel::LoopbackBootstrapChannel(PrivateTag, std::shared_ptr<Link> link)
    : link_(std::move(link)) {
}

transfer::TransferResult LoopbackBootstrapChannel::init_sender() {
    std::lock_guard<std::mutex> lock(link_->mutex);
    if (link_->closed) {
        return transfer::TransferResult(transfer::TransferError::CHANNEL_FAILURE, "Bootstrap channel is closed");
    }
    return transfer::TransferResult(transfer::TransferError::SUCCESS);
}

transfer::TransferResult LoopbackBootstrapChannel::init_receiver() {
    std::lock_guard<std::mutex> lock(link_->mutex);
    if (link_->closed) {
        return transfer::TransferResult(transfer::TransferError::CHANNEL_FAILURE, "Bootstrap channel is closed");
    }
    
    link_->receiver_ready = true;
    if (!link_->backlog.empty()) {
        LOG_DEBUG("Delivering {} buffered bootstrap messages", link_->backlog.size());
    }
    auto backlog = std::move(link_->backlog);
    link_->backlog.clear();
    for (auto& message : backlog) {
        deliver_locked(std::move(message));
    }
    return transfer::TransferResult(transfer::TransferError::SUCCESS);
}

transfer::TransferResult LoopbackBootstrapChannel::send_metadata(const transfer::TransferMetadata& metadata) {
    return send(metadata);
}

transfer::TransferResult LoopbackBootstrapChannel::send_channel_config(const transfer::ChannelConfig& config) {
    return send(config);
}

void LoopbackBootstrapChannel::close() {
    std::lock_guard<std::mutex> lock(link_->mutex);
    link_->closed = true;
    link_->backlog.clear();
}

transfer::TransferResult LoopbackBootstrapChannel::send(Message message) {
    std::lock_guard<std::mutex> lock(link_->mutex);
    if (link_->closed) {
        return transfer::TransferResult(transfer::TransferError::CHANNEL_FAILURE, "Bootstrap channel is closed");
    }
    
    if (link_->receiver_ready) {
        deliver_locked(std::move(message));
    } else {
        link_->backlog.push_back(std::move(message));
    }
    return transfer::TransferResult(transfer::TransferError::SUCCESS);
}

void LoopbackBootstrapChannel::deliver_locked(Message message) {
    boost::asio::post(link_->strand, [link = link_, message = std::move(message)]() {
        std::shared_ptr<LoopbackBootstrapChannel> receiver;
        {
            std::lock_guard<std::mutex> lock(link->mutex);
            if (link->closed) {
                return;
            }
            receiver = link->receiving_end.lock();
        }
        if (receiver) {
            receiver->handle_message(message);
        }
    });
}

void LoopbackBootstrapChannel::handle_message(const Message& message) {
    if (std::holds_alternative<transfer::TransferMetadata>(message)) {
        notify_metadata(std::get<transfer::TransferMetadata>(message));
    } else {
        notify_channel_config(std::get<transfer::ChannelConfig>(message));
    }
}

}
