#pragma once

#include "bootstrap_channel.hpp"
#include "data_channel.hpp"
#include <utility>  // before Boost.Asio: awaitable.hpp uses std::exchange
#include <boost/asio.hpp>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace chanmux::channel {

/**
 * In-process data channel. Two ends are created together; whatever one end
 * sends is delivered to the other end's handlers on the io_context, so
 * delivery is asynchronous and unordered when the context runs on several
 * threads.
 *
 * Drop filters simulate loss: a chunk or acknowledgment for which the
 * filter returns true is silently discarded. Filters must be installed
 * before the transfer starts.
 */
class LoopbackDataChannel : public DataChannel {
    struct Link;
    struct PrivateTag { explicit PrivateTag() = default; };

public:
    using ChunkFilter = std::function<bool(const transfer::Chunk&)>;
    using AckFilter = std::function<bool(std::uint32_t)>;
    using Pair = std::pair<std::shared_ptr<LoopbackDataChannel>, std::shared_ptr<LoopbackDataChannel>>;
    
    // Returns {sender end, receiver end}, both carrying the same identifier
    static Pair create_pair(boost::asio::io_context& io_context, const std::string& identifier);
    
    // Only reachable through create_pair()
    LoopbackDataChannel(PrivateTag, boost::asio::io_context& io_context, std::string identifier,
                        std::shared_ptr<Link> link);
    
    transfer::TransferResult init_sender(BootstrapChannel& bootstrap) override;
    transfer::TransferResult init_receiver(const transfer::ChannelConfig& config) override;
    
    bool send_chunk(const transfer::Chunk& chunk) override;
    bool send_ack(std::uint32_t chunk_identifier) override;
    
    // Closes both ends and wakes a pending init_sender()
    void close() override;
    
    void set_drop_filter(ChunkFilter filter) { drop_filter_ = std::move(filter); }
    void set_ack_drop_filter(AckFilter filter) { ack_drop_filter_ = std::move(filter); }
    
    std::uint64_t get_dropped_count() const { return dropped_count_.load(); }
    bool is_ready() const;

private:
    struct Link {
        std::mutex mutex;
        std::condition_variable ready_cv;
        bool receiver_ready = false;
        bool closed = false;
    };
    
    bool can_send() const;
    
    boost::asio::io_context& io_context_;
    std::shared_ptr<Link> link_;
    std::weak_ptr<LoopbackDataChannel> peer_;
    
    ChunkFilter drop_filter_;
    AckFilter ack_drop_filter_;
    std::atomic<std::uint64_t> dropped_count_;
};

/**
 * In-process control channel. Messages sent before the receiving end is
 * initialized are buffered and delivered, in order, once init_receiver()
 * runs.
 */
class LoopbackBootstrapChannel : public BootstrapChannel {
    struct Link;
    struct PrivateTag { explicit PrivateTag() = default; };

public:
    using Pair = std::pair<std::shared_ptr<LoopbackBootstrapChannel>, std::shared_ptr<LoopbackBootstrapChannel>>;
    
    // Returns {sender end, receiver end}
    static Pair create_pair(boost::asio::io_context& io_context);
    
    LoopbackBootstrapChannel(PrivateTag, std::shared_ptr<Link> link);
    
    transfer::TransferResult init_sender() override;
    transfer::TransferResult init_receiver() override;
    
    transfer::TransferResult send_metadata(const transfer::TransferMetadata& metadata) override;
    transfer::TransferResult send_channel_config(const transfer::ChannelConfig& config) override;
    
    void close() override;

private:
    using Message = std::variant<transfer::TransferMetadata, transfer::ChannelConfig>;
    
    struct Link {
        explicit Link(boost::asio::io_context& io_context) : strand(boost::asio::make_strand(io_context)) {}
        
        std::mutex mutex;
        bool receiver_ready = false;
        bool closed = false;
        std::vector<Message> backlog;
        std::weak_ptr<LoopbackBootstrapChannel> receiving_end;
        boost::asio::strand<boost::asio::io_context::executor_type> strand;
    };
    
    transfer::TransferResult send(Message message);
    void deliver_locked(Message message);
    void handle_message(const Message& message);
    
    std::shared_ptr<Link> link_;
};

}
