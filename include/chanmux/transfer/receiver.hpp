#pragma once

#include "transfer_types.hpp"
#include "chanmux/channel/bootstrap_channel.hpp"
#include "chanmux/channel/data_channel.hpp"
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace chanmux::transfer {

struct ReceiverStats {
    std::uint64_t chunks_accepted = 0;
    std::uint64_t duplicate_chunks = 0;
    std::uint64_t discarded_chunks = 0;
    std::uint64_t bytes_accepted = 0;
};

/**
 * Receiving side of a transfer.
 *
 * receive() reads the transfer metadata and one ChannelConfig per data
 * channel from the bootstrap channel, initializes the matching channels,
 * then collects chunks from all of them until the announced count is
 * reached. Chunks are kept once per identifier; every arrival is
 * acknowledged on the channel that carried it. The payload is written to
 * destination / name in identifier order.
 */
class Receiver {
public:
    explicit Receiver(std::shared_ptr<channel::BootstrapChannel> bootstrap);
    ~Receiver();

    Receiver(const Receiver&) = delete;
    Receiver& operator=(const Receiver&) = delete;

    TransferResult register_channel(std::shared_ptr<channel::DataChannel> channel);

    // destination must be an existing, writable directory
    TransferResult receive(const std::filesystem::path& destination);

    TransferState get_state() const;
    ReceiverStats get_stats() const;
    std::optional<TransferMetadata> get_metadata() const;
    size_t get_received_count() const;

    // Path of the reassembled file, set once receive() succeeded
    const std::filesystem::path& output_path() const { return output_path_; }

private:
    void handle_metadata(const TransferMetadata& metadata);
    void handle_channel_config(const ChannelConfig& config);
    void handle_chunk(channel::DataChannel& channel, Chunk chunk);

    bool is_handshake_complete() const;
    bool is_data_complete() const;
    TransferResult fail(TransferResult result);
    TransferResult write_output(const std::filesystem::path& destination);
    void set_state_locked(TransferState new_state);

    static std::string sanitize_name(const std::string& name);

    std::shared_ptr<channel::BootstrapChannel> bootstrap_;
    std::unordered_map<std::string, std::shared_ptr<channel::DataChannel>> channels_;

    mutable std::mutex mutex_;
    std::condition_variable state_cv_;
    TransferState state_;
    std::optional<TransferMetadata> metadata_;
    std::unordered_set<std::string> initialized_channels_;
    std::map<std::uint32_t, Chunk> received_chunks_;
    bool collecting_;
    std::optional<TransferResult> error_;
    ReceiverStats stats_;

    std::filesystem::path output_path_;
};

}
