#include "chanmux/transfer/receiver.hpp"
#include "chanmux/transfer/chunker.hpp"
#include "chanmux/core/logger.hpp"
#include "chanmux/core/utils.hpp"
#include <stdexcept>
#include <vector>

namespace chanmux::transfer {

Receiver::Receiver(std::shared_ptr<channel::BootstrapChannel> bootstrap)
    : bootstrap_(std::move(bootstrap))
    , state_(TransferState::IDLE)
    , collecting_(true) {
    if (!bootstrap_) {
        throw std::invalid_argument("Receiver requires a bootstrap channel");
    }
}

Receiver::~Receiver() {
    bootstrap_->set_metadata_handler(nullptr);
    bootstrap_->set_channel_config_handler(nullptr);
    for (auto& [identifier, channel] : channels_) {
        channel->set_chunk_handler(nullptr);
    }
}

TransferResult Receiver::register_channel(std::shared_ptr<channel::DataChannel> channel) {
    if (!channel) {
        throw std::invalid_argument("Cannot register a null channel");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ != TransferState::IDLE) {
        return TransferResult(TransferError::INVALID_STATE,
                              "Channels can only be registered before the transfer starts");
    }

    if (channels_.find(channel->identifier()) != channels_.end()) {
        return TransferResult(TransferError::DUPLICATE_CHANNEL_IDENTIFIER,
                              "Channel identifier \"" + channel->identifier() + "\" is already used.");
    }

    auto* raw_channel = channel.get();
    channel->set_chunk_handler([this, raw_channel](Chunk chunk) {
        handle_chunk(*raw_channel, std::move(chunk));
    });
    channels_.emplace(channel->identifier(), std::move(channel));

    LOG_DEBUG("Registered data channel {} ({} total)", raw_channel->identifier(), channels_.size());
    return TransferResult(TransferError::SUCCESS);
}

TransferResult Receiver::receive(const std::filesystem::path& destination) {
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (state_ != TransferState::IDLE) {
            return TransferResult(TransferError::INVALID_STATE,
                                  std::string("Receiver is not idle (state: ") + to_string(state_) + ")");
        }

        if (channels_.empty()) {
            LOG_ERROR("Cannot receive data because receiver has no channel");
            return TransferResult(TransferError::NO_CHANNELS_REGISTERED,
                                  "Cannot receive data because receiver has no channel.");
        }

        if (!core::utils::FileUtils::is_writable_directory(destination)) {
            LOG_ERROR("Destination {} is not a writable directory", destination.string());
            return TransferResult(TransferError::INVALID_DESTINATION,
                                  "Destination is not a writable directory: " + destination.string());
        }

        set_state_locked(TransferState::HANDSHAKE_PENDING);
    }

    bootstrap_->set_metadata_handler([this](const TransferMetadata& metadata) {
        handle_metadata(metadata);
    });
    bootstrap_->set_channel_config_handler([this](const ChannelConfig& config) {
        handle_channel_config(config);
    });

    auto result = bootstrap_->init_receiver();
    if (!result) {
        return fail(result);
    }

    LOG_INFO("Waiting for transfer metadata and {} channel configurations", channels_.size());

    {
        std::unique_lock<std::mutex> lock(mutex_);

        state_cv_.wait(lock, [this]() {
            return error_.has_value() || is_handshake_complete();
        });
        if (error_) {
            set_state_locked(TransferState::FAILED);
            return *error_;
        }

        set_state_locked(TransferState::CHANNELS_READY);
        LOG_INFO("All data channels are ready, expecting {} chunks of \"{}\"",
                 metadata_->chunk_count, metadata_->name);
        set_state_locked(TransferState::TRANSFERRING);

        state_cv_.wait(lock, [this]() {
            return error_.has_value() || is_data_complete();
        });
        if (error_) {
            set_state_locked(TransferState::FAILED);
            return *error_;
        }
    }

    result = write_output(destination);
    if (!result) {
        return fail(result);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    set_state_locked(TransferState::COMPLETE);
    LOG_INFO("Received \"{}\" ({}) into {}", metadata_->name,
             core::utils::StringUtils::format_bytes(stats_.bytes_accepted), output_path_.string());
    return TransferResult(TransferError::SUCCESS);
}

TransferState Receiver::get_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

ReceiverStats Receiver::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

std::optional<TransferMetadata> Receiver::get_metadata() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metadata_;
}

size_t Receiver::get_received_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return received_chunks_.size();
}

void Receiver::handle_metadata(const TransferMetadata& metadata) {
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (metadata_) {
            LOG_WARN("Ignoring repeated transfer metadata for \"{}\"", metadata.name);
            return;
        }

        if (metadata.chunk_count == 0 || metadata.chunk_size == 0) {
            LOG_ERROR("Transfer metadata for \"{}\" announces {} chunks of {} bytes",
                      metadata.name, metadata.chunk_count, metadata.chunk_size);
            error_ = TransferResult(TransferError::INVALID_STATE,
                                    "Transfer metadata announces an empty transfer");
        } else {
            LOG_INFO("Received metadata: \"{}\", {} chunks of {} bytes",
                     metadata.name, metadata.chunk_count, metadata.chunk_size);
            metadata_ = metadata;
        }
    }
    state_cv_.notify_all();
}

void Receiver::handle_channel_config(const ChannelConfig& config) {
    std::shared_ptr<channel::DataChannel> channel;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = channels_.find(config.channel_identifier);
        if (it == channels_.end()) {
            LOG_ERROR("No channel with identifier \"{}\" was found in receiver channels",
                      config.channel_identifier);
            if (!error_) {
                error_ = TransferResult(TransferError::UNKNOWN_CHANNEL_IDENTIFIER,
                                        "No channel with identifier \"" + config.channel_identifier +
                                        "\" was found in receiver channels.");
            }
            state_cv_.notify_all();
            return;
        }

        if (initialized_channels_.count(config.channel_identifier) > 0) {
            LOG_WARN("Ignoring repeated configuration for channel {}", config.channel_identifier);
            return;
        }

        channel = it->second;
    }

    LOG_DEBUG("Initializing channel {} as receiver", config.channel_identifier);
    auto result = channel->init_receiver(config);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!result) {
            LOG_ERROR("Channel {} failed to initialize: {}", config.channel_identifier, result.message);
            if (!error_) {
                error_ = TransferResult(TransferError::CHANNEL_FAILURE,
                                        "Data channel " + config.channel_identifier +
                                        " failed to initialize: " + result.message);
            }
        } else {
            initialized_channels_.insert(config.channel_identifier);
            LOG_DEBUG("Channel {} initialized ({}/{})", config.channel_identifier,
                      initialized_channels_.size(), channels_.size());
        }
    }
    state_cv_.notify_all();
}

void Receiver::handle_chunk(channel::DataChannel& channel, Chunk chunk) {
    auto identifier = chunk.identifier;
    bool complete = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!metadata_ || identifier >= metadata_->chunk_count) {
            stats_.discarded_chunks++;
            LOG_WARN("Discarding chunk {} received on {}: outside of the announced range",
                     identifier, channel.identifier());
            return;
        }

        auto size = chunk.data.size();
        bool inserted = false;
        if (collecting_) {
            inserted = received_chunks_.try_emplace(identifier, std::move(chunk)).second;
        }

        if (inserted) {
            stats_.chunks_accepted++;
            stats_.bytes_accepted += size;
            LOG_DEBUG("Received chunk {} on {} ({}/{})", identifier, channel.identifier(),
                      received_chunks_.size(), metadata_->chunk_count);
            complete = is_data_complete();
        } else {
            stats_.duplicate_chunks++;
            LOG_DEBUG("Ignoring duplicate chunk {} on {}", identifier, channel.identifier());
        }
    }

    // Duplicates are acknowledged too: they mean the previous ack was lost
    if (!channel.send_ack(identifier)) {
        LOG_WARN("Channel {} could not acknowledge chunk {}", channel.identifier(), identifier);
    }

    if (complete) {
        state_cv_.notify_all();
    }
}

bool Receiver::is_handshake_complete() const {
    return metadata_.has_value() && initialized_channels_.size() == channels_.size();
}

bool Receiver::is_data_complete() const {
    return metadata_.has_value() && received_chunks_.size() == metadata_->chunk_count;
}

TransferResult Receiver::fail(TransferResult result) {
    LOG_ERROR("Transfer aborted: {}", result.message);
    std::lock_guard<std::mutex> lock(mutex_);
    set_state_locked(TransferState::FAILED);
    return result;
}

TransferResult Receiver::write_output(const std::filesystem::path& destination) {
    std::vector<Chunk> chunks;
    std::string name;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        chunks.reserve(received_chunks_.size());
        for (auto& [identifier, chunk] : received_chunks_) {
            chunks.push_back(std::move(chunk));
        }
        received_chunks_.clear();
        collecting_ = false;
        name = sanitize_name(metadata_->name);
    }

    auto payload = Chunker::reassemble(chunks);
    auto path = destination / name;

    if (!core::utils::FileUtils::write_binary_file(path, payload)) {
        LOG_ERROR("Failed to write {}", path.string());
        return TransferResult(TransferError::FILE_WRITE_ERROR, "Failed to write file: " + path.string());
    }

    output_path_ = path;
    return TransferResult(TransferError::SUCCESS);
}

void Receiver::set_state_locked(TransferState new_state) {
    if (state_ != new_state) {
        LOG_DEBUG("Receiver state changed: {} -> {}", to_string(state_), to_string(new_state));
        state_ = new_state;
    }
}

std::string Receiver::sanitize_name(const std::string& name) {
    auto filename = std::filesystem::path(name).filename().string();
    if (filename.empty() || filename == "." || filename == "..") {
        return "data";
    }
    return filename;
}

}
