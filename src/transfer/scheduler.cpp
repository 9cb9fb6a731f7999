#include "chanmux/transfer/scheduler.hpp"
#include "chanmux/transfer/chunker.hpp"
#include "chanmux/core/logger.hpp"
#include "chanmux/core/utils.hpp"
#include <future>
#include <stdexcept>

namespace chanmux::transfer {

SchedulerOptions SchedulerOptions::from_config(const core::Config& config) {
    SchedulerOptions options;
    int timeout_ms = config.get_int("transfer.resubmission_timeout_ms",
                                    static_cast<int>(options.resubmission_timeout.count()));
    if (timeout_ms > 0) {
        options.resubmission_timeout = std::chrono::milliseconds(timeout_ms);
    }
    return options;
}

Scheduler::Scheduler(std::shared_ptr<channel::BootstrapChannel> bootstrap,
                     std::unique_ptr<DispatchPolicy> policy,
                     SchedulerOptions options)
    : bootstrap_(std::move(bootstrap))
    , policy_(std::move(policy))
    , options_(options)
    , next_generation_(0)
    , state_(TransferState::IDLE)
    , timer_context_()
    , timer_work_(boost::asio::make_work_guard(timer_context_)) {

    if (!bootstrap_) {
        throw std::invalid_argument("Scheduler requires a bootstrap channel");
    }
    if (!policy_) {
        policy_ = make_default_dispatch_policy();
    }

    timer_thread_ = std::thread([this]() {
        while (true) {
            try {
                timer_context_.run();
                break;
            } catch (const std::exception& e) {
                LOG_ERROR("Resubmission timer error: {}", e.what());
                timer_context_.restart();
            }
        }
    });
}

Scheduler::~Scheduler() {
    for (auto& channel : channels_) {
        channel->set_ack_handler(nullptr);
    }

    // Cancel what is still armed and let the timer thread drain, so no timer
    // outlives timer_context_
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [identifier, entry] : resubmission_timers_) {
            auto timer = std::move(entry.timer);
            boost::asio::post(timer_context_, [timer]() { timer->cancel(); });
        }
        resubmission_timers_.clear();
        pending_chunks_.clear();
    }
    timer_work_.reset();

    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }
}

TransferResult Scheduler::register_channel(std::shared_ptr<channel::DataChannel> channel) {
    if (!channel) {
        throw std::invalid_argument("Cannot register a null channel");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ != TransferState::IDLE) {
        return TransferResult(TransferError::INVALID_STATE,
                              "Channels can only be registered before the transfer starts");
    }

    for (const auto& registered : channels_) {
        if (registered->identifier() == channel->identifier()) {
            return TransferResult(TransferError::DUPLICATE_CHANNEL_IDENTIFIER,
                                  "Channel identifier \"" + channel->identifier() + "\" is already used.");
        }
    }

    channel->set_ack_handler([this](std::uint32_t chunk_identifier) {
        handle_acknowledgment(chunk_identifier);
    });
    channels_.push_back(std::move(channel));

    LOG_DEBUG("Registered data channel {} ({} total)", channels_.back()->identifier(), channels_.size());
    return TransferResult(TransferError::SUCCESS);
}

TransferResult Scheduler::send(std::span<const std::uint8_t> payload, std::int64_t chunk_size) {
    return send("data", payload, chunk_size);
}

TransferResult Scheduler::send(const std::string& name, std::span<const std::uint8_t> payload, std::int64_t chunk_size) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != TransferState::IDLE) {
            return TransferResult(TransferError::INVALID_STATE,
                                  std::string("Scheduler is not idle (state: ") + to_string(state_) + ")");
        }
    }

    if (channels_.empty()) {
        LOG_ERROR("Cannot send data because scheduler has no channel");
        return TransferResult(TransferError::NO_CHANNELS_REGISTERED,
                              "Cannot send data because scheduler has no channel.");
    }

    std::vector<Chunk> chunks;
    auto result = Chunker::split(payload, chunk_size, chunks);
    if (!result) {
        LOG_ERROR("Cannot split payload: {}", result.message);
        return result;
    }

    TransferMetadata metadata{name, static_cast<std::uint32_t>(chunk_size),
                              static_cast<std::uint32_t>(chunks.size())};

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& chunk : chunks) {
            pending_chunks_.push_back(std::make_shared<const Chunk>(std::move(chunk)));
        }
    }
    set_state(TransferState::HANDSHAKE_PENDING);

    LOG_INFO("Sending \"{}\" ({}) as {} chunks of {} bytes over {} channels",
             metadata.name, core::utils::StringUtils::format_bytes(payload.size()),
             metadata.chunk_count, metadata.chunk_size, channels_.size());

    result = bootstrap_->init_sender();
    if (!result) {
        return fail(result);
    }

    result = bootstrap_->send_metadata(metadata);
    if (!result) {
        return fail(result);
    }

    result = open_channels();
    if (!result) {
        return fail(result);
    }

    set_state(TransferState::CHANNELS_READY);
    LOG_INFO("All data channels are ready, data sending can start");

    set_state(TransferState::TRANSFERRING);
    auto started = std::chrono::steady_clock::now();

    policy_->dispatch(*this);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!is_transfer_complete()) {
            auto message = "Dispatch policy " + policy_->name() + " returned with " +
                           std::to_string(pending_chunks_.size()) + " pending and " +
                           std::to_string(resubmission_timers_.size()) + " unacknowledged chunks";
            state_ = TransferState::FAILED;
            LOG_ERROR("{}", message);
            return TransferResult(TransferError::INVALID_STATE, message);
        }
        state_ = TransferState::COMPLETE;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    auto stats = get_stats();
    LOG_INFO("Transfer of \"{}\" complete in {} ({} chunks dispatched, {} retransmissions)",
             metadata.name, core::utils::StringUtils::format_duration(elapsed),
             stats.chunks_dispatched, stats.retransmissions);

    return TransferResult(TransferError::SUCCESS);
}

TransferResult Scheduler::send_file(const std::filesystem::path& path, std::int64_t chunk_size) {
    auto content = core::utils::FileUtils::read_binary_file(path);
    if (!content) {
        LOG_ERROR("Failed to read {}", path.string());
        return TransferResult(TransferError::FILE_READ_ERROR, "Failed to read file: " + path.string());
    }

    return send(path.filename().string(), *content, chunk_size);
}

ChunkPtr Scheduler::next_chunk() {
    std::unique_lock<std::mutex> lock(mutex_);

    queue_cv_.wait(lock, [this]() {
        return !pending_chunks_.empty() || resubmission_timers_.empty();
    });

    if (pending_chunks_.empty()) {
        return nullptr;
    }

    auto chunk = std::move(pending_chunks_.front());
    pending_chunks_.pop_front();
    return chunk;
}

void Scheduler::send_chunk(ChunkPtr chunk, channel::DataChannel& channel) {
    auto timer = std::make_shared<boost::asio::steady_timer>(timer_context_);
    std::uint64_t generation = 0;

    // The timer entry must exist before the chunk leaves, otherwise a fast
    // acknowledgment would find nothing to cancel.
    {
        std::lock_guard<std::mutex> lock(mutex_);
        generation = ++next_generation_;

        auto it = resubmission_timers_.find(chunk->identifier);
        if (it != resubmission_timers_.end()) {
            auto previous = std::move(it->second.timer);
            boost::asio::post(timer_context_, [previous]() { previous->cancel(); });
        }
        resubmission_timers_[chunk->identifier] = ResubmissionTimer{timer, generation};
        stats_.chunks_dispatched++;
    }

    boost::asio::post(timer_context_, [this, timer, chunk, generation]() {
        timer->expires_after(options_.resubmission_timeout);
        timer->async_wait([this, chunk, generation](const boost::system::error_code& ec) {
            handle_resubmission_timeout(chunk, generation, ec);
        });
    });

    LOG_DEBUG("Sending chunk {} on channel {}", chunk->identifier, channel.identifier());

    if (!channel.send_chunk(*chunk)) {
        LOG_WARN("Channel {} could not send chunk {}, waiting for resubmission",
                 channel.identifier(), chunk->identifier);
    }
}

TransferState Scheduler::get_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

SchedulerStats Scheduler::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

size_t Scheduler::get_pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_chunks_.size();
}

size_t Scheduler::get_outstanding_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resubmission_timers_.size();
}

void Scheduler::handle_acknowledgment(std::uint32_t chunk_identifier) {
    std::shared_ptr<boost::asio::steady_timer> timer;
    bool drained = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = resubmission_timers_.find(chunk_identifier);
        if (it == resubmission_timers_.end()) {
            stats_.ignored_acknowledgments++;
            LOG_DEBUG("Ignoring acknowledgment for chunk {} with no live timer", chunk_identifier);
            return;
        }

        timer = std::move(it->second.timer);
        resubmission_timers_.erase(it);
        stats_.acknowledgments++;
        drained = resubmission_timers_.empty();
    }

    LOG_DEBUG("Chunk {} was acknowledged", chunk_identifier);
    boost::asio::post(timer_context_, [timer]() { timer->cancel(); });

    if (drained) {
        queue_cv_.notify_all();
    }
}

void Scheduler::handle_resubmission_timeout(const ChunkPtr& chunk, std::uint64_t generation,
                                            const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = resubmission_timers_.find(chunk->identifier);
        if (it == resubmission_timers_.end() || it->second.generation != generation) {
            return;
        }

        resubmission_timers_.erase(it);
        pending_chunks_.push_front(chunk);
        stats_.retransmissions++;
    }

    LOG_DEBUG("Chunk {} was not acknowledged in time, resending", chunk->identifier);
    queue_cv_.notify_all();
}

TransferResult Scheduler::open_channels() {
    std::vector<std::future<TransferResult>> readiness;
    readiness.reserve(channels_.size());

    for (auto& channel : channels_) {
        readiness.push_back(std::async(std::launch::async, [this, channel]() {
            return channel->init_sender(*bootstrap_);
        }));
    }

    // Barrier: nothing is dispatched until every channel reported back
    TransferResult barrier_result(TransferError::SUCCESS);
    for (size_t i = 0; i < readiness.size(); ++i) {
        auto result = readiness[i].get();
        if (!result) {
            LOG_ERROR("Data channel {} failed to initialize: {}", channels_[i]->identifier(), result.message);
            if (barrier_result) {
                barrier_result = TransferResult(
                    TransferError::CHANNEL_FAILURE,
                    "Data channel " + channels_[i]->identifier() + " failed to initialize: " + result.message);
            }
        }
    }

    return barrier_result;
}

TransferResult Scheduler::fail(TransferResult result) {
    LOG_ERROR("Transfer aborted: {}", result.message);
    set_state(TransferState::FAILED);
    return result;
}

void Scheduler::set_state(TransferState new_state) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != new_state) {
        LOG_DEBUG("Scheduler state changed: {} -> {}", to_string(state_), to_string(new_state));
        state_ = new_state;
    }
}

bool Scheduler::is_transfer_complete() const {
    return pending_chunks_.empty() && resubmission_timers_.empty();
}

}
