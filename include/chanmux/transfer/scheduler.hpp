#pragma once

#include "transfer_types.hpp"
#include "dispatch_policy.hpp"
#include "chanmux/channel/bootstrap_channel.hpp"
#include "chanmux/channel/data_channel.hpp"
#include "chanmux/core/config.hpp"
#include <utility>  // before Boost.Asio: awaitable.hpp uses std::exchange
#include <boost/asio.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace chanmux::transfer {

struct SchedulerOptions {
    std::chrono::milliseconds resubmission_timeout{1000};

    // Reads transfer.resubmission_timeout_ms
    static SchedulerOptions from_config(const core::Config& config);
};

struct SchedulerStats {
    std::uint64_t chunks_dispatched = 0;
    std::uint64_t retransmissions = 0;
    std::uint64_t acknowledgments = 0;
    std::uint64_t ignored_acknowledgments = 0;
};

/**
 * Sending side of a transfer.
 *
 * Splits the payload, performs the control handshake, brings every registered
 * data channel up, then lets the dispatch policy push chunks out. Every
 * dispatched chunk holds a resubmission timer until it is acknowledged; a
 * timer that fires puts the chunk back at the head of the pending queue.
 * send() returns once the pending queue and the outstanding set are empty.
 *
 * Acknowledgments and timer expiries arrive on other threads; all transfer
 * state is guarded by a single mutex.
 */
class Scheduler : public DispatchContext {
public:
    explicit Scheduler(std::shared_ptr<channel::BootstrapChannel> bootstrap,
                       std::unique_ptr<DispatchPolicy> policy = make_default_dispatch_policy(),
                       SchedulerOptions options = SchedulerOptions());
    ~Scheduler() override;

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    TransferResult register_channel(std::shared_ptr<channel::DataChannel> channel);

    // Transfers payload under the name "data".
    TransferResult send(std::span<const std::uint8_t> payload, std::int64_t chunk_size);
    TransferResult send(const std::string& name, std::span<const std::uint8_t> payload, std::int64_t chunk_size);
    TransferResult send_file(const std::filesystem::path& path, std::int64_t chunk_size);

    // DispatchContext
    ChunkPtr next_chunk() override;
    const std::vector<std::shared_ptr<channel::DataChannel>>& channels() const override { return channels_; }
    void send_chunk(ChunkPtr chunk, channel::DataChannel& channel) override;

    TransferState get_state() const;
    SchedulerStats get_stats() const;
    size_t get_pending_count() const;
    size_t get_outstanding_count() const;

private:
    struct ResubmissionTimer {
        std::shared_ptr<boost::asio::steady_timer> timer;
        std::uint64_t generation;
    };

    void handle_acknowledgment(std::uint32_t chunk_identifier);
    void handle_resubmission_timeout(const ChunkPtr& chunk, std::uint64_t generation,
                                     const boost::system::error_code& ec);

    TransferResult open_channels();
    TransferResult fail(TransferResult result);
    void set_state(TransferState new_state);
    bool is_transfer_complete() const;

    std::shared_ptr<channel::BootstrapChannel> bootstrap_;
    std::unique_ptr<DispatchPolicy> policy_;
    SchedulerOptions options_;
    std::vector<std::shared_ptr<channel::DataChannel>> channels_;

    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::deque<ChunkPtr> pending_chunks_;
    std::unordered_map<std::uint32_t, ResubmissionTimer> resubmission_timers_;
    std::uint64_t next_generation_;
    TransferState state_;
    SchedulerStats stats_;

    boost::asio::io_context timer_context_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> timer_work_;
    std::thread timer_thread_;
};

}
