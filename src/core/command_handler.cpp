#include "chanmux/core/command_handler.hpp"
#include "chanmux/core/config.hpp"
#include "chanmux/core/logger.hpp"
#include "chanmux/core/utils.hpp"
#include "chanmux/channel/tcp_bootstrap_channel.hpp"
#include "chanmux/channel/tcp_data_channel.hpp"
#include "chanmux/network/protocol.hpp"
#include "chanmux/transfer/receiver.hpp"
#include "chanmux/transfer/scheduler.hpp"
#include <utility>  // before Boost.Asio: awaitable.hpp uses std::exchange
#include <boost/asio.hpp>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace chanmux::core {

namespace {

// Runs an io_context on a background thread until stop()
class IoThread {
public:
    IoThread()
        : work_(boost::asio::make_work_guard(io_context_)) {
        thread_ = std::thread([this]() {
            while (true) {
                try {
                    io_context_.run();
                    break;
                } catch (const std::exception& e) {
                    LOG_ERROR("Network thread error: {}", e.what());
                    io_context_.restart();
                }
            }
        });
    }
    
    ~IoThread() { stop(); }
    
    boost::asio::io_context& context() { return io_context_; }
    
    void stop() {
        work_.reset();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    boost::asio::io_context io_context_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::thread thread_;
};

std::string channel_identifier(int index) {
    return "channel-" + std::to_string(index);
}

CommandResult read_endpoint(const Config& config, std::string& host, std::uint16_t& port, int& channels) {
    host = config.get_string("control.host", "127.0.0.1");
    
    int configured_port = config.get_int("control.port", 9400);
    if (configured_port <= 0 || configured_port > 65535) {
        return CommandResult::error("Invalid control port: " + std::to_string(configured_port));
    }
    port = static_cast<std::uint16_t>(configured_port);
    
    channels = config.get_int("transfer.channels", 4);
    if (channels <= 0) {
        return CommandResult::error("Invalid channel count: " + std::to_string(channels));
    }
    
    return CommandResult::ok();
}

}

CommandResult SendCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    std::filesystem::path file_path = args[1];
    if (!utils::FileUtils::is_file(file_path)) {
        return CommandResult::error("File does not exist: " + file_path.string());
    }
    
    auto& config = Config::instance();
    std::string host;
    std::uint16_t port = 0;
    int channel_count = 0;
    auto endpoint = read_endpoint(config, host, port, channel_count);
    if (!endpoint.success) {
        return endpoint;
    }
    
    std::int64_t chunk_size = config.get_int("transfer.chunk_size", 65536);
    auto file_size = utils::FileUtils::file_size(file_path).value_or(0);
    if (file_size == 0) {
        return CommandResult::error("Cannot send an empty file: " + file_path.string());
    }
    if (chunk_size > static_cast<std::int64_t>(network::MAX_CHUNK_DATA_SIZE)) {
        return CommandResult::error("Chunk size " + std::to_string(chunk_size) + " exceeds the maximum of " +
                                    std::to_string(network::MAX_CHUNK_DATA_SIZE) + " bytes");
    }
    if (chunk_size > static_cast<std::int64_t>(file_size)) {
        LOG_DEBUG("Chunk size {} exceeds file size, using {}", chunk_size, file_size);
        chunk_size = static_cast<std::int64_t>(file_size);
    }
    
    std::cout << "Sending " << file_path.filename().string() << " ("
              << utils::StringUtils::format_bytes(file_size) << ") to " << host << ":" << port
              << " over " << channel_count << " channels\n";
    
    IoThread io;
    auto bootstrap = std::make_shared<channel::TcpBootstrapChannel>(io.context(), host, port);
    std::vector<std::shared_ptr<channel::TcpDataChannel>> channels;
    
    transfer::TransferResult result;
    transfer::SchedulerStats stats;
    auto started = std::chrono::steady_clock::now();
    
    {
        transfer::Scheduler scheduler(bootstrap, transfer::make_default_dispatch_policy(),
                                      transfer::SchedulerOptions::from_config(config));
        
        auto bind_address = config.get_string("data.address", "127.0.0.1");
        for (int i = 0; i < channel_count; ++i) {
            auto data_channel = std::make_shared<channel::TcpDataChannel>(io.context(), channel_identifier(i), bind_address);
            channels.push_back(data_channel);
            result = scheduler.register_channel(data_channel);
            if (!result) {
                return CommandResult::error(result.message);
            }
        }
        
        result = scheduler.send_file(file_path, chunk_size);
        stats = scheduler.get_stats();
        
        for (auto& data_channel : channels) {
            data_channel->close();
        }
        bootstrap->close();
    }
    io.stop();
    
    if (!result) {
        return CommandResult::error(std::string("Transfer failed (") + transfer::to_string(result.error) + "): " + result.message);
    }
    
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    std::cout << "✓ Transfer complete in " << utils::StringUtils::format_duration(elapsed) << "\n";
    std::cout << "  Chunks dispatched: " << stats.chunks_dispatched << "\n";
    std::cout << "  Retransmissions: " << stats.retransmissions << "\n";
    
    return CommandResult::ok("File sent successfully");
}

CommandResult ReceiveCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    std::filesystem::path destination = args[1];
    if (!utils::FileUtils::is_writable_directory(destination)) {
        return CommandResult::error("Destination is not a writable directory: " + destination.string());
    }
    
    auto& config = Config::instance();
    std::string host;
    std::uint16_t port = 0;
    int channel_count = 0;
    auto endpoint = read_endpoint(config, host, port, channel_count);
    if (!endpoint.success) {
        return endpoint;
    }
    
    IoThread io;
    auto bootstrap = std::make_shared<channel::TcpBootstrapChannel>(io.context(), host, port);
    std::vector<std::shared_ptr<channel::TcpDataChannel>> channels;
    
    transfer::TransferResult result;
    transfer::ReceiverStats stats;
    std::filesystem::path output_path;
    
    {
        transfer::Receiver receiver(bootstrap);
        
        for (int i = 0; i < channel_count; ++i) {
            auto data_channel = std::make_shared<channel::TcpDataChannel>(io.context(), channel_identifier(i));
            channels.push_back(data_channel);
            result = receiver.register_channel(data_channel);
            if (!result) {
                return CommandResult::error(result.message);
            }
        }
        
        result = bootstrap->listen();
        if (result) {
            std::cout << "Waiting for a sender on " << host << ":" << bootstrap->local_port()
                      << " (" << channel_count << " channels)\n";
            result = receiver.receive(destination);
        }
        stats = receiver.get_stats();
        output_path = receiver.output_path();
        
        for (auto& data_channel : channels) {
            data_channel->close();
        }
        bootstrap->close();
    }
    io.stop();
    
    if (!result) {
        return CommandResult::error(std::string("Transfer failed (") + transfer::to_string(result.error) + "): " + result.message);
    }
    
    std::cout << "✓ Received " << output_path.string() << " ("
              << utils::StringUtils::format_bytes(stats.bytes_accepted) << ")\n";
    std::cout << "  Chunks accepted: " << stats.chunks_accepted << "\n";
    std::cout << "  Duplicates ignored: " << stats.duplicate_chunks << "\n";
    
    return CommandResult::ok("File received successfully");
}

}
