#pragma once

#include "data_channel.hpp"
#include "chanmux/network/connection.hpp"
#include <utility>  // before Boost.Asio: awaitable.hpp uses std::exchange
#include <boost/asio.hpp>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace chanmux::channel {

/**
 * Data channel over its own TCP connection.
 *
 * As sender the channel listens on an ephemeral port of bind_address and
 * publishes "address:port" as its ChannelConfig; it is ready once the
 * receiving end has connected. As receiver it connects to the published
 * endpoint.
 */
class TcpDataChannel : public DataChannel, public std::enable_shared_from_this<TcpDataChannel> {
public:
    TcpDataChannel(boost::asio::io_context& io_context, std::string identifier,
                   std::string bind_address = "127.0.0.1");
    ~TcpDataChannel() override;
    
    transfer::TransferResult init_sender(BootstrapChannel& bootstrap) override;
    transfer::TransferResult init_receiver(const transfer::ChannelConfig& config) override;
    
    bool send_chunk(const transfer::Chunk& chunk) override;
    bool send_ack(std::uint32_t chunk_identifier) override;
    
    void close() override;
    
    // "host:port" <-> endpoint parts; parse returns nullopt on malformed input
    static std::vector<std::uint8_t> encode_endpoint(const std::string& host, std::uint16_t port);
    static std::optional<std::pair<std::string, std::uint16_t>> parse_endpoint(const std::vector<std::uint8_t>& config);

private:
    void attach(network::tcp::socket socket);
    void handle_message(const network::MessageHeader& header, std::vector<std::uint8_t> payload);
    std::shared_ptr<network::Connection> get_connection() const;
    
    boost::asio::io_context& io_context_;
    std::string bind_address_;
    
    mutable std::mutex mutex_;
    std::condition_variable ready_cv_;
    std::shared_ptr<network::tcp::acceptor> acceptor_;
    std::shared_ptr<network::Connection> connection_;
    std::optional<std::string> accept_error_;
    bool closed_;
};

}
