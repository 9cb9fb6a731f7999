#pragma once

#include "bootstrap_channel.hpp"
#include "chanmux/network/connection.hpp"
#include <utility>  // before Boost.Asio: awaitable.hpp uses std::exchange
#include <boost/asio.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace chanmux::channel {

/**
 * Control channel over a single TCP connection.
 *
 * The receiving side listens and accepts exactly one control connection;
 * the sending side connects to it. Messages are framed with the network
 * protocol codec (TRANSFER_METADATA, CHANNEL_CONFIG).
 */
class TcpBootstrapChannel : public BootstrapChannel, public std::enable_shared_from_this<TcpBootstrapChannel> {
public:
    // host/port name the control endpoint: where to connect as sender,
    // where to listen as receiver. Port 0 listens on an ephemeral port.
    TcpBootstrapChannel(boost::asio::io_context& io_context, std::string host, std::uint16_t port);
    ~TcpBootstrapChannel() override;
    
    // Binds the listening socket ahead of init_receiver(); lets callers learn
    // an ephemeral port before the sender connects
    transfer::TransferResult listen();
    std::uint16_t local_port() const;
    
    transfer::TransferResult init_sender() override;
    transfer::TransferResult init_receiver() override;
    
    transfer::TransferResult send_metadata(const transfer::TransferMetadata& metadata) override;
    transfer::TransferResult send_channel_config(const transfer::ChannelConfig& config) override;
    
    void close() override;

private:
    void attach(network::tcp::socket socket);
    void handle_message(const network::MessageHeader& header, std::vector<std::uint8_t> payload);
    std::shared_ptr<network::Connection> get_connection() const;
    
    boost::asio::io_context& io_context_;
    std::string host_;
    std::uint16_t port_;
    
    mutable std::mutex mutex_;
    std::unique_ptr<network::tcp::acceptor> acceptor_;
    std::shared_ptr<network::Connection> connection_;
    bool closed_;
};

}
