#include "chanmux/channel/tcp_bootstrap_channel.hpp"
#include "chanmux/core/logger.hpp"

namespace chanmux::channel {

using transfer::TransferError;
using transfer::TransferResult;

TcpBootstrapChannel::TcpBootstrapChannel(boost::asio::io_context& io_context, std::string host, std::uint16_t port)
    : io_context_(io_context)
    , host_(std::move(host))
    , port_(port)
    , closed_(false) {
}

TcpBootstrapChannel::~TcpBootstrapChannel() {
    close();
}

TransferResult TcpBootstrapChannel::listen() {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (acceptor_) {
        return TransferResult(TransferError::SUCCESS);
    }
    
    try {
        network::tcp::resolver resolver(io_context_);
        auto endpoints = resolver.resolve(host_, std::to_string(port_),
                                          network::tcp::resolver::passive);
        auto endpoint = endpoints.begin()->endpoint();
        
        auto acceptor = std::make_unique<network::tcp::acceptor>(io_context_);
        acceptor->open(endpoint.protocol());
        acceptor->set_option(boost::asio::socket_base::reuse_address(true));
        acceptor->bind(endpoint);
        acceptor->listen();
        acceptor_ = std::move(acceptor);
        
        LOG_INFO("Waiting for control connection on {}:{}", host_, acceptor_->local_endpoint().port());
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to listen on {}:{}: {}", host_, port_, e.what());
        return TransferResult(TransferError::CHANNEL_FAILURE,
                              "Failed to listen on " + host_ + ":" + std::to_string(port_) + ": " + e.what());
    }
    
    return TransferResult(TransferError::SUCCESS);
}

std::uint16_t TcpBootstrapChannel::local_port() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!acceptor_) {
        return 0;
    }
    boost::system::error_code ec;
    auto endpoint = acceptor_->local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

TransferResult TcpBootstrapChannel::init_sender() {
    try {
        network::tcp::resolver resolver(io_context_);
        auto endpoints = resolver.resolve(host_, std::to_string(port_));
        
        network::tcp::socket socket(io_context_);
        boost::asio::connect(socket, endpoints);
        socket.set_option(network::tcp::no_delay(true));
        
        LOG_INFO("Control connection established with {}:{}", host_, port_);
        attach(std::move(socket));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to connect to {}:{}: {}", host_, port_, e.what());
        return TransferResult(TransferError::CHANNEL_FAILURE,
                              "Failed to connect to " + host_ + ":" + std::to_string(port_) + ": " + e.what());
    }
    
    return TransferResult(TransferError::SUCCESS);
}

TransferResult TcpBootstrapChannel::init_receiver() {
    auto result = listen();
    if (!result) {
        return result;
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return TransferResult(TransferError::CHANNEL_FAILURE, "Bootstrap channel is closed");
    }
    
    auto self = shared_from_this();
    acceptor_->async_accept([this, self](boost::system::error_code ec, network::tcp::socket socket) {
        if (ec) {
            if (ec != boost::asio::error::operation_aborted) {
                LOG_ERROR("Failed to accept control connection: {}", ec.message());
            }
            return;
        }
        
        LOG_INFO("Control connection accepted");
        attach(std::move(socket));
        
        // A single control connection per transfer
        std::lock_guard<std::mutex> lock(mutex_);
        if (acceptor_) {
            boost::system::error_code ignored;
            acceptor_->close(ignored);
        }
    });
    
    return TransferResult(TransferError::SUCCESS);
}

TransferResult TcpBootstrapChannel::send_metadata(const transfer::TransferMetadata& metadata) {
    auto connection = get_connection();
    if (!connection) {
        return TransferResult(TransferError::INVALID_STATE, "Bootstrap channel is not connected");
    }
    
    network::TransferMetadataMessage message{metadata.name, metadata.chunk_size, metadata.chunk_count};
    if (!connection->send_message(network::MessageType::TRANSFER_METADATA, message)) {
        return TransferResult(TransferError::CHANNEL_FAILURE, "Control connection is closed");
    }
    return TransferResult(TransferError::SUCCESS);
}

TransferResult TcpBootstrapChannel::send_channel_config(const transfer::ChannelConfig& config) {
    auto connection = get_connection();
    if (!connection) {
        return TransferResult(TransferError::INVALID_STATE, "Bootstrap channel is not connected");
    }
    
    network::ChannelConfigMessage message{config.channel_identifier, config.config};
    if (!connection->send_message(network::MessageType::CHANNEL_CONFIG, message)) {
        return TransferResult(TransferError::CHANNEL_FAILURE, "Control connection is closed");
    }
    return TransferResult(TransferError::SUCCESS);
}

void TcpBootstrapChannel::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;
    
    if (acceptor_) {
        // The acceptor is only used on the io_context thread once accepting started
        boost::asio::post(io_context_, [acceptor = std::shared_ptr<network::tcp::acceptor>(std::move(acceptor_))]() {
            boost::system::error_code ignored;
            acceptor->close(ignored);
        });
    }
    if (connection_) {
        connection_->close();
        connection_.reset();
    }
}

void TcpBootstrapChannel::attach(network::tcp::socket socket) {
    auto connection = std::make_shared<network::Connection>(std::move(socket));
    
    std::weak_ptr<TcpBootstrapChannel> weak_self = shared_from_this();
    connection->set_message_handler([weak_self](const network::MessageHeader& header, std::vector<std::uint8_t> payload) {
        if (auto self = weak_self.lock()) {
            self->handle_message(header, std::move(payload));
        }
    });
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            connection->close();
            return;
        }
        connection_ = connection;
    }
    connection->start();
}

void TcpBootstrapChannel::handle_message(const network::MessageHeader& header, std::vector<std::uint8_t> payload) {
    switch (header.type) {
        case network::MessageType::TRANSFER_METADATA: {
            auto message = network::MessageSerializer::deserialize_payload<network::TransferMetadataMessage>(payload);
            notify_metadata(transfer::TransferMetadata{message.name, message.chunk_size, message.chunk_count});
            break;
        }
        case network::MessageType::CHANNEL_CONFIG: {
            auto message = network::MessageSerializer::deserialize_payload<network::ChannelConfigMessage>(payload);
            notify_channel_config(transfer::ChannelConfig{message.channel_identifier, std::move(message.config)});
            break;
        }
        default:
            LOG_WARN("Unexpected message {} on control connection", network::to_string(header.type));
            break;
    }
}

std::shared_ptr<network::Connection> TcpBootstrapChannel::get_connection() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connection_;
}

}
