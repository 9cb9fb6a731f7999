#include "chanmux/channel/tcp_data_channel.hpp"
#include "chanmux/core/logger.hpp"
#include <charconv>

namespace chanmux::channel {

using transfer::TransferError;
using transfer::TransferResult;

TcpDataChannel::TcpDataChannel(boost::asio::io_context& io_context, std::string identifier, std::string bind_address)
    : DataChannel(std::move(identifier))
    , io_context_(io_context)
    , bind_address_(std::move(bind_address))
    , closed_(false) {
}

TcpDataChannel::~TcpDataChannel() {
    close();
}

TransferResult TcpDataChannel::init_sender(BootstrapChannel& bootstrap) {
    std::uint16_t port = 0;
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return TransferResult(TransferError::CHANNEL_FAILURE, "Channel " + identifier() + " is closed");
        }
        
        try {
            network::tcp::endpoint endpoint(boost::asio::ip::make_address(bind_address_), 0);
            acceptor_ = std::make_shared<network::tcp::acceptor>(io_context_, endpoint);
            port = acceptor_->local_endpoint().port();
        } catch (const std::exception& e) {
            LOG_ERROR("Channel {} failed to listen on {}: {}", identifier(), bind_address_, e.what());
            return TransferResult(TransferError::CHANNEL_FAILURE,
                                  "Failed to listen on " + bind_address_ + ": " + e.what());
        }
        
        auto self = shared_from_this();
        acceptor_->async_accept([this, self](boost::system::error_code ec, network::tcp::socket socket) {
            if (ec) {
                std::lock_guard<std::mutex> lock(mutex_);
                accept_error_ = ec.message();
                ready_cv_.notify_all();
                return;
            }
            attach(std::move(socket));
            
            // One connection per channel
            std::lock_guard<std::mutex> lock(mutex_);
            if (acceptor_) {
                boost::system::error_code ignored;
                acceptor_->close(ignored);
                acceptor_.reset();
            }
        });
    }
    
    LOG_DEBUG("Channel {} listening on {}:{}", identifier(), bind_address_, port);
    
    auto result = bootstrap.send_channel_config({identifier(), encode_endpoint(bind_address_, port)});
    if (!result) {
        close();
        return TransferResult(TransferError::CHANNEL_FAILURE, "Failed to publish configuration: " + result.message);
    }
    
    std::unique_lock<std::mutex> lock(mutex_);
    ready_cv_.wait(lock, [this]() {
        return connection_ != nullptr || accept_error_.has_value() || closed_;
    });
    
    if (!connection_) {
        auto reason = accept_error_ ? *accept_error_ : std::string("closed before the receiver connected");
        return TransferResult(TransferError::CHANNEL_FAILURE, "Channel " + identifier() + ": " + reason);
    }
    
    LOG_DEBUG("Channel {} ready", identifier());
    return TransferResult(TransferError::SUCCESS);
}

TransferResult TcpDataChannel::init_receiver(const transfer::ChannelConfig& config) {
    auto endpoint = parse_endpoint(config.config);
    if (!endpoint) {
        return TransferResult(TransferError::CHANNEL_FAILURE,
                              "Malformed endpoint in configuration of channel " + identifier());
    }
    
    auto& [host, port] = *endpoint;
    
    try {
        network::tcp::resolver resolver(io_context_);
        network::tcp::socket socket(io_context_);
        boost::asio::connect(socket, resolver.resolve(host, std::to_string(port)));
        LOG_DEBUG("Channel {} connected to {}:{}", identifier(), host, port);
        attach(std::move(socket));
    } catch (const std::exception& e) {
        LOG_ERROR("Channel {} failed to connect to {}:{}: {}", identifier(), host, port, e.what());
        return TransferResult(TransferError::CHANNEL_FAILURE,
                              "Failed to connect to " + host + ":" + std::to_string(port) + ": " + e.what());
    }
    
    if (!get_connection()) {
        return TransferResult(TransferError::CHANNEL_FAILURE, "Channel " + identifier() + " is closed");
    }
    return TransferResult(TransferError::SUCCESS);
}

bool TcpDataChannel::send_chunk(const transfer::Chunk& chunk) {
    if (chunk.data.size() > network::MAX_CHUNK_DATA_SIZE) {
        LOG_ERROR("Chunk {} of {} bytes does not fit in a frame on channel {}",
                  chunk.identifier, chunk.data.size(), identifier());
        return false;
    }
    
    auto connection = get_connection();
    if (!connection) {
        return false;
    }
    return connection->send_message(network::MessageType::CHUNK_DATA,
                                    network::ChunkDataMessage{chunk.identifier, chunk.data});
}

bool TcpDataChannel::send_ack(std::uint32_t chunk_identifier) {
    auto connection = get_connection();
    if (!connection) {
        return false;
    }
    return connection->send_message(network::MessageType::CHUNK_ACK, network::ChunkAckMessage{chunk_identifier});
}

void TcpDataChannel::close() {
    std::shared_ptr<network::tcp::acceptor> acceptor;
    std::shared_ptr<network::Connection> connection;
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        acceptor = std::move(acceptor_);
        connection = std::move(connection_);
    }
    ready_cv_.notify_all();
    
    if (acceptor) {
        boost::asio::post(io_context_, [acceptor]() {
            boost::system::error_code ignored;
            acceptor->close(ignored);
        });
    }
    if (connection) {
        connection->close();
    }
}

std::vector<std::uint8_t> TcpDataChannel::encode_endpoint(const std::string& host, std::uint16_t port) {
    auto text = host + ":" + std::to_string(port);
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

std::optional<std::pair<std::string, std::uint16_t>> TcpDataChannel::parse_endpoint(const std::vector<std::uint8_t>& config) {
    std::string text(config.begin(), config.end());
    auto separator = text.rfind(':');
    if (separator == std::string::npos || separator == 0 || separator + 1 == text.size()) {
        return std::nullopt;
    }
    
    std::uint16_t port = 0;
    const char* first = text.data() + separator + 1;
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, port);
    if (ec != std::errc() || ptr != last || port == 0) {
        return std::nullopt;
    }
    
    return std::make_pair(text.substr(0, separator), port);
}

void TcpDataChannel::attach(network::tcp::socket socket) {
    boost::system::error_code ec;
    socket.set_option(network::tcp::no_delay(true), ec);
    
    auto connection = std::make_shared<network::Connection>(std::move(socket));
    
    std::weak_ptr<TcpDataChannel> weak_self = shared_from_this();
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
    ready_cv_.notify_all();
    connection->start();
}

void TcpDataChannel::handle_message(const network::MessageHeader& header, std::vector<std::uint8_t> payload) {
    switch (header.type) {
        case network::MessageType::CHUNK_DATA: {
            auto message = network::MessageSerializer::deserialize_payload<network::ChunkDataMessage>(payload);
            notify_chunk(transfer::Chunk{message.identifier, std::move(message.data)});
            break;
        }
        case network::MessageType::CHUNK_ACK: {
            auto message = network::MessageSerializer::deserialize_payload<network::ChunkAckMessage>(payload);
            notify_ack(message.identifier);
            break;
        }
        default:
            LOG_WARN("Unexpected message {} on channel {}", network::to_string(header.type), identifier());
            break;
    }
}

std::shared_ptr<network::Connection> TcpDataChannel::get_connection() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connection_;
}

}
