#include "chanmux/network/connection.hpp"
#include "chanmux/core/logger.hpp"
#include <boost/asio/write.hpp>
#include <boost/asio/read.hpp>

namespace chanmux::network {

Connection::Connection(tcp::socket socket)
    : socket_(std::move(socket))
    , strand_(boost::asio::make_strand(socket_.get_executor()))
    , state_(ConnectionState::CONNECTED)
    , write_in_progress_(false) {
    
    try {
        remote_endpoint_ = socket_.remote_endpoint().address().to_string() + ":" +
                          std::to_string(socket_.remote_endpoint().port());
    } catch (const std::exception& e) {
        remote_endpoint_ = "unknown";
        LOG_WARN("Failed to get remote endpoint: {}", e.what());
    }
    
    LOG_DEBUG("New connection with {}", remote_endpoint_);
}

Connection::~Connection() {
    LOG_DEBUG("Connection to {} destroyed", remote_endpoint_);
}

void Connection::start() {
    LOG_DEBUG("Starting connection to {}", remote_endpoint_);
    boost::asio::post(strand_, [self = shared_from_this()]() {
        self->do_read_header();
    });
}

void Connection::close() {
    boost::asio::post(strand_, [self = shared_from_this()]() {
        self->do_close();
    });
}

bool Connection::send_frame(MessageType type, std::vector<std::uint8_t> frame) {
    if (!is_open()) {
        LOG_WARN("Attempted to send message on inactive connection to {}", remote_endpoint_);
        return false;
    }
    
    auto payload_size = frame.size() - MESSAGE_HEADER_SIZE;
    if (payload_size > MAX_PAYLOAD_SIZE) {
        LOG_ERROR("Refusing to send {} with {} byte payload to {}", to_string(type), payload_size, remote_endpoint_);
        return false;
    }
    
    LOG_TRACE("Queued message {} ({} bytes) for {}", to_string(type), payload_size, remote_endpoint_);
    
    boost::asio::post(strand_, [self = shared_from_this(), frame = std::move(frame)]() mutable {
        if (!self->is_open()) {
            return;
        }
        self->write_queue_.push(std::move(frame));
        if (!self->write_in_progress_) {
            self->do_write();
        }
    });
    return true;
}

void Connection::do_read_header() {
    if (!is_open()) {
        return;
    }
    
    auto self = shared_from_this();
    boost::asio::async_read(socket_,
        boost::asio::buffer(read_header_buffer_),
        boost::asio::bind_executor(strand_, [this, self](boost::system::error_code ec, std::size_t) {
            if (ec) {
                handle_error(ec);
                return;
            }
            
            try {
                read_header_ = MessageHeader::deserialize(read_header_buffer_);
            } catch (const std::exception& e) {
                LOG_ERROR("Failed to parse message header from {}: {}", remote_endpoint_, e.what());
                do_close();
                return;
            }
            
            if (!read_header_.is_valid()) {
                LOG_ERROR("Invalid message header from {} (magic {:#x}, version {}, {} bytes)", remote_endpoint_,
                          read_header_.magic, read_header_.version, read_header_.payload_size);
                do_close();
                return;
            }
            
            if (read_header_.payload_size > 0) {
                do_read_payload(read_header_.payload_size);
            } else if (!read_header_.verify_checksum({})) {
                LOG_ERROR("Checksum mismatch for message from {}", remote_endpoint_);
                do_close();
            } else {
                handle_message(read_header_, {});
                do_read_header();
            }
        }));
}

void Connection::do_read_payload(std::uint32_t payload_size) {
    read_payload_buffer_.resize(payload_size);
    
    auto self = shared_from_this();
    boost::asio::async_read(socket_,
        boost::asio::buffer(read_payload_buffer_),
        boost::asio::bind_executor(strand_, [this, self](boost::system::error_code ec, std::size_t) {
            if (ec) {
                handle_error(ec);
                return;
            }
            
            if (!read_header_.verify_checksum(read_payload_buffer_)) {
                LOG_ERROR("Checksum mismatch for message from {}", remote_endpoint_);
                do_close();
                return;
            }
            
            handle_message(read_header_, std::move(read_payload_buffer_));
            read_payload_buffer_ = {};
            do_read_header();
        }));
}

void Connection::do_write() {
    if (write_queue_.empty() || write_in_progress_) {
        return;
    }
    
    write_in_progress_ = true;
    auto& message = write_queue_.front();
    
    auto self = shared_from_this();
    boost::asio::async_write(socket_,
        boost::asio::buffer(message),
        boost::asio::bind_executor(strand_, [this, self](boost::system::error_code ec, std::size_t) {
            write_in_progress_ = false;
            
            if (!ec) {
                write_queue_.pop();
                
                if (!write_queue_.empty()) {
                    do_write();
                }
            } else {
                handle_error(ec);
            }
        }));
}

void Connection::do_close() {
    auto expected = ConnectionState::CONNECTED;
    if (!state_.compare_exchange_strong(expected, ConnectionState::CLOSING)) {
        return;
    }
    
    LOG_DEBUG("Closing connection to {}", remote_endpoint_);
    
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    
    state_ = ConnectionState::DISCONNECTED;
}

void Connection::handle_message(const MessageHeader& header, std::vector<std::uint8_t> payload) {
    LOG_TRACE("Received message {} ({} bytes) from {}", to_string(header.type), payload.size(), remote_endpoint_);
    
    if (message_handler_) {
        try {
            message_handler_(header, std::move(payload));
        } catch (const std::exception& e) {
            LOG_ERROR("Error handling message {} from {}: {}", to_string(header.type), remote_endpoint_, e.what());
            do_close();
        }
    }
}

void Connection::handle_error(const boost::system::error_code& error) {
    if (error == boost::asio::error::eof) {
        LOG_DEBUG("Connection to {} closed by peer", remote_endpoint_);
    } else if (error == boost::asio::error::operation_aborted) {
        LOG_DEBUG("Connection operation aborted for {}", remote_endpoint_);
    } else {
        LOG_WARN("Connection error with {}: {}", remote_endpoint_, error.message());
    }
    
    do_close();
}

}
