#pragma once

#include "chanmux/network/protocol.hpp"
#include <utility>  // before Boost.Asio: awaitable.hpp uses std::exchange
#include <boost/asio.hpp>
#include <atomic>
#include <memory>
#include <string>
#include <functional>
#include <queue>

namespace chanmux::network {

using boost::asio::ip::tcp;

enum class ConnectionState {
    CONNECTED,
    CLOSING,
    DISCONNECTED
};

/**
 * Framed message stream over one TCP socket.
 *
 * Reads run continuously once start() is called; every complete, valid
 * frame is handed to the message handler on the io_context thread. Invalid
 * headers, oversized frames and checksum mismatches close the connection.
 *
 * send_message() and close() may be called from any thread. All socket work
 * runs on a per-connection strand, so the io_context may be run by several
 * threads.
 */
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using MessageHandler = std::function<void(const MessageHeader&, std::vector<std::uint8_t>)>;
    
    explicit Connection(tcp::socket socket);
    ~Connection();
    
    // Handlers must be installed before start()
    void start();
    void close();
    
    // Returns false once the connection is closing or when the payload
    // exceeds MAX_PAYLOAD_SIZE
    template<MessagePayload T>
    bool send_message(MessageType type, const T& payload) {
        return send_frame(type, MessageSerializer::serialize_message(type, payload));
    }
    
    void set_message_handler(MessageHandler handler) { message_handler_ = std::move(handler); }
    
    bool is_open() const { return state_.load() == ConnectionState::CONNECTED; }

private:
    bool send_frame(MessageType type, std::vector<std::uint8_t> frame);
    
    void do_read_header();
    void do_read_payload(std::uint32_t payload_size);
    void do_write();
    void do_close();
    void handle_message(const MessageHeader& header, std::vector<std::uint8_t> payload);
    void handle_error(const boost::system::error_code& error);
    
    tcp::socket socket_;
    boost::asio::strand<tcp::socket::executor_type> strand_;
    std::atomic<ConnectionState> state_;
    std::string remote_endpoint_;
    
    MessageHandler message_handler_;
    
    std::array<std::uint8_t, MESSAGE_HEADER_SIZE> read_header_buffer_;
    MessageHeader read_header_;
    std::vector<std::uint8_t> read_payload_buffer_;
    
    // Only touched on strand_
    std::queue<std::vector<std::uint8_t>> write_queue_;
    bool write_in_progress_;
};

}
