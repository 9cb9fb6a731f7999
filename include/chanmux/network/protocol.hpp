#pragma once

#include <cstdint>
#include <array>
#include <string>
#include <utility>
#include <vector>
#include <span>
#include <concepts>

namespace chanmux::network {

constexpr std::uint32_t PROTOCOL_MAGIC = 0x434D5558; // "CMUX"
constexpr std::uint16_t PROTOCOL_VERSION = 1;
constexpr std::size_t MESSAGE_HEADER_SIZE = 16;
constexpr std::uint32_t MAX_PAYLOAD_SIZE = 16 * 1024 * 1024;
// Largest chunk whose CHUNK_DATA frame (identifier, length, data) fits
constexpr std::uint32_t MAX_CHUNK_DATA_SIZE = MAX_PAYLOAD_SIZE - 8;

enum class MessageType : std::uint8_t {
    TRANSFER_METADATA = 0x01,
    CHANNEL_CONFIG    = 0x02,

    CHUNK_DATA        = 0x10,
    CHUNK_ACK         = 0x11
};

enum class MessageFlags : std::uint8_t {
    NONE = 0x00
};

const char* to_string(MessageType type);

struct MessageHeader {
    std::uint32_t magic;           // Protocol magic number
    std::uint16_t version;         // Protocol version
    MessageType type;              // Message type
    MessageFlags flags;            // Message flags
    std::uint32_t payload_size;    // Payload length in bytes
    std::array<std::uint8_t, 4> checksum; // CRC32 of payload
    
    MessageHeader();
    MessageHeader(MessageType msg_type, std::uint32_t payload_len);
    
    // Magic, version and the payload size limit
    bool is_valid() const;
    void calculate_checksum(std::span<const std::uint8_t> payload);
    bool verify_checksum(std::span<const std::uint8_t> payload) const;
    
    std::vector<std::uint8_t> serialize() const;
    static MessageHeader deserialize(std::span<const std::uint8_t> data);
};

static_assert(sizeof(MessageHeader) == MESSAGE_HEADER_SIZE);

std::uint32_t calculate_crc32(std::span<const std::uint8_t> data);

template<typename T>
concept MessagePayload = requires(T t) {
    { t.serialize() } -> std::convertible_to<std::vector<std::uint8_t>>;
    { T::deserialize(std::declval<std::span<const std::uint8_t>>()) } -> std::same_as<T>;
};

struct TransferMetadataMessage {
    std::string name;
    std::uint32_t chunk_size;
    std::uint32_t chunk_count;
    
    std::vector<std::uint8_t> serialize() const;
    static TransferMetadataMessage deserialize(std::span<const std::uint8_t> data);
};

struct ChannelConfigMessage {
    std::string channel_identifier;
    std::vector<std::uint8_t> config;
    
    std::vector<std::uint8_t> serialize() const;
    static ChannelConfigMessage deserialize(std::span<const std::uint8_t> data);
};

struct ChunkDataMessage {
    std::uint32_t identifier;
    std::vector<std::uint8_t> data;
    
    std::vector<std::uint8_t> serialize() const;
    static ChunkDataMessage deserialize(std::span<const std::uint8_t> data);
};

struct ChunkAckMessage {
    std::uint32_t identifier;
    
    std::vector<std::uint8_t> serialize() const;
    static ChunkAckMessage deserialize(std::span<const std::uint8_t> data);
};

// Whole-frame helpers: header followed by payload
class MessageSerializer {
public:
    template<MessagePayload T>
    static std::vector<std::uint8_t> serialize_message(MessageType type, const T& payload) {
        auto payload_data = payload.serialize();
        MessageHeader header(type, static_cast<std::uint32_t>(payload_data.size()));
        header.calculate_checksum(payload_data);
        
        auto frame = header.serialize();
        frame.insert(frame.end(), payload_data.begin(), payload_data.end());
        return frame;
    }
    
    template<MessagePayload T>
    static T deserialize_payload(std::span<const std::uint8_t> payload) {
        return T::deserialize(payload);
    }
};

}

static_assert(chanmux::network::MessagePayload<chanmux::network::TransferMetadataMessage>);
static_assert(chanmux::network::MessagePayload<chanmux::network::ChannelConfigMessage>);
static_assert(chanmux::network::MessagePayload<chanmux::network::ChunkDataMessage>);
static_assert(chanmux::network::MessagePayload<chanmux::network::ChunkAckMessage>);
