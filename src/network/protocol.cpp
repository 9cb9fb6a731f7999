#include "chanmux/network/protocol.hpp"
#include <algorithm>
#include <stdexcept>

namespace chanmux::network {

namespace {
    constexpr std::array<std::uint32_t, 256> make_crc32_table() {
        std::array<std::uint32_t, 256> table{};
        for (std::uint32_t i = 0; i < 256; ++i) {
            std::uint32_t value = i;
            for (int bit = 0; bit < 8; ++bit) {
                value = (value & 1) ? (0xEDB88320 ^ (value >> 1)) : (value >> 1);
            }
            table[i] = value;
        }
        return table;
    }
    
    constexpr auto crc_table = make_crc32_table();
    
    static_assert(crc_table[1] == 0x77073096);
    static_assert(crc_table[255] == 0x2D02EF8D);
    
    void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
        buffer.push_back((value >> 24) & 0xFF);
        buffer.push_back((value >> 16) & 0xFF);
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }
    
    void write_uint16(std::vector<std::uint8_t>& buffer, std::uint16_t value) {
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }
    
    void write_string(std::vector<std::uint8_t>& buffer, const std::string& str) {
        write_uint32(buffer, static_cast<std::uint32_t>(str.size()));
        buffer.insert(buffer.end(), str.begin(), str.end());
    }
    
    void write_bytes(std::vector<std::uint8_t>& buffer, const std::vector<std::uint8_t>& bytes) {
        write_uint32(buffer, static_cast<std::uint32_t>(bytes.size()));
        buffer.insert(buffer.end(), bytes.begin(), bytes.end());
    }
    
    std::uint32_t read_uint32(std::span<const std::uint8_t>& data) {
        if (data.size() < 4) throw std::runtime_error("Insufficient data for uint32");
        std::uint32_t value = (static_cast<std::uint32_t>(data[0]) << 24) |
                             (static_cast<std::uint32_t>(data[1]) << 16) |
                             (static_cast<std::uint32_t>(data[2]) << 8) |
                             static_cast<std::uint32_t>(data[3]);
        data = data.subspan(4);
        return value;
    }
    
    std::uint16_t read_uint16(std::span<const std::uint8_t>& data) {
        if (data.size() < 2) throw std::runtime_error("Insufficient data for uint16");
        std::uint16_t value = (static_cast<std::uint16_t>(data[0]) << 8) |
                             static_cast<std::uint16_t>(data[1]);
        data = data.subspan(2);
        return value;
    }
    
    std::string read_string(std::span<const std::uint8_t>& data) {
        auto length = read_uint32(data);
        if (data.size() < length) throw std::runtime_error("Insufficient data for string");
        std::string str(reinterpret_cast<const char*>(data.data()), length);
        data = data.subspan(length);
        return str;
    }
    
    std::vector<std::uint8_t> read_bytes(std::span<const std::uint8_t>& data) {
        auto length = read_uint32(data);
        if (data.size() < length) throw std::runtime_error("Insufficient data for byte array");
        std::vector<std::uint8_t> bytes(data.begin(), data.begin() + length);
        data = data.subspan(length);
        return bytes;
    }
}

std::uint32_t calculate_crc32(std::span<const std::uint8_t> data) {
    std::uint32_t crc = 0xFFFFFFFF;
    for (auto byte : data) {
        crc = crc_table[(crc ^ byte) & 0xFF] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFF;
}

const char* to_string(MessageType type) {
    switch (type) {
        case MessageType::TRANSFER_METADATA: return "transfer-metadata";
        case MessageType::CHANNEL_CONFIG: return "channel-config";
        case MessageType::CHUNK_DATA: return "chunk-data";
        case MessageType::CHUNK_ACK: return "chunk-ack";
    }
    return "unknown";
}

MessageHeader::MessageHeader() 
    : magic(PROTOCOL_MAGIC)
    , version(PROTOCOL_VERSION)
    , type(MessageType::CHUNK_ACK)
    , flags(MessageFlags::NONE)
    , payload_size(0)
    , checksum{0, 0, 0, 0} {
}

MessageHeader::MessageHeader(MessageType msg_type, std::uint32_t payload_len)
    : magic(PROTOCOL_MAGIC)
    , version(PROTOCOL_VERSION)
    , type(msg_type)
    , flags(MessageFlags::NONE)
    , payload_size(payload_len)
    , checksum{0, 0, 0, 0} {
}

bool MessageHeader::is_valid() const {
    return magic == PROTOCOL_MAGIC && version == PROTOCOL_VERSION && payload_size <= MAX_PAYLOAD_SIZE;
}

void MessageHeader::calculate_checksum(std::span<const std::uint8_t> payload) {
    auto crc = calculate_crc32(payload);
    checksum[0] = (crc >> 24) & 0xFF;
    checksum[1] = (crc >> 16) & 0xFF;
    checksum[2] = (crc >> 8) & 0xFF;
    checksum[3] = crc & 0xFF;
}

bool MessageHeader::verify_checksum(std::span<const std::uint8_t> payload) const {
    auto expected_crc = calculate_crc32(payload);
    auto actual_crc = (static_cast<std::uint32_t>(checksum[0]) << 24) |
                     (static_cast<std::uint32_t>(checksum[1]) << 16) |
                     (static_cast<std::uint32_t>(checksum[2]) << 8) |
                     static_cast<std::uint32_t>(checksum[3]);
    return expected_crc == actual_crc;
}

std::vector<std::uint8_t> MessageHeader::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(MESSAGE_HEADER_SIZE);
    
    write_uint32(buffer, magic);
    write_uint16(buffer, version);
    buffer.push_back(static_cast<std::uint8_t>(type));
    buffer.push_back(static_cast<std::uint8_t>(flags));
    write_uint32(buffer, payload_size);
    buffer.insert(buffer.end(), checksum.begin(), checksum.end());
    
    return buffer;
}

MessageHeader MessageHeader::deserialize(std::span<const std::uint8_t> data) {
    if (data.size() < MESSAGE_HEADER_SIZE) {
        throw std::runtime_error("Insufficient data for message header");
    }
    
    MessageHeader header;
    auto span = data;
    
    header.magic = read_uint32(span);
    header.version = read_uint16(span);
    header.type = static_cast<MessageType>(span[0]);
    header.flags = static_cast<MessageFlags>(span[1]);
    span = span.subspan(2);
    header.payload_size = read_uint32(span);
    std::copy(span.begin(), span.begin() + 4, header.checksum.begin());
    
    return header;
}

std::vector<std::uint8_t> TransferMetadataMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, name);
    write_uint32(buffer, chunk_size);
    write_uint32(buffer, chunk_count);
    return buffer;
}

TransferMetadataMessage TransferMetadataMessage::deserialize(std::span<const std::uint8_t> data) {
    TransferMetadataMessage msg;
    auto span = data;
    msg.name = read_string(span);
    msg.chunk_size = read_uint32(span);
    msg.chunk_count = read_uint32(span);
    return msg;
}

std::vector<std::uint8_t> ChannelConfigMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, channel_identifier);
    write_bytes(buffer, config);
    return buffer;
}

ChannelConfigMessage ChannelConfigMessage::deserialize(std::span<const std::uint8_t> data) {
    ChannelConfigMessage msg;
    auto span = data;
    msg.channel_identifier = read_string(span);
    msg.config = read_bytes(span);
    return msg;
}

std::vector<std::uint8_t> ChunkDataMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(8 + data.size());
    write_uint32(buffer, identifier);
    write_bytes(buffer, data);
    return buffer;
}

ChunkDataMessage ChunkDataMessage::deserialize(std::span<const std::uint8_t> data_span) {
    ChunkDataMessage msg;
    auto span = data_span;
    msg.identifier = read_uint32(span);
    msg.data = read_bytes(span);
    return msg;
}

std::vector<std::uint8_t> ChunkAckMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_uint32(buffer, identifier);
    return buffer;
}

ChunkAckMessage ChunkAckMessage::deserialize(std::span<const std::uint8_t> data) {
    ChunkAckMessage msg;
    auto span = data;
    msg.identifier = read_uint32(span);
    return msg;
}

}
