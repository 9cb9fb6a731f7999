#include <gtest/gtest.h>
#include "chanmux/network/protocol.hpp"
#include <stdexcept>
#include <span>
#include <string>
#include <utility>

using namespace chanmux::network;

class ProtocolTest : public ::testing::Test {
protected:
    static std::vector<std::uint8_t> bytes(const std::string& text) {
        return std::vector<std::uint8_t>(text.begin(), text.end());
    }
    
    // Splits a frame the way Connection reads it off the socket
    static std::pair<MessageHeader, std::span<const std::uint8_t>> split(const std::vector<std::uint8_t>& frame) {
        std::span<const std::uint8_t> data(frame);
        auto header = MessageHeader::deserialize(data.first(MESSAGE_HEADER_SIZE));
        return {header, data.subspan(MESSAGE_HEADER_SIZE)};
    }
};

TEST_F(ProtocolTest, MessageHeaderConstruction) {
    MessageHeader header;
    
    EXPECT_EQ(header.magic, PROTOCOL_MAGIC);
    EXPECT_EQ(header.version, PROTOCOL_VERSION);
    EXPECT_EQ(header.flags, MessageFlags::NONE);
    EXPECT_EQ(header.payload_size, 0u);
    EXPECT_TRUE(header.is_valid());
}

TEST_F(ProtocolTest, MessageHeaderSerialization) {
    MessageHeader original(MessageType::CHUNK_DATA, 50);
    original.calculate_checksum(bytes("payload"));
    
    auto serialized = original.serialize();
    ASSERT_EQ(serialized.size(), MESSAGE_HEADER_SIZE);
    
    // Big-endian magic first, then the version
    EXPECT_EQ(serialized[0], 0x43);
    EXPECT_EQ(serialized[1], 0x4D);
    EXPECT_EQ(serialized[2], 0x55);
    EXPECT_EQ(serialized[3], 0x58);
    EXPECT_EQ(serialized[4], 0x00);
    EXPECT_EQ(serialized[5], 0x01);
    EXPECT_EQ(serialized[6], 0x10);
    
    auto deserialized = MessageHeader::deserialize(serialized);
    EXPECT_EQ(deserialized.magic, original.magic);
    EXPECT_EQ(deserialized.version, original.version);
    EXPECT_EQ(deserialized.type, original.type);
    EXPECT_EQ(deserialized.flags, original.flags);
    EXPECT_EQ(deserialized.payload_size, original.payload_size);
    EXPECT_EQ(deserialized.checksum, original.checksum);
}

TEST_F(ProtocolTest, Crc32MatchesReferenceValue) {
    EXPECT_EQ(calculate_crc32(bytes("123456789")), 0xCBF43926u);
    EXPECT_EQ(calculate_crc32(std::vector<std::uint8_t>{}), 0u);
}

TEST_F(ProtocolTest, ChecksumCalculation) {
    std::vector<std::uint8_t> payload = {1, 2, 3, 4, 5};
    MessageHeader header(MessageType::CHUNK_DATA, static_cast<std::uint32_t>(payload.size()));
    
    header.calculate_checksum(payload);
    EXPECT_TRUE(header.verify_checksum(payload));
    
    payload[0] = 99;
    EXPECT_FALSE(header.verify_checksum(payload));
}

TEST_F(ProtocolTest, HeaderValidation) {
    MessageHeader header(MessageType::CHUNK_ACK, 4);
    EXPECT_TRUE(header.is_valid());
    
    header.magic = 0xDEADBEEF;
    EXPECT_FALSE(header.is_valid());
    
    header.magic = PROTOCOL_MAGIC;
    header.version = PROTOCOL_VERSION + 1;
    EXPECT_FALSE(header.is_valid());
    
    header.version = PROTOCOL_VERSION;
    header.payload_size = MAX_PAYLOAD_SIZE + 1;
    EXPECT_FALSE(header.is_valid());
}

TEST_F(ProtocolTest, TransferMetadataMessageSerialization) {
    TransferMetadataMessage original{"report.pdf", 4096, 17};
    
    auto frame = MessageSerializer::serialize_message(MessageType::TRANSFER_METADATA, original);
    auto [header, payload] = split(frame);
    
    EXPECT_TRUE(header.is_valid());
    EXPECT_EQ(header.type, MessageType::TRANSFER_METADATA);
    EXPECT_EQ(header.payload_size, payload.size());
    EXPECT_TRUE(header.verify_checksum(payload));
    
    auto decoded = MessageSerializer::deserialize_payload<TransferMetadataMessage>(payload);
    EXPECT_EQ(decoded.name, "report.pdf");
    EXPECT_EQ(decoded.chunk_size, 4096u);
    EXPECT_EQ(decoded.chunk_count, 17u);
}

TEST_F(ProtocolTest, ChannelConfigMessageSerialization) {
    ChannelConfigMessage original{"channel-2", bytes("10.0.0.5:40123")};
    
    auto decoded = ChannelConfigMessage::deserialize(original.serialize());
    EXPECT_EQ(decoded.channel_identifier, "channel-2");
    EXPECT_EQ(decoded.config, bytes("10.0.0.5:40123"));
}

TEST_F(ProtocolTest, ChunkMessagesSerialization) {
    ChunkDataMessage chunk{7, {0x00, 0xFF, 0x10}};
    auto frame = MessageSerializer::serialize_message(MessageType::CHUNK_DATA, chunk);
    ASSERT_EQ(frame.size(), MESSAGE_HEADER_SIZE + 4 + 4 + 3);
    
    auto [header, payload] = split(frame);
    EXPECT_TRUE(header.verify_checksum(payload));
    auto decoded = ChunkDataMessage::deserialize(payload);
    EXPECT_EQ(decoded.identifier, 7u);
    EXPECT_EQ(decoded.data, chunk.data);
    
    ChunkAckMessage ack{0xFFFFFFFF};
    EXPECT_EQ(ChunkAckMessage::deserialize(ack.serialize()).identifier, 0xFFFFFFFFu);
}

TEST_F(ProtocolTest, EmptyFieldsHandling) {
    TransferMetadataMessage metadata{"", 1, 1};
    EXPECT_TRUE(TransferMetadataMessage::deserialize(metadata.serialize()).name.empty());
    
    ChannelConfigMessage config{"a", {}};
    EXPECT_TRUE(ChannelConfigMessage::deserialize(config.serialize()).config.empty());
}

TEST_F(ProtocolTest, TruncatedFramesAreRejected) {
    auto frame = MessageSerializer::serialize_message(MessageType::CHUNK_ACK, ChunkAckMessage{3});
    
    std::vector<std::uint8_t> short_header(frame.begin(), frame.begin() + 10);
    EXPECT_THROW(MessageHeader::deserialize(short_header), std::runtime_error);
    
    std::vector<std::uint8_t> short_payload(frame.begin() + MESSAGE_HEADER_SIZE, frame.end() - 1);
    EXPECT_THROW(ChunkAckMessage::deserialize(short_payload), std::runtime_error);
    
    std::vector<std::uint8_t> short_string = {0x00, 0x00, 0x00, 0x09, 'a', 'b'};
    EXPECT_THROW(TransferMetadataMessage::deserialize(short_string), std::runtime_error);
}

TEST_F(ProtocolTest, CorruptedFramesAreRejected) {
    auto frame = MessageSerializer::serialize_message(MessageType::CHUNK_DATA, ChunkDataMessage{1, bytes("abcd")});
    
    auto corrupted = frame;
    corrupted.back() ^= 0x01;
    auto [corrupted_header, corrupted_payload] = split(corrupted);
    EXPECT_TRUE(corrupted_header.is_valid());
    EXPECT_FALSE(corrupted_header.verify_checksum(corrupted_payload));
    
    auto bad_magic = frame;
    bad_magic[0] = 0x00;
    EXPECT_FALSE(split(bad_magic).first.is_valid());
}

TEST_F(ProtocolTest, MessageTypeNames) {
    EXPECT_STREQ(to_string(MessageType::TRANSFER_METADATA), "transfer-metadata");
    EXPECT_STREQ(to_string(MessageType::CHANNEL_CONFIG), "channel-config");
    EXPECT_STREQ(to_string(MessageType::CHUNK_DATA), "chunk-data");
    EXPECT_STREQ(to_string(MessageType::CHUNK_ACK), "chunk-ack");
}
