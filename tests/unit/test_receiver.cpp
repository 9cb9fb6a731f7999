#include <gtest/gtest.h>
#include "chanmux/transfer/receiver.hpp"
#include "chanmux/transfer/chunker.hpp"
#include "chanmux/core/utils.hpp"
#include "test_support.hpp"
#include <fstream>
#include <future>

using namespace chanmux::transfer;
using namespace std::chrono_literals;
using chanmux::core::utils::FileUtils;
using chanmux::test::ScriptedBootstrapChannel;
using chanmux::test::ScriptedDataChannel;
using chanmux::test::TempDirectory;
using chanmux::test::make_payload;
using chanmux::test::to_bytes;
using chanmux::test::wait_until;

class ReceiverTest : public ::testing::Test {
protected:
    void SetUp() override {
        bootstrap = std::make_shared<ScriptedBootstrapChannel>();
        receiver = std::make_unique<Receiver>(bootstrap);
    }
    
    std::shared_ptr<ScriptedDataChannel> add_channel(const std::string& identifier) {
        auto channel = std::make_shared<ScriptedDataChannel>(identifier);
        EXPECT_TRUE(receiver->register_channel(channel));
        return channel;
    }
    
    std::future<TransferResult> start_receive() {
        auto future = std::async(std::launch::async, [this]() { return receiver->receive(dir.path()); });
        EXPECT_TRUE(wait_until([this]() { return bootstrap->receiver_initialized(); }));
        return future;
    }
    
    void handshake(const std::string& name, std::uint32_t chunk_size, std::uint32_t chunk_count,
                   std::initializer_list<std::string> channels) {
        bootstrap->deliver_metadata({name, chunk_size, chunk_count});
        for (const auto& identifier : channels) {
            bootstrap->deliver_config({identifier, {0x01}});
        }
    }
    
    std::vector<std::uint8_t> read_output(const std::string& name) {
        auto content = FileUtils::read_binary_file(dir.path() / name);
        return content.value_or(std::vector<std::uint8_t>{});
    }
    
    TempDirectory dir;
    std::shared_ptr<ScriptedBootstrapChannel> bootstrap;
    std::unique_ptr<Receiver> receiver;
};

TEST_F(ReceiverTest, RequiresBootstrapChannel) {
    EXPECT_THROW(Receiver(nullptr), std::invalid_argument);
}

TEST_F(ReceiverTest, RejectsDuplicateChannelIdentifier) {
    add_channel("a");
    
    auto result = receiver->register_channel(std::make_shared<ScriptedDataChannel>("a"));
    
    EXPECT_EQ(result.error, TransferError::DUPLICATE_CHANNEL_IDENTIFIER);
}

TEST_F(ReceiverTest, ReceiveWithoutChannelsFails) {
    auto result = receiver->receive(dir.path());
    
    EXPECT_EQ(result.error, TransferError::NO_CHANNELS_REGISTERED);
    EXPECT_EQ(result.message, "Cannot receive data because receiver has no channel.");
    EXPECT_EQ(bootstrap->init_receiver_calls.load(), 0);
}

TEST_F(ReceiverTest, MissingDestinationIsRejected) {
    add_channel("a");
    
    auto result = receiver->receive(dir.path() / "missing");
    
    EXPECT_EQ(result.error, TransferError::INVALID_DESTINATION);
    EXPECT_EQ(bootstrap->init_receiver_calls.load(), 0);
}

TEST_F(ReceiverTest, FileDestinationIsRejected) {
    add_channel("a");
    auto file = dir.path() / "plain.txt";
    ASSERT_TRUE(FileUtils::write_binary_file(file, to_bytes("x")));
    
    EXPECT_EQ(receiver->receive(file).error, TransferError::INVALID_DESTINATION);
}

TEST_F(ReceiverTest, ReassemblesOutOfOrderChunks) {
    auto a = add_channel("a");
    auto b = add_channel("b");
    auto payload = to_bytes("Hello, world!");
    std::vector<Chunk> chunks;
    ASSERT_TRUE(Chunker::split(payload, 4, chunks));
    
    auto transfer = start_receive();
    handshake("greeting.txt", 4, 4, {"a", "b"});
    ASSERT_TRUE(wait_until([&]() { return receiver->get_state() == TransferState::TRANSFERRING; }));
    
    b->deliver_chunk(chunks[3]);
    a->deliver_chunk(chunks[1]);
    b->deliver_chunk(chunks[0]);
    a->deliver_chunk(chunks[2]);
    
    ASSERT_EQ(transfer.wait_for(5s), std::future_status::ready);
    auto result = transfer.get();
    ASSERT_TRUE(result) << result.message;
    
    EXPECT_EQ(receiver->get_state(), TransferState::COMPLETE);
    EXPECT_EQ(read_output("greeting.txt"), payload);
    EXPECT_EQ(receiver->output_path(), dir.path() / "greeting.txt");
    
    auto metadata = receiver->get_metadata();
    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(metadata->chunk_count, 4u);
}

TEST_F(ReceiverTest, InitializesChannelsWithTheirConfiguration) {
    auto a = add_channel("a");
    
    auto transfer = start_receive();
    bootstrap->deliver_metadata({"x", 1, 1});
    bootstrap->deliver_config({"a", {0x0A, 0x0B}});
    
    ASSERT_TRUE(wait_until([&]() { return receiver->get_state() == TransferState::TRANSFERRING; }));
    auto config = a->received_config();
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->config, (std::vector<std::uint8_t>{0x0A, 0x0B}));
    
    a->deliver_chunk({0, {0x42}});
    ASSERT_EQ(transfer.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(transfer.get());
}

TEST_F(ReceiverTest, ConfigurationBeforeMetadataIsAccepted) {
    auto a = add_channel("a");
    
    auto transfer = start_receive();
    bootstrap->deliver_config({"a", {}});
    EXPECT_EQ(receiver->get_state(), TransferState::HANDSHAKE_PENDING);
    bootstrap->deliver_metadata({"late.bin", 2, 1});
    
    ASSERT_TRUE(wait_until([&]() { return receiver->get_state() == TransferState::TRANSFERRING; }));
    a->deliver_chunk({0, {0x01, 0x02}});
    
    ASSERT_EQ(transfer.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(transfer.get());
    EXPECT_EQ(read_output("late.bin"), (std::vector<std::uint8_t>{0x01, 0x02}));
}

TEST_F(ReceiverTest, EveryArrivalIsAcknowledgedOnItsChannel) {
    auto a = add_channel("a");
    auto b = add_channel("b");
    
    auto transfer = start_receive();
    handshake("dup.bin", 1, 3, {"a", "b"});
    ASSERT_TRUE(wait_until([&]() { return receiver->get_state() == TransferState::TRANSFERRING; }));
    
    a->deliver_chunk({0, {0x10}});
    b->deliver_chunk({0, {0x10}});
    a->deliver_chunk({1, {0x11}});
    a->deliver_chunk({1, {0x11}});
    EXPECT_EQ(receiver->get_received_count(), 2u);
    b->deliver_chunk({2, {0x12}});
    
    ASSERT_EQ(transfer.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(transfer.get());
    
    EXPECT_EQ(a->sent_acks(), (std::vector<std::uint32_t>{0, 1, 1}));
    EXPECT_EQ(b->sent_acks(), (std::vector<std::uint32_t>{0, 2}));
    
    auto stats = receiver->get_stats();
    EXPECT_EQ(stats.chunks_accepted, 3u);
    EXPECT_EQ(stats.duplicate_chunks, 2u);
    EXPECT_EQ(stats.bytes_accepted, 3u);
}

TEST_F(ReceiverTest, FirstCopyOfChunkWins) {
    auto a = add_channel("a");
    
    auto transfer = start_receive();
    handshake("first.bin", 1, 2, {"a"});
    ASSERT_TRUE(wait_until([&]() { return receiver->get_state() == TransferState::TRANSFERRING; }));
    
    a->deliver_chunk({0, {0xAA}});
    a->deliver_chunk({0, {0xBB}});
    a->deliver_chunk({1, {0xCC}});
    
    ASSERT_EQ(transfer.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(transfer.get());
    EXPECT_EQ(read_output("first.bin"), (std::vector<std::uint8_t>{0xAA, 0xCC}));
}

TEST_F(ReceiverTest, LateRetransmissionIsStillAcknowledged) {
    auto a = add_channel("a");
    
    auto transfer = start_receive();
    handshake("late.bin", 1, 1, {"a"});
    ASSERT_TRUE(wait_until([&]() { return receiver->get_state() == TransferState::TRANSFERRING; }));
    
    a->deliver_chunk({0, {0x01}});
    ASSERT_EQ(transfer.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(transfer.get());
    
    a->deliver_chunk({0, {0x01}});
    
    EXPECT_EQ(a->sent_acks(), (std::vector<std::uint32_t>{0, 0}));
    EXPECT_EQ(read_output("late.bin"), (std::vector<std::uint8_t>{0x01}));
}

TEST_F(ReceiverTest, OutOfRangeChunkIsDiscarded) {
    auto a = add_channel("a");
    
    auto transfer = start_receive();
    handshake("range.bin", 1, 1, {"a"});
    ASSERT_TRUE(wait_until([&]() { return receiver->get_state() == TransferState::TRANSFERRING; }));
    
    a->deliver_chunk({7, {0x07}});
    EXPECT_EQ(receiver->get_received_count(), 0u);
    EXPECT_TRUE(a->sent_acks().empty());
    EXPECT_EQ(receiver->get_stats().discarded_chunks, 1u);
    
    a->deliver_chunk({0, {0x00}});
    ASSERT_EQ(transfer.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(transfer.get());
}

TEST_F(ReceiverTest, UnknownChannelIdentifierIsSurfaced) {
    add_channel("a");
    
    auto transfer = start_receive();
    bootstrap->deliver_metadata({"data", 4, 4});
    bootstrap->deliver_config({"b", {}});
    
    ASSERT_EQ(transfer.wait_for(5s), std::future_status::ready);
    auto result = transfer.get();
    EXPECT_EQ(result.error, TransferError::UNKNOWN_CHANNEL_IDENTIFIER);
    EXPECT_EQ(result.message, "No channel with identifier \"b\" was found in receiver channels.");
    EXPECT_EQ(receiver->get_state(), TransferState::FAILED);
}

TEST_F(ReceiverTest, ChannelInitFailureIsSurfaced) {
    auto a = add_channel("a");
    a->init_result = TransferResult(TransferError::CHANNEL_FAILURE, "connection refused");
    
    auto transfer = start_receive();
    handshake("data", 4, 4, {"a"});
    
    ASSERT_EQ(transfer.wait_for(5s), std::future_status::ready);
    auto result = transfer.get();
    EXPECT_EQ(result.error, TransferError::CHANNEL_FAILURE);
    EXPECT_NE(result.message.find("connection refused"), std::string::npos);
}

TEST_F(ReceiverTest, EmptyTransferMetadataIsRejected) {
    add_channel("a");
    
    auto transfer = start_receive();
    handshake("data", 4, 0, {"a"});
    
    ASSERT_EQ(transfer.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(transfer.get().error, TransferError::INVALID_STATE);
}

TEST_F(ReceiverTest, NameIsReducedToFinalComponent) {
    auto a = add_channel("a");
    
    auto transfer = start_receive();
    handshake("../../escape/evil.bin", 1, 1, {"a"});
    ASSERT_TRUE(wait_until([&]() { return receiver->get_state() == TransferState::TRANSFERRING; }));
    a->deliver_chunk({0, {0x66}});
    
    ASSERT_EQ(transfer.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(transfer.get());
    EXPECT_EQ(receiver->output_path(), dir.path() / "evil.bin");
    EXPECT_TRUE(FileUtils::is_file(dir.path() / "evil.bin"));
}

TEST_F(ReceiverTest, ExistingFileIsReplaced) {
    auto a = add_channel("a");
    ASSERT_TRUE(FileUtils::write_binary_file(dir.path() / "out.bin", make_payload(1000)));
    
    auto transfer = start_receive();
    handshake("out.bin", 2, 1, {"a"});
    ASSERT_TRUE(wait_until([&]() { return receiver->get_state() == TransferState::TRANSFERRING; }));
    a->deliver_chunk({0, {0x01, 0x02}});
    
    ASSERT_EQ(transfer.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(transfer.get());
    EXPECT_EQ(read_output("out.bin"), (std::vector<std::uint8_t>{0x01, 0x02}));
}

TEST_F(ReceiverTest, ReceiverRunsSingleTransfer) {
    auto a = add_channel("a");
    
    auto transfer = start_receive();
    handshake("once.bin", 1, 1, {"a"});
    ASSERT_TRUE(wait_until([&]() { return receiver->get_state() == TransferState::TRANSFERRING; }));
    a->deliver_chunk({0, {0x01}});
    ASSERT_EQ(transfer.wait_for(5s), std::future_status::ready);
    ASSERT_TRUE(transfer.get());
    
    EXPECT_EQ(receiver->receive(dir.path()).error, TransferError::INVALID_STATE);
}
