#include <benchmark/benchmark.h>
#include "chanmux/channel/loopback_channel.hpp"
#include "chanmux/network/protocol.hpp"
#include "chanmux/transfer/chunker.hpp"
#include "chanmux/transfer/receiver.hpp"
#include "chanmux/transfer/scheduler.hpp"
#include "chanmux/core/logger.hpp"
#include "test_support.hpp"
#include <future>
#include <span>

using namespace chanmux;

static void BM_ChunkerSplit(benchmark::State& state) {
    auto payload = test::make_payload(static_cast<size_t>(state.range(0)));
    
    for (auto _ : state) {
        std::vector<transfer::Chunk> chunks;
        auto result = transfer::Chunker::split(payload, 4096, chunks);
        benchmark::DoNotOptimize(result);
        benchmark::DoNotOptimize(chunks);
    }
    
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ChunkerSplit)->Range(64 * 1024, 16 * 1024 * 1024);

static void BM_ChunkerReassemble(benchmark::State& state) {
    auto payload = test::make_payload(static_cast<size_t>(state.range(0)));
    std::vector<transfer::Chunk> chunks;
    transfer::Chunker::split(payload, 4096, chunks);
    
    for (auto _ : state) {
        auto reassembled = transfer::Chunker::reassemble(chunks);
        benchmark::DoNotOptimize(reassembled);
    }
    
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ChunkerReassemble)->Range(64 * 1024, 16 * 1024 * 1024);

static void BM_Crc32(benchmark::State& state) {
    auto payload = test::make_payload(static_cast<size_t>(state.range(0)));
    
    for (auto _ : state) {
        auto crc = network::calculate_crc32(payload);
        benchmark::DoNotOptimize(crc);
    }
    
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Crc32)->Range(1024, 1024 * 1024);

static void BM_ChunkFrameRoundTrip(benchmark::State& state) {
    network::ChunkDataMessage message{42, test::make_payload(static_cast<size_t>(state.range(0)))};
    
    for (auto _ : state) {
        auto frame = network::MessageSerializer::serialize_message(network::MessageType::CHUNK_DATA, message);
        std::span<const std::uint8_t> data(frame);
        auto header = network::MessageHeader::deserialize(data.first(network::MESSAGE_HEADER_SIZE));
        auto payload = data.subspan(network::MESSAGE_HEADER_SIZE);
        bool valid = header.is_valid() && header.verify_checksum(payload);
        auto decoded = network::ChunkDataMessage::deserialize(payload);
        benchmark::DoNotOptimize(valid);
        benchmark::DoNotOptimize(decoded);
    }
    
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ChunkFrameRoundTrip)->Range(1024, 64 * 1024);

// Whole transfer over in-process channels; range(0) is the channel count
static void BM_LoopbackTransfer(benchmark::State& state) {
    spdlog::set_level(spdlog::level::warn);
    
    const size_t payload_size = 4 * 1024 * 1024;
    auto payload = test::make_payload(payload_size);
    
    for (auto _ : state) {
        test::IoContextRunner runner{4};
        test::TempDirectory dir("chanmux_bench");
        auto bootstrap = channel::LoopbackBootstrapChannel::create_pair(runner.context());
        
        transfer::Scheduler scheduler(bootstrap.first);
        transfer::Receiver receiver(bootstrap.second);
        for (int i = 0; i < state.range(0); ++i) {
            auto pair = channel::LoopbackDataChannel::create_pair(runner.context(), "channel-" + std::to_string(i));
            scheduler.register_channel(pair.first);
            receiver.register_channel(pair.second);
        }
        
        auto receiving = std::async(std::launch::async, [&]() { return receiver.receive(dir.path()); });
        auto sent = scheduler.send(payload, 16 * 1024);
        auto received = receiving.get();
        
        if (!sent || !received) {
            state.SkipWithError("transfer failed");
            break;
        }
    }
    
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(payload_size));
}
BENCHMARK(BM_LoopbackTransfer)->Arg(1)->Arg(4)->Arg(8)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
