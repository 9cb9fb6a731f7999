#include <gtest/gtest.h>
#include "chanmux/transfer/dispatch_policy.hpp"
#include "test_support.hpp"
#include <deque>
#include <map>

using namespace chanmux::transfer;
using chanmux::test::ScriptedDataChannel;

namespace {

// Hands out a fixed number of chunks and records where each one went
class RecordingContext : public DispatchContext {
public:
    RecordingContext(size_t chunk_count, std::vector<std::shared_ptr<chanmux::channel::DataChannel>> channels)
        : channels_(std::move(channels)) {
        for (size_t i = 0; i < chunk_count; ++i) {
            pending_.push_back(std::make_shared<const Chunk>(Chunk{static_cast<std::uint32_t>(i), {0x00}}));
        }
    }
    
    ChunkPtr next_chunk() override {
        if (pending_.empty()) {
            return nullptr;
        }
        auto chunk = pending_.front();
        pending_.pop_front();
        return chunk;
    }
    
    const std::vector<std::shared_ptr<chanmux::channel::DataChannel>>& channels() const override { return channels_; }
    
    void send_chunk(ChunkPtr chunk, chanmux::channel::DataChannel& channel) override {
        assignments.emplace_back(chunk->identifier, channel.identifier());
    }
    
    std::vector<std::pair<std::uint32_t, std::string>> assignments;

private:
    std::deque<ChunkPtr> pending_;
    std::vector<std::shared_ptr<chanmux::channel::DataChannel>> channels_;
};

std::vector<std::shared_ptr<chanmux::channel::DataChannel>> make_channels(std::initializer_list<std::string> names) {
    std::vector<std::shared_ptr<chanmux::channel::DataChannel>> channels;
    for (const auto& name : names) {
        channels.push_back(std::make_shared<ScriptedDataChannel>(name));
    }
    return channels;
}

}

TEST(RoundRobinDispatchPolicyTest, CyclesThroughChannels) {
    RecordingContext context(7, make_channels({"a", "b", "c"}));
    RoundRobinDispatchPolicy policy;
    
    policy.dispatch(context);
    
    ASSERT_EQ(context.assignments.size(), 7u);
    const char* expected[] = {"a", "b", "c", "a", "b", "c", "a"};
    for (size_t i = 0; i < 7; ++i) {
        EXPECT_EQ(context.assignments[i].first, i);
        EXPECT_EQ(context.assignments[i].second, expected[i]);
    }
}

TEST(RoundRobinDispatchPolicyTest, ReturnsWhenNothingIsPending) {
    RecordingContext context(0, make_channels({"a"}));
    RoundRobinDispatchPolicy policy;
    
    policy.dispatch(context);
    
    EXPECT_TRUE(context.assignments.empty());
}

TEST(WeightedDispatchPolicyTest, DistributesProportionallyToWeights) {
    RecordingContext context(4000, make_channels({"fast", "slow"}));
    WeightedDispatchPolicy policy({{"fast", 3}, {"slow", 1}}, 2024);
    
    policy.dispatch(context);
    
    std::map<std::string, int> counts;
    for (const auto& [identifier, channel] : context.assignments) {
        counts[channel]++;
    }
    
    ASSERT_EQ(context.assignments.size(), 4000u);
    EXPECT_NEAR(counts["fast"] / 4000.0, 0.75, 0.05);
    EXPECT_NEAR(counts["slow"] / 4000.0, 0.25, 0.05);
}

TEST(WeightedDispatchPolicyTest, UnknownChannelsDefaultToWeightOne) {
    WeightedDispatchPolicy policy({{"a", 5}});
    
    EXPECT_EQ(policy.get_weight("a"), 5);
    EXPECT_EQ(policy.get_weight("b"), 1);
}

TEST(WeightedDispatchPolicyTest, WeightsAreClampedToOne) {
    WeightedDispatchPolicy policy({{"a", 0}, {"b", -3}});
    policy.set_weight("c", -1);
    
    EXPECT_EQ(policy.get_weight("a"), 1);
    EXPECT_EQ(policy.get_weight("b"), 1);
    EXPECT_EQ(policy.get_weight("c"), 1);
}

TEST(WeightedDispatchPolicyTest, EveryChunkIsDispatchedOnce) {
    RecordingContext context(100, make_channels({"a", "b", "c"}));
    WeightedDispatchPolicy policy({{"a", 2}, {"b", 1}, {"c", 4}}, 7);
    
    policy.dispatch(context);
    
    ASSERT_EQ(context.assignments.size(), 100u);
    for (size_t i = 0; i < 100; ++i) {
        EXPECT_EQ(context.assignments[i].first, i);
    }
}

TEST(DispatchPolicyTest, DefaultPolicyIsRoundRobin) {
    auto policy = make_default_dispatch_policy();
    
    ASSERT_NE(policy, nullptr);
    EXPECT_EQ(policy->name(), "round-robin");
}
