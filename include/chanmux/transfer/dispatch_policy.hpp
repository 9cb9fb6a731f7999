#pragma once

#include "transfer_types.hpp"
#include "chanmux/channel/data_channel.hpp"
#include <memory>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace chanmux::transfer {

// What the Scheduler exposes to a dispatch policy while a transfer runs.
class DispatchContext {
public:
    virtual ~DispatchContext() = default;
    
    // Blocks until a chunk is pending. Returns nullptr once every chunk has
    // been acknowledged, which is the policy's signal to return.
    virtual ChunkPtr next_chunk() = 0;
    
    virtual const std::vector<std::shared_ptr<channel::DataChannel>>& channels() const = 0;
    
    virtual void send_chunk(ChunkPtr chunk, channel::DataChannel& channel) = 0;
};

// Decides which channel carries which chunk. An implementation must hand
// every chunk returned by next_chunk() to send_chunk() and keep going until
// next_chunk() returns nullptr.
class DispatchPolicy {
public:
    virtual ~DispatchPolicy() = default;
    virtual void dispatch(DispatchContext& context) = 0;
    virtual std::string name() const = 0;
};

class RoundRobinDispatchPolicy : public DispatchPolicy {
public:
    void dispatch(DispatchContext& context) override;
    std::string name() const override { return "round-robin"; }
};

// Picks a channel at random, proportionally to its weight. Channels without
// an explicit weight count as 1.
class WeightedDispatchPolicy : public DispatchPolicy {
public:
    explicit WeightedDispatchPolicy(std::unordered_map<std::string, int> weights,
                                    std::uint32_t seed = std::random_device{}());
    
    void dispatch(DispatchContext& context) override;
    std::string name() const override { return "weighted"; }
    
    void set_weight(const std::string& channel_identifier, int weight);
    int get_weight(const std::string& channel_identifier) const;

private:
    std::unordered_map<std::string, int> weights_;
    std::mt19937 rng_;
    
    std::vector<int> build_weight_table(const std::vector<std::shared_ptr<channel::DataChannel>>& channels) const;
};

std::unique_ptr<DispatchPolicy> make_default_dispatch_policy();

}
