#include "chanmux/transfer/dispatch_policy.hpp"
#include "chanmux/core/logger.hpp"
#include <algorithm>

namespace chanmux::transfer {

void RoundRobinDispatchPolicy::dispatch(DispatchContext& context) {
    const auto& channels = context.channels();
    size_t next_channel = 0;
    
    while (auto chunk = context.next_chunk()) {
        context.send_chunk(std::move(chunk), *channels[next_channel]);
        next_channel = (next_channel + 1) % channels.size();
    }
}

WeightedDispatchPolicy::WeightedDispatchPolicy(std::unordered_map<std::string, int> weights,
                                               std::uint32_t seed)
    : weights_(std::move(weights))
    , rng_(seed) {
    for (auto& [identifier, weight] : weights_) {
        weight = std::max(1, weight);
    }
}

void WeightedDispatchPolicy::dispatch(DispatchContext& context) {
    const auto& channels = context.channels();
    auto cumulative_weights = build_weight_table(channels);
    int total_weight = cumulative_weights.back();
    
    LOG_DEBUG("Weighted dispatch over {} channels, total weight {}", channels.size(), total_weight);
    
    std::uniform_int_distribution<int> dist(1, total_weight);
    
    while (auto chunk = context.next_chunk()) {
        int r = dist(rng_);
        auto it = std::lower_bound(cumulative_weights.begin(), cumulative_weights.end(), r);
        auto index = static_cast<size_t>(std::distance(cumulative_weights.begin(), it));
        
        context.send_chunk(std::move(chunk), *channels[index]);
    }
}

void WeightedDispatchPolicy::set_weight(const std::string& channel_identifier, int weight) {
    weights_[channel_identifier] = std::max(1, weight);
}

int WeightedDispatchPolicy::get_weight(const std::string& channel_identifier) const {
    auto it = weights_.find(channel_identifier);
    return it != weights_.end() ? it->second : 1;
}

std::vector<int> WeightedDispatchPolicy::build_weight_table(
    const std::vector<std::shared_ptr<channel::DataChannel>>& channels) const {
    std::vector<int> cumulative_weights;
    cumulative_weights.reserve(channels.size());
    
    int total_weight = 0;
    for (const auto& channel : channels) {
        total_weight += get_weight(channel->identifier());
        cumulative_weights.push_back(total_weight);
    }
    
    return cumulative_weights;
}

std::unique_ptr<DispatchPolicy> make_default_dispatch_policy() {
    return std::make_unique<RoundRobinDispatchPolicy>();
}

}
