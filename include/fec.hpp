
#pragma once
#include <cstdint>
#include <cstddef>
#include <map>
#include <optional>
#include <vector>
#include "util.hpp"

namespace dasim {

// Process-wide code parameters: k data shards, m parity shards.
constexpr uint16_t kDataShards = 4;
constexpr uint16_t kParityShards = 2;
constexpr uint16_t kTotalShards = kDataShards + kParityShards;

using ShardMap = std::map<uint32_t, Bytes>;

struct ShardPlan {
    uint16_t data_count{kDataShards};
    uint16_t parity_count{kParityShards};
    uint16_t total() const { return (uint16_t)(data_count + parity_count); }
};

// Zero-pads data up to the smallest multiple of k that is >= data.size().
Bytes pad_to_multiple(const Bytes& data, size_t k);

// Systematic Reed-Solomon over GF(2^8) (poly 0x11d, generator 2). Any
// data_count of the total() shards recover the rest.
class ReedSolomon {
public:
    explicit ReedSolomon(const ShardPlan& plan = ShardPlan{});

    const ShardPlan& plan() const { return plan_; }
    size_t shard_size(size_t blob_len) const;

    std::vector<Bytes> encode(const Bytes& blob) const;

    // Fills in every shard whose present flag is false. Returns false when
    // fewer than data_count shards are present, lengths disagree, or the
    // decode matrix is singular; shards are left untouched in that case.
    bool reconstruct_shards(std::vector<Bytes>& shards, std::vector<bool>& present) const;

    // Decodes, concatenates the data shards and truncates to original_len.
    std::optional<Bytes> reconstruct(const ShardMap& partial, size_t original_len) const;

private:
    using Matrix = std::vector<std::vector<uint8_t>>;
    ShardPlan plan_;
    Matrix matrix_;
};

} // namespace dasim
