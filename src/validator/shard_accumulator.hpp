
#pragma once
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "fec.hpp"
#include "protocol.hpp"

namespace dasim {

struct AccumulatorOptions {
    // Empty an entry after a failed reconstruction instead of retrying on
    // every later shard.
    bool clear_on_failure{false};
};

enum class ShardOutcome {
    Rejected,         // index out of range, nothing stored
    Accumulating,     // below threshold
    Verified,         // reconstructed, checksum ok, entry cleared
    ChecksumMismatch,
    DecodeFailed
};

const char* outcome_name(ShardOutcome o);

struct InsertResult {
    ShardOutcome outcome{ShardOutcome::Accumulating};
    size_t count{0};
    Bytes blob;
};

struct SampleReport {
    std::string filename;
    size_t count{0};
};

// Per-filename shard sets shared by every connection of a validator.
class ShardAccumulator {
public:
    explicit ShardAccumulator(const ReedSolomon& rs, AccumulatorOptions opts = AccumulatorOptions{});

    InsertResult insert(const DasShard& shard);

    // Filenames holding at least one but fewer than k shards.
    std::vector<SampleReport> pending_samples() const;

    size_t count(const std::string& filename) const;
    size_t threshold() const { return rs_.plan().data_count; }

private:
    const ReedSolomon& rs_;
    AccumulatorOptions opts_;
    mutable std::mutex mtx_;
    std::map<std::string, ShardMap> entries_;
};

} // namespace dasim
