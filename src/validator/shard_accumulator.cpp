
#include "shard_accumulator.hpp"
#include "crypto.hpp"
#include "logging.hpp"

namespace dasim {

const char *outcome_name(ShardOutcome o) {
  switch (o) {
  case ShardOutcome::Rejected:
    return "rejected";
  case ShardOutcome::Accumulating:
    return "accumulating";
  case ShardOutcome::Verified:
    return "verified";
  case ShardOutcome::ChecksumMismatch:
    return "checksum-mismatch";
  default:
    return "decode-failed";
  }
}

ShardAccumulator::ShardAccumulator(const ReedSolomon &rs,
                                   AccumulatorOptions opts)
    : rs_(rs), opts_(opts) {}

InsertResult ShardAccumulator::insert(const DasShard &shard) {
  InsertResult res;
  std::lock_guard<std::mutex> lk(mtx_);

  if (shard.index >= rs_.plan().total()) {
    Logger::instance().log(LogLevel::WARN,
                           "shard index %llu out of range for %s (n=%u)",
                           (unsigned long long)shard.index,
                           shard.filename.c_str(), (unsigned)rs_.plan().total());
    auto it = entries_.find(shard.filename);
    res.outcome = ShardOutcome::Rejected;
    res.count = it == entries_.end() ? 0 : it->second.size();
    return res;
  }

  auto &map = entries_[shard.filename];
  map[(uint32_t)shard.index] = shard.data;
  res.count = map.size();
  Logger::instance().log(LogLevel::INFO, "shards for %s: %zu/%u (k=%u)",
                         shard.filename.c_str(), map.size(),
                         (unsigned)rs_.plan().total(),
                         (unsigned)rs_.plan().data_count);

  if (map.size() < threshold()) {
    res.outcome = ShardOutcome::Accumulating;
    return res;
  }

  Logger::instance().log(LogLevel::INFO,
                         "threshold reached for %s, reconstructing",
                         shard.filename.c_str());
  auto blob = rs_.reconstruct(map, (size_t)shard.original_len);
  if (!blob) {
    res.outcome = ShardOutcome::DecodeFailed;
  } else if (sha256_hex(*blob) != shard.full_file_checksum) {
    res.outcome = ShardOutcome::ChecksumMismatch;
  } else {
    res.outcome = ShardOutcome::Verified;
    res.blob = std::move(*blob);
    map.clear();
    return res;
  }

  if (opts_.clear_on_failure)
    map.clear();
  return res;
}

std::vector<SampleReport> ShardAccumulator::pending_samples() const {
  std::lock_guard<std::mutex> lk(mtx_);
  std::vector<SampleReport> out;
  for (const auto &kv : entries_) {
    if (!kv.second.empty() && kv.second.size() < threshold())
      out.push_back(SampleReport{kv.first, kv.second.size()});
  }
  return out;
}

size_t ShardAccumulator::count(const std::string &filename) const {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = entries_.find(filename);
  return it == entries_.end() ? 0 : it->second.size();
}

} // namespace dasim
