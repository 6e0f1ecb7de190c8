
#include "transfer_plan.hpp"
#include "crypto.hpp"
#include <algorithm>
#include <numeric>

namespace dasim {

const char *mode_name(TransferMode m) {
  switch (m) {
  case TransferMode::Naive:
    return "naive";
  case TransferMode::DasFull:
    return "das-full";
  default:
    return "das-sample";
  }
}

bool parse_transfer_mode(const std::string &s, TransferMode &out) {
  if (s == "naive")
    out = TransferMode::Naive;
  else if (s == "das-full")
    out = TransferMode::DasFull;
  else if (s == "das-sample")
    out = TransferMode::DasSample;
  else
    return false;
  return true;
}

std::vector<Message> plan_transfer(const std::string &filename,
                                   const Bytes &blob, TransferMode mode,
                                   const ReedSolomon &rs, std::mt19937 &rng) {
  std::vector<Message> out;
  std::string checksum = sha256_hex(blob);

  if (mode == TransferMode::Naive) {
    out.push_back(NaiveTransfer{filename, blob, checksum});
    return out;
  }

  std::vector<Bytes> shards = rs.encode(blob);
  std::vector<size_t> order(shards.size());
  std::iota(order.begin(), order.end(), 0);
  std::shuffle(order.begin(), order.end(), rng);

  size_t count = mode == TransferMode::DasSample ? kSampleShards
                                                 : (size_t)rs.plan().data_count;
  count = std::min(count, order.size());
  for (size_t i = 0; i < count; i++) {
    size_t idx = order[i];
    DasShard s;
    s.filename = filename;
    s.original_len = blob.size();
    s.index = idx;
    s.data = std::move(shards[idx]);
    s.full_file_checksum = checksum;
    out.push_back(std::move(s));
  }
  return out;
}

} // namespace dasim
