
#pragma once
#include <random>
#include <string>
#include <vector>
#include "fec.hpp"
#include "protocol.hpp"

namespace dasim {

enum class TransferMode {
    Naive,      // whole blob in one message
    DasFull,    // k random shards, enough to reconstruct
    DasSample   // kSampleShards random shards, light client
};

// Shards sent in sampling mode; deliberately below k.
constexpr size_t kSampleShards = 2;

const char* mode_name(TransferMode m);
bool parse_transfer_mode(const std::string& s, TransferMode& out);

// Messages the proposer sends for one blob, in wire order.
std::vector<Message> plan_transfer(const std::string& filename, const Bytes& blob,
                                   TransferMode mode, const ReedSolomon& rs,
                                   std::mt19937& rng);

} // namespace dasim
