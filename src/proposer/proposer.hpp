
#pragma once
#include <asio.hpp>
#include <string>
#include "crypto.hpp"
#include "transfer_plan.hpp"

namespace dasim {

struct ProposerConfig {
    std::string peer_host;
    uint16_t peer_port{8080};
    std::string file_path;
    TransferMode mode{TransferMode::Naive};
};

struct SendReport {
    TransferMode mode{TransferMode::Naive};
    size_t file_bytes{0};
    size_t wire_bytes{0};
    size_t messages{0};
    double seconds{0};
};

// One synchronous transfer to one validator.
class Proposer {
public:
    using tcp = asio::ip::tcp;

    Proposer(asio::io_context& io, const ProposerConfig& cfg, const Identity& id);
    // Throws std::runtime_error if the file cannot be read and
    // std::system_error on connect/write failures.
    SendReport run();

private:
    void drain(tcp::socket& sock);

    asio::io_context& io_;
    ProposerConfig cfg_;
    const Identity& id_;
    ReedSolomon rs_;
    std::mt19937 rng_;
};

void log_send_report(const SendReport& r);

} // namespace dasim
