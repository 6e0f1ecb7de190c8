
#pragma once
#include <string>
#include "crypto.hpp"
#include "outcome_sink.hpp"
#include "protocol.hpp"
#include "shard_accumulator.hpp"

namespace dasim {

// Message handling for one validator connection, independent of the socket.
class ValidatorSession {
public:
    ValidatorSession(ShardAccumulator& acc, OutcomeSink& sink, HandshakeVerifier& verifier);

    // Handles one received line. Returns false when the connection must end
    // (unparseable line, or a handshake the verifier refuses).
    bool on_line(const std::string& line, std::string* err);

    // Connection end: report every filename still below threshold.
    void finish();

    size_t bytes_received() const { return bytes_received_; }
    size_t messages() const { return messages_; }

private:
    void on_naive(const NaiveTransfer& t);
    void on_shard(const DasShard& s);

    ShardAccumulator& acc_;
    OutcomeSink& sink_;
    HandshakeVerifier& verifier_;
    bool admitted_{false};
    size_t bytes_received_{0};
    size_t messages_{0};
};

} // namespace dasim
