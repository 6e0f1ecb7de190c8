
#pragma once
#include <asio.hpp>
#include <memory>
#include <string>
#include "crypto.hpp"
#include "fec.hpp"
#include "outcome_sink.hpp"
#include "shard_accumulator.hpp"
#include "validator_session.hpp"

namespace dasim {

struct ValidatorConfig {
    std::string listen_host{"0.0.0.0"};
    uint16_t listen_port{8080};
    std::string output_dir{"."};
    bool verify_handshake{false};
    bool clear_on_failure{false};
    // Stop accepting after this many connections; 0 means never.
    size_t max_sessions{0};
};

// Accepts one connection at a time and runs it to completion before the
// next accept is issued.
class Validator {
public:
    using tcp = asio::ip::tcp;

    Validator(asio::io_context& io, const ValidatorConfig& cfg, const Identity& id, OutcomeSink& sink);
    // Binds and listens; throws std::system_error on failure.
    void start();
    uint16_t local_port() const;
    size_t sessions() const { return sessions_; }
    const ShardAccumulator& accumulator() const { return acc_; }

private:
    struct Conn {
        tcp::socket sock;
        asio::streambuf inbuf;
        std::string peer;
        std::string hello;
        std::unique_ptr<ValidatorSession> session;
        explicit Conn(tcp::socket s) : sock(std::move(s)) {}
    };

    void do_accept();
    void send_handshake(std::shared_ptr<Conn> c);
    void do_read(std::shared_ptr<Conn> c);
    bool handle_line(const std::shared_ptr<Conn>& c, std::string line);
    void end_session(std::shared_ptr<Conn> c, bool report);

    ValidatorConfig cfg_;
    const Identity& id_;
    OutcomeSink& sink_;
    tcp::acceptor acceptor_;
    ReedSolomon rs_;
    ShardAccumulator acc_;
    std::unique_ptr<HandshakeVerifier> verifier_;
    size_t sessions_{0};
};

} // namespace dasim
