
#include "validator.hpp"
#include "logging.hpp"

namespace dasim {

Validator::Validator(asio::io_context &io, const ValidatorConfig &cfg,
                     const Identity &id, OutcomeSink &sink)
    : cfg_(cfg), id_(id), sink_(sink), acceptor_(io), rs_(),
      acc_(rs_, AccumulatorOptions{cfg.clear_on_failure}) {
  if (cfg_.verify_handshake)
    verifier_.reset(new Ed25519Verifier());
  else
    verifier_.reset(new PermissiveVerifier());
}

void Validator::start() {
  tcp::endpoint ep(asio::ip::make_address(cfg_.listen_host), cfg_.listen_port);
  acceptor_.open(ep.protocol());
  acceptor_.set_option(asio::socket_base::reuse_address(true));
  acceptor_.bind(ep);
  acceptor_.listen();
  Logger::instance().log(LogLevel::INFO, "validator listening on %s:%u",
                         cfg_.listen_host.c_str(), (unsigned)local_port());
  do_accept();
}

uint16_t Validator::local_port() const {
  std::error_code ec;
  auto ep = acceptor_.local_endpoint(ec);
  return ec ? 0 : ep.port();
}

void Validator::do_accept() {
  acceptor_.async_accept([this](std::error_code ec, tcp::socket sock) {
    if (ec) {
      if (ec == asio::error::operation_aborted)
        return;
      // Retrying at once spins on EMFILE and similar; stop accepting so
      // io_context::run returns.
      Logger::instance().log(LogLevel::ERROR,
                             "accept failed: %s, no longer accepting",
                             ec.message().c_str());
      std::error_code ignored;
      acceptor_.close(ignored);
      return;
    }
    auto c = std::make_shared<Conn>(std::move(sock));
    std::error_code ec2;
    auto remote = c->sock.remote_endpoint(ec2);
    c->peer = ec2 ? std::string("?")
                  : remote.address().to_string() + ":" +
                        std::to_string(remote.port());
    c->session.reset(new ValidatorSession(acc_, sink_, *verifier_));
    Logger::instance().log(LogLevel::INFO, "connection from %s",
                           c->peer.c_str());
    send_handshake(c);
  });
}

void Validator::send_handshake(std::shared_ptr<Conn> c) {
  c->hello = encode_line(make_handshake(id_, unix_now()));
  asio::async_write(
      c->sock, asio::buffer(c->hello), [this, c](std::error_code ec, std::size_t) {
        if (ec) {
          Logger::instance().log(LogLevel::ERROR, "auth failed for %s: %s",
                                 c->peer.c_str(), ec.message().c_str());
          end_session(c, false);
          return;
        }
        Logger::instance().log(LogLevel::INFO,
                               "session secured (ed25519, peer check: %s)",
                               verifier_->name());
        do_read(c);
      });
}

void Validator::do_read(std::shared_ptr<Conn> c) {
  asio::async_read_until(
      c->sock, c->inbuf, '\n', [this, c](std::error_code ec, std::size_t n) {
        bool at_eof = false;
        std::string line;
        if (!ec) {
          line.assign(asio::buffers_begin(c->inbuf.data()),
                      asio::buffers_begin(c->inbuf.data()) + (n - 1));
          c->inbuf.consume(n);
        } else if (ec == asio::error::eof && c->inbuf.size() > 0) {
          // Trailing line without a terminator still counts.
          at_eof = true;
          line.assign(asio::buffers_begin(c->inbuf.data()),
                      asio::buffers_end(c->inbuf.data()));
          c->inbuf.consume(c->inbuf.size());
        } else {
          if (ec != asio::error::eof)
            Logger::instance().log(LogLevel::WARN, "read from %s failed: %s",
                                   c->peer.c_str(), ec.message().c_str());
          end_session(c, true);
          return;
        }
        if (!handle_line(c, std::move(line)) || at_eof) {
          end_session(c, true);
          return;
        }
        do_read(c);
      });
}

bool Validator::handle_line(const std::shared_ptr<Conn> &c, std::string line) {
  if (!line.empty() && line.back() == '\r')
    line.pop_back();
  std::string err;
  if (c->session->on_line(line, &err))
    return true;
  Logger::instance().log(LogLevel::ERROR, "closing connection from %s: %s",
                         c->peer.c_str(), err.c_str());
  return false;
}

void Validator::end_session(std::shared_ptr<Conn> c, bool report) {
  if (report)
    c->session->finish();
  Logger::instance().log(LogLevel::INFO,
                         "connection from %s closed (%zu messages, %s)",
                         c->peer.c_str(), c->session->messages(),
                         format_bytes(c->session->bytes_received()).c_str());
  std::error_code ec;
  c->sock.shutdown(tcp::socket::shutdown_both, ec);
  c->sock.close(ec);

  sessions_++;
  if (cfg_.max_sessions && sessions_ >= cfg_.max_sessions) {
    Logger::instance().log(LogLevel::INFO,
                           "session limit %zu reached, no longer accepting",
                           cfg_.max_sessions);
    acceptor_.close(ec);
    return;
  }
  do_accept();
}

} // namespace dasim
