
#include "proposer.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <chrono>
#include <stdexcept>

namespace dasim {

Proposer::Proposer(asio::io_context &io, const ProposerConfig &cfg,
                   const Identity &id)
    : io_(io), cfg_(cfg), id_(id), rs_(), rng_(std::random_device{}()) {}

SendReport Proposer::run() {
  Bytes data;
  if (!read_file(cfg_.file_path, data))
    throw std::runtime_error("cannot read file " + cfg_.file_path);

  std::string filename = base_name(cfg_.file_path);
  SendReport report;
  report.mode = cfg_.mode;
  report.file_bytes = data.size();

  Logger::instance().log(LogLevel::INFO, "target %s:%u, payload %s (%s), strategy %s",
                         cfg_.peer_host.c_str(), (unsigned)cfg_.peer_port,
                         filename.c_str(), format_bytes(data.size()).c_str(),
                         mode_name(cfg_.mode));

  tcp::resolver resolver(io_);
  tcp::socket sock(io_);
  asio::connect(sock,
                resolver.resolve(cfg_.peer_host, std::to_string(cfg_.peer_port)));

  std::string hello = encode_line(make_handshake(id_, unix_now()));
  asio::write(sock, asio::buffer(hello));

  auto start = std::chrono::steady_clock::now();
  for (const Message &m : plan_transfer(filename, data, cfg_.mode, rs_, rng_)) {
    std::string line = encode_line(m);
    report.wire_bytes += line.size() - 1;
    report.messages++;
    asio::write(sock, asio::buffer(line));
  }
  report.seconds = std::chrono::duration<double>(
                       std::chrono::steady_clock::now() - start)
                       .count();

  sock.shutdown(tcp::socket::shutdown_send);
  drain(sock);
  std::error_code ec;
  sock.close(ec);
  return report;
}

// Reads the validator's lines until it closes its side, so nothing unread
// is left behind when the socket closes.
void Proposer::drain(tcp::socket &sock) {
  asio::streambuf buf;
  for (;;) {
    std::error_code ec;
    std::size_t n = asio::read_until(sock, buf, '\n', ec);
    if (ec) {
      if (ec != asio::error::eof)
        Logger::instance().log(LogLevel::WARN, "read from validator failed: %s",
                               ec.message().c_str());
      return;
    }
    std::string line(asio::buffers_begin(buf.data()),
                     asio::buffers_begin(buf.data()) + (n - 1));
    buf.consume(n);
    Message msg;
    std::string err;
    if (decode_message(line, msg, &err))
      Logger::instance().log(LogLevel::DEBUG, "validator sent %s",
                             message_kind(msg));
    else
      Logger::instance().log(LogLevel::DEBUG, "unparseable validator line: %s",
                             err.c_str());
  }
}

void log_send_report(const SendReport &r) {
  double mb = r.wire_bytes / 1024.0 / 1024.0;
  double mbps = r.seconds > 0 ? mb / r.seconds : 0.0;
  Logger::instance().log(LogLevel::INFO,
                         "mode %s: latency %.3f ms, throughput %.2f MB/s, "
                         "%zu messages, wire %s",
                         mode_name(r.mode), r.seconds * 1000.0, mbps,
                         r.messages, format_bytes(r.wire_bytes).c_str());
  if (r.file_bytes == 0)
    return;
  if (r.wire_bytes < r.file_bytes) {
    double saved = 100.0 * (double)(r.file_bytes - r.wire_bytes) / r.file_bytes;
    Logger::instance().log(LogLevel::INFO, "efficiency: %.2f%% saved", saved);
  } else {
    double overhead = 100.0 * ((double)r.wire_bytes / r.file_bytes - 1.0);
    Logger::instance().log(LogLevel::INFO, "overhead: %.2f%%", overhead);
  }
}

} // namespace dasim
