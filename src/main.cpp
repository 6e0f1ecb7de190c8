
#include "crypto.hpp"
#include "logging.hpp"
#include "proposer/proposer.hpp"
#include "util.hpp"
#include "validator/outcome_sink.hpp"
#include "validator/validator.hpp"
#include <asio.hpp>
#include <cstdlib>
#include <iostream>

using namespace dasim;

static void usage() {
  std::cerr << "usage:\n"
               "  dasim listen [--port P] [--host H] [--out DIR]\n"
               "               [--verify-handshake] [--clear-on-failure]\n"
               "               [--max-sessions N] [--log-level L]\n"
               "  dasim send --peer HOST[:PORT] --file PATH\n"
               "             --mode naive|das-full|das-sample [--port P]\n"
               "             [--log-level L]\n";
}

static int run_listen(const ValidatorConfig &cfg, const Identity &id) {
  asio::io_context io;
  FileOutcomeSink sink(cfg.output_dir);
  Validator v(io, cfg, id, sink);
  v.start();
  io.run();
  return 0;
}

static int run_send(const ProposerConfig &cfg, const Identity &id) {
  asio::io_context io;
  Proposer p(io, cfg, id);
  log_send_report(p.run());
  return 0;
}

int main(int argc, char **argv) {
  if (argc < 2) {
    usage();
    return 1;
  }
  std::string cmd = argv[1];
  if (cmd != "listen" && cmd != "send") {
    usage();
    return 1;
  }

  uint16_t port = 8080;
  std::string host = "0.0.0.0";
  std::string out_dir = ".";
  std::string peer, file, mode_str, level_str;
  bool verify = false, clear_on_failure = false;
  size_t max_sessions = 0;

  try {
    for (int i = 2; i < argc; i++) {
      std::string a = argv[i];
      auto next = [&](int &i) -> std::string {
        if (i + 1 < argc)
          return std::string(argv[++i]);
        std::cerr << "missing value for " << a << "\n";
        std::exit(1);
      };
      if (a == "--port" || a == "-p") {
        int p = std::stoi(next(i));
        if (p < 0 || p > 65535) {
          std::cerr << "bad port" << std::endl;
          return 1;
        }
        port = (uint16_t)p;
      } else if (a == "--host")
        host = next(i);
      else if (a == "--out")
        out_dir = next(i);
      else if (a == "--peer")
        peer = next(i);
      else if (a == "--file" || a == "-f")
        file = next(i);
      else if (a == "--mode" || a == "-m")
        mode_str = next(i);
      else if (a == "--log-level")
        level_str = next(i);
      else if (a == "--verify-handshake")
        verify = true;
      else if (a == "--clear-on-failure")
        clear_on_failure = true;
      else if (a == "--max-sessions")
        max_sessions = (size_t)std::stoul(next(i));
      else {
        std::cerr << "unknown option " << a << "\n";
        usage();
        return 1;
      }
    }
  } catch (const std::logic_error &e) {
    std::cerr << "bad numeric option: " << e.what() << std::endl;
    return 1;
  }

  if (!level_str.empty()) {
    LogLevel lvl;
    if (!parse_log_level(level_str, lvl)) {
      std::cerr << "bad log level" << std::endl;
      return 1;
    }
    Logger::instance().set_level(lvl);
  }

  if (!crypto_init()) {
    Logger::instance().log(LogLevel::ERROR, "libsodium initialisation failed");
    return 1;
  }

  try {
    Identity id = Identity::generate();
    Logger::instance().log(LogLevel::INFO, "=== DAS exchange simulator ===");

    if (cmd == "listen") {
      ValidatorConfig cfg;
      cfg.listen_host = host;
      cfg.listen_port = port;
      cfg.output_dir = out_dir;
      cfg.verify_handshake = verify;
      cfg.clear_on_failure = clear_on_failure;
      cfg.max_sessions = max_sessions;
      return run_listen(cfg, id);
    }

    ProposerConfig cfg;
    if (peer.empty() || file.empty() || mode_str.empty()) {
      usage();
      return 1;
    }
    if (!parse_host_port(peer, cfg.peer_host, cfg.peer_port)) {
      cfg.peer_host = peer;
      cfg.peer_port = port;
    }
    if (!parse_transfer_mode(mode_str, cfg.mode)) {
      std::cerr << "bad mode " << mode_str << std::endl;
      return 1;
    }
    cfg.file_path = file;
    return run_send(cfg, id);
  } catch (const std::exception &e) {
    Logger::instance().log(LogLevel::ERROR, "%s", e.what());
    return 1;
  }
}
