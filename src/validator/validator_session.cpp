
#include "validator_session.hpp"
#include "logging.hpp"

namespace dasim {

ValidatorSession::ValidatorSession(ShardAccumulator &acc, OutcomeSink &sink,
                                   HandshakeVerifier &verifier)
    : acc_(acc), sink_(sink), verifier_(verifier),
      admitted_(!verifier.requires_handshake()) {}

bool ValidatorSession::on_line(const std::string &line, std::string *err) {
  if (is_blank_line(line))
    return true;
  bytes_received_ += line.size();

  Message msg;
  if (!decode_message(line, msg, err))
    return false;
  messages_++;

  if (!admitted_) {
    const Handshake *hs = std::get_if<Handshake>(&msg);
    if (!hs) {
      if (err)
        *err = std::string("expected Handshake, got ") + message_kind(msg);
      return false;
    }
    if (!verifier_.admit(*hs)) {
      if (err)
        *err = "handshake signature rejected";
      return false;
    }
    admitted_ = true;
    Logger::instance().log(LogLevel::INFO, "peer handshake verified (%s)",
                           verifier_.name());
    return true;
  }

  if (auto *t = std::get_if<NaiveTransfer>(&msg))
    on_naive(*t);
  else if (auto *s = std::get_if<DasShard>(&msg))
    on_shard(*s);
  else
    Logger::instance().log(LogLevel::DEBUG, "ignoring peer handshake");
  return true;
}

void ValidatorSession::on_naive(const NaiveTransfer &t) {
  Logger::instance().log(LogLevel::INFO, "receiving full blob %s (naive)",
                         t.filename.c_str());
  if (sha256_hex(t.data) == t.checksum)
    sink_.naive_received(t.filename, t.data);
  else
    sink_.naive_corrupted(t.filename);
}

void ValidatorSession::on_shard(const DasShard &s) {
  InsertResult r = acc_.insert(s);
  switch (r.outcome) {
  case ShardOutcome::Verified:
    sink_.reconstructed(s.filename, r.blob);
    break;
  case ShardOutcome::ChecksumMismatch:
  case ShardOutcome::DecodeFailed:
    sink_.reconstruction_failed(s.filename, r.outcome);
    break;
  default:
    break;
  }
}

void ValidatorSession::finish() {
  for (const auto &r : acc_.pending_samples())
    sink_.availability_verified(r, bytes_received_);
}

} // namespace dasim
