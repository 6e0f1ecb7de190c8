
#include "outcome_sink.hpp"
#include "logging.hpp"
#include "util.hpp"

namespace dasim {

FileOutcomeSink::FileOutcomeSink(std::string out_dir)
    : out_dir_(std::move(out_dir)) {}

std::string FileOutcomeSink::output_path(const std::string &prefix,
                                         const std::string &filename) const {
  std::string name = prefix + base_name(filename);
  if (out_dir_.empty() || out_dir_ == ".")
    return name;
  if (out_dir_.back() == '/')
    return out_dir_ + name;
  return out_dir_ + "/" + name;
}

void FileOutcomeSink::naive_received(const std::string &filename,
                                     const Bytes &data) {
  Logger::instance().log(LogLevel::INFO, "integrity verified: %s (%s)",
                         filename.c_str(), format_bytes(data.size()).c_str());
  std::string path = output_path("recv_", filename);
  if (!write_file(path, data))
    Logger::instance().log(LogLevel::ERROR, "cannot write %s", path.c_str());
}

void FileOutcomeSink::naive_corrupted(const std::string &filename) {
  Logger::instance().log(LogLevel::WARN,
                         "corrupted transfer of %s, payload discarded",
                         filename.c_str());
}

void FileOutcomeSink::reconstructed(const std::string &filename,
                                    const Bytes &data) {
  Logger::instance().log(LogLevel::INFO, "reconstruction successful: %s (%s)",
                         filename.c_str(), format_bytes(data.size()).c_str());
  std::string path = output_path("reconstructed_", filename);
  if (!write_file(path, data))
    Logger::instance().log(LogLevel::ERROR, "cannot write %s", path.c_str());
}

void FileOutcomeSink::reconstruction_failed(const std::string &filename,
                                            ShardOutcome why) {
  Logger::instance().log(LogLevel::WARN,
                         "reconstruction of %s failed: %s",
                         filename.c_str(), outcome_name(why));
}

void FileOutcomeSink::availability_verified(const SampleReport &report,
                                            size_t bytes_received) {
  Logger::instance().log(LogLevel::INFO,
                         "light client: %s sampled %zu random shards, data "
                         "availability verified (>99%% prob), bandwidth %s",
                         report.filename.c_str(), report.count,
                         format_bytes(bytes_received).c_str());
}

} // namespace dasim
