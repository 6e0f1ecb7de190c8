
#pragma once
#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <random>
#include <string>
#include <vector>
#include <unistd.h>

#include "crypto.hpp"
#include "validator/outcome_sink.hpp"

namespace dasim_test {

inline dasim::Bytes random_blob(size_t n, uint32_t seed) {
    std::mt19937 rng(seed);
    dasim::Bytes b(n);
    for (auto& v : b) v = static_cast<uint8_t>(rng() & 0xff);
    return b;
}

struct RecordingSink : public dasim::OutcomeSink {
    struct Received {
        std::string filename;
        dasim::Bytes data;
    };
    struct Failure {
        std::string filename;
        dasim::ShardOutcome why;
    };

    std::vector<Received> naive;
    std::vector<std::string> corrupted;
    std::vector<Received> rebuilt;
    std::vector<Failure> failures;
    std::vector<dasim::SampleReport> samples;

    void naive_received(const std::string& f, const dasim::Bytes& d) override { naive.push_back({f, d}); }
    void naive_corrupted(const std::string& f) override { corrupted.push_back(f); }
    void reconstructed(const std::string& f, const dasim::Bytes& d) override { rebuilt.push_back({f, d}); }
    void reconstruction_failed(const std::string& f, dasim::ShardOutcome why) override { failures.push_back({f, why}); }
    void availability_verified(const dasim::SampleReport& r, size_t) override { samples.push_back(r); }
};

// Scratch directory removed on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<unsigned> seq{0};
        path_ = std::filesystem::temp_directory_path() /
                ("dasim_test_" + std::to_string(::getpid()) + "_" + std::to_string(seq++));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    std::string path() const { return path_.string(); }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

} // namespace dasim_test
