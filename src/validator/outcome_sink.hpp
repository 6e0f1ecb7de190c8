
#pragma once
#include <string>
#include "shard_accumulator.hpp"

namespace dasim {

// Receives the user-visible results of a validator session.
class OutcomeSink {
public:
    virtual ~OutcomeSink() = default;
    virtual void naive_received(const std::string& filename, const Bytes& data) = 0;
    virtual void naive_corrupted(const std::string& filename) = 0;
    virtual void reconstructed(const std::string& filename, const Bytes& data) = 0;
    virtual void reconstruction_failed(const std::string& filename, ShardOutcome why) = 0;
    virtual void availability_verified(const SampleReport& report, size_t bytes_received) = 0;
};

// Logs every outcome and writes recv_<name> / reconstructed_<name> into
// out_dir.
class FileOutcomeSink : public OutcomeSink {
public:
    explicit FileOutcomeSink(std::string out_dir);
    void naive_received(const std::string& filename, const Bytes& data) override;
    void naive_corrupted(const std::string& filename) override;
    void reconstructed(const std::string& filename, const Bytes& data) override;
    void reconstruction_failed(const std::string& filename, ShardOutcome why) override;
    void availability_verified(const SampleReport& report, size_t bytes_received) override;

    std::string output_path(const std::string& prefix, const std::string& filename) const;

private:
    std::string out_dir_;
};

} // namespace dasim
