
#pragma once
#include <string>
#include <cstdint>
#include <vector>

namespace dasim {

using Bytes = std::vector<uint8_t>;

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);

// "512 B", "1.50 KB", "2.00 MB"
std::string format_bytes(size_t n);

// Final path component; "" stays "".
std::string base_name(const std::string& path);

bool read_file(const std::string& path, Bytes& out);
bool write_file(const std::string& path, const Bytes& data);

} // namespace dasim
