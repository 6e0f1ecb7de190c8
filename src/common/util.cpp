
#include "util.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace dasim {

bool parse_host_port(const std::string &s, std::string &host, uint16_t &port) {
  auto pos = s.rfind(':');
  if (pos == std::string::npos)
    return false;
  host = s.substr(0, pos);
  if (host.size() >= 2 && host.front() == '[' && host.back() == ']')
    host = host.substr(1, host.size() - 2);
  try {
    int p = std::stoi(s.substr(pos + 1));
    if (p < 0 || p > 65535)
      return false;
    port = (uint16_t)p;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

std::string format_bytes(size_t n) {
  char buf[32];
  if (n < 1024)
    std::snprintf(buf, sizeof(buf), "%zu B", n);
  else if (n < 1024 * 1024)
    std::snprintf(buf, sizeof(buf), "%.2f KB", n / 1024.0);
  else
    std::snprintf(buf, sizeof(buf), "%.2f MB", n / 1024.0 / 1024.0);
  return buf;
}

std::string base_name(const std::string &path) {
  auto pos = path.find_last_of("/\\");
  if (pos == std::string::npos)
    return path;
  return path.substr(pos + 1);
}

bool read_file(const std::string &path, Bytes &out) {
  // A directory opens fine but throws from the first read.
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec))
    return false;
  std::ifstream in(path, std::ios::binary);
  if (!in)
    return false;
  try {
    out.assign(std::istreambuf_iterator<char>(in),
               std::istreambuf_iterator<char>());
  } catch (const std::ios_base::failure &) {
    return false;
  }
  return !in.bad();
}

bool write_file(const std::string &path, const Bytes &data) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out)
    return false;
  out.write((const char *)data.data(), (std::streamsize)data.size());
  return (bool)out;
}

} // namespace dasim
