
#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <variant>
#include <vector>
#include "util.hpp"

namespace dasim {

// Wire format: one JSON object per '\n'-terminated line, externally tagged
// by variant name. Byte strings travel as arrays of numbers, so a dumped
// message never contains a raw newline.

struct Handshake {
    Bytes pubkey;
    Bytes sig;
    uint64_t ts{0};
};

struct NaiveTransfer {
    std::string filename;
    Bytes data;
    std::string checksum;
};

struct DasShard {
    std::string filename;
    uint64_t original_len{0};
    uint64_t index{0};
    Bytes data;
    std::string full_file_checksum;
};

using Message = std::variant<Handshake, NaiveTransfer, DasShard>;

const char* message_kind(const Message& m);

// Serialized message followed by '\n'.
std::string encode_line(const Message& m);

// Parses one line (with or without its trailing newline). On failure err
// receives a short reason.
bool decode_message(const std::string& line, Message& out, std::string* err);

bool is_blank_line(const std::string& line);

} // namespace dasim
