
#include "protocol.hpp"
#include <cctype>
#include <nlohmann/json.hpp>

namespace dasim {

using json = nlohmann::json;

namespace {

bool fail(std::string *err, const std::string &why) {
  if (err)
    *err = why;
  return false;
}

bool get_bytes(const json &obj, const char *key, Bytes &out, std::string *err) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_array())
    return fail(err, std::string("missing byte array '") + key + "'");
  out.clear();
  out.reserve(it->size());
  for (const auto &v : *it) {
    if (!v.is_number_unsigned() || v.get<uint64_t>() > 255)
      return fail(err, std::string("non-byte value in '") + key + "'");
    out.push_back((uint8_t)v.get<uint64_t>());
  }
  return true;
}

bool get_u64(const json &obj, const char *key, uint64_t &out,
             std::string *err) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_number_unsigned())
    return fail(err, std::string("missing unsigned integer '") + key + "'");
  out = it->get<uint64_t>();
  return true;
}

bool get_string(const json &obj, const char *key, std::string &out,
                std::string *err) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string())
    return fail(err, std::string("missing string '") + key + "'");
  out = it->get<std::string>();
  return true;
}

struct ToJson {
  json operator()(const Handshake &h) const {
    json body;
    body["pubkey"] = h.pubkey;
    body["sig"] = h.sig;
    body["ts"] = h.ts;
    json j;
    j["Handshake"] = std::move(body);
    return j;
  }
  json operator()(const NaiveTransfer &t) const {
    json body;
    body["filename"] = t.filename;
    body["data"] = t.data;
    body["checksum"] = t.checksum;
    json j;
    j["NaiveTransfer"] = std::move(body);
    return j;
  }
  json operator()(const DasShard &s) const {
    json body;
    body["filename"] = s.filename;
    body["original_len"] = s.original_len;
    body["index"] = s.index;
    body["data"] = s.data;
    body["full_file_checksum"] = s.full_file_checksum;
    json j;
    j["DasShard"] = std::move(body);
    return j;
  }
};

} // namespace

const char *message_kind(const Message &m) {
  switch (m.index()) {
  case 0:
    return "Handshake";
  case 1:
    return "NaiveTransfer";
  default:
    return "DasShard";
  }
}

std::string encode_line(const Message &m) {
  json j = std::visit(ToJson{}, m);
  std::string line = j.dump(-1, ' ', false, json::error_handler_t::replace);
  line.push_back('\n');
  return line;
}

bool decode_message(const std::string &line, Message &out, std::string *err) {
  json j;
  try {
    j = json::parse(line);
  } catch (const json::parse_error &e) {
    return fail(err, e.what());
  }
  if (!j.is_object() || j.size() != 1)
    return fail(err, "expected an object with exactly one variant tag");

  auto it = j.begin();
  const std::string tag = it.key();
  const json &body = it.value();
  if (!body.is_object())
    return fail(err, "variant body for '" + tag + "' is not an object");

  if (tag == "Handshake") {
    Handshake h;
    if (!get_bytes(body, "pubkey", h.pubkey, err) ||
        !get_bytes(body, "sig", h.sig, err) || !get_u64(body, "ts", h.ts, err))
      return false;
    out = std::move(h);
    return true;
  }
  if (tag == "NaiveTransfer") {
    NaiveTransfer t;
    if (!get_string(body, "filename", t.filename, err) ||
        !get_bytes(body, "data", t.data, err) ||
        !get_string(body, "checksum", t.checksum, err))
      return false;
    out = std::move(t);
    return true;
  }
  if (tag == "DasShard") {
    DasShard s;
    if (!get_string(body, "filename", s.filename, err) ||
        !get_u64(body, "original_len", s.original_len, err) ||
        !get_u64(body, "index", s.index, err) ||
        !get_bytes(body, "data", s.data, err) ||
        !get_string(body, "full_file_checksum", s.full_file_checksum, err))
      return false;
    out = std::move(s);
    return true;
  }
  return fail(err, "unknown message variant '" + tag + "'");
}

bool is_blank_line(const std::string &line) {
  for (char c : line)
    if (!std::isspace((unsigned char)c))
      return false;
  return true;
}

} // namespace dasim
