
#include "fec.hpp"
#include <algorithm>
#include <stdexcept>

namespace dasim {

namespace {

struct GfTables {
  uint8_t exp[512];
  uint8_t log[256];
  GfTables() {
    unsigned x = 1;
    log[0] = 0;
    for (int i = 0; i < 255; i++) {
      exp[i] = (uint8_t)x;
      log[x] = (uint8_t)i;
      x <<= 1;
      if (x & 0x100)
        x ^= 0x11d;
    }
    for (int i = 255; i < 512; i++)
      exp[i] = exp[i - 255];
  }
};

const GfTables &gf() {
  static const GfTables t;
  return t;
}

uint8_t gf_mul(uint8_t a, uint8_t b) {
  if (a == 0 || b == 0)
    return 0;
  const GfTables &t = gf();
  return t.exp[t.log[a] + t.log[b]];
}

uint8_t gf_inv(uint8_t a) {
  const GfTables &t = gf();
  return t.exp[255 - t.log[a]];
}

uint8_t gf_pow(uint8_t a, size_t n) {
  if (n == 0)
    return 1;
  if (a == 0)
    return 0;
  const GfTables &t = gf();
  return t.exp[(t.log[a] * n) % 255];
}

// dst ^= c * src
void mul_add(Bytes &dst, const Bytes &src, uint8_t c) {
  if (c == 0)
    return;
  const GfTables &t = gf();
  unsigned lc = t.log[c];
  for (size_t i = 0; i < dst.size(); i++) {
    uint8_t s = src[i];
    if (s)
      dst[i] ^= t.exp[lc + t.log[s]];
  }
}

using Matrix = std::vector<std::vector<uint8_t>>;

Matrix multiply(const Matrix &a, const Matrix &b) {
  size_t rows = a.size(), inner = b.size(), cols = b.empty() ? 0 : b[0].size();
  Matrix out(rows, std::vector<uint8_t>(cols, 0));
  for (size_t r = 0; r < rows; r++)
    for (size_t c = 0; c < cols; c++) {
      uint8_t v = 0;
      for (size_t i = 0; i < inner; i++)
        v ^= gf_mul(a[r][i], b[i][c]);
      out[r][c] = v;
    }
  return out;
}

// Gauss-Jordan elimination, in place. False if m is singular.
bool invert(Matrix &m) {
  size_t n = m.size();
  Matrix inv(n, std::vector<uint8_t>(n, 0));
  for (size_t i = 0; i < n; i++)
    inv[i][i] = 1;
  for (size_t c = 0; c < n; c++) {
    size_t pivot = c;
    while (pivot < n && m[pivot][c] == 0)
      pivot++;
    if (pivot == n)
      return false;
    std::swap(m[c], m[pivot]);
    std::swap(inv[c], inv[pivot]);
    uint8_t s = gf_inv(m[c][c]);
    for (size_t j = 0; j < n; j++) {
      m[c][j] = gf_mul(m[c][j], s);
      inv[c][j] = gf_mul(inv[c][j], s);
    }
    for (size_t r = 0; r < n; r++) {
      uint8_t f = m[r][c];
      if (r == c || f == 0)
        continue;
      for (size_t j = 0; j < n; j++) {
        m[r][j] ^= gf_mul(f, m[c][j]);
        inv[r][j] ^= gf_mul(f, inv[c][j]);
      }
    }
  }
  m.swap(inv);
  return true;
}

} // namespace

Bytes pad_to_multiple(const Bytes &data, size_t k) {
  Bytes padded = data;
  size_t rem = k ? data.size() % k : 0;
  if (rem != 0)
    padded.resize(data.size() + (k - rem), 0);
  return padded;
}

ReedSolomon::ReedSolomon(const ShardPlan &plan) : plan_(plan) {
  if (plan_.data_count == 0 || plan_.total() > 256)
    throw std::invalid_argument("reed-solomon: need 1..256 shards with k > 0");

  size_t k = plan_.data_count;
  size_t n = plan_.total();
  Matrix vand(n, std::vector<uint8_t>(k, 0));
  for (size_t r = 0; r < n; r++)
    for (size_t c = 0; c < k; c++)
      vand[r][c] = gf_pow((uint8_t)r, c);

  Matrix top(vand.begin(), vand.begin() + k);
  if (!invert(top))
    throw std::logic_error("reed-solomon: vandermonde top block is singular");
  matrix_ = multiply(vand, top);
}

size_t ReedSolomon::shard_size(size_t blob_len) const {
  return (blob_len + plan_.data_count - 1) / plan_.data_count;
}

std::vector<Bytes> ReedSolomon::encode(const Bytes &blob) const {
  size_t k = plan_.data_count;
  size_t n = plan_.total();
  Bytes padded = pad_to_multiple(blob, k);
  size_t len = padded.size() / k;

  std::vector<Bytes> shards(n, Bytes(len, 0));
  for (size_t i = 0; i < k; i++)
    std::copy(padded.begin() + i * len, padded.begin() + (i + 1) * len,
              shards[i].begin());

  for (size_t p = k; p < n; p++)
    for (size_t j = 0; j < k; j++)
      mul_add(shards[p], shards[j], matrix_[p][j]);
  return shards;
}

bool ReedSolomon::reconstruct_shards(std::vector<Bytes> &shards,
                                     std::vector<bool> &present) const {
  size_t k = plan_.data_count;
  size_t n = plan_.total();
  if (shards.size() != n || present.size() != n)
    return false;

  std::vector<size_t> valid;
  size_t len = 0;
  for (size_t i = 0; i < n; i++) {
    if (!present[i])
      continue;
    if (valid.empty())
      len = shards[i].size();
    else if (shards[i].size() != len)
      return false;
    valid.push_back(i);
  }
  if (valid.size() < k)
    return false;
  if (valid.size() == n)
    return true;

  bool data_missing = false;
  for (size_t i = 0; i < k; i++)
    if (!present[i])
      data_missing = true;

  std::vector<Bytes> out = shards;
  if (data_missing) {
    Matrix sub;
    sub.reserve(k);
    for (size_t i = 0; i < k; i++)
      sub.push_back(matrix_[valid[i]]);
    if (!invert(sub))
      return false;
    for (size_t d = 0; d < k; d++) {
      if (present[d])
        continue;
      Bytes rec(len, 0);
      for (size_t i = 0; i < k; i++)
        mul_add(rec, shards[valid[i]], sub[d][i]);
      out[d] = std::move(rec);
    }
  }

  for (size_t p = k; p < n; p++) {
    if (present[p])
      continue;
    Bytes rec(len, 0);
    for (size_t j = 0; j < k; j++)
      mul_add(rec, out[j], matrix_[p][j]);
    out[p] = std::move(rec);
  }

  shards.swap(out);
  present.assign(n, true);
  return true;
}

std::optional<Bytes> ReedSolomon::reconstruct(const ShardMap &partial,
                                              size_t original_len) const {
  size_t n = plan_.total();
  std::vector<Bytes> shards(n);
  std::vector<bool> present(n, false);
  for (const auto &kv : partial) {
    if (kv.first >= n)
      return std::nullopt;
    shards[kv.first] = kv.second;
    present[kv.first] = true;
  }
  if (!reconstruct_shards(shards, present))
    return std::nullopt;

  Bytes out;
  for (size_t i = 0; i < plan_.data_count; i++)
    out.insert(out.end(), shards[i].begin(), shards[i].end());
  if (original_len > out.size())
    return std::nullopt;
  out.resize(original_len);
  return out;
}

} // namespace dasim
