#include "cpupool/util/Sha256.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace cpupool {
namespace util {

namespace {

constexpr std::uint32_t K[64] = {
  0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
  0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
  0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
  0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
  0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
  0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
  0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
  0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2,
};

inline std::uint32_t rotr(std::uint32_t x, unsigned n) { return (x >> n) | (x << (32 - n)); }

inline std::uint32_t readBe32(const std::uint8_t* p) {
  return (std::uint32_t(p[0]) << 24) | (std::uint32_t(p[1]) << 16) |
         (std::uint32_t(p[2]) << 8)  |  std::uint32_t(p[3]);
}

} // namespace

Sha256::Sha256()
  : h_{0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
       0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19} {}

void Sha256::block(const std::uint8_t* p) {
  std::uint32_t w[64];
  for (int i = 0; i < 16; ++i) w[i] = readBe32(p + i * 4);
  for (int i = 16; i < 64; ++i) {
    const std::uint32_t g0 = rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
    const std::uint32_t g1 = rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
    w[i] = g1 + w[i - 7] + g0 + w[i - 16];
  }

  std::uint32_t a = h_[0], b = h_[1], c = h_[2], d = h_[3];
  std::uint32_t e = h_[4], f = h_[5], g = h_[6], h = h_[7];

  for (int i = 0; i < 64; ++i) {
    const std::uint32_t s1 = rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25);
    const std::uint32_t ch = (e & f) ^ (~e & g);
    const std::uint32_t t1 = h + s1 + ch + K[i] + w[i];
    const std::uint32_t s0 = rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22);
    const std::uint32_t mj = (a & b) ^ (a & c) ^ (b & c);
    const std::uint32_t t2 = s0 + mj;
    h = g; g = f; f = e; e = d + t1;
    d = c; c = b; b = a; a = t1 + t2;
  }

  h_[0] += a; h_[1] += b; h_[2] += c; h_[3] += d;
  h_[4] += e; h_[5] += f; h_[6] += g; h_[7] += h;
}

void Sha256::update(const void* data, std::size_t len) {
  if (done_) throw std::logic_error("Sha256::update after finish");
  const auto* p = static_cast<const std::uint8_t*>(data);
  total_ += len;

  if (bufLen_ > 0) {
    const std::size_t take = std::min(len, buf_.size() - bufLen_);
    std::memcpy(buf_.data() + bufLen_, p, take);
    bufLen_ += take; p += take; len -= take;
    if (bufLen_ < buf_.size()) return;
    block(buf_.data());
    bufLen_ = 0;
  }
  while (len >= 64) {
    block(p);
    p += 64; len -= 64;
  }
  if (len > 0) {
    std::memcpy(buf_.data(), p, len);
    bufLen_ = len;
  }
}

Sha256::Digest Sha256::finish() {
  if (done_) throw std::logic_error("Sha256::finish called twice");

  // Message + 0x80 + zeros + 64-bit big-endian bit length.
  const std::uint64_t bits = total_ * 8;
  buf_[bufLen_++] = 0x80;
  if (bufLen_ > 56) {
    std::memset(buf_.data() + bufLen_, 0, buf_.size() - bufLen_);
    block(buf_.data());
    bufLen_ = 0;
  }
  std::memset(buf_.data() + bufLen_, 0, 56 - bufLen_);
  for (int i = 0; i < 8; ++i) buf_[56 + i] = static_cast<std::uint8_t>(bits >> (56 - 8 * i));
  block(buf_.data());
  done_ = true;

  Digest out{};
  for (int i = 0; i < 8; ++i) {
    out[i * 4]     = static_cast<std::uint8_t>(h_[i] >> 24);
    out[i * 4 + 1] = static_cast<std::uint8_t>(h_[i] >> 16);
    out[i * 4 + 2] = static_cast<std::uint8_t>(h_[i] >> 8);
    out[i * 4 + 3] = static_cast<std::uint8_t>(h_[i]);
  }
  return out;
}

std::string Sha256::toHex(const Digest& d) {
  static const char* hex = "0123456789abcdef";
  std::string s;
  s.reserve(d.size() * 2);
  for (auto b : d) {
    s.push_back(hex[b >> 4]);
    s.push_back(hex[b & 0x0f]);
  }
  return s;
}

std::string Sha256::hexOf(const std::string& bytes) {
  Sha256 sha;
  sha.update(bytes.data(), bytes.size());
  return toHex(sha.finish());
}

} // namespace util
} // namespace cpupool
