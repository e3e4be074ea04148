#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace cpupool {
namespace util {

// Incremental SHA-256 (FIPS 180-4). Feed bytes with update(), then call
// finish() once.
class Sha256 {
public:
  using Digest = std::array<std::uint8_t, 32>;

  Sha256();

  void update(const void* data, std::size_t len);
  Digest finish();

  static std::string toHex(const Digest& d);

  // Convenience for in-memory input.
  static std::string hexOf(const std::string& bytes);

private:
  void block(const std::uint8_t* p);

  std::array<std::uint32_t, 8> h_;
  std::array<std::uint8_t, 64> buf_{};
  std::size_t   bufLen_ = 0;
  std::uint64_t total_  = 0;
  bool          done_   = false;
};

} // namespace util
} // namespace cpupool
