#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace auditchain::core {

// Sha256 is an incremental FIPS 180-4 SHA-256 hasher.
//
// Feed bytes with update() any number of times, then call finalize() or
// finalize_hex() exactly once. Used directly when the input is streamed
// (archive checksums); sha256_hex() covers the one-shot case.
class Sha256 {
 public:
  static constexpr std::size_t kDigestSize = 32;

  Sha256();

  void update(std::string_view data) noexcept;

  [[nodiscard]] std::array<std::uint8_t, kDigestSize> finalize() noexcept;
  [[nodiscard]] std::string finalize_hex();

 private:
  void process_buffer() noexcept;

  std::array<std::uint32_t, 8> state_;
  std::array<std::uint8_t, 64> buffer_{};
  std::size_t buffer_len_{0};
  std::uint64_t total_len_{0};
};

// sha256_hex returns the SHA-256 digest of input as a lower-case hex string.
// Output: 64-character lower-case hexadecimal string.
[[nodiscard]] std::string sha256_hex(std::string_view input);

// to_hex renders bytes as lower-case hex.
[[nodiscard]] std::string to_hex(const std::uint8_t* data, std::size_t size);

}  // namespace auditchain::core
