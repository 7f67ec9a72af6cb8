#include "auditchain/core/sha256.h"

namespace auditchain::core {

namespace {

// FIPS 180-4 §4.2.2 initial hash values.
// First 32 bits of fractional parts of square roots of first 8 primes.
constexpr std::array<std::uint32_t, 8> kH0 = {
    0x6a09e667u, 0xbb67ae85u, 0x3c6ef372u, 0xa54ff53au,
    0x510e527fu, 0x9b05688cu, 0x1f83d9abu, 0x5be0cd19u,
};

// FIPS 180-4 §4.2.2 round constants.
// First 32 bits of fractional parts of cube roots of first 64 primes.
constexpr std::array<std::uint32_t, 64> kK = {
    0x428a2f98u, 0x71374491u, 0xb5c0fbcfu, 0xe9b5dba5u, 0x3956c25bu, 0x59f111f1u, 0x923f82a4u,
    0xab1c5ed5u, 0xd807aa98u, 0x12835b01u, 0x243185beu, 0x550c7dc3u, 0x72be5d74u, 0x80deb1feu,
    0x9bdc06a7u, 0xc19bf174u, 0xe49b69c1u, 0xefbe4786u, 0x0fc19dc6u, 0x240ca1ccu, 0x2de92c6fu,
    0x4a7484aau, 0x5cb0a9dcu, 0x76f988dau, 0x983e5152u, 0xa831c66du, 0xb00327c8u, 0xbf597fc7u,
    0xc6e00bf3u, 0xd5a79147u, 0x06ca6351u, 0x14292967u, 0x27b70a85u, 0x2e1b2138u, 0x4d2c6dfcu,
    0x53380d13u, 0x650a7354u, 0x766a0abbu, 0x81c2c92eu, 0x92722c85u, 0xa2bfe8a1u, 0xa81a664bu,
    0xc24b8b70u, 0xc76c51a3u, 0xd192e819u, 0xd6990624u, 0xf40e3585u, 0x106aa070u, 0x19a4c116u,
    0x1e376c08u, 0x2748774cu, 0x34b0bcb5u, 0x391c0cb3u, 0x4ed8aa4au, 0x5b9cca4fu, 0x682e6ff3u,
    0x748f82eeu, 0x78a5636fu, 0x84c87814u, 0x8cc70208u, 0x90befffau, 0xa4506cebu, 0xbef9a3f7u,
    0xc67178f2u,
};

constexpr std::uint32_t rotr32(std::uint32_t x, unsigned n) noexcept {
  return (x >> n) | (x << (32u - n));
}

constexpr std::uint32_t ch(std::uint32_t x, std::uint32_t y, std::uint32_t z) noexcept {
  return (x & y) ^ (~x & z);
}

constexpr std::uint32_t maj(std::uint32_t x, std::uint32_t y, std::uint32_t z) noexcept {
  return (x & y) ^ (x & z) ^ (y & z);
}

// FIPS 180-4 §4.1.2
constexpr std::uint32_t sigma0_big(std::uint32_t x) noexcept {
  return rotr32(x, 2u) ^ rotr32(x, 13u) ^ rotr32(x, 22u);
}

constexpr std::uint32_t sigma1_big(std::uint32_t x) noexcept {
  return rotr32(x, 6u) ^ rotr32(x, 11u) ^ rotr32(x, 25u);
}

constexpr std::uint32_t sigma0_small(std::uint32_t x) noexcept {
  return rotr32(x, 7u) ^ rotr32(x, 18u) ^ (x >> 3u);
}

constexpr std::uint32_t sigma1_small(std::uint32_t x) noexcept {
  return rotr32(x, 17u) ^ rotr32(x, 19u) ^ (x >> 10u);
}

void process_block(std::array<std::uint32_t, 8>& state, const std::uint8_t* block) noexcept {
  std::array<std::uint32_t, 64> w{};

  for (unsigned i = 0; i < 16u; ++i) {
    w[i] = (static_cast<std::uint32_t>(block[i * 4u + 0u]) << 24u) |
           (static_cast<std::uint32_t>(block[i * 4u + 1u]) << 16u) |
           (static_cast<std::uint32_t>(block[i * 4u + 2u]) << 8u) |
           (static_cast<std::uint32_t>(block[i * 4u + 3u]));
  }
  for (unsigned i = 16u; i < 64u; ++i) {
    w[i] = sigma1_small(w[i - 2u]) + w[i - 7u] + sigma0_small(w[i - 15u]) + w[i - 16u];
  }

  std::uint32_t a = state[0];
  std::uint32_t b = state[1];
  std::uint32_t c = state[2];
  std::uint32_t d = state[3];
  std::uint32_t e = state[4];
  std::uint32_t f = state[5];
  std::uint32_t g = state[6];
  std::uint32_t h = state[7];

  for (unsigned i = 0; i < 64u; ++i) {
    const std::uint32_t t1 = h + sigma1_big(e) + ch(e, f, g) + kK[i] + w[i];
    const std::uint32_t t2 = sigma0_big(a) + maj(a, b, c);
    h = g;
    g = f;
    f = e;
    e = d + t1;
    d = c;
    c = b;
    b = a;
    a = t1 + t2;
  }

  state[0] += a;
  state[1] += b;
  state[2] += c;
  state[3] += d;
  state[4] += e;
  state[5] += f;
  state[6] += g;
  state[7] += h;
}

}  // namespace

Sha256::Sha256() : state_(kH0) {}

void Sha256::update(std::string_view data) noexcept {
  total_len_ += data.size();
  for (const char ch_byte : data) {
    buffer_[buffer_len_++] = static_cast<std::uint8_t>(ch_byte);
    if (buffer_len_ == buffer_.size()) {
      process_buffer();
    }
  }
}

void Sha256::process_buffer() noexcept {
  process_block(state_, buffer_.data());
  buffer_len_ = 0;
}

std::array<std::uint8_t, Sha256::kDigestSize> Sha256::finalize() noexcept {
  // FIPS 180-4 §5.1.1: append 0x80, zero-pad to 56 mod 64, then the 64-bit big-endian bit length.
  const std::uint64_t bit_len = total_len_ * 8u;

  buffer_[buffer_len_++] = 0x80u;
  if (buffer_len_ > 56u) {
    while (buffer_len_ < buffer_.size()) {
      buffer_[buffer_len_++] = 0u;
    }
    process_buffer();
  }
  while (buffer_len_ < 56u) {
    buffer_[buffer_len_++] = 0u;
  }
  for (unsigned i = 0; i < 8u; ++i) {
    buffer_[56u + i] = static_cast<std::uint8_t>(bit_len >> ((7u - i) * 8u));
  }
  process_buffer();

  std::array<std::uint8_t, kDigestSize> digest{};
  for (std::size_t i = 0; i < state_.size(); ++i) {
    digest[i * 4u + 0u] = static_cast<std::uint8_t>(state_[i] >> 24u);
    digest[i * 4u + 1u] = static_cast<std::uint8_t>(state_[i] >> 16u);
    digest[i * 4u + 2u] = static_cast<std::uint8_t>(state_[i] >> 8u);
    digest[i * 4u + 3u] = static_cast<std::uint8_t>(state_[i]);
  }
  return digest;
}

std::string Sha256::finalize_hex() {
  const auto digest = finalize();
  return to_hex(digest.data(), digest.size());
}

std::string to_hex(const std::uint8_t* data, std::size_t size) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(size * 2u);
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(kDigits[data[i] >> 4u]);
    out.push_back(kDigits[data[i] & 0x0fu]);
  }
  return out;
}

std::string sha256_hex(std::string_view input) {
  Sha256 hasher;
  hasher.update(input);
  return hasher.finalize_hex();
}

}  // namespace auditchain::core
