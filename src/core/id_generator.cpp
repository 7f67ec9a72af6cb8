#include "auditchain/core/id_generator.h"

#include <array>
#include <cstdint>
#include <cstdio>

namespace auditchain::core {

SystemIdGenerator::SystemIdGenerator() {
  std::random_device rd;
  std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
  engine_.seed(seq);
}

std::string SystemIdGenerator::next() {
  std::uint64_t hi = 0;
  std::uint64_t lo = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    hi = engine_();
    lo = engine_();
  }

  // RFC 4122 version 4, variant 10xx.
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  std::array<char, 40> buffer{};
  std::snprintf(buffer.data(), buffer.size(), "%08llx-%04llx-%04llx-%04llx-%012llx",
                static_cast<unsigned long long>(hi >> 32U),
                static_cast<unsigned long long>((hi >> 16U) & 0xFFFFULL),
                static_cast<unsigned long long>(hi & 0xFFFFULL),
                static_cast<unsigned long long>(lo >> 48U),
                static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
  return std::string{buffer.data()};
}

std::string DeterministicIdGenerator::next() {
  const auto c = counter_.fetch_add(1, std::memory_order_relaxed) + 1;
  std::array<char, 40> buffer{};
  std::snprintf(buffer.data(), buffer.size(), "00000000-0000-4000-8000-%012llx", c);
  return std::string{buffer.data()};
}

}  // namespace auditchain::core
