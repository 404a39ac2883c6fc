#pragma once
#include <cstdint>
#include <random>

namespace ringout {

// Stream ids derived from the single match seed.
inline constexpr std::uint32_t kPowerUpStream = 0;
inline constexpr std::uint32_t kAiStreamBase  = 1; // + actor slot

// Seeded pseudo-random stream owned by the match state.
// Values are built from raw mt19937 output (not std::*_distribution) so the
// same seed yields the same sequence with any standard library.
class MatchRng {
public:
  MatchRng() : MatchRng(0) {}
  explicit MatchRng(std::uint64_t seed, std::uint32_t stream = 0) { reseed(seed, stream); }

  void reseed(std::uint64_t seed, std::uint32_t stream = 0) {
    std::seed_seq seq{static_cast<std::uint32_t>(seed & 0xffffffffu),
                      static_cast<std::uint32_t>(seed >> 32),
                      stream};
    eng_.seed(seq);
    draws_ = 0;
  }

  std::uint32_t next_u32() {
    ++draws_;
    return static_cast<std::uint32_t>(eng_());
  }

  // [0, 1)
  double uniform01() { return static_cast<double>(next_u32()) * (1.0 / 4294967296.0); }

  double uniform(double lo, double hi) { return lo + (hi - lo) * uniform01(); }

  // [lo, hi]
  int uniform_int(int lo, int hi) {
    if (hi <= lo) return lo;
    const std::uint64_t span = static_cast<std::uint64_t>(hi - lo) + 1u;
    return lo + static_cast<int>((static_cast<std::uint64_t>(next_u32()) * span) >> 32);
  }

  bool chance(double p) {
    if (p <= 0.0) return false;
    if (p >= 1.0) return true;
    return uniform01() < p;
  }

  std::uint64_t draws() const { return draws_; }

  bool operator==(const MatchRng& o) const { return eng_ == o.eng_; }

private:
  std::mt19937 eng_;
  std::uint64_t draws_{0};
};

} // namespace ringout
