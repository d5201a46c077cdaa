#pragma once

#include <cstddef>
#include <cstdint>

namespace cfg {
// --- Seed transform ---
constexpr std::int64_t kHalfModulus = 100000LL;      // 10^5, one 5-digit half
constexpr std::int64_t kSeedModulus = 10000000000LL; // 10^10, seed window

// --- Perturbation noise ---
constexpr std::int64_t kPerturbSeed = 1111111111LL;
constexpr double kNoiseScale = 7.509e6;
constexpr int kNoiseGridNx = 16;
constexpr int kNoiseGridNy = 16;
constexpr std::size_t kNoiseFieldMaxPoints = std::size_t{1} << 24;

} // namespace cfg
