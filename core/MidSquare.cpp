#include "core/MidSquare.hpp"

#include "core/Config.hpp"
#include "core/Log.hpp"

namespace core {
std::int64_t NextSeed(std::int64_t x) {
    const std::int64_t a = x / cfg::kHalfModulus;
    const std::int64_t b = x % cfg::kHalfModulus;

    // (a*a*10^5) mod 10^10 only depends on a mod 10^5, and 2ab mod 10^10 on
    // a mod 10^10. Reducing first keeps out-of-domain inputs from overflowing.
    const std::int64_t aLow = a % cfg::kHalfModulus;
    const std::int64_t aMid = a % cfg::kSeedModulus;

    const std::int64_t t1 = ((aLow * aLow) % cfg::kHalfModulus) * cfg::kHalfModulus;
    const std::int64_t t2 = (2 * aMid * b) % cfg::kSeedModulus;
    const std::int64_t t3 = (b * b) / cfg::kHalfModulus;

    return (t1 + t2 + t3) % cfg::kSeedModulus;
}

bool IsSeedInDomain(std::int64_t x) {
    return x >= 0 && x < cfg::kSeedModulus;
}

bool TryNextSeed(std::int64_t x, std::int64_t& out) {
    if (!IsSeedInDomain(x)) {
        LOG_ERROR("Seed {} outside [0, {})", x, cfg::kSeedModulus);
        return false;
    }
    out = NextSeed(x);
    return true;
}

double NextUnit(std::int64_t& state) {
    state = NextSeed(state);
    return static_cast<double>(state) / static_cast<double>(cfg::kSeedModulus);
}
}  // namespace core
