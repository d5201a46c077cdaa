#pragma once

#include <cstdint>

// Hammer's mid-square generator over 10-digit decimal seeds.
//
// The next seed is digits 5..14 of x^2, i.e. floor(x^2 / 10^5) mod 10^10,
// built from the 5-digit halves of x so the 20-digit square is never formed.

namespace core {

// Pure transform. Inputs outside [0, 10^10) are not rejected; the result is
// still in [0, 10^10) for every int64_t, and NextSeed(-x) == NextSeed(x).
std::int64_t NextSeed(std::int64_t x);

bool IsSeedInDomain(std::int64_t x);

// Validating variant. On failure logs, leaves `out` unchanged, returns false.
bool TryNextSeed(std::int64_t x, std::int64_t &out);

// Advances `state` and returns it as a fraction in [0, 1).
double NextUnit(std::int64_t &state);

} // namespace core
