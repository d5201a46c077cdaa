#pragma once

#include "core/Config.hpp"
#include <cstdint>
#include <vector>

// Grid-point perturbation noise driven by the mid-square sequence.
// Points are indexed (i, j) with i in [0, nx] and j in [0, ny]; storage is
// row-major in i.

// Build through MakeNoiseField; values is sized from nx and ny.
struct NoiseField {
  int nx = 0;
  int ny = 0;
  std::vector<double> values = std::vector<double>(1, 0.0);

  double At(int i, int j) const { return values[Index(i, j)]; }
  double &At(int i, int j) { return values[Index(i, j)]; }

private:
  std::size_t Index(int i, int j) const {
    return static_cast<std::size_t>(i) * (static_cast<std::size_t>(ny) + 1) +
           static_cast<std::size_t>(j);
  }
};

// Zero field of (nx+1)*(ny+1) points. Negative sizes, or more than
// cfg::kNoiseFieldMaxPoints points, give an empty field.
NoiseField MakeNoiseField(int nx, int ny);

// Interior points (1..nx, 1..ny-1), i-major, each set to the next seed over
// 10^10. Returns the seed after the last point.
std::int64_t FillNoiseField(NoiseField &field, std::int64_t seed);

// Subtracts the mean over i in [1, nx] from every point of each j row.
void RemoveZonalMean(NoiseField &field);

void ScaleNoiseField(NoiseField &field, double factor);

// Fill, remove zonal mean, scale.
NoiseField MakePerturbation(int nx = cfg::kNoiseGridNx,
                            int ny = cfg::kNoiseGridNy,
                            std::int64_t seed = cfg::kPerturbSeed,
                            double scale = cfg::kNoiseScale);
