#include "sim/NoiseField.hpp"

#include "core/Log.hpp"
#include "core/MidSquare.hpp"

NoiseField MakeNoiseField(int nx, int ny) {
  NoiseField field{};
  if (nx < 0 || ny < 0) {
    LOG_ERROR("Invalid noise field size {}x{}", nx, ny);
    return field;
  }

  const std::size_t columns = static_cast<std::size_t>(nx) + 1;
  const std::size_t rows = static_cast<std::size_t>(ny) + 1;
  if (columns > cfg::kNoiseFieldMaxPoints / rows) {
    LOG_ERROR("Noise field size {}x{} exceeds {} points", nx, ny,
              cfg::kNoiseFieldMaxPoints);
    return field;
  }

  field.nx = nx;
  field.ny = ny;
  field.values.assign(columns * rows, 0.0);
  return field;
}

std::int64_t FillNoiseField(NoiseField &field, std::int64_t seed) {
  std::int64_t state = seed;
  for (int i = 1; i <= field.nx; ++i) {
    for (int j = 1; j < field.ny; ++j) {
      field.At(i, j) = core::NextUnit(state);
    }
  }
  return state;
}

void RemoveZonalMean(NoiseField &field) {
  if (field.nx < 1) {
    return;
  }

  for (int j = 0; j <= field.ny; ++j) {
    double sum = 0.0;
    for (int i = 1; i <= field.nx; ++i) {
      sum += field.At(i, j);
    }
    const double mean = sum / static_cast<double>(field.nx);
    for (int i = 0; i <= field.nx; ++i) {
      field.At(i, j) -= mean;
    }
  }
}

void ScaleNoiseField(NoiseField &field, double factor) {
  for (double &v : field.values) {
    v *= factor;
  }
}

NoiseField MakePerturbation(int nx, int ny, std::int64_t seed, double scale) {
  NoiseField field = MakeNoiseField(nx, ny);
  FillNoiseField(field, seed);
  RemoveZonalMean(field);
  ScaleNoiseField(field, scale);
  LOG_DEBUG("Perturbation {}x{} from seed {} scaled by {}", field.nx, field.ny,
            seed, scale);
  return field;
}
