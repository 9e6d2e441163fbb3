#include "rcx_spatial_index.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace rcx::extract {

rcx_spatial_index::rcx_spatial_index(const std::vector<rcx_fragment>& fragments, int bands_per_unit_val, int row_band_val)
  : bands_per_unit(bands_per_unit_val < 1 ? 1 : bands_per_unit_val)
  , row_band(row_band_val < 0 ? 0 : row_band_val)
{
  bucket_of.reserve(fragments.size());
  for (size_t i = 0; i < fragments.size(); ++i) {
    int b = bucket_for(fragments[i].get_center_y(), bands_per_unit);
    bucket_of.push_back(b);
    rows[b].push_back(i);
  }
}

int rcx_spatial_index::bucket_for(double center_y, int bands_per_unit) {
  // NaN and centers off the image land on the nearest edge row
  double clamped = std::isnan(center_y) ? 0.0 : std::min(std::max(center_y, 0.0), 1.0);
  return static_cast<int>(std::floor(clamped * bands_per_unit));
}

int rcx_spatial_index::bucket(size_t index) const {
  if (index >= bucket_of.size()) {
    throw std::out_of_range("Fragment index out of range");
  }
  return bucket_of[index];
}

std::vector<size_t> rcx_spatial_index::neighbors(size_t index) const {
  std::vector<size_t> result;
  int center = bucket(index);

  auto it = rows.lower_bound(center - row_band);
  auto end = rows.upper_bound(center + row_band);
  for (; it != end; ++it) {
    for (size_t candidate : it->second) {
      if (candidate != index) {
        result.push_back(candidate);
      }
    }
  }

  std::sort(result.begin(), result.end());
  return result;
}

const std::vector<size_t>& rcx_spatial_index::row(int bucket) const {
  static const std::vector<size_t> empty;
  auto it = rows.find(bucket);
  return it == rows.end() ? empty : it->second;
}

} // namespace rcx::extract
