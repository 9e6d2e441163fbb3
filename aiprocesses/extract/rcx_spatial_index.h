#ifndef RCX_SPATIAL_INDEX_H
#define RCX_SPATIAL_INDEX_H

#include "../../documents/receipt/rcx_fragment.h"
#include <map>
#include <vector>

namespace rcx::extract {

// Buckets fragments by the vertical center of their box so that text printed on
// the same line can be found without scanning the whole receipt.
class rcx_spatial_index {
  std::map<int, std::vector<size_t>> rows;
  std::vector<int> bucket_of;
  int bands_per_unit;
  int row_band;

public:
  rcx_spatial_index(const std::vector<rcx_fragment>& fragments, int bands_per_unit = 100, int row_band = 2);

  // floor(center_y * bands_per_unit), with center_y clamped to [0,1]
  static int bucket_for(double center_y, int bands_per_unit);

  int bucket(size_t index) const;

  // Indices (ascending, without index itself) whose bucket is within
  // +-row_band of the bucket of index.
  std::vector<size_t> neighbors(size_t index) const;

  const std::vector<size_t>& row(int bucket) const;
  size_t row_count() const { return rows.size(); }
  size_t size() const { return bucket_of.size(); }
};

} // namespace rcx::extract

#endif // RCX_SPATIAL_INDEX_H
