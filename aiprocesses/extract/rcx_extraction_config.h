#ifndef RCX_EXTRACTION_CONFIG_H
#define RCX_EXTRACTION_CONFIG_H

namespace rcx::extract {

// Tunable constants of the extraction engine. All distances are fractions of
// the image width/height.
struct rcx_extraction_config {
  double confidence_floor = 0.3;  // fragments below are dropped
  double row_resolution = 0.01;   // height of one row bucket
  int row_band = 2;               // neighbor query spans +-row_band buckets
  double max_gap = 0.6;           // farthest value allowed right of a label
  double right_tolerance = 0.02;  // how far a value may start left of the label's right edge
  bool verbose = false;

  // Number of row buckets per image height, round(1 / row_resolution).
  int bands_per_unit() const;

  static rcx_extraction_config defaults();

  // Defaults overridden by RCX_CONFIDENCE_FLOOR, RCX_ROW_RESOLUTION, RCX_ROW_BAND,
  // RCX_MAX_GAP, RCX_RIGHT_TOLERANCE and RCX_VERBOSE. Values outside their valid
  // range are ignored.
  static rcx_extraction_config from_env();
};

} // namespace rcx::extract

#endif // RCX_EXTRACTION_CONFIG_H
