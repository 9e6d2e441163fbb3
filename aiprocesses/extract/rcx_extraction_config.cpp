#include "rcx_extraction_config.h"
#include "../../utils/rcx_env.h"
#include <cmath>
#include <iostream>

namespace rcx::extract {

int rcx_extraction_config::bands_per_unit() const {
  if (row_resolution <= 0.0) {
    return 100;
  }
  int bands = static_cast<int>(std::lround(1.0 / row_resolution));
  return bands < 1 ? 1 : bands;
}

rcx_extraction_config rcx_extraction_config::defaults() {
  return rcx_extraction_config();
}

rcx_extraction_config rcx_extraction_config::from_env() {
  rcx_extraction_config config;
  double value = 0.0;

  if (env_double("RCX_CONFIDENCE_FLOOR", value)) {
    if (value >= 0.0 && value <= 1.0) {
      config.confidence_floor = value;
    } else {
      std::cerr << "Warning: RCX_CONFIDENCE_FLOOR out of range, keeping " << config.confidence_floor << std::endl;
    }
  }
  if (env_double("RCX_ROW_RESOLUTION", value)) {
    if (value > 0.0 && value <= 1.0) {
      config.row_resolution = value;
    } else {
      std::cerr << "Warning: RCX_ROW_RESOLUTION out of range, keeping " << config.row_resolution << std::endl;
    }
  }
  if (env_double("RCX_ROW_BAND", value)) {
    if (value >= 0.0 && value <= 50.0) {
      config.row_band = static_cast<int>(value);
    } else {
      std::cerr << "Warning: RCX_ROW_BAND out of range, keeping " << config.row_band << std::endl;
    }
  }
  if (env_double("RCX_MAX_GAP", value)) {
    if (value > 0.0 && value <= 1.0) {
      config.max_gap = value;
    } else {
      std::cerr << "Warning: RCX_MAX_GAP out of range, keeping " << config.max_gap << std::endl;
    }
  }
  if (env_double("RCX_RIGHT_TOLERANCE", value)) {
    if (value >= 0.0 && value < 1.0) {
      config.right_tolerance = value;
    } else {
      std::cerr << "Warning: RCX_RIGHT_TOLERANCE out of range, keeping " << config.right_tolerance << std::endl;
    }
  }
  config.verbose = env_flag("RCX_VERBOSE", config.verbose);

  return config;
}

} // namespace rcx::extract
