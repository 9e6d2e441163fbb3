#include "rcx_env.h"
#include <fstream>
#include <cstdlib>

void load_env_file(const rcx_string& filepath) {
  std::ifstream file(filepath.c_str());
  if (!file.is_open()) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    rcx_string rcx_line(line.c_str());
    rcx_line = rcx_line.trim();

    if (rcx_line.empty() || rcx_line.starts_with("#")) {
      continue;
    }

    size_t pos = rcx_line.find("=");
    if (pos == rcx_string::npos) {
      continue;
    }

    rcx_string key = rcx_line.substr(0, pos).trim();
    rcx_string value = rcx_line.substr(pos + 1).trim();

    setenv(key.c_str(), value.c_str(), 1);
  }
}

bool env_double(const char* name, double& out) {
  const char* raw = std::getenv(name);
  if (!raw) {
    return false;
  }
  rcx_string value = rcx_string(raw).trim();
  if (!value.is_numeric()) {
    return false;
  }
  out = value.to_double();
  return true;
}

bool env_flag(const char* name, bool def) {
  const char* raw = std::getenv(name);
  if (!raw) {
    return def;
  }
  rcx_string value = rcx_string(raw).trim().to_lower();
  return value == "1" || value == "true" || value == "yes" || value == "on";
}
