#pragma once

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace astro_compute::config {

namespace fs = std::filesystem;

struct OpenClConfig {
  int platform_index = -1;        // -1 = first platform with a usable device
  std::string device_type = "gpu"; // gpu | any
  int workgroup_size = 256;        // power of two, local scratch size
};

struct CpuConfig {
  int workers = 0; // 0 = std::thread::hardware_concurrency()
};

struct ComputeConfig {
  std::string backend = "auto"; // auto | cpu | opencl
  OpenClConfig opencl;
  CpuConfig cpu;
};

struct StfConfig {
  float target_background = 0.25f;
  float shadow_k = -2.8f;
};

struct PyramidConfig {
  bool enabled = true;
  int coarse_max_shift = 64; // searched at 1/4 resolution
  int mid_max_shift = 4;     // searched at 1/2 resolution
  int fine_max_shift = 2;    // searched at full resolution
};

struct CorrelationConfig {
  int max_shift = 8;
  PyramidConfig pyramid;
};

struct LoggingConfig {
  bool events = true;
};

struct Config {
  ComputeConfig compute;
  StfConfig stf;
  CorrelationConfig correlation;
  LoggingConfig logging;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

} // namespace astro_compute::config
