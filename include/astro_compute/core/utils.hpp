#pragma once

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace astro_compute::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_session_id();

// File utilities
std::vector<uint8_t> read_bytes(const fs::path& path);
void write_bytes(const fs::path& path, const std::vector<uint8_t>& data);

// Raw little-endian float32 sample files (width*height samples, row-major)
Matrix2Df read_raw_f32(const fs::path& path, int width, int height);
void write_raw_f32(const fs::path& path, const Matrix2Df& data);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
std::vector<std::string> split(const std::string& str, char delimiter);

} // namespace astro_compute::core
