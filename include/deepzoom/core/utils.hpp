#pragma once

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace deepzoom::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<fs::path> discover_files(const fs::path& input_dir, const std::string& extension);
void write_bytes(const fs::path& path, const std::vector<uint8_t>& data);

// Writes to a sibling temporary file and renames it over `path`, so readers
// never observe a half-written file.
void write_bytes_atomic(const fs::path& path, const std::vector<uint8_t>& data);

fs::path ensure_directory(const fs::path& dir);

// String utilities
std::string to_lower(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);

} // namespace deepzoom::core
