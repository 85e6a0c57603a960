#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace rangeshift::core {

namespace fs = std::filesystem;

// UTC time as 2024-05-01T12:00:00.123Z, used on every event and manifest.
std::string get_iso_timestamp();

// Run directory name: UTC start time plus 8 random hex digits.
std::string get_run_id();

// Regular files in `input_dir` whose name matches `pattern`, sorted by path.
// A missing directory yields an empty list.
std::vector<fs::path> discover_files(const fs::path& input_dir, const std::string& pattern = "*.fits");

std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

// Hex SHA-256 of a file, read in chunks.
std::string sha256_file(const fs::path& path);

// Case-insensitive shell wildcard match. '*' and '?' are wildcards, ';'
// separates alternatives and every other character is literal.
bool glob_match(const std::string& pattern, const std::string& name);

} // namespace rangeshift::core
