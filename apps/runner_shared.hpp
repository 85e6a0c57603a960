#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <streambuf>
#include <string>
#include <vector>

namespace rangeshift::runner {

std::string format_bytes(uint64_t bytes);

uint64_t estimate_total_file_bytes(const std::vector<std::filesystem::path> &paths);

// Pretty-printed JSON artifact; throws IOError when the file cannot be written.
void write_json_file(const std::filesystem::path &path, const nlohmann::json &doc);

class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
  int overflow(int c) override;
  int sync() override;

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

} // namespace rangeshift::runner
