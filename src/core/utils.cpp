#include "rangeshift/core/utils.hpp"
#include "rangeshift/core/errors.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <memory>
#include <random>
#include <regex>
#include <sstream>

#include <openssl/evp.h>

namespace rangeshift::core {

namespace {

std::tm utc_now(std::chrono::system_clock::time_point now) {
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);
    return tm_buf;
}

// One ';'-separated alternative of a glob turned into an anchored regex.
std::regex glob_regex(const std::string& glob) {
    static const std::string kRegexSpecials = "\\^$.|+()[]{}";
    std::string re;
    re.reserve(glob.size() * 2);
    for (char c : glob) {
        if (c == '*') {
            re += ".*";
        } else if (c == '?') {
            re += '.';
        } else {
            if (kRegexSpecials.find(c) != std::string::npos) re += '\\';
            re += c;
        }
    }
    return std::regex(re, std::regex::icase);
}

} // namespace

std::string get_iso_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    const std::tm tm_buf = utc_now(now);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return oss.str();
}

std::string get_run_id() {
    const std::tm tm_buf = utc_now(std::chrono::system_clock::now());
    std::mt19937 gen(std::random_device{}());
    const uint32_t suffix = std::uniform_int_distribution<uint32_t>()(gen);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%dT%H%M%SZ") << '_' << std::hex << std::setfill('0') << std::setw(8)
        << suffix;
    return oss.str();
}

std::vector<fs::path> discover_files(const fs::path& input_dir, const std::string& pattern) {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(input_dir, ec)) {
        return files;
    }

    for (const auto& entry : fs::directory_iterator(input_dir)) {
        if (entry.is_regular_file() && glob_match(pattern, entry.path().filename().string())) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::string read_text(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

void write_text(const fs::path& path, const std::string& text) {
    std::ofstream file(path);
    if (!file) {
        throw IOError("Cannot create file: " + path.string());
    }
    file << text;
    if (!file) {
        throw IOError("Cannot write file: " + path.string());
    }
}

std::string sha256_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw IOError("Cannot initialise SHA-256 for " + path.string());
    }

    std::vector<char> chunk(1 << 20);
    while (file) {
        file.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        const std::streamsize got = file.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.get(), chunk.data(), static_cast<size_t>(got)) != 1) {
            throw IOError("SHA-256 update failed for " + path.string());
        }
    }
    if (file.bad()) {
        throw IOError("Cannot read file: " + path.string());
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &len) != 1) {
        throw IOError("SHA-256 final failed for " + path.string());
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < len; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

bool glob_match(const std::string& pattern, const std::string& name) {
    size_t start = 0;
    while (start <= pattern.size()) {
        size_t end = pattern.find(';', start);
        if (end == std::string::npos) end = pattern.size();

        std::string alt = pattern.substr(start, end - start);
        alt.erase(0, alt.find_first_not_of(" \t"));
        alt.erase(alt.find_last_not_of(" \t") + 1);
        if (!alt.empty() && std::regex_match(name, glob_regex(alt))) {
            return true;
        }
        start = end + 1;
    }
    return false;
}

} // namespace rangeshift::core
