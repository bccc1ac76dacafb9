#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace security {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct HomoglyphEntry {
    std::string from;  // UTF-8, non-Latin look-alike
    std::string to;    // Latin replacement
};

struct MismatchPair {
    std::string meta_term;  // looked up in title / keywords
    std::string text_term;  // looked up in sanitized text
};

struct ScanConfig {
    // UTF-8 encoded code points, stripped in this order
    std::vector<std::string> zero_width_chars;
    std::vector<HomoglyphEntry> homoglyphs;
    std::vector<MismatchPair> metadata_mismatches;

    // packed RGB colors treated as unreadable on a white page
    std::vector<int> invisible_colors;

    int max_pages = 50;                          // <= 0: unlimited
    std::chrono::milliseconds timeout{10000};    // 0: no deadline

    // true: a page whose spans cannot be read counts as "no invisible text"
    bool fail_open_on_rendering_error = false;

    bool verbose = false;  // log degraded stages to stderr
};

// Built-in tables; immutable for the life of the process.
const ScanConfig& default_scan_config();

// Keys present in `j` replace the matching defaults. Throws ConfigError.
ScanConfig scan_config_from_json(const nlohmann::json& j);
ScanConfig load_scan_config(const std::string& path);

// Rules-file form of a config (round-trips through scan_config_from_json).
nlohmann::json to_json(const ScanConfig& cfg);

}  // namespace security
