#include "security/ScanConfig.hpp"
#include "text/TextUtil.hpp"

#include <fstream>
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace security {

static ScanConfig make_default_config() {
    ScanConfig cfg;

    cfg.zero_width_chars = {
        "\u200B",  // zero width space
        "\u200C",  // zero width non-joiner
        "\u200D",  // zero width joiner
        "\u2060",  // word joiner
        "\uFEFF",  // zero width no-break space
    };

    // Cyrillic look-alikes
    cfg.homoglyphs = {
        {"а", "a"}, {"е", "e"}, {"о", "o"}, {"р", "p"}, {"с", "c"},
        {"у", "y"}, {"х", "x"}, {"А", "A"}, {"В", "B"}, {"Е", "E"},
        {"К", "K"}, {"М", "M"}, {"Н", "H"}, {"О", "O"}, {"Р", "P"},
        {"С", "C"}, {"Т", "T"}, {"Х", "X"},
    };

    cfg.metadata_mismatches = {
        {"entry level", "senior"},
        {"junior", "senior"},
        {"intern", "director"},
    };

    cfg.invisible_colors = {0xFFFFFF};
    return cfg;
}

const ScanConfig& default_scan_config() {
    static const ScanConfig cfg = make_default_config();
    return cfg;
}

// ---------- rules file ----------

static const json& require_array(const json& j, const char* key) {
    const json& arr = j.at(key);
    if (!arr.is_array()) throw ConfigError(std::string(key) + " must be an array");
    return arr;
}

static std::string require_string(const json& j, const std::string& where) {
    if (!j.is_string()) throw ConfigError(where + " must be a string");
    return j.get<std::string>();
}

static std::pair<std::string, std::string> require_string_pair(const json& j, const std::string& where) {
    if (!j.is_array() || j.size() != 2) throw ConfigError(where + " must be a [string, string] pair");
    std::string a = require_string(j.at(0), where + "[0]");
    std::string b = require_string(j.at(1), where + "[1]");
    if (a.empty() || b.empty()) throw ConfigError(where + " must not contain empty strings");
    return {a, b};
}

// Integer in [lo, hi]; unsigned values are checked before narrowing.
static bool int_in_range(const json& v, long long lo, long long hi) {
    if (!v.is_number_integer()) return false;
    if (v.is_number_unsigned()) return v.get<unsigned long long>() <= (unsigned long long)hi;
    const long long x = v.get<long long>();
    return x >= lo && x <= hi;
}

static int require_int(const json& j, const char* key) {
    if (!int_in_range(j.at(key), 0, std::numeric_limits<int>::max())) {
        throw ConfigError(std::string(key) + " must be an integer in [0, " +
                          std::to_string(std::numeric_limits<int>::max()) + "]");
    }
    return j.at(key).get<int>();
}

ScanConfig scan_config_from_json(const json& j) {
    if (!j.is_object()) throw ConfigError("rules root must be an object");

    ScanConfig cfg = default_scan_config();

    if (j.contains("zero_width")) {
        const json& arr = require_array(j, "zero_width");
        cfg.zero_width_chars.clear();
        for (size_t i = 0; i < arr.size(); ++i) {
            std::ostringstream where;
            where << "zero_width[" << i << "]";
            const std::string s = require_string(arr.at(i), where.str());
            try {
                cfg.zero_width_chars.push_back(textutil::utf8_from_code_point(textutil::parse_code_point(s)));
            } catch (const std::invalid_argument& e) {
                throw ConfigError(where.str() + ": " + e.what());
            }
        }
    }

    if (j.contains("homoglyphs")) {
        const json& arr = require_array(j, "homoglyphs");
        cfg.homoglyphs.clear();
        for (size_t i = 0; i < arr.size(); ++i) {
            auto p = require_string_pair(arr.at(i), "homoglyphs[" + std::to_string(i) + "]");
            cfg.homoglyphs.push_back({p.first, p.second});
        }
    }

    if (j.contains("metadata_mismatches")) {
        const json& arr = require_array(j, "metadata_mismatches");
        cfg.metadata_mismatches.clear();
        for (size_t i = 0; i < arr.size(); ++i) {
            auto p = require_string_pair(arr.at(i), "metadata_mismatches[" + std::to_string(i) + "]");
            cfg.metadata_mismatches.push_back({p.first, p.second});
        }
    }

    if (j.contains("invisible_colors")) {
        const json& arr = require_array(j, "invisible_colors");
        cfg.invisible_colors.clear();
        for (size_t i = 0; i < arr.size(); ++i) {
            const json& c = arr.at(i);
            if (!int_in_range(c, 0, 0xFFFFFF)) {
                throw ConfigError("invisible_colors[" + std::to_string(i) + "] must be an integer in [0, 0xFFFFFF]");
            }
            cfg.invisible_colors.push_back(c.get<int>());
        }
    }

    if (j.contains("max_pages")) cfg.max_pages = require_int(j, "max_pages");

    if (j.contains("timeout_ms")) {
        const int ms = require_int(j, "timeout_ms");
        cfg.timeout = std::chrono::milliseconds(ms);
    }

    if (j.contains("fail_open_on_rendering_error")) {
        if (!j.at("fail_open_on_rendering_error").is_boolean()) {
            throw ConfigError("fail_open_on_rendering_error must be a boolean");
        }
        cfg.fail_open_on_rendering_error = j.at("fail_open_on_rendering_error").get<bool>();
    }

    return cfg;
}

ScanConfig load_scan_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("failed to open rules file: " + path);

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw ConfigError(std::string("failed to parse rules JSON: ") + e.what());
    }
    return scan_config_from_json(j);
}

json to_json(const ScanConfig& cfg) {
    json j;

    j["zero_width"] = json::array();
    for (const auto& c : cfg.zero_width_chars) j["zero_width"].push_back(textutil::code_point_label(c));

    j["homoglyphs"] = json::array();
    for (const auto& h : cfg.homoglyphs) j["homoglyphs"].push_back(json::array({h.from, h.to}));

    j["metadata_mismatches"] = json::array();
    for (const auto& m : cfg.metadata_mismatches) j["metadata_mismatches"].push_back(json::array({m.meta_term, m.text_term}));

    j["invisible_colors"] = cfg.invisible_colors;
    j["max_pages"] = cfg.max_pages;
    j["timeout_ms"] = (long long)cfg.timeout.count();
    j["fail_open_on_rendering_error"] = cfg.fail_open_on_rendering_error;
    return j;
}

}  // namespace security
