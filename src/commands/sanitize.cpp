#include "commands/sanitize.hpp"
#include "security/ScanConfig.hpp"
#include "security/TextSanitizer.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

#include "nlohmann/json.hpp"

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

// "" reads stdin.
static bool read_input(const std::string& path, std::string& out) {
    if (path.empty()) {
        std::ostringstream ss;
        ss << std::cin.rdbuf();
        out = ss.str();
        return true;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
}

int cmd_sanitize(int argc, char** argv) {
    const std::string in_path    = get_arg(argc, argv, "--in", "");
    const std::string rules_path = get_arg(argc, argv, "--rules", "");
    const bool as_json           = has_flag(argc, argv, "--json");

    security::ScanConfig cfg = security::default_scan_config();
    if (!rules_path.empty()) {
        try {
            cfg = security::load_scan_config(rules_path);
        } catch (const std::exception& e) {
            std::cerr << "error: failed to load --rules: " << e.what() << "\n";
            return 1;
        }
    }

    std::string text;
    if (!read_input(in_path, text)) {
        std::cerr << "error: failed to read --in: " << in_path << "\n";
        return 1;
    }

    security::SanitizeResult r;
    try {
        r = security::sanitize(text, cfg);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    if (as_json) {
        nlohmann::json j;
        j["text"] = r.text;
        j["flags"] = r.flags;
        j["zero_width_found"] = r.zero_width_found;
        j["homoglyphs_detected"] = r.homoglyphs_detected;
        std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
        return 0;
    }

    for (const auto& f : r.flags) std::cerr << "[warn] " << f << "\n";
    std::cout << r.text;
    return 0;
}
