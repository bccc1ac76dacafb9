#include "commands/rules.hpp"
#include "security/ScanConfig.hpp"

#include <iostream>
#include <string>

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

// Prints the effective rules file: the built-in tables, or --rules <file>
// after validation and default filling.
int cmd_rules(int argc, char** argv) {
    const std::string rules_path = get_arg(argc, argv, "--rules", "");

    security::ScanConfig cfg = security::default_scan_config();
    if (!rules_path.empty()) {
        try {
            cfg = security::load_scan_config(rules_path);
        } catch (const std::exception& e) {
            std::cerr << "error: failed to load --rules: " << e.what() << "\n";
            return 1;
        }
    }

    std::cout << security::to_json(cfg).dump(2) << "\n";
    return 0;
}
