#include "commands/wrap.hpp"
#include "security/LlmWrapper.hpp"
#include "security/TextSanitizer.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

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

int cmd_wrap(int argc, char** argv) {
    const std::string in_path = get_arg(argc, argv, "--in", "");
    const bool sanitize_first = has_flag(argc, argv, "--sanitize");

    std::string text;
    if (in_path.empty()) {
        std::ostringstream ss;
        ss << std::cin.rdbuf();
        text = ss.str();
    } else {
        std::ifstream in(in_path, std::ios::binary);
        if (!in) {
            std::cerr << "error: failed to read --in: " << in_path << "\n";
            return 1;
        }
        text.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    if (sanitize_first) {
        try {
            text = security::sanitize(text).text;
        } catch (const std::exception& e) {
            std::cerr << "error: " << e.what() << "\n";
            return 1;
        }
    }

    std::cout << security::wrap_for_downstream_model(text) << "\n";
    return 0;
}
