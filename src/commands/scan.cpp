#include "commands/scan.hpp"
#include "pdf/FixtureDocument.hpp"
#include "security/Flags.hpp"
#include "security/LlmWrapper.hpp"
#include "security/ResumeScanner.hpp"
#include "security/ScanConfig.hpp"
#include "security/ScanReport.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <set>
#include <string>
#include <thread>
#include <vector>

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

// Everything that is neither an option nor an option's value.
static std::vector<std::string> positional_args(int argc, char** argv) {
    static const std::set<std::string> takes_value = {
        "--rules", "--max_pages", "--timeout_ms", "--threads", "--out",
    };

    std::vector<std::string> out;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (takes_value.count(a)) {
            ++i;
            continue;
        }
        if (a.rfind("--", 0) == 0) continue;
        out.push_back(a);
    }
    return out;
}

static bool parse_int(const std::string& s, int& out) {
    try {
        size_t used = 0;
        out = std::stoi(s, &used);
        return used == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

static security::ScanReport fixture_parse_error(const std::string& path, const std::string& detail) {
    security::ScanReport rep;
    rep.source = path;
    rep.flags.push_back(security::with_detail(security::flag::kParseError, detail));
    rep.stages.push_back({"parse", security::StageStatus::Fatal, detail});
    rep.is_safe = false;
    return rep;
}

static security::ScanReport scan_one(const security::ResumeScanner& scanner, const std::string& path, bool fixture) {
    if (!fixture) return scanner.scan_file(path);

    try {
        const pdf::FixtureDocument doc = pdf::FixtureDocument::load(path);
        security::ScanReport rep = scanner.scan(doc);
        rep.source = path;
        return rep;
    } catch (const pdf::ParseError& e) {
        return fixture_parse_error(path, e.what());
    }
}

static void print_report_line(const security::ScanReport& rep) {
    std::cout << (rep.is_safe ? "SAFE    " : "UNSAFE  ") << rep.source << "\n";
    for (const auto& f : rep.flags) std::cout << "        " << f << "\n";
}

int cmd_scan(int argc, char** argv) {
    const std::string rules_path   = get_arg(argc, argv, "--rules", "");
    const std::string max_pages_s  = get_arg(argc, argv, "--max_pages", "");
    const std::string timeout_s    = get_arg(argc, argv, "--timeout_ms", "");
    const std::string threads_s    = get_arg(argc, argv, "--threads", "1");
    const std::string out_path     = get_arg(argc, argv, "--out", "");
    const bool fixture             = has_flag(argc, argv, "--fixture");
    const bool wrap                = has_flag(argc, argv, "--wrap");
    const bool as_json             = has_flag(argc, argv, "--json");
    const bool no_text             = has_flag(argc, argv, "--no_text");

    const std::vector<std::string> files = positional_args(argc, argv);
    if (files.empty()) {
        std::cerr << "error: no input files\n";
        return 1;
    }

    security::ScanConfig cfg = security::default_scan_config();
    if (!rules_path.empty()) {
        try {
            cfg = security::load_scan_config(rules_path);
        } catch (const std::exception& e) {
            std::cerr << "error: failed to load --rules: " << e.what() << "\n";
            return 1;
        }
    }

    if (!max_pages_s.empty() && !parse_int(max_pages_s, cfg.max_pages)) {
        std::cerr << "error: invalid --max_pages\n";
        return 1;
    }

    if (!timeout_s.empty()) {
        int ms = 0;
        if (!parse_int(timeout_s, ms) || ms < 0) {
            std::cerr << "error: invalid --timeout_ms\n";
            return 1;
        }
        cfg.timeout = std::chrono::milliseconds(ms);
    }

    int threads = 1;
    if (!parse_int(threads_s, threads) || threads < 1) {
        std::cerr << "error: invalid --threads\n";
        return 1;
    }
    threads = std::min<int>(threads, (int)files.size());

    if (has_flag(argc, argv, "--fail_open")) cfg.fail_open_on_rendering_error = true;
    if (has_flag(argc, argv, "--verbose")) cfg.verbose = true;

    const security::DocumentScanner scanner(cfg);

    // Workers claim the next unscanned index; results keep input order.
    std::vector<security::ScanReport> reports(files.size());
    std::atomic<size_t> next{0};

    auto worker_fn = [&]() {
        for (;;) {
            const size_t i = next.fetch_add(1);
            if (i >= files.size()) break;
            reports[i] = scan_one(scanner, files[i], fixture);
        }
    };

    if (threads == 1) {
        worker_fn();
    } else {
        std::vector<std::thread> workers;
        workers.reserve((size_t)threads);
        for (int t = 0; t < threads; ++t) workers.emplace_back(worker_fn);
        for (auto& w : workers) w.join();
    }

    if (as_json) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& r : reports) j.push_back(r.to_json(!no_text));
        std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    } else {
        for (const auto& r : reports) {
            print_report_line(r);
            if (wrap && !r.sanitized_text.empty()) {
                std::cout << security::wrap_for_downstream_model(r.sanitized_text) << "\n";
            }
        }
    }

    if (!out_path.empty()) {
        try {
            security::write_scan_reports(out_path, reports);
        } catch (const std::exception& e) {
            std::cerr << "error: " << e.what() << "\n";
            return 1;
        }
        if (!as_json) std::cout << "wrote: " << out_path << "\n";
    }

    const bool all_safe = std::all_of(reports.begin(), reports.end(),
                                      [](const security::ScanReport& r) { return r.is_safe; });
    return all_safe ? 0 : 2;
}
