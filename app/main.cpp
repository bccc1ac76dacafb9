#include "commands/rules.hpp"
#include "commands/sanitize.hpp"
#include "commands/scan.hpp"
#include "commands/wrap.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  resume-shield scan <file.pdf>... [options]\n"
        << "  resume-shield sanitize [--in <path>] [options]\n"
        << "  resume-shield wrap [--in <path>] [--sanitize]\n"
        << "  resume-shield rules [--rules <path>]\n"
        << "  resume-shield help\n";
    return 1;
}

static int print_scan_help() {
    std::cerr
        << "usage:\n"
        << "  resume-shield scan <file>... [options]\n"
        << "\n"
        << "rules:\n"
        << "  --rules <path>               JSON rules file (missing keys keep defaults)\n"
        << "  --max_pages <n>              default: 50 (0 = unlimited)\n"
        << "  --timeout_ms <n>             default: 10000 (0 = no deadline)\n"
        << "  --fail_open                  unreadable pages count as \"no invisible text\"\n"
        << "\n"
        << "input:\n"
        << "  --fixture                    inputs are JSON document descriptions, not PDFs\n"
        << "  --threads <n>                default: 1\n"
        << "\n"
        << "output:\n"
        << "  --json                       print reports as a JSON array\n"
        << "  --no_text                    with --json: omit sanitized_text\n"
        << "  --wrap                       print delimiter-wrapped text after each report\n"
        << "  --out <path>                 also write reports to a JSON file\n"
        << "  --verbose                    log degraded stages to stderr\n"
        << "\n"
        << "exit status: 0 all safe, 1 usage or I/O error, 2 at least one unsafe document\n";
    return 0;
}

static int print_sanitize_help() {
    std::cerr
        << "usage:\n"
        << "  resume-shield sanitize [options]\n"
        << "\n"
        << "options:\n"
        << "  --in <path>                  default: stdin\n"
        << "  --rules <path>               JSON rules file\n"
        << "  --json                       print text and flags as JSON\n";
    return 0;
}

static int print_wrap_help() {
    std::cerr
        << "usage:\n"
        << "  resume-shield wrap [options]\n"
        << "\n"
        << "options:\n"
        << "  --in <path>                  default: stdin\n"
        << "  --sanitize                   sanitize with the built-in rules first\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        print_usage();
        return 0;
    }

    // subcommand help
    const bool want_help = (argc >= 3 && std::string(argv[2]) == "--help");
    if (cmd == "scan"     && want_help) return print_scan_help();
    if (cmd == "sanitize" && want_help) return print_sanitize_help();
    if (cmd == "wrap"     && want_help) return print_wrap_help();

    if (cmd == "scan")     return cmd_scan(argc - 1, argv + 1);
    if (cmd == "sanitize") return cmd_sanitize(argc - 1, argv + 1);
    if (cmd == "wrap")     return cmd_wrap(argc - 1, argv + 1);
    if (cmd == "rules")    return cmd_rules(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
