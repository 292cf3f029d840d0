#include "commands/check.hpp"
#include "commands/html.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  hwcheck check <submissions_dir> <reports_dir> [--assignment <name>]\n"
        << "  hwcheck html <path/to/index.html>\n"
        << "  hwcheck help\n";
    return 1;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        return print_usage();
    }

    if (cmd == "check") return cmd_check(argc - 1, argv + 1);
    if (cmd == "html")  return cmd_html(argc - 1, argv + 1);

    // legacy: hwcheck <submissions_dir> <reports_dir>
    if (argc == 3) return cmd_check(argc, argv);

    std::cerr << "unknown command\n";
    return print_usage();
}
