#include "commands/html.hpp"

#include "html/FormatValidator.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

static std::string read_all_bytes(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("failed to open: " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static int html_usage() {
    std::cerr
        << "usage:\n"
        << "  hwcheck html <path/to/index.html>\n";
    return 1;
}

int cmd_html(int argc, char** argv) {
    if (argc != 2 || std::string(argv[1]) == "--help") return html_usage();

    std::string bytes;
    try {
        bytes = read_all_bytes(argv[1]);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }

    const hwcheck::ValidationResult result = hwcheck::validate_index_html(bytes);
    if (result.format_ok()) {
        std::cout << "FORMAT: ok\n";
        return 0;
    }

    std::cout << "FORMAT: " << result.issues.size() << " issue(s)\n";
    for (const auto& issue : result.issues) {
        std::cout << "- " << hwcheck::issue_kind_name(issue.kind) << ": " << hwcheck::describe(issue) << "\n";
    }
    return 1;
}
