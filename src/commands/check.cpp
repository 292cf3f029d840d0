#include "commands/check.hpp"

#include "submission/SubmissionBatch.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

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

// positional arguments after the command name, skipping "--key value" pairs
static std::vector<std::string> positionals(int argc, char** argv) {
    std::vector<std::string> out;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a.rfind("--", 0) == 0) {
            ++i;
            continue;
        }
        out.push_back(a);
    }
    return out;
}

static int check_usage() {
    std::cerr
        << "usage:\n"
        << "  hwcheck check <submissions_dir> <reports_dir> [--assignment <name>]\n"
        << "\n"
        << "options:\n"
        << "  --assignment <str>           default: hw1\n";
    return 1;
}

int cmd_check(int argc, char** argv) {
    if (has_flag(argc, argv, "--help")) return check_usage();

    const std::vector<std::string> pos = positionals(argc, argv);
    if (pos.size() != 2) return check_usage();

    hwcheck::CheckConfig cfg;
    cfg.assignment = get_arg(argc, argv, "--assignment", cfg.assignment);

    std::error_code ec;
    const fs::path submissions_dir = fs::absolute(pos[0], ec);
    if (ec || !fs::is_directory(submissions_dir, ec)) {
        std::cerr << "error: submissions directory does not exist or is not a directory: " << pos[0] << "\n";
        return 1;
    }

    const fs::path reports_dir = fs::absolute(pos[1], ec);
    if (!ec) fs::create_directories(reports_dir, ec);
    if (ec) {
        std::cerr << "error: cannot create reports directory " << pos[1] << ": " << ec.message() << "\n";
        return 1;
    }

    hwcheck::BatchSummary summary;
    try {
        summary = hwcheck::check_submissions_dir(submissions_dir, reports_dir, cfg, std::cout, std::cerr);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "CHECKED: " << summary.checked
              << " (ok=" << summary.passed
              << ", with_issues=" << (summary.checked - summary.passed) << ")\n";
    std::cout << "OUT_REPORTS: " << reports_dir.string() << "\n";

    if (summary.write_failures > 0) {
        std::cerr << "error: " << summary.write_failures << " report(s) could not be written\n";
        return 1;
    }
    return 0;
}
