#pragma once

#include "submission/SubmissionChecker.hpp"

#include <filesystem>
#include <ostream>
#include <vector>

namespace hwcheck {

struct BatchSummary {
    int checked = 0;
    int passed = 0;         // format_ok
    int write_failures = 0;
};

// *.zip regular files directly inside dir (extension case-insensitive), sorted by path.
std::vector<std::filesystem::path> list_submissions(const std::filesystem::path& dir);

// Checks every submission and writes <reports_dir>/<stem>.json for each.
// One line per archive goes to `log`; a report that fails to write is logged to `err` and counted.
BatchSummary check_submissions_dir(const std::filesystem::path& submissions_dir,
                                   const std::filesystem::path& reports_dir,
                                   const CheckConfig& cfg,
                                   std::ostream& log,
                                   std::ostream& err);

} // namespace hwcheck
