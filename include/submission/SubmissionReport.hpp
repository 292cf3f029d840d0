// include/submission/SubmissionReport.hpp
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace hwcheck {

struct SubmissionReport {
    std::string filename;     // archive file name, no directory
    std::string assignment;

    std::vector<std::string> format_issues;

    bool format_ok() const { return format_issues.empty(); }

    // {student_id, filename, assignment, format_ok, format_issues}; student_id is always null
    nlohmann::ordered_json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

}  // namespace hwcheck
