#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "submission/SubmissionReport.hpp"

namespace hwcheck {

struct CheckConfig {
    std::string assignment = "hw1";
    std::string index_name = "index.html";
    std::vector<std::string> stylesheet_paths = {"style.css", "css/style.css"};
};

// Archive-level checks (nested zips, index.html, stylesheet member) followed by
// the structural checks of index.html. Never throws for a bad archive.
SubmissionReport check_submission(const std::filesystem::path& zip_path, const CheckConfig& cfg);

}  // namespace hwcheck
