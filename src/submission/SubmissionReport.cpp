#include "submission/SubmissionReport.hpp"

#include <fstream>
#include <stdexcept>

namespace hwcheck {

nlohmann::ordered_json SubmissionReport::to_json() const {
    nlohmann::ordered_json j;
    j["student_id"] = nullptr;
    j["filename"] = filename;
    j["assignment"] = assignment;
    j["format_ok"] = format_ok();
    j["format_issues"] = format_issues;
    return j;
}

void SubmissionReport::write_to(const std::filesystem::path& out_path) const {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << to_json().dump(2) << "\n";
    if (!out) throw std::runtime_error("Failed to write output file: " + out_path.string());
}

}  // namespace hwcheck
