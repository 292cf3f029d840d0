#include "submission/SubmissionBatch.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace hwcheck {

static bool has_zip_extension(const fs::path& p) {
    std::string ext = p.extension().string();
    for (char& c : ext) c = (char)std::tolower((unsigned char)c);
    return ext == ".zip";
}

std::vector<fs::path> list_submissions(const fs::path& dir) {
    if (!fs::is_directory(dir)) throw std::runtime_error("dir not found: " + dir.string());

    std::vector<fs::path> out;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file()) continue;
        if (!has_zip_extension(entry.path())) continue;
        out.push_back(entry.path());
    }
    std::sort(out.begin(), out.end());
    return out;
}

BatchSummary check_submissions_dir(const fs::path& submissions_dir,
                                   const fs::path& reports_dir,
                                   const CheckConfig& cfg,
                                   std::ostream& log,
                                   std::ostream& err) {
    BatchSummary summary;

    for (const auto& zip_path : list_submissions(submissions_dir)) {
        const SubmissionReport rep = check_submission(zip_path, cfg);
        ++summary.checked;
        if (rep.format_ok()) ++summary.passed;

        const fs::path out_path = reports_dir / (zip_path.stem().string() + ".json");
        try {
            rep.write_to(out_path);
        } catch (const std::exception& e) {
            ++summary.write_failures;
            err << "error: " << e.what() << "\n";
            continue;
        }

        log << "checked " << rep.filename << ": ";
        if (rep.format_ok()) log << "ok";
        else log << rep.format_issues.size() << " issue(s)";
        log << "\n";
        log << "REPORT: " << out_path.string() << "\n";
    }

    return summary;
}

} // namespace hwcheck
