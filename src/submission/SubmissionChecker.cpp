#include "submission/SubmissionChecker.hpp"

#include "html/FormatValidator.hpp"
#include "submission/ZipInspector.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>
#include <utility>

namespace fs = std::filesystem;

namespace hwcheck {

static bool ends_with_zip(const std::string& name) {
    if (name.size() < 4) return false;
    std::string ext = name.substr(name.size() - 4);
    for (char& c : ext) c = (char)std::tolower((unsigned char)c);
    return ext == ".zip";
}

// "style.css at root or css/style.css"
static std::string stylesheet_hint(const std::vector<std::string>& paths) {
    std::string out;
    for (size_t i = 0; i < paths.size(); ++i) {
        if (i > 0) out += (i + 1 == paths.size()) ? " or " : ", ";
        out += paths[i];
        if (paths[i].find('/') == std::string::npos) out += " at root";
    }
    return out;
}

SubmissionReport check_submission(const fs::path& zip_path, const CheckConfig& cfg) {
    SubmissionReport rep;
    rep.filename = zip_path.filename().string();
    rep.assignment = cfg.assignment;

    auto& issues = rep.format_issues;

    const ZipListing listing = inspect_zip(zip_path, cfg.index_name);
    if (!listing.opened) {
        issues.push_back("Could not open zip file (corrupted or invalid).");
        return rep;
    }

    for (const auto& name : listing.members) {
        if (ends_with_zip(name)) issues.push_back("Nested zip found: " + name);
    }

    if (!listing.index_present) {
        issues.push_back("No " + cfg.index_name + " found at zip root.");
    } else if (!listing.index_read_ok) {
        issues.push_back("Could not read " + cfg.index_name + " from the zip archive.");
    }

    const std::unordered_set<std::string> members(listing.members.begin(), listing.members.end());
    const bool has_stylesheet = std::any_of(cfg.stylesheet_paths.begin(), cfg.stylesheet_paths.end(),
        [&](const std::string& p) { return members.count(p) > 0; });
    if (!has_stylesheet) {
        issues.push_back("No style.css found. Expected " + stylesheet_hint(cfg.stylesheet_paths) + ".");
    }

    if (listing.index_present && listing.index_read_ok) {
        const ValidationResult result = validate_index_html(listing.index_bytes);
        for (auto& msg : result.format_issues()) issues.push_back(std::move(msg));
    }

    return rep;
}

}  // namespace hwcheck
