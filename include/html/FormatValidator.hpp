#pragma once

#include "html/Issue.hpp"
#include "html/TagEvent.hpp"
#include "html/TagScanner.hpp"

#include <string>
#include <vector>

namespace hwcheck {

struct ValidationResult {
    std::vector<Issue> issues;

    bool format_ok() const { return issues.empty(); }
    std::vector<std::string> format_issues() const;
};

// Merges findings into the final deterministic order:
// in-stream issues by document position, then Unclosed, then
// MissingRequired html/head/body and BadOrder, then NoCssLink.
class IssueCollector {
public:
    void add_scan_issues(const std::vector<ScanIssue>& scan_issues);
    void add_stream_issues(const std::vector<Issue>& issues);
    void add_end_of_stream_issues(const std::vector<Issue>& issues);
    void set_has_css_link(bool has_link) { m_has_css_link = has_link; }

    ValidationResult collect() const;

private:
    std::vector<Issue> m_stream;
    std::vector<Issue> m_end_of_stream;
    bool m_has_css_link = false;
};

// Raw bytes of index.html, as stored in the archive.
ValidationResult validate_index_html(const std::string& raw_bytes);

// Already decoded text.
ValidationResult validate_text(const std::string& text);

// Synthetic event stream, bypassing the scanner.
ValidationResult validate_events(const std::vector<TagEvent>& events);

} // namespace hwcheck
