#include "html/FormatValidator.hpp"

#include "html/LinkDetector.hpp"
#include "html/StructureMatcher.hpp"
#include "html/Utf8.hpp"

#include <algorithm>
#include <utility>

namespace hwcheck {

std::vector<std::string> ValidationResult::format_issues() const {
    std::vector<std::string> out;
    out.reserve(issues.size());
    for (const auto& issue : issues) out.push_back(describe(issue));
    return out;
}

void IssueCollector::add_scan_issues(const std::vector<ScanIssue>& scan_issues) {
    for (const auto& s : scan_issues) {
        Issue issue;
        issue.kind = IssueKind::Malformed;
        issue.detail = s.detail;
        issue.offset = s.offset;
        issue.line = s.line;
        m_stream.push_back(issue);
    }
}

void IssueCollector::add_stream_issues(const std::vector<Issue>& issues) {
    m_stream.insert(m_stream.end(), issues.begin(), issues.end());
}

void IssueCollector::add_end_of_stream_issues(const std::vector<Issue>& issues) {
    m_end_of_stream.insert(m_end_of_stream.end(), issues.begin(), issues.end());
}

ValidationResult IssueCollector::collect() const {
    ValidationResult result;

    std::vector<Issue> stream = m_stream;
    std::stable_sort(stream.begin(), stream.end(), [](const Issue& a, const Issue& b) {
        return a.offset < b.offset;
    });
    result.issues = std::move(stream);

    result.issues.insert(result.issues.end(), m_end_of_stream.begin(), m_end_of_stream.end());

    if (!m_has_css_link) {
        Issue issue;
        issue.kind = IssueKind::NoCssLink;
        result.issues.push_back(std::move(issue));
    }
    return result;
}

ValidationResult validate_text(const std::string& text) {
    TagScanner scanner(text);
    StructureMatcher matcher;
    LinkDetector links;

    TagEvent ev;
    while (scanner.next(ev)) {
        matcher.consume(ev);
        links.observe(ev);
    }

    IssueCollector collector;
    collector.add_scan_issues(scanner.issues());
    collector.add_stream_issues(matcher.stream_issues());
    collector.add_end_of_stream_issues(matcher.finish());
    collector.set_has_css_link(links.has_css_link());
    return collector.collect();
}

ValidationResult validate_events(const std::vector<TagEvent>& events) {
    StructureMatcher matcher;
    LinkDetector links;

    for (const auto& ev : events) {
        matcher.consume(ev);
        links.observe(ev);
    }

    IssueCollector collector;
    collector.add_stream_issues(matcher.stream_issues());
    collector.add_end_of_stream_issues(matcher.finish());
    collector.set_has_css_link(links.has_css_link());
    return collector.collect();
}

ValidationResult validate_index_html(const std::string& raw_bytes) {
    const DecodedText decoded = decode_utf8_lossy(raw_bytes);
    if (!decoded.readable) {
        ValidationResult result;
        Issue issue;
        issue.kind = IssueKind::Unreadable;
        result.issues.push_back(std::move(issue));
        return result;
    }
    return validate_text(decoded.text);
}

} // namespace hwcheck
