#include "html/Issue.hpp"

namespace hwcheck {

const char* issue_kind_name(IssueKind kind) {
    switch (kind) {
        case IssueKind::Unreadable: return "unreadable";
        case IssueKind::Malformed: return "malformed";
        case IssueKind::MissingRequired: return "missing_required";
        case IssueKind::Unclosed: return "unclosed";
        case IssueKind::Mismatched: return "mismatched";
        case IssueKind::UnexpectedClose: return "unexpected_close";
        case IssueKind::BadOrder: return "bad_order";
        case IssueKind::NoCssLink: return "no_css_link";
        default: return "unknown";
    }
}

static std::string at_line(size_t line) {
    if (line == 0) return "";
    return " at line " + std::to_string(line);
}

std::string describe(const Issue& issue) {
    switch (issue.kind) {
        case IssueKind::Unreadable:
            return "index.html is not readable as text.";
        case IssueKind::Malformed:
            return "index.html has malformed markup" + at_line(issue.line) + ": " + issue.detail + ".";
        case IssueKind::MissingRequired:
            return "index.html is missing <" + issue.tag + "> tag.";
        case IssueKind::Unclosed:
            if (issue.line == 0) return "Unclosed tag <" + issue.tag + ">.";
            return "Unclosed tag <" + issue.tag + "> (opened at line " + std::to_string(issue.line) + ").";
        case IssueKind::Mismatched:
            return "Mismatched closing tag </" + issue.tag + ">" + at_line(issue.line) +
                   " (expected </" + issue.expected + ">).";
        case IssueKind::UnexpectedClose:
            return "Unexpected closing tag </" + issue.tag + ">" + at_line(issue.line) + ".";
        case IssueKind::BadOrder:
            return "index.html has an unexpected order of <html>, <head>, and <body> tags.";
        case IssueKind::NoCssLink:
            return "index.html does not link to a CSS file.";
        default:
            return "index.html has an unknown issue.";
    }
}

} // namespace hwcheck
