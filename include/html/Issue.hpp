#pragma once

#include <string>

namespace hwcheck {

enum class IssueKind {
    Unreadable,       // document is not text
    Malformed,        // scanner could not make sense of a region
    MissingRequired,  // html/head/body never opened
    Unclosed,         // still open at end of document
    Mismatched,       // end tag closed over an open tag
    UnexpectedClose,  // end tag with nothing matching open
    BadOrder,         // html, head, body not opened in that order
    NoCssLink         // no stylesheet <link>
};

struct Issue {
    IssueKind kind = IssueKind::Malformed;
    std::string tag;       // offending tag; for Mismatched the end tag that was found
    std::string expected;  // Mismatched only: the tag that was still open
    std::string detail;    // Malformed only
    size_t offset = 0;
    size_t line = 0;       // 0 when unknown (end-of-document findings, synthetic events)
};

// stable snake_case code, e.g. "unexpected_close"
const char* issue_kind_name(IssueKind kind);

// human readable message naming the offending tag
std::string describe(const Issue& issue);

} // namespace hwcheck
