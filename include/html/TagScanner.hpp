#pragma once

#include "html/TagEvent.hpp"

#include <string>
#include <vector>

namespace hwcheck {

struct ScanIssue {
    std::string detail;  // e.g. "unterminated tag <div"
    size_t offset = 0;
    size_t line = 1;
};

// Lazy lexer over one HTML document. Emits start/end tag events only:
// text, comments, doctype/declarations and processing instructions are skipped,
// as is the content of <script> and <style>.
// Malformed regions are recorded in issues() and scanning carries on past them.
class TagScanner {
public:
    explicit TagScanner(std::string text);

    // Fills `out` with the next event. Returns false once the input is exhausted.
    bool next(TagEvent& out);

    const std::vector<ScanIssue>& issues() const { return m_issues; }

private:
    std::string m_text;
    size_t m_pos = 0;
    bool m_done = false;

    // set while inside <script>/<style>
    std::string m_raw_text_tag;

    // incremental line counting
    size_t m_line_offset = 0;
    size_t m_line = 1;

    std::vector<ScanIssue> m_issues;

    static bool is_ws(char c);
    static bool is_alpha(char c);
    static bool is_name_char(char c);
    static char lower(char c);

    char at(size_t i) const { return i < m_text.size() ? m_text[i] : '\0'; }
    size_t line_at(size_t offset);
    void add_issue(size_t offset, const std::string& detail);
    void finish();

    void skip_raw_text();
    bool scan_tag(size_t lt, bool is_end, TagEvent& out);
};

} // namespace hwcheck
