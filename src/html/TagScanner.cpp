#include "html/TagScanner.hpp"

#include <utility>

namespace hwcheck {

TagScanner::TagScanner(std::string text) : m_text(std::move(text)) {}

bool TagScanner::is_ws(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

bool TagScanner::is_alpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool TagScanner::is_name_char(char c) {
    return is_alpha(c) || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == ':' || c == '.';
}

char TagScanner::lower(char c) {
    return (c >= 'A' && c <= 'Z') ? (char)(c - 'A' + 'a') : c;
}

size_t TagScanner::line_at(size_t offset) {
    if (offset > m_text.size()) offset = m_text.size();

    if (offset >= m_line_offset) {
        for (size_t i = m_line_offset; i < offset; ++i) {
            if (m_text[i] == '\n') ++m_line;
        }
    } else {
        for (size_t i = offset; i < m_line_offset; ++i) {
            if (m_text[i] == '\n') --m_line;
        }
    }
    m_line_offset = offset;
    return m_line;
}

void TagScanner::add_issue(size_t offset, const std::string& detail) {
    ScanIssue issue;
    issue.detail = detail;
    issue.offset = offset;
    issue.line = line_at(offset);
    m_issues.push_back(std::move(issue));
}

void TagScanner::finish() {
    m_pos = m_text.size();
    m_done = true;
}

void TagScanner::skip_raw_text() {
    const std::string tag = std::move(m_raw_text_tag);
    m_raw_text_tag.clear();

    size_t i = m_pos;
    while (true) {
        const size_t lt = m_text.find("</", i);
        if (lt == std::string::npos) {
            // unterminated script/style swallows the rest; the matcher reports it unclosed
            m_pos = m_text.size();
            return;
        }

        bool match = lt + 2 + tag.size() <= m_text.size();
        for (size_t k = 0; match && k < tag.size(); ++k) {
            if (lower(m_text[lt + 2 + k]) != tag[k]) match = false;
        }
        if (match) {
            const char after = at(lt + 2 + tag.size());
            if (after == '\0' || after == '>' || after == '/' || is_ws(after)) {
                m_pos = lt;
                return;
            }
        }
        i = lt + 2;
    }
}

bool TagScanner::scan_tag(size_t lt, bool is_end, TagEvent& out) {
    size_t i = lt + (is_end ? 2 : 1);

    std::string name;
    while (i < m_text.size() && is_name_char(m_text[i])) {
        name.push_back(lower(m_text[i]));
        ++i;
    }

    std::vector<Attribute> attrs;
    bool self_closing = false;

    while (true) {
        while (i < m_text.size() && is_ws(m_text[i])) ++i;

        if (i >= m_text.size()) {
            add_issue(lt, "unterminated tag <" + std::string(is_end ? "/" : "") + name);
            finish();
            return false;
        }

        const char c = m_text[i];
        if (c == '>') {
            ++i;
            break;
        }
        if (c == '/') {
            if (at(i + 1) == '>') {
                self_closing = true;
                i += 2;
                break;
            }
            ++i;
            continue;
        }
        if (c == '<') {
            // the tag never closed; rescan from the stray '<'
            add_issue(lt, "unterminated tag <" + std::string(is_end ? "/" : "") + name);
            m_pos = i;
            return false;
        }

        Attribute attr;
        while (i < m_text.size()) {
            const char ac = m_text[i];
            if (is_ws(ac) || ac == '=' || ac == '>' || ac == '<' || ac == '/') break;
            attr.name.push_back(lower(ac));
            ++i;
        }
        if (attr.name.empty()) {
            // lone '=' or similar junk
            ++i;
            continue;
        }

        size_t j = i;
        while (j < m_text.size() && is_ws(m_text[j])) ++j;

        if (at(j) == '=') {
            i = j + 1;
            while (i < m_text.size() && is_ws(m_text[i])) ++i;

            const char q = at(i);
            if (q == '"' || q == '\'') {
                const size_t close = m_text.find(q, i + 1);
                if (close == std::string::npos) {
                    add_issue(lt, "unterminated attribute value in <" + name);
                    m_pos = i + 1;
                    return false;
                }
                attr.value = m_text.substr(i + 1, close - i - 1);
                i = close + 1;
            } else {
                const size_t begin = i;
                while (i < m_text.size() && !is_ws(m_text[i]) && m_text[i] != '>' && m_text[i] != '<') ++i;
                attr.value = m_text.substr(begin, i - begin);
            }
        }

        bool seen = false;
        for (const auto& a : attrs) {
            if (a.name == attr.name) { seen = true; break; }
        }
        if (!seen) attrs.push_back(std::move(attr));
    }

    m_pos = i;

    out = TagEvent{};
    out.kind = is_end ? TagKind::End : TagKind::Start;
    out.name = std::move(name);
    out.offset = lt;
    out.line = line_at(lt);

    if (!is_end) {
        out.attributes = std::move(attrs);
        out.self_closing = self_closing;
        if (!self_closing && (out.name == "script" || out.name == "style")) {
            m_raw_text_tag = out.name;
        }
    }
    return true;
}

bool TagScanner::next(TagEvent& out) {
    while (!m_done) {
        if (!m_raw_text_tag.empty()) skip_raw_text();

        const size_t lt = m_text.find('<', m_pos);
        if (lt == std::string::npos) {
            finish();
            break;
        }
        m_pos = lt;

        if (m_text.compare(lt, 4, "<!--") == 0) {
            // <!--> and <!---> close immediately
            if (at(lt + 4) == '>') {
                m_pos = lt + 5;
                continue;
            }
            if (m_text.compare(lt + 4, 2, "->") == 0) {
                m_pos = lt + 6;
                continue;
            }
            const size_t close = m_text.find("-->", lt + 4);
            if (close == std::string::npos) {
                add_issue(lt, "unterminated comment");
                finish();
                break;
            }
            m_pos = close + 3;
            continue;
        }

        const char c1 = at(lt + 1);

        if (c1 == '!' || c1 == '?') {
            const size_t gt = m_text.find('>', lt + 2);
            if (gt == std::string::npos) {
                add_issue(lt, "unterminated declaration");
                finish();
                break;
            }
            m_pos = gt + 1;
            continue;
        }

        if (c1 == '/') {
            if (is_alpha(at(lt + 2))) {
                if (scan_tag(lt, true, out)) return true;
                continue;
            }
            add_issue(lt, "malformed end tag");
            const size_t gt = m_text.find('>', lt + 2);
            if (gt == std::string::npos) {
                finish();
                break;
            }
            m_pos = gt + 1;
            continue;
        }

        if (is_alpha(c1)) {
            if (scan_tag(lt, false, out)) return true;
            continue;
        }

        // a bare '<' in text
        m_pos = lt + 1;
    }
    return false;
}

} // namespace hwcheck
