#include "html/StructureMatcher.hpp"

#include <unordered_set>
#include <utility>

namespace hwcheck {

static Issue make_issue(IssueKind kind, const std::string& tag, const TagEvent& ev) {
    Issue issue;
    issue.kind = kind;
    issue.tag = tag;
    issue.offset = ev.offset;
    issue.line = ev.line;
    return issue;
}

void StructureMatcher::consume(const TagEvent& ev) {
    if (ev.kind == TagKind::Start) on_start(ev);
    else on_end(ev);
}

void StructureMatcher::on_start(const TagEvent& ev) {
    const bool is_html = ev.name == "html";
    const bool is_head = ev.name == "head";
    const bool is_body = ev.name == "body";

    if (is_html) m_order.html_seen = true;
    if (is_head) m_order.head_seen = true;
    if (is_body) m_order.body_seen = true;

    if (ev.self_closing || is_void_element(ev.name)) return;

    const size_t seq = m_pushed++;
    if (is_html && m_order.html_first == OrderState::kNotOpened) {
        m_order.html_first = seq;
    }
    if (is_head && m_order.head_first == OrderState::kNotOpened) {
        m_order.head_first = seq;
    }
    if (is_body && m_order.body_first == OrderState::kNotOpened) {
        m_order.body_first = seq;
        for (const auto& open : m_stack) {
            if (open.name == "head") {
                m_order.body_opened_inside_head = true;
                break;
            }
        }
    }

    OpenTag open;
    open.name = ev.name;
    open.offset = ev.offset;
    open.line = ev.line;
    m_stack.push_back(std::move(open));
}

void StructureMatcher::on_end(const TagEvent& ev) {
    // </br>, </img> and friends carry no structure
    if (is_void_element(ev.name)) return;

    size_t match = m_stack.size();
    while (match > 0) {
        if (m_stack[match - 1].name == ev.name) break;
        --match;
    }

    if (match == 0) {
        m_stream_issues.push_back(make_issue(IssueKind::UnexpectedClose, ev.name, ev));
        return;
    }

    // match - 1 is the matching ancestor; everything above it was closed over
    for (size_t i = m_stack.size(); i > match; --i) {
        Issue issue = make_issue(IssueKind::Mismatched, ev.name, ev);
        issue.expected = m_stack[i - 1].name;
        m_stream_issues.push_back(std::move(issue));
    }
    m_stack.resize(match - 1);
}

bool StructureMatcher::has_bad_order() const {
    if (m_order.body_opened_inside_head) return true;

    const size_t firsts[] = {m_order.html_first, m_order.head_first, m_order.body_first};
    size_t prev = OrderState::kNotOpened;
    bool have_prev = false;
    for (size_t first : firsts) {
        if (first == OrderState::kNotOpened) continue;
        if (have_prev && first < prev) return true;
        prev = first;
        have_prev = true;
    }
    return false;
}

std::vector<Issue> StructureMatcher::finish() const {
    std::vector<Issue> out;

    std::unordered_set<std::string> reported;
    for (const auto& open : m_stack) {
        if (!reported.insert(open.name).second) continue;
        Issue issue;
        issue.kind = IssueKind::Unclosed;
        issue.tag = open.name;
        issue.offset = open.offset;
        issue.line = open.line;
        out.push_back(std::move(issue));
    }

    const std::pair<const char*, bool> required[] = {
        {"html", m_order.html_seen},
        {"head", m_order.head_seen},
        {"body", m_order.body_seen},
    };
    for (const auto& r : required) {
        if (r.second) continue;
        Issue issue;
        issue.kind = IssueKind::MissingRequired;
        issue.tag = r.first;
        out.push_back(std::move(issue));
    }

    if (has_bad_order()) {
        Issue issue;
        issue.kind = IssueKind::BadOrder;
        out.push_back(std::move(issue));
    }

    return out;
}

} // namespace hwcheck
