#pragma once

#include "html/Issue.hpp"
#include "html/TagEvent.hpp"

#include <string>
#include <vector>

namespace hwcheck {

struct OpenTag {
    std::string name;
    size_t offset = 0;
    size_t line = 0;
};

// First-occurrence bookkeeping for html, head, body.
struct OrderState {
    static constexpr size_t kNotOpened = static_cast<size_t>(-1);

    // any start tag, void or self-closing included
    bool html_seen = false;
    bool head_seen = false;
    bool body_seen = false;

    // sequence number of the first start that was pushed on the stack
    size_t html_first = kNotOpened;
    size_t head_first = kNotOpened;
    size_t body_first = kNotOpened;

    bool body_opened_inside_head = false;
};

// Stack-based tag matcher. Feed events in document order with consume(),
// then call finish() once.
class StructureMatcher {
public:
    void consume(const TagEvent& ev);

    // Mismatched / UnexpectedClose, in the order the offending end tags appeared.
    const std::vector<Issue>& stream_issues() const { return m_stream_issues; }

    // Unclosed (bottom of stack first), then MissingRequired html/head/body, then BadOrder.
    std::vector<Issue> finish() const;

    const std::vector<OpenTag>& open_tags() const { return m_stack; }
    const OrderState& order() const { return m_order; }

private:
    std::vector<OpenTag> m_stack;
    OrderState m_order;
    size_t m_pushed = 0;
    std::vector<Issue> m_stream_issues;

    void on_start(const TagEvent& ev);
    void on_end(const TagEvent& ev);
    bool has_bad_order() const;
};

} // namespace hwcheck
