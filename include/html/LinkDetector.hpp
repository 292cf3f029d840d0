#pragma once

#include "html/TagEvent.hpp"

namespace hwcheck {

// Watches start tags for <link rel="stylesheet" href="....css">.
// rel may be omitted; position in the document does not matter.
class LinkDetector {
public:
    void observe(const TagEvent& ev);
    bool has_css_link() const { return m_found; }

    static bool is_stylesheet_link(const TagEvent& ev);

private:
    bool m_found = false;
};

} // namespace hwcheck
