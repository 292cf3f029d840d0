#include "html/TagEvent.hpp"

#include <unordered_set>
#include <utility>

namespace hwcheck {

const Attribute* TagEvent::find_attribute(const std::string& attr_name) const {
    for (const auto& a : attributes) {
        if (a.name == attr_name) return &a;
    }
    return nullptr;
}

bool is_void_element(const std::string& name) {
    static const std::unordered_set<std::string> void_tags = {
        "area", "base", "br", "col", "embed", "hr", "img",
        "input", "link", "meta", "param", "source", "track", "wbr"
    };
    return void_tags.find(name) != void_tags.end();
}

TagEvent start_tag(const std::string& name, std::vector<Attribute> attributes, bool self_closing) {
    TagEvent ev;
    ev.kind = TagKind::Start;
    ev.name = name;
    ev.attributes = std::move(attributes);
    ev.self_closing = self_closing;
    return ev;
}

TagEvent end_tag(const std::string& name) {
    TagEvent ev;
    ev.kind = TagKind::End;
    ev.name = name;
    return ev;
}

} // namespace hwcheck
