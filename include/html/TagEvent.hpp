#pragma once

#include <string>
#include <vector>

namespace hwcheck {

struct Attribute {
    std::string name;   // lowercased
    std::string value;  // raw, empty for boolean attributes
};

enum class TagKind { Start, End };

struct TagEvent {
    TagKind kind = TagKind::Start;
    std::string name;                   // lowercased
    std::vector<Attribute> attributes;  // source order, first occurrence of a name wins
    bool self_closing = false;          // written as <name .../>

    size_t offset = 0;  // byte offset of '<'
    size_t line = 0;    // 1-based, 0 for synthetic events

    // nullptr when the attribute is absent
    const Attribute* find_attribute(const std::string& attr_name) const;
};

// area, base, br, col, embed, hr, img, input, link, meta, param, source, track, wbr
bool is_void_element(const std::string& name);

// convenience constructors, mostly for feeding synthetic events
TagEvent start_tag(const std::string& name, std::vector<Attribute> attributes = {}, bool self_closing = false);
TagEvent end_tag(const std::string& name);

} // namespace hwcheck
