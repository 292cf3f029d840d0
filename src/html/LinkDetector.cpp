#include "html/LinkDetector.hpp"

#include <cctype>
#include <string>

namespace hwcheck {

static std::string lower_ascii(std::string s) {
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

static std::string trim(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    size_t b = s.size();
    while (b > a && std::isspace((unsigned char)s[b - 1])) --b;
    return s.substr(a, b - a);
}

static bool rel_allows_stylesheet(const Attribute* rel) {
    if (rel == nullptr) return true;

    const std::string v = lower_ascii(rel->value);
    std::string cur;
    for (size_t i = 0; i <= v.size(); ++i) {
        if (i == v.size() || std::isspace((unsigned char)v[i])) {
            if (cur == "stylesheet") return true;
            cur.clear();
        } else {
            cur.push_back(v[i]);
        }
    }
    return false;
}

static bool href_is_css(const Attribute* href) {
    if (href == nullptr) return false;

    std::string v = trim(href->value);
    const size_t cut = v.find_first_of("?#");
    if (cut != std::string::npos) v.resize(cut);

    static const std::string ext = ".css";
    if (v.size() <= ext.size()) return false;
    return lower_ascii(v.substr(v.size() - ext.size())) == ext;
}

bool LinkDetector::is_stylesheet_link(const TagEvent& ev) {
    if (ev.kind != TagKind::Start || ev.name != "link") return false;
    return rel_allows_stylesheet(ev.find_attribute("rel")) &&
           href_is_css(ev.find_attribute("href"));
}

void LinkDetector::observe(const TagEvent& ev) {
    if (m_found) return;
    if (is_stylesheet_link(ev)) m_found = true;
}

} // namespace hwcheck
