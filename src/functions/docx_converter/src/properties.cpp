#include "properties.hpp"
#include "functions/xml_tree/src/xml_tree.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

Alignment parse_alignment(const std::string& value) {
    if (value == "center") return Alignment::Center;
    if (value == "right") return Alignment::Right;
    if (value == "both" || value == "justify") return Alignment::Justify;
    return Alignment::Left;
}

long parse_indent_units(const std::string& value) {
    char* end = nullptr;
    long n = std::strtol(value.c_str(), &end, 10);
    if (end == value.c_str() || n < 0) return 0;
    return n;
}

bool is_heading_style(const std::string& style_id) {
    std::string lower = style_id;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("heading") != std::string::npos;
}

ParagraphProperties read_paragraph_properties(const XmlElement& paragraph, const std::string& ns) {
    ParagraphProperties props;
    auto ppr = paragraph.child(ns, "pPr");
    if (!ppr) return props;

    if (auto jc = ppr->child(ns, "jc")) {
        if (auto val = jc->attribute(ns, "val")) props.alignment = parse_alignment(*val);
    }
    if (auto ind = ppr->child(ns, "ind")) {
        if (auto first_line = ind->attribute(ns, "firstLine"))
            props.first_line_indent = parse_indent_units(*first_line);
    }
    if (auto style = ppr->child(ns, "pStyle")) {
        props.is_heading = is_heading_style(style->attribute(ns, "val").value_or(""));
    }
    return props;
}

// 요소가 있고 w:val 이 off 값이 아니면 켜짐. w:val 이 아예 없으면 켜짐
static bool toggle_on(const XmlElement& rpr, const std::string& ns,
                      const char* name, const char* off_value) {
    auto el = rpr.child(ns, name);
    if (!el) return false;
    auto val = el->attribute(ns, "val");
    return !val || *val != off_value;
}

RunProperties read_run_properties(const XmlElement& run, const std::string& ns) {
    RunProperties props;
    auto rpr = run.child(ns, "rPr");
    if (!rpr) return props;

    props.bold      = toggle_on(*rpr, ns, "b", "0");
    props.italic    = toggle_on(*rpr, ns, "i", "0");
    props.underline = toggle_on(*rpr, ns, "u", "none");
    props.strike    = toggle_on(*rpr, ns, "strike", "0");
    return props;
}
