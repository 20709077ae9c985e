#include "run_renderer.hpp"
#include "functions/xml_tree/src/xml_tree.hpp"

#include <iterator>

// 바깥쪽부터. 새 강조 종류는 여기 한 줄만 추가
struct EmphasisRule {
    bool RunProperties::*flag;
    Emphasis emphasis;
};

static const EmphasisRule kEmphasisOrder[] = {
    {&RunProperties::bold,      Emphasis::Bold},
    {&RunProperties::italic,    Emphasis::Italic},
    {&RunProperties::underline, Emphasis::Underline},
    {&RunProperties::strike,    Emphasis::Strike},
};

static bool has_visible_content(const InlineContent& content) {
    for (const auto& node : content) {
        if (node.kind != InlineNode::Kind::Text || !node.text.empty()) return true;
    }
    return false;
}

InlineContent apply_emphasis(InlineContent content, const RunProperties& props) {
    if (!has_visible_content(content)) return {};

    // 안쪽부터 감싸야 표의 첫 항목이 가장 바깥이 됨
    for (auto it = std::rbegin(kEmphasisOrder); it != std::rend(kEmphasisOrder); ++it) {
        const EmphasisRule& rule = *it;
        if (!(props.*rule.flag)) continue;
        InlineContent wrapped;
        wrapped.push_back(InlineNode::make_emphasis(rule.emphasis, std::move(content)));
        content = std::move(wrapped);
    }
    return content;
}

InlineContent render_run(const XmlElement& run, const std::string& ns) {
    InlineContent content;
    for (const auto& ch : run.children()) {
        if (ch->is(ns, "t")) {
            std::string text = ch->text();
            if (!text.empty()) content.push_back(InlineNode::make_text(std::move(text)));
        } else if (ch->is(ns, "tab")) {
            content.push_back(InlineNode::make_indent());
        } else if (ch->is(ns, "br") || ch->is(ns, "cr")) {
            content.push_back(InlineNode::make_line_break());
        }
        // w:rPr, w:drawing, w:fldChar, w:footnoteReference ... 무시
    }
    return apply_emphasis(std::move(content), read_run_properties(run, ns));
}
