#include "paragraph_assembler.hpp"
#include "run_renderer.hpp"
#include "functions/xml_tree/src/xml_tree.hpp"

#include <memory>
#include <vector>

static const char* const kMarkupCompatibilityNs =
    "http://schemas.openxmlformats.org/markup-compatibility/2006";

// mc:AlternateContent 는 Choice 와 Fallback 에 같은 내용이 두 번 들어 있음
static bool is_fallback(const XmlElement& el) {
    return el.is(kMarkupCompatibilityNs, "Fallback");
}

using ElementList = std::vector<std::unique_ptr<XmlElement>>;

// 깊게 중첩된 w:sdt / w:customXml 에서도 스택이 넘치지 않도록 재귀 대신 명시적 스택 사용.
// 각 프레임은 (자식 목록, 다음에 볼 위치)
struct WalkFrame {
    ElementList children;
    size_t next = 0;
};

// 문서 순서(pre-order)로 node 아래 element 를 방문.
// visit 가 true 를 돌려주면 그 element 안으로는 내려가지 않음
template <typename Visit>
static void walk_elements(const XmlElement& node, Visit visit) {
    std::vector<WalkFrame> stack;
    stack.push_back({node.children(), 0});
    while (!stack.empty()) {
        WalkFrame& top = stack.back();
        if (top.next == top.children.size()) {
            stack.pop_back();
            continue;
        }
        const XmlElement& el = *top.children[top.next++];
        if (visit(el)) continue;
        // push_back 뒤에는 top 참조가 무효가 될 수 있음
        ElementList grandchildren = el.children();
        stack.push_back({std::move(grandchildren), 0});
    }
}

// w:hyperlink, w:ins, w:smartTag 안의 run 도 포함. 중첩된 w:p 안으로는 내려가지 않음
static void collect_runs(const XmlElement& paragraph, const std::string& ns, InlineContent& out) {
    walk_elements(paragraph, [&](const XmlElement& el) {
        if (el.is(ns, "p") || is_fallback(el)) return true;
        if (!el.is(ns, "r")) return false;
        InlineContent piece = render_run(el, ns);
        for (auto& n : piece) out.push_back(std::move(n));
        return true;
    });
}

// s[i] 에서 시작하는 공백 문자의 UTF-8 바이트 수. 공백이 아니면 0.
// ASCII 공백 외에 U+00A0, U+1680, U+2000-200A, U+2028/2029, U+202F, U+205F, U+3000, U+FEFF
static size_t whitespace_length(const std::string& s, size_t i) {
    auto at = [&s](size_t k) { return k < s.size() ? static_cast<unsigned char>(s[k]) : 0u; };
    const unsigned c0 = at(i);
    if (c0 == ' ' || (c0 >= '\t' && c0 <= '\r')) return 1;
    if (c0 == 0xC2 && at(i + 1) == 0xA0) return 2;
    if (c0 == 0xE1 && at(i + 1) == 0x9A && at(i + 2) == 0x80) return 3;
    if (c0 == 0xE2 && at(i + 1) == 0x80) {
        const unsigned c2 = at(i + 2);
        if (c2 <= 0x8A || c2 == 0xA8 || c2 == 0xA9 || c2 == 0xAF) return c2 >= 0x80 ? 3 : 0;
    }
    if (c0 == 0xE2 && at(i + 1) == 0x81 && at(i + 2) == 0x9F) return 3;
    if (c0 == 0xE3 && at(i + 1) == 0x80 && at(i + 2) == 0x80) return 3;
    if (c0 == 0xEF && at(i + 1) == 0xBB && at(i + 2) == 0xBF) return 3;
    return 0;
}

bool is_blank(const InlineContent& content) {
    const std::string markup = render_inline(content);
    for (size_t i = 0; i < markup.size();) {
        const size_t n = whitespace_length(markup, i);
        if (n == 0) return false;
        i += n;
    }
    return true;
}

Block assemble_paragraph(const XmlElement& paragraph, const std::string& ns) {
    const ParagraphProperties props = read_paragraph_properties(paragraph, ns);

    Block block;
    collect_runs(paragraph, ns, block.content);

    if (props.is_heading) {
        block.kind = Block::Kind::Heading;
        return block;
    }

    block.kind = Block::Kind::Paragraph;
    block.alignment = props.alignment;
    block.indented = props.first_line_indent > 0 && !is_blank(block.content);
    if (block.content.empty()) block.content.push_back(InlineNode::make_line_break());
    return block;
}

void assemble_body(const XmlElement& body, const std::string& ns, RichTextDocument& doc) {
    // w:tbl/w:tr/w:tc, w:sdt/w:sdtContent 등 컨테이너는 구조만 버리고 안쪽 문단은 살림
    walk_elements(body, [&](const XmlElement& el) {
        if (el.is(ns, "p")) {
            doc.blocks.push_back(assemble_paragraph(el, ns));
            return true;
        }
        return is_fallback(el);
    });
}
