#include "rich_text.hpp"

const char* const kIndentToken = "&nbsp;&nbsp;&nbsp;&nbsp;";
const char* const kLineBreakToken = "<br>";

InlineNode InlineNode::make_text(std::string value) {
    InlineNode n;
    n.kind = Kind::Text;
    n.text = std::move(value);
    return n;
}

InlineNode InlineNode::make_indent() {
    InlineNode n;
    n.kind = Kind::Indent;
    return n;
}

InlineNode InlineNode::make_line_break() {
    InlineNode n;
    n.kind = Kind::LineBreak;
    return n;
}

InlineNode InlineNode::make_emphasis(::Emphasis which, std::vector<InlineNode> inner) {
    InlineNode n;
    n.kind = Kind::Emphasis;
    n.emphasis = which;
    n.children = std::move(inner);
    return n;
}

std::string escape_markup(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;";  break;
            case '<': out += "&lt;";   break;
            case '>': out += "&gt;";   break;
            case '"': out += "&quot;"; break;
            default:  out.push_back(c);
        }
    }
    return out;
}

const char* alignment_class(Alignment alignment) {
    switch (alignment) {
        case Alignment::Center:  return "ql-align-center";
        case Alignment::Right:   return "ql-align-right";
        case Alignment::Justify: return "ql-align-justify";
        case Alignment::Left:    break;
    }
    return "";
}

const char* emphasis_tag(Emphasis emphasis) {
    switch (emphasis) {
        case Emphasis::Bold:      return "strong";
        case Emphasis::Italic:    return "em";
        case Emphasis::Underline: return "u";
        case Emphasis::Strike:    return "s";
    }
    return "span";
}

static void render_node(const InlineNode& node, std::string& out) {
    switch (node.kind) {
        case InlineNode::Kind::Text:
            out += escape_markup(node.text);
            break;
        case InlineNode::Kind::Indent:
            out += kIndentToken;
            break;
        case InlineNode::Kind::LineBreak:
            out += kLineBreakToken;
            break;
        case InlineNode::Kind::Emphasis: {
            const std::string tag = emphasis_tag(node.emphasis);
            out += "<" + tag + ">";
            for (const auto& ch : node.children) render_node(ch, out);
            out += "</" + tag + ">";
            break;
        }
    }
}

std::string render_inline(const InlineContent& content) {
    std::string out;
    for (const auto& node : content) render_node(node, out);
    return out;
}

std::string render_block(const Block& block) {
    if (block.kind == Block::Kind::Heading)
        return "<h1>" + render_inline(block.content) + "</h1>";

    std::string out = "<p";
    const std::string cls = alignment_class(block.alignment);
    if (!cls.empty()) out += " class=\"" + cls + "\"";
    out += ">";
    if (block.indented) out += kIndentToken;
    out += render_inline(block.content);
    out += "</p>";
    return out;
}

std::string render_document(const RichTextDocument& doc) {
    std::string html;
    for (const auto& block : doc.blocks) html += render_block(block);
    return html;
}
