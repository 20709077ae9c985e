#pragma once
#include "properties.hpp"

#include <string>
#include <vector>

enum class Emphasis { Bold, Italic, Underline, Strike };

// 인라인 조각 하나. Emphasis 는 children 을 감싼다
struct InlineNode {
    enum class Kind { Text, Indent, LineBreak, Emphasis };

    Kind kind = Kind::Text;
    std::string text;                    // Kind::Text 일 때만, escape 전 원문
    ::Emphasis emphasis = ::Emphasis::Bold;  // Kind::Emphasis 일 때만
    std::vector<InlineNode> children;

    static InlineNode make_text(std::string value);
    static InlineNode make_indent();
    static InlineNode make_line_break();
    static InlineNode make_emphasis(::Emphasis which, std::vector<InlineNode> inner);
};

using InlineContent = std::vector<InlineNode>;

// 입력 문단 하나 = 출력 블록 하나
struct Block {
    enum class Kind { Heading, Paragraph };

    Kind kind = Kind::Paragraph;
    Alignment alignment = Alignment::Left;  // Heading 에서는 무시
    bool indented = false;                  // Heading 에서는 항상 false
    InlineContent content;
};

struct RichTextDocument {
    std::vector<Block> blocks;
};

// ---- 마크업 직렬화 ----
// 탭/첫 줄 들여쓰기에 쓰는 토큰 (non-breaking space 4개)
extern const char* const kIndentToken;
extern const char* const kLineBreakToken;

// '&', '<', '>', '"' 를 엔티티로 바꿈
std::string escape_markup(const std::string& text);

// 정렬 클래스 이름. Left 는 "" (클래스 없음)
const char* alignment_class(Alignment alignment);

const char* emphasis_tag(Emphasis emphasis);

std::string render_inline(const InlineContent& content);
std::string render_block(const Block& block);
std::string render_document(const RichTextDocument& doc);
