#pragma once
#include <string>

class XmlElement;

enum class Alignment { Left, Center, Right, Justify };

// w:pPr 에서 뽑은 문단 속성
struct ParagraphProperties {
    Alignment alignment = Alignment::Left;
    long first_line_indent = 0;  // w:ind/@w:firstLine. 0이면 들여쓰기 없음
    bool is_heading = false;
};

// w:rPr 에서 뽑은 글자 속성
struct RunProperties {
    bool bold = false;
    bool italic = false;
    bool underline = false;
    bool strike = false;
};

// "center", "right", "both"/"justify" 외에는 모두 Left
Alignment parse_alignment(const std::string& value);

// 앞부분 정수만 읽음 ("720abc" -> 720). 숫자가 없거나 음수면 0
long parse_indent_units(const std::string& value);

// 스타일 이름에 "heading"이 (대소문자 무시) 들어 있으면 제목으로 취급.
// "Heading Centered" 같은 사용자 스타일도 제목이 된다
bool is_heading_style(const std::string& style_id);

ParagraphProperties read_paragraph_properties(const XmlElement& paragraph, const std::string& ns);
RunProperties read_run_properties(const XmlElement& run, const std::string& ns);
