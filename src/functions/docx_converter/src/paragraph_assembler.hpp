#pragma once
#include "rich_text.hpp"

#include <string>

class XmlElement;

// w:p 하나 -> Block 하나.
// 제목이면 정렬/들여쓰기 무시, 아니면 정렬 클래스와 첫 줄 들여쓰기 적용.
// 내용이 비면 <br> 하나를 넣어 빈 줄이 사라지지 않게 함
Block assemble_paragraph(const XmlElement& paragraph, const std::string& ns);

// body 아래 모든 w:p 를 문서 순서대로 변환해 doc 뒤에 붙임
void assemble_body(const XmlElement& body, const std::string& ns, RichTextDocument& doc);

// 직렬화했을 때 비어 있거나 공백(ASCII 및 U+00A0, U+3000 등 유니코드 공백)만 있으면 true
bool is_blank(const InlineContent& content);
