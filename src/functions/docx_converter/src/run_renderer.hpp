#pragma once
#include "rich_text.hpp"

#include <string>

class XmlElement;

// w:r 하나를 인라인 조각으로. w:t / w:tab / w:br / w:cr 만 보고 나머지는 버림.
// 내용이 있으면 bold -> italic -> underline -> strike 순서(바깥 -> 안쪽)로 감쌈
InlineContent render_run(const XmlElement& run, const std::string& ns);

// 주어진 속성대로 content 를 감쌈. 빈 content 는 감싸지 않음
InlineContent apply_emphasis(InlineContent content, const RunProperties& props);
