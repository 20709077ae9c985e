#pragma once
#include <string>
#include <unordered_map>

// 변환 호출마다 명시적으로 넘기는 설정값 (전역 상수 없음)
struct ConversionOptions {
    std::string document_part = "word/document.xml";
    std::string namespace_uri = "http://schemas.openxmlformats.org/wordprocessingml/2006/main";
    std::string title_suffix  = ".docx";
};

// KEY=VALUE 형식의 .env 파일 읽기. '#' 주석과 빈 줄은 건너뜀
// 파일을 열 수 없으면 std::runtime_error
std::unordered_map<std::string, std::string> load_env(const std::string& path);

// DOCX_DOCUMENT_PART / DOCX_NAMESPACE_URI / DOCX_TITLE_SUFFIX 가 있으면 기본값을 덮어씀
ConversionOptions options_from_env(const std::unordered_map<std::string, std::string>& env,
                                   ConversionOptions base = {});
