#pragma once
#include "functions/conversion_options/src/conversion_options.hpp"
#include "functions/import_error/src/import_error.hpp"

#include <string>
#include <vector>

struct PackageInput {
    std::string name;   // 표시 이름 (파일 이름 또는 경로)
    std::string bytes;  // .docx 내용
};

// 챕터 저장소에 넘길 레코드
struct ImportedChapter {
    std::string source_name;
    std::string title;
    std::string html;
};

struct ImportFailure {
    std::string source_name;
    ImportErrorKind kind;
    std::string message;
};

// 둘 다 입력 순서를 유지
struct BatchImportResult {
    std::vector<ImportedChapter> chapters;
    std::vector<ImportFailure> failures;
};

// 경로의 파일 이름에서 suffix(대소문자 무시)를 뗀 값. "ch1.DOCX" -> "ch1"
std::string derive_title(const std::string& name, const std::string& suffix);

// 패키지마다 따로 변환. 한 패키지의 실패는 기록만 하고 나머지는 계속 처리
BatchImportResult import_packages(const std::vector<PackageInput>& inputs,
                                  const ConversionOptions& options = {});

// 디스크에서 읽기까지 패키지 단위로 격리. 읽을 수 없는 파일도 실패로 기록됨
BatchImportResult import_files(const std::vector<std::string>& paths,
                               const ConversionOptions& options = {});
