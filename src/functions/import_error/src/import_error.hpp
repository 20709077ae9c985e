#pragma once
#include <stdexcept>
#include <string>

// 패키지 하나를 변환하다 실패한 이유
enum class ImportErrorKind {
    CorruptArchive,       // zip으로 열 수 없음
    MissingDocumentPart,  // zip은 열리지만 word/document.xml 없음
    MalformedXml,         // document.xml이 well-formed XML이 아님
    Unexpected            // 그 밖의 런타임 오류
};

const char* to_string(ImportErrorKind kind);

// 변환 파이프라인이 던지는 예외. 배치 단계에서 kind별로 기록된다.
class DocxImportError : public std::runtime_error {
public:
    DocxImportError(ImportErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ImportErrorKind kind() const noexcept { return kind_; }

private:
    ImportErrorKind kind_;
};
