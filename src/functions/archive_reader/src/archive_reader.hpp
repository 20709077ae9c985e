#pragma once
#include <string>

// 메모리에 올린 zip 패키지에서 entry 하나를 꺼내 반환
// zip으로 열 수 없으면 DocxImportError(CorruptArchive),
// entry가 없으면 DocxImportError(MissingDocumentPart)
std::string read_package_entry(const std::string& package_bytes, const std::string& entry_name);

// 디스크의 파일 전체를 바이트 그대로 읽음. 실패 시 std::runtime_error
std::string read_file_bytes(const std::string& path);
