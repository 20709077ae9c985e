#pragma once
#include "functions/batch_import/src/batch_import.hpp"

#include <nlohmann/json.hpp>
#include <string>

// {"chapters":[{"title","html","source"}], "failures":[{"file","error","message"}]}
nlohmann::json batch_result_to_json(const BatchImportResult& result);

// 들여쓰기 2칸 JSON 문자열. 파일 이름이나 본문에 UTF-8이 아닌 바이트가 있으면
// U+FFFD 로 바꿔서 나머지 챕터는 그대로 내보냄
std::string dump_report(const BatchImportResult& result);

void save_to_file(const std::string& path, const std::string& content);
