#include "batch_import.hpp"
#include "functions/archive_reader/src/archive_reader.hpp"
#include "functions/docx_converter/src/docx_converter.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <filesystem>
#include <functional>
#include <iostream>

std::string derive_title(const std::string& name, const std::string& suffix) {
    std::string title = std::filesystem::path(name).filename().string();
    if (suffix.empty() || title.size() < suffix.size()) return title;

    auto lower = [](unsigned char c) { return std::tolower(c); };
    const bool ends_with = std::equal(suffix.rbegin(), suffix.rend(), title.rbegin(),
                                      [&](char a, char b) { return lower(a) == lower(b); });
    if (ends_with) title.resize(title.size() - suffix.size());
    return title;
}

// 패키지 하나 처리. 어떤 예외든 여기서 멈추고 실패 목록에 기록
static void import_one(const std::string& name,
                       const std::function<std::string()>& load_bytes,
                       const ConversionOptions& options,
                       BatchImportResult& result) {
    try {
        std::string html = convert_docx_to_html(load_bytes(), options);
        result.chapters.push_back({name, derive_title(name, options.title_suffix), std::move(html)});
    }
    catch (const DocxImportError& e) {
        std::cerr << "[warn] failed to import " << name << " (" << to_string(e.kind()) << "): "
                  << e.what() << "\n";
        result.failures.push_back({name, e.kind(), e.what()});
    }
    catch (const std::exception& e) {
        std::cerr << "[warn] failed to import " << name << ": " << e.what() << "\n";
        result.failures.push_back({name, ImportErrorKind::Unexpected, e.what()});
    }
}

BatchImportResult import_packages(const std::vector<PackageInput>& inputs,
                                  const ConversionOptions& options) {
    BatchImportResult result;
    for (const auto& in : inputs) {
        import_one(in.name, [&in] { return in.bytes; }, options, result);
    }
    return result;
}

BatchImportResult import_files(const std::vector<std::string>& paths,
                               const ConversionOptions& options) {
    BatchImportResult result;
    for (const auto& path : paths) {
        import_one(path, [&path] { return read_file_bytes(path); }, options, result);
    }
    return result;
}
