#include "archive_reader.hpp"
#include "functions/import_error/src/import_error.hpp"

#include <zip.h>

#include <fstream>
#include <iterator>
#include <stdexcept>

static std::string zip_error_message(zip_error_t* ze) {
    std::string msg = zip_error_strerror(ze);
    zip_error_fini(ze);
    return msg;
}

// ---- zip에서 entry 읽기 ----
static std::string read_zip_entry(zip_t* z, const std::string& name) {
    zip_stat_t st;
    zip_stat_init(&st);
    if (zip_stat(z, name.c_str(), 0, &st) != 0) {
        if (zip_error_code_zip(zip_get_error(z)) == ZIP_ER_NOENT)
            throw DocxImportError(ImportErrorKind::MissingDocumentPart, "missing entry: " + name);
        throw DocxImportError(ImportErrorKind::CorruptArchive,
                              "zip_stat failed: " + name + ": " + zip_strerror(z));
    }

    zip_file_t* f = zip_fopen(z, name.c_str(), 0);
    if (!f)
        throw DocxImportError(ImportErrorKind::CorruptArchive,
                              "zip_fopen failed: " + name + ": " + zip_strerror(z));

    std::string buf;
    buf.resize(static_cast<size_t>(st.size));
    zip_int64_t n = zip_fread(f, buf.data(), st.size);
    zip_fclose(f);

    // CRC 오류, 압축 해제 실패 등
    if (n < 0 || n != static_cast<zip_int64_t>(st.size))
        throw DocxImportError(ImportErrorKind::CorruptArchive, "zip_fread incomplete: " + name);
    return buf;
}

std::string read_package_entry(const std::string& package_bytes, const std::string& entry_name) {
    // libzip은 0바이트 입력을 빈 아카이브로 열어버리므로 먼저 거름
    if (package_bytes.empty())
        throw DocxImportError(ImportErrorKind::CorruptArchive, "empty package");

    zip_error_t ze;
    zip_error_init(&ze);
    zip_source_t* src = zip_source_buffer_create(package_bytes.data(), package_bytes.size(), 0, &ze);
    if (!src)
        throw DocxImportError(ImportErrorKind::CorruptArchive,
                              "zip_source_buffer_create failed: " + zip_error_message(&ze));

    zip_t* z = zip_open_from_source(src, ZIP_RDONLY, &ze);
    if (!z) {
        zip_source_free(src);
        throw DocxImportError(ImportErrorKind::CorruptArchive,
                              "zip_open failed: " + zip_error_message(&ze));
    }
    zip_error_fini(&ze);

    // 성공하면 source는 archive 소유가 됨
    try {
        std::string content = read_zip_entry(z, entry_name);
        zip_discard(z);
        return content;
    }
    catch (...) {
        zip_discard(z);
        throw;  // 예외 다시 던짐
    }
}

std::string read_file_bytes(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("failed to open: " + path);
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) throw std::runtime_error("failed to read: " + path);
    return bytes;
}
