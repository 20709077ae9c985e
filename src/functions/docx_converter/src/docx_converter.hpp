#pragma once
#include "rich_text.hpp"
#include "functions/conversion_options/src/conversion_options.hpp"

#include <string>

// document.xml 본문 -> 문서 모델. 실패 시 DocxImportError(MalformedXml)
RichTextDocument convert_document_xml(const std::string& xml, const ConversionOptions& options = {});

// .docx 바이트 -> 문서 모델
// 오류 시 DocxImportError (CorruptArchive / MissingDocumentPart / MalformedXml)
RichTextDocument convert_docx(const std::string& package_bytes, const ConversionOptions& options = {});

// convert_docx + render_document
std::string convert_docx_to_html(const std::string& package_bytes, const ConversionOptions& options = {});
