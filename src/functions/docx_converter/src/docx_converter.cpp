#include "docx_converter.hpp"
#include "paragraph_assembler.hpp"
#include "functions/archive_reader/src/archive_reader.hpp"
#include "functions/xml_tree/src/xml_tree.hpp"

RichTextDocument convert_document_xml(const std::string& xml, const ConversionOptions& options) {
    XmlTree tree = XmlTree::parse(xml);
    const XmlElement& root = tree.root();
    const std::string& ns = options.namespace_uri;

    // 본문 루트 후보: <w:document> -> <w:body>, 없으면 루트 자체
    RichTextDocument doc;
    auto body = root.child(ns, "body");
    assemble_body(body ? *body : root, ns, doc);
    return doc;
}

RichTextDocument convert_docx(const std::string& package_bytes, const ConversionOptions& options) {
    std::string xml = read_package_entry(package_bytes, options.document_part);
    return convert_document_xml(xml, options);
}

std::string convert_docx_to_html(const std::string& package_bytes, const ConversionOptions& options) {
    return render_document(convert_docx(package_bytes, options));
}
