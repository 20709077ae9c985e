#include "import_error.hpp"

const char* to_string(ImportErrorKind kind) {
    switch (kind) {
        case ImportErrorKind::CorruptArchive:      return "CorruptArchive";
        case ImportErrorKind::MissingDocumentPart: return "MissingDocumentPart";
        case ImportErrorKind::MalformedXml:        return "MalformedXml";
        case ImportErrorKind::Unexpected:          return "Unexpected";
    }
    return "Unexpected";
}
