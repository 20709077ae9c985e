#include "xml_tree.hpp"
#include "functions/import_error/src/import_error.hpp"

#include <pugixml.hpp>

#include <cstring>
#include <unordered_map>

static const char* const kXmlNamespace = "http://www.w3.org/XML/1998/namespace";

// ---- namespace 해석 ----
// "w:p" -> ("w", "p"), "p" -> ("", "p")
static void split_qname(const char* qname, std::string& prefix, std::string& local) {
    const char* colon = std::strchr(qname, ':');
    if (!colon) {
        prefix.clear();
        local = qname;
        return;
    }
    prefix.assign(qname, colon);
    local = colon + 1;
}

static bool is_namespace_decl(const char* name) {
    return std::strcmp(name, "xmlns") == 0 || std::strncmp(name, "xmlns:", 6) == 0;
}

// 문서 하나에서 prefix 를 URI 로 바꾸는 유일한 곳.
// 조상 방향으로 xmlns 선언을 찾고, 지나온 element 마다 결과를 기억해서
// 깊게 중첩된 문서도 element 당 한 번만 거슬러 올라감
class NamespaceScopes {
public:
    // 바인딩이 없으면 ""
    const std::string& resolve(pugi::xml_node node, const std::string& prefix) {
        if (prefix == "xml") return xml_ns_;

        auto& seen = cache_[prefix];
        const std::string decl = prefix.empty() ? std::string("xmlns") : "xmlns:" + prefix;

        std::vector<pugi::xml_node_struct*> path;
        const std::string* found = &unbound_;
        for (pugi::xml_node n = node; n && n.type() == pugi::node_element; n = n.parent()) {
            auto hit = seen.find(n.internal_object());
            if (hit != seen.end()) {
                found = &hit->second;
                break;
            }
            path.push_back(n.internal_object());
            pugi::xml_attribute a = n.attribute(decl.c_str());
            if (a) {
                found = &seen.emplace(n.internal_object(), a.value()).first->second;
                path.pop_back();
                break;
            }
        }

        // unordered_map 의 원소 참조는 rehash 후에도 유효
        const std::string value = *found;
        for (auto* p : path) seen.emplace(p, value);
        return path.empty() ? *found : seen.find(path.front())->second;
    }

private:
    std::unordered_map<std::string, std::unordered_map<pugi::xml_node_struct*, std::string>> cache_;
    const std::string xml_ns_ = kXmlNamespace;
    const std::string unbound_;
};

// ---- pugixml 위의 XmlElement 구현 ----
namespace {

class PugiElement : public XmlElement {
public:
    PugiElement(pugi::xml_node node, NamespaceScopes* scopes) : node_(node), scopes_(scopes) {
        split_qname(node_.name(), prefix_, local_);
    }

    // is()/child() 는 local name 이 맞을 때만 여기까지 옴
    std::string namespace_uri() const override {
        if (!ns_) ns_ = scopes_->resolve(node_, prefix_);
        return *ns_;
    }

    std::string local_name() const override { return local_; }

    std::optional<std::string> attribute(const std::string& ns, const std::string& local) const override {
        for (pugi::xml_attribute a = node_.first_attribute(); a; a = a.next_attribute()) {
            if (is_namespace_decl(a.name())) continue;
            std::string prefix, name;
            split_qname(a.name(), prefix, name);
            if (name != local) continue;
            // prefix 없는 attribute는 기본 namespace를 상속하지 않음
            const std::string attr_ns = prefix.empty() ? std::string() : scopes_->resolve(node_, prefix);
            if (attr_ns == ns) return std::string(a.value());
        }
        return std::nullopt;
    }

    std::unique_ptr<XmlElement> child(const std::string& ns, const std::string& local) const override {
        for (pugi::xml_node ch = node_.first_child(); ch; ch = ch.next_sibling()) {
            if (ch.type() != pugi::node_element) continue;
            auto el = std::make_unique<PugiElement>(ch, scopes_);
            if (el->is(ns, local)) return el;
        }
        return nullptr;
    }

    std::vector<std::unique_ptr<XmlElement>> children() const override {
        std::vector<std::unique_ptr<XmlElement>> out;
        for (pugi::xml_node ch = node_.first_child(); ch; ch = ch.next_sibling()) {
            if (ch.type() == pugi::node_element) out.push_back(std::make_unique<PugiElement>(ch, scopes_));
        }
        return out;
    }

    std::string text() const override {
        std::string out;
        for (pugi::xml_node ch = node_.first_child(); ch; ch = ch.next_sibling()) {
            if (ch.type() == pugi::node_pcdata || ch.type() == pugi::node_cdata) out.append(ch.value());
        }
        return out;
    }

private:
    pugi::xml_node node_;
    NamespaceScopes* scopes_;  // XmlTree 소유
    std::string prefix_;
    std::string local_;
    mutable std::optional<std::string> ns_;
};

} // namespace

XmlTree::XmlTree(std::unique_ptr<pugi::xml_document> doc)
    : doc_(std::move(doc)),
      scopes_(std::make_unique<NamespaceScopes>()),
      root_(std::make_unique<PugiElement>(doc_->document_element(), scopes_.get())) {}

XmlTree::XmlTree(XmlTree&&) noexcept = default;
XmlTree& XmlTree::operator=(XmlTree&&) noexcept = default;
XmlTree::~XmlTree() = default;

XmlTree XmlTree::parse(const std::string& blob) {
    auto doc = std::make_unique<pugi::xml_document>();
    // w:t 안의 공백 하나짜리 텍스트(xml:space="preserve")도 살림
    const unsigned int flags = pugi::parse_default | pugi::parse_ws_pcdata_single;
    pugi::xml_parse_result result = doc->load_buffer(blob.data(), blob.size(), flags, pugi::encoding_auto);
    if (!result) {
        throw DocxImportError(ImportErrorKind::MalformedXml,
                              std::string("XML parse error: ") + result.description() +
                              " at offset " + std::to_string(result.offset));
    }
    if (!doc->document_element())
        throw DocxImportError(ImportErrorKind::MalformedXml, "XML has no document element");
    return XmlTree(std::move(doc));
}
