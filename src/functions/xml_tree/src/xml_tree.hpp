#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pugi { class xml_document; }
class NamespaceScopes;

// 파싱된 element 하나에 대한 읽기 전용 조회 인터페이스.
// 이름은 항상 (namespace URI, local name)으로 비교한다. prefix는 문서마다 다를 수 있음
class XmlElement {
public:
    virtual ~XmlElement() = default;

    virtual std::string namespace_uri() const = 0;
    virtual std::string local_name() const = 0;

    bool is(const std::string& ns, const std::string& local) const {
        return local_name() == local && namespace_uri() == ns;
    }

    // 없는 attribute는 std::nullopt. prefix 없는 attribute의 namespace는 ""
    virtual std::optional<std::string> attribute(const std::string& ns, const std::string& local) const = 0;

    // 조건에 맞는 첫 번째 자식 element. 없으면 nullptr
    virtual std::unique_ptr<XmlElement> child(const std::string& ns, const std::string& local) const = 0;

    // 자식 element 전체 (문서 순서)
    virtual std::vector<std::unique_ptr<XmlElement>> children() const = 0;

    // 직계 텍스트/CDATA 자식을 이어붙인 값
    virtual std::string text() const = 0;
};

// XML 문서 하나. 트리는 이 객체가 소유하며 root()가 돌려주는 element들은
// XmlTree보다 오래 살 수 없다.
class XmlTree {
public:
    // 실패 시 DocxImportError(MalformedXml)
    static XmlTree parse(const std::string& blob);

    XmlTree(XmlTree&&) noexcept;
    XmlTree& operator=(XmlTree&&) noexcept;
    ~XmlTree();

    const XmlElement& root() const { return *root_; }

private:
    explicit XmlTree(std::unique_ptr<pugi::xml_document> doc);

    std::unique_ptr<pugi::xml_document> doc_;
    std::unique_ptr<NamespaceScopes> scopes_;
    std::unique_ptr<XmlElement> root_;
};
