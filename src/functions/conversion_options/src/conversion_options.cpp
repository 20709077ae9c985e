#include "conversion_options.hpp"

#include <fstream>
#include <stdexcept>

static std::string trim_copy(const std::string& s) {
    const char* ws = " \t\r\n";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return std::string();
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

std::unordered_map<std::string, std::string> load_env(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("cannot open config: " + path);

    std::unordered_map<std::string, std::string> env;
    std::string line;
    while (std::getline(in, line)) {
        line = trim_copy(line);
        if (line.empty() || line[0] == '#') continue;
        auto pos = line.find('=');
        if (pos == std::string::npos) continue;
        std::string key = trim_copy(line.substr(0, pos));
        std::string val = trim_copy(line.substr(pos + 1));
        // "..." 로 감싼 값 허용
        if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
            val = val.substr(1, val.size() - 2);
        if (!key.empty()) env[key] = val;
    }
    return env;
}

ConversionOptions options_from_env(const std::unordered_map<std::string, std::string>& env,
                                   ConversionOptions base) {
    auto pick = [&env](const char* key, std::string& target) {
        auto it = env.find(key);
        if (it != env.end() && !it->second.empty()) target = it->second;
    };
    pick("DOCX_DOCUMENT_PART", base.document_part);
    pick("DOCX_NAMESPACE_URI", base.namespace_uri);
    // 빈 suffix는 "확장자 제거 안 함"으로 의미가 있으므로 그대로 반영
    auto it = env.find("DOCX_TITLE_SUFFIX");
    if (it != env.end()) base.title_suffix = it->second;
    return base;
}
