#include "chapter_json.hpp"

#include <fstream>
#include <stdexcept>

nlohmann::json batch_result_to_json(const BatchImportResult& result) {
    nlohmann::json chapters = nlohmann::json::array();
    for (const auto& c : result.chapters) {
        chapters.push_back({
            {"title", c.title},
            {"html", c.html},
            {"source", c.source_name},
        });
    }

    nlohmann::json failures = nlohmann::json::array();
    for (const auto& f : result.failures) {
        failures.push_back({
            {"file", f.source_name},
            {"error", to_string(f.kind)},
            {"message", f.message},
        });
    }

    return {{"chapters", chapters}, {"failures", failures}};
}

std::string dump_report(const BatchImportResult& result) {
    return batch_result_to_json(result).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

void save_to_file(const std::string& path, const std::string& content) {
    std::ofstream ofs(path, std::ios::binary);
    if (!ofs) throw std::runtime_error("failed to create: " + path);
    ofs << content;
    ofs.close();
    if (!ofs) throw std::runtime_error("failed to write: " + path);
}
