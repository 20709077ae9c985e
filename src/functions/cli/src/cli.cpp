#include "cli.hpp"
#include "functions/batch_import/src/batch_import.hpp"
#include "functions/chapter_json/src/chapter_json.hpp"
#include "functions/conversion_options/src/conversion_options.hpp"

#include <exception>
#include <filesystem>
#include <ostream>

static void usage(std::ostream& err) {
    err << "Usage: docx2chapter [--config <file.env>] [--out <chapters.json>] <file.docx> [...]\n";
}

int run_cli(const std::vector<std::string>& args,
            const std::string& fallback_config,
            std::ostream& out,
            std::ostream& err) {
    std::string config_path;
    std::string out_path;
    std::vector<std::string> inputs;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--config" || arg == "--out") {
            if (i + 1 >= args.size()) {
                usage(err);
                return 1;
            }
            (arg == "--config" ? config_path : out_path) = args[++i];
        } else if (arg == "-h" || arg == "--help") {
            usage(out);
            return 0;
        } else {
            inputs.push_back(arg);
        }
    }
    if (inputs.empty()) {
        usage(err);
        return 1;
    }

    // JSON을 stdout으로 낼 때는 진행 로그를 stderr로
    std::ostream& info = out_path.empty() ? err : out;

    try {
        ConversionOptions options;
        if (config_path.empty() && !fallback_config.empty() && std::filesystem::exists(fallback_config))
            config_path = fallback_config;
        if (!config_path.empty()) {
            options = options_from_env(load_env(config_path));
            info << "[info] Loaded config from " << config_path << "\n";
        }

        BatchImportResult result = import_files(inputs, options);
        info << "[info] Imported " << result.chapters.size() << " of " << inputs.size() << " file(s)\n";

        const std::string json = dump_report(result);
        if (out_path.empty()) {
            out << json;
        } else {
            save_to_file(out_path, json);
            info << "[info] Saved chapters to " << out_path << "\n";
        }

        for (const auto& f : result.failures) {
            err << "[error] Failed to import " << f.source_name << ": " << to_string(f.kind) << "\n";
        }
        return result.failures.empty() ? 0 : 3;
    } catch (const std::exception& e) {
        err << "[error] " << e.what() << "\n";
        return 2;
    }
}
