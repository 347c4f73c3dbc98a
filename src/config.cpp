#include "config.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "log.hpp"
#include "text_util.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace pdfmask {

namespace {

int parse_int(const std::string &flag, const std::string &v) {
    try {
        size_t used = 0;
        int n = std::stoi(v, &used);
        if (used != v.size()) throw UsageError("bad value for " + flag + ": " + v);
        return n;
    } catch (const std::logic_error &) {
        throw UsageError("bad value for " + flag + ": " + v);
    }
}

} // namespace

std::string usage(const char *argv0) {
    return std::string("Usage: ") + argv0 +
           " INPUT_PATH OUTPUT_PATH [--words=a,b] [--config=path] [--lang=chi_tra+eng] [--dpi=300] "
           "[--min-gain=80] [--threads=N] [--report=path.json] [--password=..] [--no-ocr] [--no-clean] "
           "[--log-level=info]";
}

std::string default_config_path() {
    const char *home = std::getenv("HOME");
    return home && *home ? (fs::path(home) / ".pdfmask").string() : std::string(".pdfmask");
}

void apply_config_json(const json &j, Config &c) {
    if (j.contains("words")) {
        c.words.clear();
        for (auto &w : j.at("words")) c.words.push_back(w.get<std::string>());
        c.words = normalize_literals(c.words);
    }
    if (j.contains("ocr_language")) c.ocr_language = j.at("ocr_language").get<std::string>();
    if (j.contains("min_char_gain")) c.min_char_gain = j.at("min_char_gain").get<long long>();
    if (j.contains("dpi")) c.dpi = std::max(72, j.at("dpi").get<int>());
    if (j.contains("threads")) c.threads = std::max(1, j.at("threads").get<int>());
    if (j.contains("log_level")) c.log_level = j.at("log_level").get<std::string>();
    if (j.contains("clean_ocr_input")) c.clean_ocr_input = j.at("clean_ocr_input").get<bool>();
    if (j.contains("adaptive_ocr")) c.adaptive_ocr = j.at("adaptive_ocr").get<bool>();
}

bool load_config_file(const std::string &path, Config &c) {
    std::ifstream f(path);
    if (!f) return false;
    try {
        json j = json::parse(f);
        if (!j.is_object()) {
            log_warn("config", LogLine("ignoring config, root is not an object").kv("path", path).str());
            return false;
        }
        Config next = c;
        apply_config_json(j, next);
        c = std::move(next);
        log_debug("config", LogLine("loaded").kv("path", path).str());
        return true;
    } catch (const json::exception &e) {
        log_warn("config", LogLine("ignoring malformed config").kv("path", path).kv("error", e.what()).str());
        return false;
    }
}

// ---------------- CLI ----------------
Config parse_cli(int argc, char **argv) {
    if (argc < 3) throw UsageError(usage(argc > 0 ? argv[0] : "pdfmask"));
    Config c;
    std::vector<std::string> args(argv + 3, argv + argc);

    for (auto &a : args) {
        if (a.rfind("--config=", 0) == 0) c.config_path = a.substr(9);
    }
    load_config_file(c.config_path.empty() ? default_config_path() : c.config_path, c);

    c.input_path = argv[1];
    c.output_path = argv[2];
    for (auto &a : args) {
        if (a.rfind("--words=", 0) == 0) c.words = split_csv(a.substr(8));
        else if (a.rfind("--config=", 0) == 0) continue;
        else if (a.rfind("--lang=", 0) == 0) c.ocr_language = a.substr(7);
        else if (a.rfind("--dpi=", 0) == 0) c.dpi = std::max(72, parse_int("--dpi", a.substr(6)));
        else if (a.rfind("--min-gain=", 0) == 0) c.min_char_gain = parse_int("--min-gain", a.substr(11));
        else if (a.rfind("--threads=", 0) == 0) c.threads = std::max(1, parse_int("--threads", a.substr(10)));
        else if (a.rfind("--report=", 0) == 0) c.report_path = a.substr(9);
        else if (a.rfind("--password=", 0) == 0) c.password = a.substr(11);
        else if (a == "--no-ocr") c.adaptive_ocr = false;
        else if (a == "--no-clean") c.clean_ocr_input = false;
        else if (a.rfind("--log-level=", 0) == 0) c.log_level = a.substr(12);
        else throw UsageError("unknown option " + a + "\n" + usage(argv[0]));
    }
    if (c.ocr_language.empty()) throw UsageError("--lang must not be empty");
    return c;
}

PipelineConfig pipeline_config(const Config &c) {
    PipelineConfig p;
    p.dpi = c.dpi;
    p.adaptive_ocr = c.adaptive_ocr;
    p.ocr.language = c.ocr_language;
    p.ocr.min_char_gain = c.min_char_gain;
    return p;
}

} // namespace pdfmask
