#ifndef PDFMASK_CONFIG_HPP
#define PDFMASK_CONFIG_HPP

#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "pipeline.hpp"

namespace pdfmask {

// ---------------- Config defaults ----------------
struct Config {
    std::string input_path;
    std::string output_path;
    std::string config_path;  // empty: ~/.pdfmask
    std::string report_path;  // empty disables the JSON report
    std::string password;
    std::vector<std::string> words;
    std::string ocr_language = "chi_tra+eng";
    long long min_char_gain = 80;
    int dpi = 300;
    int threads = std::thread::hardware_concurrency() ? std::thread::hardware_concurrency() : 4;
    std::string log_level = "info";
    bool clean_ocr_input = true;
    bool adaptive_ocr = true;
};

struct UsageError : std::runtime_error {
    explicit UsageError(const std::string &m) : std::runtime_error(m) {}
};

std::string usage(const char *argv0);

// $HOME/.pdfmask, or ".pdfmask" when HOME is unset.
std::string default_config_path();

// Copies the known keys of `j` into `c`. Throws nlohmann::json::exception
// on a key with the wrong type.
void apply_config_json(const nlohmann::json &j, Config &c);

// Missing file: false, `c` untouched. Malformed file: logged, false, `c`
// untouched.
bool load_config_file(const std::string &path, Config &c);

// Defaults, then the config file, then the flags. Throws UsageError.
Config parse_cli(int argc, char **argv);

PipelineConfig pipeline_config(const Config &c);

} // namespace pdfmask

#endif // PDFMASK_CONFIG_HPP
