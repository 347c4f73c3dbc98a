// pdfmask: burn literal strings out of PDFs, with adaptive OCR.
//
// ./pdfmask INPUT_PATH OUTPUT_PATH --words=a,b [--threads=N] [--lang=chi_tra+eng] [--report=out.json]
//
// INPUT_PATH may be a directory; every *.pdf in it is written to
// OUTPUT_PATH/redacted_<name>.

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "cancellation.hpp"
#include "config.hpp"
#include "log.hpp"
#include "pdfium_document.hpp"
#include "pipeline.hpp"
#include "report.hpp"
#include "rotation.hpp"
#include "tesseract_ocr_engine.hpp"
#include "text_util.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace pdfmask;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_sigint(int) { g_interrupted = 1; }

void die(const std::string &m) {
    std::cerr << "Error: " << m << std::endl;
    std::exit(1);
}

bool is_pdf(const fs::path &p) { return p.has_extension() && to_lower(p.extension().string()) == ".pdf"; }

struct DocResult {
    bool ok = false;
    bool cancelled = false;
    std::string error;
    RunReport report;
};

DocResult process_single_document(const fs::path &in, const fs::path &out, const Config &cfg,
                                  const ProgressSink &sink) {
    DocResult r;
    r.report.input_path = in.string();
    ScopedRun run(CancellationRegistry::instance(), in.string());
    try {
        PdfiumProvider provider(cfg.password);
        TesseractOsdDetector detector("", cfg.dpi);
        TesseractOcrConfig ocfg;
        ocfg.dpi = cfg.dpi;
        ocfg.clean_input = cfg.clean_ocr_input;
        TesseractOcrEngine engine(ocfg);
        RedactionPipeline pipeline(provider, detector, engine, pipeline_config(cfg));

        r.report = pipeline.run(in.string(), out.string(), cfg.words, sink, run.token());
        r.ok = r.report.status == RunStatus::kOk;
        r.cancelled = r.report.status == RunStatus::kCancelled;
    } catch (const std::exception &e) {
        r.ok = false;
        r.error = e.what();
        r.report.status = RunStatus::kFailed;
        r.report.error = e.what();
        log_error("run", LogLine("failed").kv("input", in.string()).kv("error", e.what()).str());
    }
    return r;
}

} // namespace

// ---------------- Main ----------------
int main(int argc, char **argv) {
    Config cfg;
    try {
        cfg = parse_cli(argc, argv);
    } catch (const UsageError &e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    if (!set_log_level(cfg.log_level)) log_warn("config", LogLine("unknown log level").kv("value", cfg.log_level).str());
    if (cfg.words.empty()) die("No literals given, use --words=a,b or the config's \"words\" list");

    std::vector<fs::path> inputs;
    std::vector<fs::path> outputs;
    if (fs::is_directory(cfg.input_path)) {
        for (auto &entry : fs::directory_iterator(cfg.input_path)) {
            if (entry.is_regular_file() && is_pdf(entry.path())) inputs.push_back(entry.path());
        }
        if (inputs.empty()) die("No PDFs found in folder");
        std::sort(inputs.begin(), inputs.end());
        std::error_code ec;
        fs::create_directories(cfg.output_path, ec);
        if (ec) die("Cannot create output folder " + cfg.output_path + ": " + ec.message());
        for (auto &p : inputs) outputs.push_back(fs::path(cfg.output_path) / ("redacted_" + p.filename().string()));
    } else {
        inputs.push_back(cfg.input_path);
        outputs.push_back(cfg.output_path);
    }

    std::signal(SIGINT, on_sigint);
    std::atomic<bool> done{false};
    std::thread watcher([&] {
        while (!done.load()) {
            if (g_interrupted) {
                log_warn("run", "interrupted, cancelling all runs");
                CancellationRegistry::instance().cancel_all();
                g_interrupted = 0;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    std::mutex io_mu;
    std::vector<DocResult> results(inputs.size());
    std::atomic<size_t> idx{0};
    const bool batch = inputs.size() > 1;

    auto worker = [&]() {
        while (true) {
            size_t i = idx.fetch_add(1);
            if (i >= inputs.size()) break;
            const std::string name = inputs[i].filename().string();
            ProgressSink sink = [&io_mu, &name, batch](const ProgressEvent &ev) {
                std::lock_guard<std::mutex> lk(io_mu);
                std::cout << "PROGRESS " << ev.percentage << ": " << ev.message;
                if (batch) std::cout << " [" << name << "]";
                std::cout << "\n";
            };
            DocResult r = process_single_document(inputs[i], outputs[i], cfg, sink);
            {
                std::lock_guard<std::mutex> lk(io_mu);
                results[i] = std::move(r);
                std::cout << "[" << i + 1 << "/" << inputs.size() << "] " << name << " -> "
                          << (results[i].ok ? "OK" : results[i].cancelled ? "CANCELLED" : "ERR") << "\n";
            }
        }
    };

    int thread_count = std::min<int>(cfg.threads, (int)inputs.size());
    std::vector<std::thread> workers;
    workers.reserve(thread_count);
    for (int t = 0; t < thread_count; ++t) workers.emplace_back(worker);
    for (auto &th : workers) th.join();
    done = true;
    watcher.join();

    size_t ok = 0, cancelled = 0, failed = 0;
    for (auto &r : results) {
        if (r.ok) ++ok;
        else if (r.cancelled) ++cancelled;
        else ++failed;
    }

    if (!cfg.report_path.empty()) {
        json out;
        out["generated_at"] = (long long)std::time(nullptr);
        out["documents"] = json::array();
        for (auto &r : results) out["documents"].push_back(to_json(r.report));
        out["stats"] = {{"processed", results.size()}, {"ok", ok}, {"cancelled", cancelled}, {"errors", failed}};
        std::ofstream f(cfg.report_path);
        if (!f) die("Failed to open report file");
        f << out.dump(2);
        f.close();
        std::cout << "Report written: " << cfg.report_path << "\n";
    }

    if (failed) return 1;
    return cancelled ? 130 : 0;
}
