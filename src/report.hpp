#ifndef PDFMASK_REPORT_HPP
#define PDFMASK_REPORT_HPP

#include <string>

#include <nlohmann/json.hpp>

#include "evidence.hpp"
#include "geometry.hpp"
#include "redaction_burner.hpp"

namespace pdfmask {

enum class RunStatus { kOk, kCancelled, kFailed };

const char *run_status_str(RunStatus s);

struct OcrSummary {
    bool attempted = false;
    bool committed = false;
    bool fallback_used = false;
    std::string reason;
    EvidenceSnapshot before;
    EvidenceSnapshot after;
};

// Everything one pipeline run decided, for the CLI's --report output.
struct RunReport {
    RunStatus status = RunStatus::kOk;
    std::string error;
    std::string input_path;
    std::string output_path;
    int pages = 0;
    int rotated_pages = 0;
    OcrSummary ocr;
    PageHits hits;
    BurnReport burn;
};

nlohmann::json to_json(const Rect &r);
nlohmann::json to_json(const EvidenceSnapshot &e);
nlohmann::json to_json(const RunReport &r);

} // namespace pdfmask

#endif // PDFMASK_REPORT_HPP
