#ifndef PDFMASK_PIPELINE_HPP
#define PDFMASK_PIPELINE_HPP

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "cancellation.hpp"
#include "document.hpp"
#include "literal_matcher.hpp"
#include "ocr_engine.hpp"
#include "ocr_policy.hpp"
#include "progress.hpp"
#include "redaction_burner.hpp"
#include "report.hpp"
#include "rotation.hpp"

namespace pdfmask {

struct PipelineConfig {
    int dpi = 300;            // rendering for orientation detection
    bool adaptive_ocr = true; // false: rotation-corrected document goes straight to redaction
    OcrPolicyConfig ocr;
    MatchTuning match;
    BurnTuning burn;
};

// Where the document comes from and goes to. Both may throw IoError.
using Loader = std::function<Bytes()>;
using Persister = std::function<void(const Bytes &)>;

// load -> rotation -> adaptive OCR -> redaction -> persistence, with a fixed
// progress checkpoint per stage and a cancellation check before each one.
class RedactionPipeline {
public:
    RedactionPipeline(const DocumentProvider &provider, RotationDetector &detector, OcrEngine &engine,
                      PipelineConfig cfg = {})
        : provider_(provider), detector_(detector), engine_(engine), cfg_(std::move(cfg)) {}

    // IoError from `load` or `persist` propagates. A cancelled run returns
    // kCancelled and never calls `persist`.
    RunReport execute(const Loader &load, const Persister &persist, const std::vector<std::string> &literals,
                      const ProgressSink &sink, const CancellationToken &token) const;

    // execute() over files.
    RunReport run(const std::string &input_path, const std::string &output_path,
                  const std::vector<std::string> &literals, const ProgressSink &sink,
                  const CancellationToken &token) const;

private:
    const DocumentProvider &provider_;
    RotationDetector &detector_;
    OcrEngine &engine_;
    PipelineConfig cfg_;
};

} // namespace pdfmask

#endif // PDFMASK_PIPELINE_HPP
