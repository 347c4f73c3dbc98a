#ifndef PDFMASK_OCR_POLICY_HPP
#define PDFMASK_OCR_POLICY_HPP

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "document.hpp"
#include "evidence.hpp"
#include "ocr_engine.hpp"

namespace pdfmask {

struct OcrPolicyConfig {
    std::string language = "chi_tra+eng";
    // OCR must add at least this many characters to be kept.
    long long min_char_gain = 80;
};

struct OcrDecision {
    bool revert = false;
    std::string reason;
};

// Revert when OCR did not raise the literal hit count, or when it added
// fewer than min_char_gain characters.
OcrDecision decide_ocr(const EvidenceSnapshot &before, const EvidenceSnapshot &after, const OcrPolicyConfig &cfg);

enum class OcrPolicyState { Candidate, Committed };

struct OcrPolicyResult {
    bool cancelled = false;
    Bytes document;
    OcrPolicyState state = OcrPolicyState::Candidate;
    EvidenceSnapshot before;
    EvidenceSnapshot after;
    bool committed = false;     // the force_ocr result is the working document
    bool fallback_used = false; // skip_text failed, original kept unchanged
    std::string reason;
};

// One-shot keep-or-revert decision for a forced OCR pass.
class AdaptiveOcrPolicy {
public:
    AdaptiveOcrPolicy(const DocumentProvider &provider, OcrEngine &engine, OcrPolicyConfig cfg = {})
        : provider_(provider), engine_(engine), cfg_(std::move(cfg)) {}

    // `on_revert` is called once before the skip_text pass starts.
    OcrPolicyResult run(const Bytes &original, const std::vector<std::string> &literals,
                        const OcrProgress &progress, const std::function<void()> &on_revert = {}) const;

private:
    const DocumentProvider &provider_;
    OcrEngine &engine_;
    OcrPolicyConfig cfg_;
};

} // namespace pdfmask

#endif // PDFMASK_OCR_POLICY_HPP
