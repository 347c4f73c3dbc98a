#include "ocr_policy.hpp"

#include <exception>

#include "errors.hpp"
#include "log.hpp"

namespace pdfmask {

OcrDecision decide_ocr(const EvidenceSnapshot &before, const EvidenceSnapshot &after, const OcrPolicyConfig &cfg) {
    const long long diff = after.char_count - before.char_count;
    if (after.literal_hit_count <= before.literal_hit_count) {
        return {true, "OCR did not improve literal hits (" + std::to_string(after.literal_hit_count) +
                          " <= " + std::to_string(before.literal_hit_count) + ")"};
    }
    if (diff < cfg.min_char_gain) {
        return {true, "OCR did not significantly improve text length (diff=" + std::to_string(diff) + ")"};
    }
    return {false, "OCR improved text content"};
}

OcrPolicyResult AdaptiveOcrPolicy::run(const Bytes &original, const std::vector<std::string> &literals,
                                       const OcrProgress &progress, const std::function<void()> &on_revert) const {
    OcrPolicyResult r;
    r.before = measure_evidence(provider_, original, literals);
    log_info("ocr", LogLine("evidence before OCR").kv("chars", r.before.char_count).kv("hits", r.before.literal_hit_count).str());

    OcrDecision decision;
    Bytes ocred;
    try {
        OcrOutcome forced = engine_.run(original, {cfg_.language, OcrMode::ForceOcr}, progress);
        if (forced.cancelled) {
            r.cancelled = true;
            return r;
        }
        r.after = measure_evidence(provider_, forced.data, literals);
        ocred = std::move(forced.data);
        log_info("ocr", LogLine("evidence after OCR").kv("chars", r.after.char_count).kv("hits", r.after.literal_hit_count)
                            .kv("diff", r.after.char_count - r.before.char_count).str());
        decision = decide_ocr(r.before, r.after, cfg_);
    } catch (const std::exception &e) {
        // EngineError, an unreadable OCR result (IoError), or anything else the engine threw
        log_warn("ocr", LogLine("forced OCR failed, keeping pre-OCR document").kv("error", e.what()).str());
        r.document = original;
        r.reason = std::string("OCR engine failed: ") + e.what();
        r.fallback_used = true;
        return r;
    }

    r.reason = decision.reason;
    if (!decision.revert) {
        log_info("ocr", LogLine("keeping OCR result").kv("reason", decision.reason).str());
        r.document = std::move(ocred);
        r.committed = true;
        r.state = OcrPolicyState::Committed;
        return r;
    }

    log_info("ocr", LogLine("reverting to skip_text").kv("reason", decision.reason).str());
    if (on_revert) on_revert();
    try {
        OcrOutcome skipped = engine_.run(original, {cfg_.language, OcrMode::SkipText}, progress);
        if (skipped.cancelled) {
            r.cancelled = true;
            return r;
        }
        r.document = std::move(skipped.data);
    } catch (const std::exception &e) {
        log_warn("ocr", LogLine("revert failed, using pre-OCR document").kv("error", e.what()).str());
        r.document = original;
        r.fallback_used = true;
    }
    return r;
}

} // namespace pdfmask
