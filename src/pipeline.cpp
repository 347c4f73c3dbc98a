#include "pipeline.hpp"

#include "errors.hpp"
#include "file_io.hpp"
#include "log.hpp"
#include "text_util.hpp"

namespace pdfmask {

namespace {

RunReport cancelled(RunReport r, const char *stage) {
    log_info(stage, "run cancelled");
    r.status = RunStatus::kCancelled;
    return r;
}

} // namespace

RunReport RedactionPipeline::execute(const Loader &load, const Persister &persist,
                                     const std::vector<std::string> &raw_literals, const ProgressSink &sink,
                                     const CancellationToken &token) const {
    RunReport report;
    ProgressReporter progress(sink);
    const std::vector<std::string> literals = normalize_literals(raw_literals);

    // ---- load
    if (token.is_cancelled()) return cancelled(std::move(report), "load");
    progress.report(0, "Loading document");
    Bytes doc = load();
    report.pages = provider_.open(doc)->page_count();
    log_info("load", LogLine("document loaded").kv("bytes", doc.size()).kv("pages", report.pages)
                         .kv("literals", literals.size()).str());

    // ---- rotation
    if (token.is_cancelled()) return cancelled(std::move(report), "rotation");
    progress.report(20, "Correcting page rotation");
    try {
        RotationSummary rs = correct_rotation(provider_, doc, detector_, cfg_.dpi);
        doc = std::move(rs.data);
        report.rotated_pages = rs.rotated_pages;
        log_info("rotation", LogLine("rotation checked").kv("rotated", rs.rotated_pages).str());
    } catch (const EngineError &e) {
        log_warn("rotation", LogLine("orientation detection failed, keeping page rotation").kv("error", e.what()).str());
    }

    // ---- adaptive OCR
    if (token.is_cancelled()) return cancelled(std::move(report), "ocr");
    progress.report(40, "Running OCR");
    if (cfg_.adaptive_ocr) {
        OcrProgress on_progress = [&](int pct, const std::string &message) {
            if (token.is_cancelled()) return false;
            progress.report(40 + pct * 30 / 100, message);
            return true;
        };
        auto on_revert = [&] { progress.report(60, "Reverting to original text..."); };

        AdaptiveOcrPolicy policy(provider_, engine_, cfg_.ocr);
        OcrPolicyResult r = policy.run(doc, literals, on_progress, on_revert);
        if (r.cancelled || token.is_cancelled()) return cancelled(std::move(report), "ocr");
        report.ocr.attempted = true;
        report.ocr.committed = r.committed;
        report.ocr.fallback_used = r.fallback_used;
        report.ocr.reason = r.reason;
        report.ocr.before = r.before;
        report.ocr.after = r.after;
        log_info("ocr", LogLine("decision").kv("committed", r.committed).kv("fallback", r.fallback_used)
                            .kv("reason", r.reason).str());
        doc = std::move(r.document);
    } else {
        log_info("ocr", "adaptive OCR disabled");
    }

    // ---- redaction
    if (token.is_cancelled()) return cancelled(std::move(report), "redact");
    progress.report(70, "Redacting literals");
    auto working = provider_.open(doc);
    LiteralMatcher matcher(cfg_.match);
    for (int i = 0; i < working->page_count(); ++i) {
        std::vector<MatchRect> hits = matcher.find_all(working->page(i), literals);
        if (hits.empty()) continue;
        for (auto &lit : literals) {
            int n = 0;
            for (auto &h : hits) n += h.literal == lit ? 1 : 0;
            if (n > 0) log_info("redact", LogLine("hits").kv("page", i + 1).kv("literal", lit).kv("count", n).str());
        }
        report.hits[i] = std::move(hits);
    }
    report.burn = RedactionBurner(cfg_.burn).burn(*working, report.hits);
    Bytes redacted = working->save();
    working.reset();
    log_info("redact", LogLine("burn-in done").kv("marks", report.burn.marks).kv("labels", report.burn.labels_placed)
                           .kv("incomplete", report.burn.incomplete.size()).str());

    // ---- persistence
    if (token.is_cancelled()) return cancelled(std::move(report), "persist");
    progress.report(90, "Saving document");
    persist(redacted);

    progress.report(100, "Done");
    report.status = RunStatus::kOk;
    return report;
}

RunReport RedactionPipeline::run(const std::string &input_path, const std::string &output_path,
                                 const std::vector<std::string> &literals, const ProgressSink &sink,
                                 const CancellationToken &token) const {
    RunReport report = execute([&] { return read_file(input_path); },
                               [&](const Bytes &data) { write_file(output_path, data); }, literals, sink, token);
    report.input_path = input_path;
    if (report.status == RunStatus::kOk) report.output_path = output_path;
    return report;
}

} // namespace pdfmask
