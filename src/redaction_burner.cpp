#include "redaction_burner.hpp"

#include "log.hpp"
#include "redaction_label.hpp"

namespace pdfmask {

BurnReport RedactionBurner::burn(Document &doc, const PageHits &hits) const {
    BurnReport report;
    for (auto &entry : hits) {
        const int page_no = entry.first;
        const auto &page_hits = entry.second;
        if (page_hits.empty()) continue;
        Page &page = doc.page(page_no);

        // pass 1: remove everything under the marks
        for (auto &hit : page_hits) page.add_redaction(hit.box);
        report.marks += static_cast<int>(page_hits.size());
        for (std::size_t idx : page.apply_redactions()) {
            if (idx >= page_hits.size()) continue;
            const MatchRect &hit = page_hits[idx];
            log_warn("redact", LogLine("text left under mark").kv("page", page_no + 1).kv("literal", hit.literal).str());
            report.incomplete.push_back({page_no, hit.literal, "text left under mark"});
        }

        // pass 2: labels
        for (auto &hit : page_hits) {
            const std::string label = verification_label(hit.literal);
            const Rect box = hit.box.inflated(tuning_.label_margin);
            bool placed = false;
            for (double fs : tuning_.font_sizes) {
                if (page.insert_label(box, label, fs)) {
                    placed = true;
                    break;
                }
            }
            if (placed) {
                ++report.labels_placed;
            } else {
                log_debug("redact", LogLine("label omitted").kv("page", page_no + 1).kv("label", label).str());
                report.incomplete.push_back({page_no, hit.literal, "label did not fit"});
            }
        }
    }
    return report;
}

} // namespace pdfmask
