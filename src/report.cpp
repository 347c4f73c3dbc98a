#include "report.hpp"

using json = nlohmann::json;

namespace pdfmask {

const char *run_status_str(RunStatus s) {
    switch (s) {
        case RunStatus::kOk: return "ok";
        case RunStatus::kCancelled: return "cancelled";
        case RunStatus::kFailed: return "failed";
    }
    return "unknown";
}

json to_json(const Rect &r) { return json::array({r.x0, r.y0, r.x1, r.y1}); }

json to_json(const EvidenceSnapshot &e) {
    return {{"char_count", e.char_count}, {"literal_hit_count", e.literal_hit_count}};
}

json to_json(const RunReport &r) {
    json out;
    out["status"] = run_status_str(r.status);
    if (!r.error.empty()) out["error"] = r.error;
    out["input"] = r.input_path;
    out["output"] = r.output_path;
    out["page_count"] = r.pages;
    out["rotated_pages"] = r.rotated_pages;

    json ocr;
    ocr["attempted"] = r.ocr.attempted;
    if (r.ocr.attempted) {
        ocr["committed"] = r.ocr.committed;
        ocr["fallback_used"] = r.ocr.fallback_used;
        ocr["reason"] = r.ocr.reason;
        ocr["before"] = to_json(r.ocr.before);
        ocr["after"] = to_json(r.ocr.after);
        ocr["char_diff"] = r.ocr.after.char_count - r.ocr.before.char_count;
    }
    out["ocr"] = ocr;

    out["pages"] = json::array();
    for (auto &kv : r.hits) {
        json hits = json::array();
        for (auto &m : kv.second) hits.push_back({{"literal", m.literal}, {"rect", to_json(m.box)}});
        out["pages"].push_back({{"index", kv.first}, {"hits", hits}});
    }
    out["labels_placed"] = r.burn.labels_placed;
    out["incomplete"] = json::array();
    for (auto &inc : r.burn.incomplete) {
        out["incomplete"].push_back({{"page", inc.page}, {"literal", inc.literal}, {"reason", inc.reason}});
    }
    return out;
}

} // namespace pdfmask
