#include "evidence.hpp"

#include "text_util.hpp"

namespace pdfmask {

long long count_chars(Document &doc) {
    long long total = 0;
    for (int i = 0; i < doc.page_count(); ++i) total += static_cast<long long>(utf8_length(doc.page(i).text()));
    return total;
}

long long count_literal_hits(Document &doc, const std::vector<std::string> &literals) {
    long long total = 0;
    for (int i = 0; i < doc.page_count(); ++i) {
        const std::string text = doc.page(i).text();
        for (auto &lit : literals) total += static_cast<long long>(count_occurrences(text, lit));
    }
    return total;
}

EvidenceSnapshot measure_evidence(Document &doc, const std::vector<std::string> &literals) {
    EvidenceSnapshot s;
    s.char_count = count_chars(doc);
    s.literal_hit_count = count_literal_hits(doc, literals);
    return s;
}

EvidenceSnapshot measure_evidence(const DocumentProvider &provider, const Bytes &data,
                                  const std::vector<std::string> &literals) {
    auto doc = provider.open(data);
    return measure_evidence(*doc, literals);
}

} // namespace pdfmask
