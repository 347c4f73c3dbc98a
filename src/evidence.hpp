#ifndef PDFMASK_EVIDENCE_HPP
#define PDFMASK_EVIDENCE_HPP

#include <string>
#include <vector>

#include "document.hpp"

namespace pdfmask {

// Text measurements of one document state, used to judge an OCR pass.
struct EvidenceSnapshot {
    long long char_count = 0;
    long long literal_hit_count = 0;
};

// Sum over pages of the extracted text length, in code points.
long long count_chars(Document &doc);

// Sum over pages and literals of case-sensitive, non-overlapping occurrences.
long long count_literal_hits(Document &doc, const std::vector<std::string> &literals);

EvidenceSnapshot measure_evidence(Document &doc, const std::vector<std::string> &literals);

// Opens `data` with `provider` first. Throws what the provider throws.
EvidenceSnapshot measure_evidence(const DocumentProvider &provider, const Bytes &data,
                                  const std::vector<std::string> &literals);

} // namespace pdfmask

#endif // PDFMASK_EVIDENCE_HPP
