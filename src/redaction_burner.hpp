#ifndef PDFMASK_REDACTION_BURNER_HPP
#define PDFMASK_REDACTION_BURNER_HPP

#include <string>
#include <utility>
#include <vector>

#include "document.hpp"

namespace pdfmask {

struct BurnTuning {
    double label_margin = 2.0;
    std::vector<double> font_sizes{10, 8, 6, 5};
};

// A hit that was not fully protected. The white fill is applied regardless.
struct IncompleteRedaction {
    int page = 0;
    std::string literal;
    std::string reason;
};

struct BurnReport {
    int marks = 0;
    int labels_placed = 0;
    std::vector<IncompleteRedaction> incomplete;
};

class RedactionBurner {
public:
    RedactionBurner() = default;
    explicit RedactionBurner(BurnTuning tuning) : tuning_(std::move(tuning)) {}

    // Burns every hit into `doc` and labels it. Pages without hits are not
    // touched.
    BurnReport burn(Document &doc, const PageHits &hits) const;

private:
    BurnTuning tuning_;
};

} // namespace pdfmask

#endif // PDFMASK_REDACTION_BURNER_HPP
