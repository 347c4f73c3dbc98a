#ifndef PDFMASK_LITERAL_MATCHER_HPP
#define PDFMASK_LITERAL_MATCHER_HPP

#include <string>
#include <utility>
#include <vector>

#include "document.hpp"
#include "page_word_index.hpp"

namespace pdfmask {

// Bounds for rebuilding a split literal out of separate words.
struct MatchTuning {
    std::string delimiters = " _-";
    int lookahead = 4;               // words ahead in reading order
    double min_vertical_overlap = 0.5; // fraction of the next word's height
    double min_gap = -2.0;           // page units from previous right edge
    double max_gap = 50.0;
};

class LiteralMatcher {
public:
    LiteralMatcher() = default;
    explicit LiteralMatcher(MatchTuning tuning) : tuning_(std::move(tuning)) {}

    // Every rectangle on `page` that satisfies `literal`: the provider's
    // case-insensitive search first, then the multi-word fallback.
    // Duplicates are possible. `words` must index the same page.
    std::vector<MatchRect> find(Page &page, PageWordIndex &words, const std::string &literal) const;

    // find() for each literal in order, blank literals skipped.
    std::vector<MatchRect> find_all(Page &page, const std::vector<std::string> &literals) const;

    // Fallback pass only, over an explicit word sequence.
    std::vector<MatchRect> find_split(const std::vector<PositionedWord> &words, const std::string &literal) const;

private:
    bool extends(const PositionedWord &last, const PositionedWord &next) const;

    MatchTuning tuning_;
};

// Non-empty pieces of `literal` split on `delim`.
std::vector<std::string> sub_words(const std::string &literal, char delim);

} // namespace pdfmask

#endif // PDFMASK_LITERAL_MATCHER_HPP
