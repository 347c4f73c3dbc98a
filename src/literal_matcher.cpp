#include "literal_matcher.hpp"

#include "text_util.hpp"

namespace pdfmask {

std::vector<std::string> sub_words(const std::string &literal, char delim) {
    std::vector<std::string> parts;
    for (auto &p : split(literal, delim)) {
        if (!p.empty()) parts.push_back(p);
    }
    return parts;
}

bool LiteralMatcher::extends(const PositionedWord &last, const PositionedWord &next) const {
    // same line
    double overlap = span_overlap(last.box.y0, last.box.y1, next.box.y0, next.box.y1);
    if (overlap < next.box.height() * tuning_.min_vertical_overlap) return false;
    // to the right, not too far
    double gap = next.box.x0 - last.box.x1;
    return gap >= tuning_.min_gap && gap <= tuning_.max_gap;
}

std::vector<MatchRect> LiteralMatcher::find_split(const std::vector<PositionedWord> &words,
                                                  const std::string &literal) const {
    std::vector<MatchRect> out;
    for (char delim : tuning_.delimiters) {
        if (literal.find(delim) == std::string::npos) continue;
        std::vector<std::string> parts = sub_words(literal, delim);
        if (parts.size() < 2) continue;

        std::vector<std::string> lowered;
        for (auto &p : parts) lowered.push_back(fold_case(p));

        for (size_t start = 0; start < words.size(); ++start) {
            if (fold_case(words[start].text).find(lowered[0]) == std::string::npos) continue;

            size_t cur = start;
            Rect span = words[start].box;
            bool complete = true;
            for (size_t i = 1; i < lowered.size() && complete; ++i) {
                complete = false;
                for (int off = 1; off <= tuning_.lookahead; ++off) {
                    size_t next = cur + static_cast<size_t>(off);
                    if (next >= words.size()) break;
                    const PositionedWord &w = words[next];
                    if (fold_case(w.text).find(lowered[i]) == std::string::npos) continue;
                    if (!extends(words[cur], w)) continue;
                    span = span.united(w.box);
                    cur = next;
                    complete = true;
                    break;
                }
            }
            if (complete) out.push_back({span, literal});
        }
    }
    return out;
}

std::vector<MatchRect> LiteralMatcher::find(Page &page, PageWordIndex &words, const std::string &literal) const {
    std::vector<MatchRect> out;
    for (auto &r : page.search(literal)) out.push_back({r.normalized(), literal});

    bool splittable = false;
    for (char delim : tuning_.delimiters) {
        if (sub_words(literal, delim).size() >= 2) splittable = true;
    }
    if (!splittable) return out;

    auto fallback = find_split(words.words(), literal);
    out.insert(out.end(), fallback.begin(), fallback.end());
    return out;
}

std::vector<MatchRect> LiteralMatcher::find_all(Page &page, const std::vector<std::string> &literals) const {
    PageWordIndex words(page);
    std::vector<MatchRect> out;
    for (auto &lit : literals) {
        if (trim_copy(lit).empty()) continue;
        auto hits = find(page, words, lit);
        out.insert(out.end(), hits.begin(), hits.end());
    }
    return out;
}

} // namespace pdfmask
