#ifndef PDFMASK_GEOMETRY_HPP
#define PDFMASK_GEOMETRY_HPP

#include <algorithm>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace pdfmask {

// Axis aligned box in page units. x0 <= x1 and y0 <= y1 once normalized.
struct Rect {
    double x0 = 0, y0 = 0, x1 = 0, y1 = 0;

    double width() const { return x1 - x0; }
    double height() const { return y1 - y0; }
    bool empty() const { return width() <= 0 || height() <= 0; }

    Rect normalized() const {
        return {std::min(x0, x1), std::min(y0, y1), std::max(x0, x1), std::max(y0, y1)};
    }
    Rect inflated(double d) const { return {x0 - d, y0 - d, x1 + d, y1 + d}; }
    Rect united(const Rect &o) const {
        return {std::min(x0, o.x0), std::min(y0, o.y0), std::max(x1, o.x1), std::max(y1, o.y1)};
    }
    bool intersects(const Rect &o) const {
        return x1 > o.x0 && x0 < o.x1 && y1 > o.y0 && y0 < o.y1;
    }
    bool contains(const Rect &o) const {
        return o.x0 >= x0 && o.x1 <= x1 && o.y0 >= y0 && o.y1 <= y1;
    }
};

inline bool operator==(const Rect &a, const Rect &b) {
    return a.x0 == b.x0 && a.y0 == b.y0 && a.x1 == b.x1 && a.y1 == b.y1;
}
inline bool operator!=(const Rect &a, const Rect &b) { return !(a == b); }

// Length of the overlap of [a0,a1] and [b0,b1], never negative.
inline double span_overlap(double a0, double a1, double b0, double b1) {
    return std::max(0.0, std::min(a1, b1) - std::max(a0, b0));
}

// One token on a page. sequence_index is its position in the provider's
// reading order and is what the fallback matcher walks.
struct PositionedWord {
    Rect box;
    std::string text;
    std::size_t sequence_index = 0;
};

struct MatchRect {
    Rect box;
    std::string literal;
};

using PageHits = std::map<int, std::vector<MatchRect>>;

} // namespace pdfmask

#endif // PDFMASK_GEOMETRY_HPP
