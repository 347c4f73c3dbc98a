#ifndef PDFMASK_PAGE_WORD_INDEX_HPP
#define PDFMASK_PAGE_WORD_INDEX_HPP

#include <cstddef>
#include <vector>

#include "document.hpp"

namespace pdfmask {

// Words of one page, fetched from the provider on first use and kept for the
// rest of the page visit. Order and sequence indices are the provider's.
class PageWordIndex {
public:
    explicit PageWordIndex(Page &page) : page_(page) {}

    const std::vector<PositionedWord> &words();
    std::size_t size() { return words().size(); }
    const PositionedWord &operator[](std::size_t i) { return words()[i]; }
    bool loaded() const { return loaded_; }

private:
    Page &page_;
    std::vector<PositionedWord> words_;
    bool loaded_ = false;
};

} // namespace pdfmask

#endif // PDFMASK_PAGE_WORD_INDEX_HPP
