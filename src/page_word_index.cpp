#include "page_word_index.hpp"

namespace pdfmask {

const std::vector<PositionedWord> &PageWordIndex::words() {
    if (!loaded_) {
        words_ = page_.words();
        loaded_ = true;
    }
    return words_;
}

} // namespace pdfmask
