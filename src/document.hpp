#ifndef PDFMASK_DOCUMENT_HPP
#define PDFMASK_DOCUMENT_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "geometry.hpp"

namespace pdfmask {

using Bytes = std::vector<unsigned char>;

// One page of an open document. Coordinates are page units in whatever space
// the provider uses, as long as words(), search() and the redaction calls
// agree with each other.
class Page {
public:
    virtual ~Page() = default;

    virtual std::string text() = 0;
    // Words in the provider's reading order.
    virtual std::vector<PositionedWord> words() = 0;
    // Case-insensitive substring search.
    virtual std::vector<Rect> search(const std::string &needle) = 0;

    // Marks an area for removal. Nothing changes until apply_redactions().
    virtual void add_redaction(const Rect &area) = 0;
    // Irreversibly removes text, image pixels and enclosed vector art under
    // every mark, fills each mark white and clears the mark list. Returns the
    // indices, in add_redaction() order, of marks that still had text under
    // them afterwards.
    virtual std::vector<std::size_t> apply_redactions() = 0;
    // Writes `label` centred in `box` at `font_size`. Returns false and draws
    // nothing when the label does not fit.
    virtual bool insert_label(const Rect &box, const std::string &label, double font_size) = 0;

    // BGR rendering of the page as displayed.
    virtual cv::Mat render(int dpi) = 0;
    virtual int rotation() const = 0;
    virtual void rotate(int clockwise_degrees) = 0;
};

class Document {
public:
    virtual ~Document() = default;

    virtual int page_count() const = 0;
    virtual Page &page(int index) = 0;
    virtual Bytes save() = 0;
};

class DocumentProvider {
public:
    virtual ~DocumentProvider() = default;

    // Throws IoError when the buffer is not a readable document.
    virtual std::unique_ptr<Document> open(const Bytes &data) const = 0;
};

} // namespace pdfmask

#endif // PDFMASK_DOCUMENT_HPP
