#ifndef PDFMASK_ERRORS_HPP
#define PDFMASK_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace pdfmask {

// Reading or writing a document or a temp artefact failed.
struct IoError : std::runtime_error {
    explicit IoError(const std::string &m) : std::runtime_error(m) {}
};

// The rotation detector or the OCR engine failed or produced unusable output.
struct EngineError : std::runtime_error {
    explicit EngineError(const std::string &m) : std::runtime_error(m) {}
};

} // namespace pdfmask

#endif // PDFMASK_ERRORS_HPP
