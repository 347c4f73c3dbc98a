#ifndef PDFMASK_REDACTION_LABEL_HPP
#define PDFMASK_REDACTION_LABEL_HPP

#include <string>

namespace pdfmask {

// Lowercase hex SHA-256 of `data`.
std::string sha256_hex(const std::string &data);

// First 8 hex characters of SHA-256(literal), drawn over each redaction so a
// reader holding the literal can verify what was removed.
std::string verification_label(const std::string &literal);

} // namespace pdfmask

#endif // PDFMASK_REDACTION_LABEL_HPP
