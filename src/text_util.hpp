#ifndef PDFMASK_TEXT_UTIL_HPP
#define PDFMASK_TEXT_UTIL_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace pdfmask {

std::string to_lower(std::string s);
std::string trim_copy(const std::string &s);

// Splits on every occurrence of `delim`, keeping empty pieces.
std::vector<std::string> split(const std::string &s, char delim);

// Trims every entry and drops the ones left empty.
std::vector<std::string> normalize_literals(const std::vector<std::string> &raw);

// Comma separated list, e.g. "--words=a, b ,c".
std::vector<std::string> split_csv(const std::string &s);

// Unicode simple case folding of a UTF-8 string, one code point to one.
std::string fold_case(const std::string &s);

// Non-overlapping, case-sensitive occurrences of `needle`. Zero for an empty needle.
std::size_t count_occurrences(const std::string &haystack, const std::string &needle);

// Number of code points in a UTF-8 string.
std::size_t utf8_length(const std::string &s);

std::u16string utf8_to_utf16(const std::string &s);
std::string utf16_to_utf8(const std::u16string &s);
void append_utf8(std::string &out, char32_t cp);

} // namespace pdfmask

#endif // PDFMASK_TEXT_UTIL_HPP
