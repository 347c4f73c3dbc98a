#ifndef PDFMASK_FILE_IO_HPP
#define PDFMASK_FILE_IO_HPP

#include <string>

#include "document.hpp"

namespace pdfmask {

// Both throw IoError.
Bytes read_file(const std::string &path);
void write_file(const std::string &path, const Bytes &data);

// Unique directory under the system temp path, removed with its contents on
// destruction.
class TempDir {
public:
    explicit TempDir(const std::string &prefix);
    ~TempDir();
    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::string &path() const { return path_; }
    std::string file(const std::string &name) const;

private:
    std::string path_;
};

} // namespace pdfmask

#endif // PDFMASK_FILE_IO_HPP
