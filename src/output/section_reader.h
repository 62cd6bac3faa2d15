#ifndef METADUMP_SRC_OUTPUT_SECTION_READER_H_
#define METADUMP_SRC_OUTPUT_SECTION_READER_H_

#include <cstdint>
#include <string>

#include "table_of_contents.h"

namespace Metadump {

/**
 * Read side of a committed section file. Extract() seeks straight to an
 * entry's byte range, so restoring one object never reads the objects before it.
 */
class SectionReader {
public:
    explicit SectionReader(std::string path);
    ~SectionReader();

    SectionReader(const SectionReader&) = delete;
    SectionReader& operator=(const SectionReader&) = delete;

    // Exact statement text of entry. Empty for zero-length entries.
    std::string Extract(const TocEntry& entry) const;

    uint64_t size() const { return size_; }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    int fd_ = -1;
    uint64_t size_ = 0;
};

} // namespace Metadump

#endif // METADUMP_SRC_OUTPUT_SECTION_READER_H_
