#ifndef METADUMP_SRC_OUTPUT_BYTE_COUNTING_WRITER_H_
#define METADUMP_SRC_OUTPUT_BYTE_COUNTING_WRITER_H_

#include <cstdint>
#include <string>
#include <string_view>

#include "catalog/catalog_object.h"

namespace Metadump {

/**
 * Append-only output stream of one section that knows the byte offset of
 * everything written to it.
 *
 * By default data goes to "<path>.partial" and only Commit() renames it to
 * path, so an aborted run never leaves a section file a TOC could point at.
 * Any I/O failure throws WriteFaultError and leaves the writer unusable.
 */
class ByteCountingWriter {
public:
    struct Options {
        // Write straight to path (devices, pipes) instead of staging a partial file.
        bool direct = false;
        // fsync before the rename in Commit().
        bool sync_on_commit = true;
    };

    ByteCountingWriter(Section section, std::string path);
    ByteCountingWriter(Section section, std::string path, Options options);
    ~ByteCountingWriter();

    ByteCountingWriter(const ByteCountingWriter&) = delete;
    ByteCountingWriter& operator=(const ByteCountingWriter&) = delete;

    // Bytes written so far. The next Append() starts at this offset.
    uint64_t CurrentOffset() const { return offset_; }

    // Writes every byte of text and advances the offset by text.size().
    void Append(std::string_view text);

    // Makes the section file visible under its final path.
    void Commit();

    // Closes the stream and removes the staged file. Safe to call more than once.
    void Abandon() noexcept;

    Section section() const { return section_; }
    const std::string& path() const { return path_; }
    bool committed() const { return committed_; }

private:
    [[noreturn]] void Fail(int error_number, const char* operation);
    void CloseFd() noexcept;
    const std::string& write_path() const { return options_.direct ? path_ : partial_path_; }

    Section section_;
    std::string path_;
    std::string partial_path_;
    Options options_;
    int fd_ = -1;
    uint64_t offset_ = 0;
    bool committed_ = false;
};

} // namespace Metadump

#endif // METADUMP_SRC_OUTPUT_BYTE_COUNTING_WRITER_H_
