#include "section_reader.h"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "common/errors.h"

namespace Metadump {

SectionReader::SectionReader(std::string path) : path_(std::move(path)) {
    fd_ = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        throw TocFormatError("cannot open section file " + path_ + ": " + std::strerror(errno));
    }
    struct stat st;
    if (::fstat(fd_, &st) != 0) {
        int error_number = errno;
        ::close(fd_);
        fd_ = -1;
        throw TocFormatError("cannot stat section file " + path_ + ": " + std::strerror(error_number));
    }
    size_ = static_cast<uint64_t>(st.st_size);
}

SectionReader::~SectionReader() {
    if (fd_ >= 0) ::close(fd_);
}

std::string SectionReader::Extract(const TocEntry& entry) const {
    if (entry.start_offset > entry.end_offset || entry.end_offset > size_) {
        throw TocFormatError("entry " + entry.schema + "." + entry.name + " [" +
                             std::to_string(entry.start_offset) + ", " + std::to_string(entry.end_offset) +
                             ") is outside " + path_ + " (" + std::to_string(size_) + " bytes)");
    }
    std::string text(entry.length(), '\0');
    size_t done = 0;
    while (done < text.size()) {
        ssize_t n = ::pread(fd_, &text[done], text.size() - done,
                            static_cast<off_t>(entry.start_offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw TocFormatError("read failed on " + path_ + ": " + std::strerror(errno));
        }
        if (n == 0) {
            throw TocFormatError("unexpected end of " + path_ + " at byte " +
                                 std::to_string(entry.start_offset + done));
        }
        done += static_cast<size_t>(n);
    }
    return text;
}

} // namespace Metadump
