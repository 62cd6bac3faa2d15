#include "byte_counting_writer.h"

#include <cerrno>
#include <cstdio>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

#include <glog/logging.h>

#include "common/errors.h"

namespace Metadump {

ByteCountingWriter::ByteCountingWriter(Section section, std::string path)
    : ByteCountingWriter(section, std::move(path), Options{}) {}

ByteCountingWriter::ByteCountingWriter(Section section, std::string path, Options options)
    : section_(section),
      path_(std::move(path)),
      partial_path_(path_ + ".partial"),
      options_(options) {
    fd_ = ::open(write_path().c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw WriteFaultError(SectionName(section_), write_path(), errno, "open");
    }
    VLOG(2) << "Opened " << SectionName(section_) << " section stream " << write_path();
}

ByteCountingWriter::~ByteCountingWriter() {
    if (!committed_) {
        Abandon();
    }
}

void ByteCountingWriter::Append(std::string_view text) {
    if (fd_ < 0) {
        Fail(EBADF, "write");
    }
    const char* data = text.data();
    size_t remaining = text.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd_, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            Fail(errno, "write");
        }
        data += written;
        remaining -= static_cast<size_t>(written);
        offset_ += static_cast<uint64_t>(written);
    }
}

void ByteCountingWriter::Commit() {
    if (committed_) return;
    if (fd_ < 0) {
        Fail(EBADF, "commit");
    }
    if (options_.sync_on_commit && ::fsync(fd_) != 0) {
        // Character devices and pipes cannot be synced.
        if (!(options_.direct && (errno == EINVAL || errno == EROFS))) {
            Fail(errno, "fsync");
        }
    }
    if (::close(fd_) != 0) {
        fd_ = -1;
        Fail(errno, "close");
    }
    fd_ = -1;
    if (!options_.direct && std::rename(partial_path_.c_str(), path_.c_str()) != 0) {
        Fail(errno, "rename");
    }
    committed_ = true;
    LOG(INFO) << "Committed " << SectionName(section_) << " section: " << offset_ << " bytes to " << path_;
}

void ByteCountingWriter::Abandon() noexcept {
    if (committed_) return;
    CloseFd();
    if (!options_.direct && ::unlink(partial_path_.c_str()) == 0) {
        VLOG(1) << "Removed partial section file " << partial_path_;
    }
}

void ByteCountingWriter::Fail(int error_number, const char* operation) {
    std::string path = write_path();
    LOG(ERROR) << operation << " failed on " << SectionName(section_) << " section after " << offset_
               << " bytes";
    Abandon();
    throw WriteFaultError(SectionName(section_), path, error_number, operation);
}

void ByteCountingWriter::CloseFd() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace Metadump
