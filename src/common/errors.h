#ifndef METADUMP_SRC_COMMON_ERRORS_H_
#define METADUMP_SRC_COMMON_ERRORS_H_

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace Metadump {

/**
 * Base of every fatal metadump failure. Nothing below the CLI retries;
 * the run is aborted and its section files are discarded.
 */
class MetadumpError : public std::runtime_error {
public:
    explicit MetadumpError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * A dependency name matched more than one object in the backup set.
 */
class AmbiguousDependencyError : public MetadumpError {
public:
    AmbiguousDependencyError(std::string name, std::vector<uint32_t> candidate_oids);

    const std::string& name() const { return name_; }
    const std::vector<uint32_t>& candidate_oids() const { return candidate_oids_; }

private:
    std::string name_;
    std::vector<uint32_t> candidate_oids_;
};

/**
 * A dependency cycle that shell promotion cannot break.
 * Members are "schema.name (kind, oid)" strings in tie-break order.
 */
class UnbreakableCycleError : public MetadumpError {
public:
    explicit UnbreakableCycleError(std::vector<std::string> members);

    const std::vector<std::string>& members() const { return members_; }

private:
    std::vector<std::string> members_;
};

// I/O failure on a section stream.
class WriteFaultError : public MetadumpError {
public:
    WriteFaultError(std::string section, std::string path, int error_number, const std::string& operation);

    const std::string& section() const { return section_; }
    const std::string& path() const { return path_; }
    int error_number() const { return error_number_; }

private:
    std::string section_;
    std::string path_;
    int error_number_;
};

// Malformed persisted TOC, catalog snapshot, or an extraction outside a section file.
class TocFormatError : public MetadumpError {
public:
    explicit TocFormatError(const std::string& what) : MetadumpError(what) {}
};

} // namespace Metadump

#endif // METADUMP_SRC_COMMON_ERRORS_H_
