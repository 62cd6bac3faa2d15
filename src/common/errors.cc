#include "errors.h"

#include <cstring>
#include <sstream>
#include <utility>

namespace Metadump {

namespace {

std::string FormatAmbiguous(const std::string& name, const std::vector<uint32_t>& oids) {
    std::ostringstream out;
    out << "Ambiguous dependency " << name << " matches " << oids.size() << " objects (oids";
    for (uint32_t oid : oids) {
        out << " " << oid;
    }
    out << ")";
    return out.str();
}

std::string FormatCycle(const std::vector<std::string>& members) {
    std::ostringstream out;
    out << "Unbreakable dependency cycle among " << members.size() << " objects: ";
    for (size_t i = 0; i < members.size(); ++i) {
        if (i > 0) out << ", ";
        out << members[i];
    }
    return out.str();
}

} // namespace

AmbiguousDependencyError::AmbiguousDependencyError(std::string name, std::vector<uint32_t> candidate_oids)
    : MetadumpError(FormatAmbiguous(name, candidate_oids)),
      name_(std::move(name)),
      candidate_oids_(std::move(candidate_oids)) {}

UnbreakableCycleError::UnbreakableCycleError(std::vector<std::string> members)
    : MetadumpError(FormatCycle(members)),
      members_(std::move(members)) {}

WriteFaultError::WriteFaultError(std::string section, std::string path, int error_number,
                                 const std::string& operation)
    : MetadumpError(operation + " failed for " + section + " section file " + path + ": " +
                    std::strerror(error_number)),
      section_(std::move(section)),
      path_(std::move(path)),
      error_number_(error_number) {}

} // namespace Metadump
