#include "table_of_contents.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "common/errors.h"

namespace Metadump {

namespace {

constexpr Section kSectionOrder[kNumSections] = {Section::kGlobal, Section::kPredata, Section::kPostdata};

std::string YamlKey(Section section) {
    return std::string(SectionName(section)) + "entries";
}

size_t SectionSlot(Section section) {
    return static_cast<size_t>(section);
}

constexpr char kBinaryTag[] = "tag:yaml.org,2002:binary";

// Strict UTF-8 check: no overlong forms, surrogates or code points past U+10FFFF.
bool IsValidUtf8(const std::string& text) {
    size_t i = 0;
    while (i < text.size()) {
        const unsigned char lead = static_cast<unsigned char>(text[i]);
        size_t length = 0;
        uint32_t code_point = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            code_point = lead & 0x07;
        } else {
            return false;
        }
        if (i + length > text.size()) return false;
        for (size_t k = 1; k < length; ++k) {
            const unsigned char next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xC0) != 0x80) return false;
            code_point = (code_point << 6) | (next & 0x3F);
        }
        constexpr uint32_t kMinForLength[] = {0, 0, 0x80, 0x800, 0x10000};
        if (code_point < kMinForLength[length] || code_point > 0x10FFFF ||
            (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }
        i += length;
    }
    return true;
}

// Identifiers in a non-UTF-8 server encoding are stored as !!binary so they read back byte for byte.
void EmitIdentifier(YAML::Emitter& out, const std::string& identifier) {
    if (IsValidUtf8(identifier)) {
        out << YAML::DoubleQuoted << identifier;
    } else {
        out << YAML::Binary(reinterpret_cast<const unsigned char*>(identifier.data()), identifier.size());
    }
}

std::string ReadIdentifier(const YAML::Node& node) {
    if (node.Tag() == kBinaryTag) {
        YAML::Binary binary = node.as<YAML::Binary>();
        return std::string(reinterpret_cast<const char*>(binary.data()), binary.size());
    }
    return node.as<std::string>();
}

} // namespace

void TableOfContents::AddEntry(Section section, std::string schema, std::string name, std::string object_type,
                               uint64_t start, uint64_t end) {
    if (start > end) {
        throw std::invalid_argument("TOC entry for " + schema + "." + name + " ends at " + std::to_string(end) +
                                    " before its start " + std::to_string(start));
    }
    TocEntry entry{section, std::move(schema), std::move(name), std::move(object_type), start, end};
    VLOG(3) << "TOC " << SectionName(section) << " " << entry.object_type << " " << entry.schema << "."
            << entry.name << " [" << start << ", " << end << ")";

    absl::MutexLock lock(&mu_);
    SectionEntries& slot = sections_[SectionSlot(section)];
    slot.index.emplace(IndexKey{entry.schema, entry.name, entry.object_type}, slot.entries.size());
    slot.entries.push_back(std::move(entry));
}

std::vector<TocEntry> TableOfContents::Find(Section section, const std::string& schema,
                                            const std::string& name) const {
    absl::MutexLock lock(&mu_);
    const SectionEntries& slot = sections_[SectionSlot(section)];
    std::vector<size_t> positions;
    for (auto it = slot.index.lower_bound(IndexKey{schema, name, std::string()});
         it != slot.index.end() && std::get<0>(it->first) == schema && std::get<1>(it->first) == name; ++it) {
        positions.push_back(it->second);
    }
    std::sort(positions.begin(), positions.end());
    std::vector<TocEntry> found;
    found.reserve(positions.size());
    for (size_t position : positions) {
        found.push_back(slot.entries[position]);
    }
    return found;
}

std::optional<TocEntry> TableOfContents::FindFirst(Section section, const std::string& schema,
                                                   const std::string& name, const std::string& object_type) const {
    absl::MutexLock lock(&mu_);
    const SectionEntries& slot = sections_[SectionSlot(section)];
    auto it = slot.index.find(IndexKey{schema, name, object_type});
    if (it == slot.index.end()) {
        return std::nullopt;
    }
    return slot.entries[it->second];
}

std::vector<TocEntry> TableOfContents::Entries(Section section) const {
    absl::MutexLock lock(&mu_);
    return sections_[SectionSlot(section)].entries;
}

size_t TableOfContents::size() const {
    absl::MutexLock lock(&mu_);
    size_t total = 0;
    for (const auto& slot : sections_) {
        total += slot.entries.size();
    }
    return total;
}

std::string TableOfContents::Serialize() const {
    absl::MutexLock lock(&mu_);
    YAML::Emitter out;
    out << YAML::BeginMap;
    for (Section section : kSectionOrder) {
        out << YAML::Key << YamlKey(section) << YAML::Value << YAML::BeginSeq;
        for (const TocEntry& entry : sections_[SectionSlot(section)].entries) {
            out << YAML::BeginMap;
            out << YAML::Key << "schema" << YAML::Value;
            EmitIdentifier(out, entry.schema);
            out << YAML::Key << "name" << YAML::Value;
            EmitIdentifier(out, entry.name);
            out << YAML::Key << "objecttype" << YAML::Value << entry.object_type;
            out << YAML::Key << "startbyte" << YAML::Value << entry.start_offset;
            out << YAML::Key << "endbyte" << YAML::Value << entry.end_offset;
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;
    }
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

std::unique_ptr<TableOfContents> TableOfContents::Deserialize(const std::string& yaml) {
    auto toc = std::make_unique<TableOfContents>();
    FromYaml(yaml, *toc);
    return toc;
}

void TableOfContents::FromYaml(const std::string& yaml, TableOfContents& toc) {
    try {
        YAML::Node root = YAML::Load(yaml);
        if (!root.IsMap()) {
            throw TocFormatError("table of contents is not a YAML mapping");
        }
        for (Section section : kSectionOrder) {
            YAML::Node entries = root[YamlKey(section)];
            if (!entries) continue;
            if (!entries.IsSequence()) {
                throw TocFormatError(YamlKey(section) + " is not a list");
            }
            for (const auto& node : entries) {
                if (!node["name"] || !node["objecttype"] || !node["startbyte"] || !node["endbyte"]) {
                    throw TocFormatError("incomplete entry in " + YamlKey(section));
                }
                toc.AddEntry(section,
                             node["schema"] ? ReadIdentifier(node["schema"]) : std::string(),
                             ReadIdentifier(node["name"]),
                             node["objecttype"].as<std::string>(),
                             node["startbyte"].as<uint64_t>(),
                             node["endbyte"].as<uint64_t>());
            }
        }
    } catch (const YAML::Exception& e) {
        throw TocFormatError(std::string("failed to parse table of contents: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw TocFormatError(e.what());
    }
}

void TableOfContents::WriteToFile(const std::string& path, bool sync_on_commit) const {
    const std::string tmp_path = path + ".partial";
    const std::string yaml = Serialize();
    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw WriteFaultError("toc", tmp_path, errno, "open");
    }
    auto fail = [&fd, &tmp_path](int error_number, const char* operation) {
        if (fd >= 0) {
            ::close(fd);
        }
        ::unlink(tmp_path.c_str());
        throw WriteFaultError("toc", tmp_path, error_number, operation);
    };

    const char* data = yaml.data();
    size_t remaining = yaml.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            fail(errno, "write");
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
    if (sync_on_commit && ::fsync(fd) != 0) {
        fail(errno, "fsync");
    }
    if (::close(fd) != 0) {
        fd = -1;
        fail(errno, "close");
    }
    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        int error_number = errno;
        ::unlink(tmp_path.c_str());
        throw WriteFaultError("toc", path, error_number, "rename");
    }
    LOG(INFO) << "Wrote table of contents with " << size() << " entries to " << path;
}

std::unique_ptr<TableOfContents> TableOfContents::ReadFromFile(const std::string& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        throw TocFormatError("cannot open table of contents " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return Deserialize(buffer.str());
}

} // namespace Metadump
