#ifndef METADUMP_SRC_OUTPUT_TABLE_OF_CONTENTS_H_
#define METADUMP_SRC_OUTPUT_TABLE_OF_CONTENTS_H_

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/btree_map.h"
#include "absl/synchronization/mutex.h"
#include "catalog/catalog_object.h"

namespace Metadump {

/**
 * Byte range of one object's statement text within its section stream.
 * start_offset == end_offset means the object was considered but produced
 * no text.
 */
struct TocEntry {
    Section section = Section::kGlobal;
    std::string schema;
    std::string name;
    std::string object_type;
    uint64_t start_offset = 0;
    uint64_t end_offset = 0;

    uint64_t length() const { return end_offset - start_offset; }
    bool empty() const { return start_offset == end_offset; }

    bool operator==(const TocEntry& other) const {
        return section == other.section && schema == other.schema && name == other.name &&
               object_type == other.object_type && start_offset == other.start_offset &&
               end_offset == other.end_offset;
    }
};

/**
 * Index from (section, schema, name, object type) to committed byte ranges.
 *
 * Shared by every section worker of a run: AddEntry() is serialized, and
 * each section keeps its entries in the order they were added. Lookups go
 * through an ordered index and never scan the entry list.
 */
class TableOfContents {
public:
    TableOfContents() = default;
    TableOfContents(const TableOfContents&) = delete;
    TableOfContents& operator=(const TableOfContents&) = delete;

    /**
     * Records one emitted object.
     *
     * @throws std::invalid_argument if start > end
     */
    void AddEntry(Section section, std::string schema, std::string name, std::string object_type,
                  uint64_t start, uint64_t end);

    // All entries for the object in emission order; a shell and its full type share a name.
    std::vector<TocEntry> Find(Section section, const std::string& schema, const std::string& name) const;

    std::optional<TocEntry> FindFirst(Section section, const std::string& schema, const std::string& name,
                                      const std::string& object_type) const;

    std::vector<TocEntry> Entries(Section section) const;
    size_t size() const;

    // Deterministic YAML rendering: sections in fixed order, entries in emission order.
    std::string Serialize() const;
    static std::unique_ptr<TableOfContents> Deserialize(const std::string& yaml);

    // Stages the YAML in "<path>.partial", syncs it when asked and renames it to path.
    void WriteToFile(const std::string& path, bool sync_on_commit = true) const;
    static std::unique_ptr<TableOfContents> ReadFromFile(const std::string& path);

private:
    // schema, name, object type
    using IndexKey = std::tuple<std::string, std::string, std::string>;

    struct SectionEntries {
        std::vector<TocEntry> entries;
        absl::btree_multimap<IndexKey, size_t> index;
    };

    static void FromYaml(const std::string& yaml, TableOfContents& toc);

    mutable absl::Mutex mu_;
    std::array<SectionEntries, kNumSections> sections_ ABSL_GUARDED_BY(mu_);
};

} // namespace Metadump

#endif // METADUMP_SRC_OUTPUT_TABLE_OF_CONTENTS_H_
