#ifndef METADUMP_SRC_EMITTER_METADATA_DUMP_H_
#define METADUMP_SRC_EMITTER_METADATA_DUMP_H_

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "catalog/catalog_object.h"
#include "output/byte_counting_writer.h"
#include "output/table_of_contents.h"
#include "render/statement_renderer.h"

namespace Metadump {

class Configuration;

/**
 * One metadata dump run: resolve dependencies, sequence, emit every section,
 * then commit the section files and persist the table of contents.
 *
 * Either every section file and the TOC are committed, or none of them is.
 * The first error of any section abandons all writers and is rethrown.
 */
class MetadataDump {
public:
    struct Options {
        std::array<std::string, kNumSections> section_paths;
        std::string toc_path;
        bool parallel_sections = true;
        ByteCountingWriter::Options writer_options;
    };

    struct Result {
        size_t sequenced_objects = 0;
        size_t shells = 0;
        std::array<size_t, kNumSections> section_entries{};
        std::array<uint64_t, kNumSections> section_bytes{};
    };

    static Options OptionsFromConfiguration(const Configuration& config);

    MetadataDump(Options options, StatementRenderer& renderer)
        : options_(std::move(options)), renderer_(renderer), toc_(std::make_unique<TableOfContents>()) {}

    /**
     * Runs the dump over records.
     *
     * @throws AmbiguousDependencyError, UnbreakableCycleError, WriteFaultError
     */
    Result Run(const std::vector<CatalogObjectRecord>& records);

    // Entries recorded by the last Run(), including a failed one.
    const TableOfContents& toc() const { return *toc_; }

private:
    Options options_;
    StatementRenderer& renderer_;
    std::unique_ptr<TableOfContents> toc_;
};

} // namespace Metadump

#endif // METADUMP_SRC_EMITTER_METADATA_DUMP_H_
