#ifndef METADUMP_SRC_EMITTER_METADATA_EMITTER_H_
#define METADUMP_SRC_EMITTER_METADATA_EMITTER_H_

#include <cstddef>

#include "dependency/topological_sequencer.h"
#include "output/byte_counting_writer.h"
#include "output/table_of_contents.h"
#include "render/statement_renderer.h"

namespace Metadump {

/**
 * Writes the objects of one section in emission order and records the byte
 * range of each in the table of contents.
 */
class MetadataEmitter {
public:
    MetadataEmitter(StatementRenderer& renderer, TableOfContents& toc)
        : renderer_(renderer), toc_(toc) {}

    /**
     * Emits every object of sequence that belongs to writer's section.
     *
     * @param sequence Full emission sequence of the run
     * @param writer Stream of the section to emit
     * @return Number of TOC entries recorded
     */
    size_t EmitSection(const EmissionSequence& sequence, ByteCountingWriter& writer);

    /**
     * Renders and writes one object; an object with no text still gets a
     * zero-length entry. Supplemental statements get one entry each.
     *
     * @return Number of TOC entries recorded
     */
    size_t EmitObject(const SequencedObject& object, ByteCountingWriter& writer);

private:
    StatementRenderer& renderer_;
    TableOfContents& toc_;
};

} // namespace Metadump

#endif // METADUMP_SRC_EMITTER_METADATA_EMITTER_H_
