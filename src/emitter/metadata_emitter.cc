#include "metadata_emitter.h"

#include <glog/logging.h>

namespace Metadump {

size_t MetadataEmitter::EmitSection(const EmissionSequence& sequence, ByteCountingWriter& writer) {
    const Section section = writer.section();
    size_t objects = 0;
    size_t entries = 0;
    for (const SequencedObject& object : sequence) {
        if (!BelongsTo(object.record->kind, section)) continue;
        entries += EmitObject(object, writer);
        ++objects;
    }
    VLOG(1) << "Emitted " << objects << " objects (" << entries << " entries, " << writer.CurrentOffset()
            << " bytes) to " << SectionName(section) << " section";
    return entries;
}

size_t MetadataEmitter::EmitObject(const SequencedObject& object, ByteCountingWriter& writer) {
    const CatalogObjectRecord& record = *object.record;
    uint64_t start = writer.CurrentOffset();
    RenderedStatement rendered = renderer_.Render(object);
    writer.Append(rendered.statement);
    if (!rendered.annotation.empty()) {
        writer.Append(rendered.annotation);
    }
    uint64_t end = writer.CurrentOffset();
    if (start == end) {
        VLOG(2) << "No statement text for " << DescribeObject(record);
    }
    toc_.AddEntry(writer.section(), record.schema, record.name, TocObjectType(object), start, end);

    for (const SupplementalStatement& supplement : rendered.supplements) {
        start = end;
        writer.Append(supplement.text);
        end = writer.CurrentOffset();
        toc_.AddEntry(writer.section(), record.schema, record.name, supplement.object_type, start, end);
    }
    return 1 + rendered.supplements.size();
}

} // namespace Metadump
