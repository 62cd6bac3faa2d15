#pragma once

#include <string>
#include <vector>

#include "dependency/topological_sequencer.h"

namespace Metadump {

/**
 * Text produced for one sequenced object. The annotation (comment, owner,
 * privileges) directly follows the statement and shares its TOC entry.
 * Either part may be empty.
 */
struct SupplementalStatement {
    std::string object_type;
    std::string text;
};

struct RenderedStatement {
    std::string statement;
    std::string annotation;
    // Written after the annotation, each under its own TOC entry of the same object.
    std::vector<SupplementalStatement> supplements;
};

/**
 * Interface for turning one catalog object into statement text.
 * Called once per object, in emission order. Sections emitted in parallel
 * share one renderer, so implementations must allow concurrent Render() calls.
 */
class StatementRenderer {
public:
    virtual ~StatementRenderer() = default;

    virtual RenderedStatement Render(const SequencedObject& object) = 0;
};

// Object type tag recorded in the table of contents for this object.
std::string TocObjectType(const SequencedObject& object);

} // namespace Metadump
