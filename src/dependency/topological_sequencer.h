#ifndef METADUMP_SRC_DEPENDENCY_TOPOLOGICAL_SEQUENCER_H_
#define METADUMP_SRC_DEPENDENCY_TOPOLOGICAL_SEQUENCER_H_

#include <vector>

#include "catalog/catalog_object.h"
#include "dependency_graph.h"

namespace Metadump {

enum class EmissionForm {
    kShell, // forward declaration emitted ahead of a cycle
    kFull,
};

struct SequencedObject {
    const CatalogObjectRecord* record;
    EmissionForm form;

    bool is_shell() const { return form == EmissionForm::kShell; }
};

using EmissionSequence = std::vector<SequencedObject>;

/**
 * Orders a DependencyGraph so every object follows its dependencies.
 *
 * Cycles through shell-capable types are broken by emitting shells for the
 * promoted members first and their full definitions later. Ties among ready
 * objects go to the smallest (priority class, schema, name, oid, form), so
 * unchanged input always yields the same sequence.
 */
class TopologicalSequencer {
public:
    /**
     * @param graph Resolved graph of the run
     * @return Emission order, including shell forms
     * @throws UnbreakableCycleError if a cycle has no shell-capable way out
     */
    EmissionSequence Sequence(const DependencyGraph& graph);

    // Records that were forward declared during the last Sequence() call.
    const std::vector<const CatalogObjectRecord*>& promoted() const { return promoted_; }

    // Tarjan's algorithm over dependency edges, without recursion.
    static std::vector<std::vector<DependencyGraph::NodeId>> StronglyConnectedComponents(
            const DependencyGraph& graph);

private:
    std::vector<const CatalogObjectRecord*> promoted_;
};

// Strict weak order used for every tie-break in the sequencer. It is a total
// order whenever oids are unique within the run.
bool EmitsBefore(const SequencedObject& a, const SequencedObject& b);

} // namespace Metadump

#endif // METADUMP_SRC_DEPENDENCY_TOPOLOGICAL_SEQUENCER_H_
