#ifndef METADUMP_SRC_DEPENDENCY_DEPENDENCY_RESOLVER_H_
#define METADUMP_SRC_DEPENDENCY_DEPENDENCY_RESOLVER_H_

#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "catalog/catalog_object.h"
#include "dependency_graph.h"

namespace Metadump {

/**
 * Turns the depends_upon name lists of a record set into a DependencyGraph.
 *
 * Names that match no object are external or built-in (pg_catalog types,
 * functions outside the dump) and are dropped. Names that match more than one
 * object abort resolution with AmbiguousDependencyError.
 */
class DependencyResolver {
public:
    struct Stats {
        size_t excluded_implicit_types = 0;
        size_t resolved_references = 0;
        size_t external_references = 0;
        size_t self_references = 0;
    };

    /**
     * Builds the graph. The records must outlive the returned graph.
     *
     * @param records Full record set for the run, in any order
     * @return Graph whose nodes are every record except implicit types
     */
    DependencyGraph Resolve(const std::vector<CatalogObjectRecord>& records);

    const Stats& stats() const { return stats_; }

private:
    using NameIndex = absl::flat_hash_map<std::string, std::vector<DependencyGraph::NodeId>>;

    static NameIndex BuildNameIndex(const DependencyGraph& graph);

    Stats stats_;
};

} // namespace Metadump

#endif // METADUMP_SRC_DEPENDENCY_DEPENDENCY_RESOLVER_H_
