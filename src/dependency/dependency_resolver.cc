#include "dependency_resolver.h"

#include <algorithm>

#include <glog/logging.h>

#include "common/errors.h"

namespace Metadump {

DependencyGraph DependencyResolver::Resolve(const std::vector<CatalogObjectRecord>& records) {
    stats_ = Stats{};
    DependencyGraph graph;

    // Array types generated for base and composite types, and row types
    // generated for tables, are recreated by the server with their owners.
    for (const auto& record : records) {
        if (IsImplicitType(record)) {
            VLOG(2) << "Excluding implicit type " << DescribeObject(record);
            ++stats_.excluded_implicit_types;
            continue;
        }
        graph.AddNode(&record);
    }

    NameIndex index = BuildNameIndex(graph);

    for (DependencyGraph::NodeId id = 0; id < graph.size(); ++id) {
        const CatalogObjectRecord& record = graph.record(id);
        for (const std::string& name : record.depends_upon) {
            auto it = index.find(name);
            if (it == index.end()) {
                VLOG(3) << DescribeObject(record) << " references external object " << name;
                ++stats_.external_references;
                continue;
            }
            const auto& candidates = it->second;
            if (candidates.size() > 1) {
                std::vector<Oid> oids;
                oids.reserve(candidates.size());
                for (DependencyGraph::NodeId candidate : candidates) {
                    oids.push_back(graph.record(candidate).oid);
                }
                std::sort(oids.begin(), oids.end());
                LOG(ERROR) << DescribeObject(record) << " depends on ambiguous name " << name;
                throw AmbiguousDependencyError(name, std::move(oids));
            }
            DependencyGraph::NodeId target = candidates.front();
            if (target == id) {
                ++stats_.self_references;
                continue;
            }
            if (graph.AddEdge(id, target)) {
                ++stats_.resolved_references;
            }
        }
    }

    VLOG(1) << "Resolved " << graph.size() << " objects, " << graph.num_edges() << " edges, "
            << stats_.external_references << " external references, "
            << stats_.excluded_implicit_types << " implicit types excluded";
    return graph;
}

DependencyResolver::NameIndex DependencyResolver::BuildNameIndex(const DependencyGraph& graph) {
    NameIndex index;
    index.reserve(graph.size());
    for (DependencyGraph::NodeId id = 0; id < graph.size(); ++id) {
        index[QualifiedName(graph.record(id))].push_back(id);
    }
    return index;
}

} // namespace Metadump
