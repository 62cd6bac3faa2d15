#pragma once

#include <cstddef>
#include <vector>

#include "catalog/catalog_object.h"

namespace Metadump {

/**
 * Directed dependency graph over the dumpable objects of one run.
 * An edge from node to dependency means node's definition needs dependency
 * to exist first. Node ids are indices into nodes().
 */
class DependencyGraph {
public:
    using NodeId = size_t;

    NodeId AddNode(const CatalogObjectRecord* record) {
        nodes_.push_back(record);
        dependencies_.emplace_back();
        dependents_.emplace_back();
        return nodes_.size() - 1;
    }

    // Returns false if the edge already existed.
    bool AddEdge(NodeId node, NodeId dependency) {
        for (NodeId existing : dependencies_[node]) {
            if (existing == dependency) return false;
        }
        dependencies_[node].push_back(dependency);
        dependents_[dependency].push_back(node);
        ++num_edges_;
        return true;
    }

    size_t size() const { return nodes_.size(); }
    size_t num_edges() const { return num_edges_; }

    const CatalogObjectRecord& record(NodeId id) const { return *nodes_[id]; }
    const std::vector<const CatalogObjectRecord*>& nodes() const { return nodes_; }
    const std::vector<NodeId>& dependencies(NodeId id) const { return dependencies_[id]; }
    const std::vector<NodeId>& dependents(NodeId id) const { return dependents_[id]; }

private:
    std::vector<const CatalogObjectRecord*> nodes_;
    std::vector<std::vector<NodeId>> dependencies_;
    std::vector<std::vector<NodeId>> dependents_;
    size_t num_edges_ = 0;
};

} // namespace Metadump
