#include "topological_sequencer.h"

#include <algorithm>
#include <limits>
#include <queue>
#include <string>
#include <tuple>
#include <utility>

#include <glog/logging.h>

#include "common/errors.h"

namespace Metadump {

namespace {

using NodeId = DependencyGraph::NodeId;
constexpr NodeId kNoShell = std::numeric_limits<NodeId>::max();

int FormRank(EmissionForm form) {
    return form == EmissionForm::kShell ? 0 : 1;
}

int EffectivePriority(const SequencedObject& object) {
    if (object.is_shell()) return PriorityClass(ObjectKind::kShellType);
    return PriorityClass(object.record->kind);
}

// Graph after shell promotion: the input nodes keep their ids and shells are appended.
struct ExpandedGraph {
    std::vector<SequencedObject> nodes;
    std::vector<std::vector<NodeId>> dependents;
    std::vector<size_t> pending;

    NodeId Add(const CatalogObjectRecord* record, EmissionForm form) {
        nodes.push_back(SequencedObject{record, form});
        dependents.emplace_back();
        pending.push_back(0);
        return nodes.size() - 1;
    }

    void AddEdge(NodeId node, NodeId dependency) {
        dependents[dependency].push_back(node);
        ++pending[node];
    }
};

std::vector<std::string> DescribeMembers(const DependencyGraph& graph, std::vector<NodeId> members) {
    std::sort(members.begin(), members.end(), [&graph](NodeId a, NodeId b) {
        return EmitsBefore({&graph.record(a), EmissionForm::kFull}, {&graph.record(b), EmissionForm::kFull});
    });
    std::vector<std::string> described;
    described.reserve(members.size());
    for (NodeId id : members) {
        described.push_back(DescribeObject(graph.record(id)));
    }
    return described;
}

} // namespace

bool EmitsBefore(const SequencedObject& a, const SequencedObject& b) {
    return std::forward_as_tuple(EffectivePriority(a), a.record->schema, a.record->name, a.record->oid,
                                 FormRank(a.form)) <
           std::forward_as_tuple(EffectivePriority(b), b.record->schema, b.record->name, b.record->oid,
                                 FormRank(b.form));
}

std::vector<std::vector<NodeId>> TopologicalSequencer::StronglyConnectedComponents(const DependencyGraph& graph) {
    const size_t n = graph.size();
    std::vector<size_t> index(n, kNoShell);
    std::vector<size_t> lowlink(n, 0);
    std::vector<bool> on_stack(n, false);
    std::vector<NodeId> stack;
    std::vector<std::pair<NodeId, size_t>> call_stack; // node, next dependency to visit
    std::vector<std::vector<NodeId>> components;
    size_t next_index = 0;

    auto visit = [&](NodeId v) {
        index[v] = lowlink[v] = next_index++;
        stack.push_back(v);
        on_stack[v] = true;
        call_stack.emplace_back(v, 0);
    };

    for (NodeId root = 0; root < n; ++root) {
        if (index[root] != kNoShell) continue;
        visit(root);
        while (!call_stack.empty()) {
            NodeId v = call_stack.back().first;
            const auto& deps = graph.dependencies(v);
            if (call_stack.back().second < deps.size()) {
                NodeId w = deps[call_stack.back().second++];
                if (index[w] == kNoShell) {
                    visit(w);
                } else if (on_stack[w]) {
                    lowlink[v] = std::min(lowlink[v], index[w]);
                }
                continue;
            }
            call_stack.pop_back();
            if (!call_stack.empty()) {
                NodeId parent = call_stack.back().first;
                lowlink[parent] = std::min(lowlink[parent], lowlink[v]);
            }
            if (lowlink[v] == index[v]) {
                std::vector<NodeId> component;
                NodeId w;
                do {
                    w = stack.back();
                    stack.pop_back();
                    on_stack[w] = false;
                    component.push_back(w);
                } while (w != v);
                components.push_back(std::move(component));
            }
        }
    }
    return components;
}

EmissionSequence TopologicalSequencer::Sequence(const DependencyGraph& graph) {
    promoted_.clear();
    const size_t n = graph.size();

    auto components = StronglyConnectedComponents(graph);
    std::vector<size_t> component_of(n, 0);
    for (size_t c = 0; c < components.size(); ++c) {
        for (NodeId id : components[c]) component_of[id] = c;
    }

    ExpandedGraph expanded;
    for (NodeId id = 0; id < n; ++id) {
        expanded.Add(&graph.record(id), EmissionForm::kFull);
    }

    std::vector<NodeId> shell_of(n, kNoShell);
    for (auto& component : components) {
        if (component.size() < 2) continue;
        std::sort(component.begin(), component.end(), [&graph](NodeId a, NodeId b) {
            return EmitsBefore({&graph.record(a), EmissionForm::kFull}, {&graph.record(b), EmissionForm::kFull});
        });
        bool all_types = std::all_of(component.begin(), component.end(), [&graph](NodeId id) {
            return IsShellCapable(graph.record(id).kind);
        });
        // A pure type cycle keeps its first member as the anchor. Otherwise the
        // non-type members anchor the cycle and every type is forward declared.
        size_t first = all_types ? 1 : 0;
        size_t promoted_here = 0;
        for (size_t i = first; i < component.size(); ++i) {
            NodeId member = component[i];
            if (!IsShellCapable(graph.record(member).kind)) continue;
            shell_of[member] = expanded.Add(&graph.record(member), EmissionForm::kShell);
            promoted_.push_back(&graph.record(member));
            ++promoted_here;
        }
        if (promoted_here == 0) {
            auto members = DescribeMembers(graph, component);
            LOG(ERROR) << "Dependency cycle without a shell-capable type: " << members.size() << " objects";
            throw UnbreakableCycleError(std::move(members));
        }
        VLOG(1) << "Breaking cycle of " << component.size() << " objects with " << promoted_here << " shells";
    }

    for (NodeId id = 0; id < n; ++id) {
        for (NodeId dependency : graph.dependencies(id)) {
            if (shell_of[dependency] != kNoShell && component_of[id] == component_of[dependency]) {
                expanded.AddEdge(id, shell_of[dependency]);
            } else {
                expanded.AddEdge(id, dependency);
            }
        }
        if (shell_of[id] != kNoShell) {
            expanded.AddEdge(id, shell_of[id]);
        }
    }

    auto later = [&expanded](NodeId a, NodeId b) {
        return EmitsBefore(expanded.nodes[b], expanded.nodes[a]);
    };
    std::priority_queue<NodeId, std::vector<NodeId>, decltype(later)> ready(later);
    for (NodeId id = 0; id < expanded.nodes.size(); ++id) {
        if (expanded.pending[id] == 0) ready.push(id);
    }

    EmissionSequence sequence;
    sequence.reserve(expanded.nodes.size());
    while (!ready.empty()) {
        NodeId id = ready.top();
        ready.pop();
        sequence.push_back(expanded.nodes[id]);
        for (NodeId dependent : expanded.dependents[id]) {
            if (--expanded.pending[dependent] == 0) ready.push(dependent);
        }
    }

    if (sequence.size() != expanded.nodes.size()) {
        // Shells did not break every cycle: the rest runs through non-type members.
        size_t stuck_component = components.size();
        for (NodeId id = 0; id < n; ++id) {
            if (expanded.pending[id] == 0) continue;
            size_t c = component_of[id];
            if (components[c].size() > 1 && c < stuck_component) {
                stuck_component = c;
            }
        }
        CHECK_LT(stuck_component, components.size()) << "Unemitted objects outside any cycle";
        auto members = DescribeMembers(graph, components[stuck_component]);
        LOG(ERROR) << "Dependency cycle not broken by shell types: " << members.size() << " objects";
        throw UnbreakableCycleError(std::move(members));
    }

    VLOG(1) << "Sequenced " << sequence.size() << " objects with " << promoted_.size() << " shells";
    return sequence;
}

} // namespace Metadump
