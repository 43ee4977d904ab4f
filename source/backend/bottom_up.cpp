// ____________________________________ LICENSE ____________________________________
//
// Source repo: https://github.com/DmitriBogdanov/clang-build-profiler
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "backend/bottom_up.hpp"

#include <algorithm>

#include "utility/exception.hpp"


// --- Bottom-up node ---
// ----------------------

void cpa::bottom_up_node::add_node(const cpa::computed_node& node) {
    for (bottom_up_node* current = this; current; current = current->parent) {
        current->self_time += node.self_time;
        current->aggregate_time += node.self_time; // callees of 'node' are seeded separately
    }
}

cpa::bottom_up_node& cpa::bottom_up_node::child(const cpa::location& location) {
    auto& entry = this->children[location.id];

    if (!entry) entry = std::make_unique<bottom_up_node>(bottom_up_node{.location = &location, .parent = this});

    return *entry;
}

std::vector<const cpa::bottom_up_node*> cpa::bottom_up_node::sorted_children() const {
    std::vector<const bottom_up_node*> result;
    result.reserve(this->children.size());

    for (const auto& [id, child] : this->children) result.push_back(child.get());

    std::stable_sort(result.begin(), result.end(), [](const bottom_up_node* lhs, const bottom_up_node* rhs) {
        return lhs->aggregate_time > rhs->aggregate_time;
    });

    return result;
}


// --- Graph ---
// -------------

// Every node that was running at some sample seeds a walk towards the call tree root. That's every leaf
// of the call tree, plus inner nodes with self time of their own. The walk descends the bottom-up graph
// at the same time, which means each level of the graph corresponds to one more caller up the stack:
//
// Call tree:                Walk for leaf 'parse' under 'render':
//    > (root)                  graph root  => 'parse'
//    >    main                 'parse'     => 'render'
//    >       render            'render'    => 'main'            (self time is added here)
//    >          parse          'main' has the call tree root as a parent, which is never inserted
//
// Self time is added once at the end of the chain and propagates upwards, so every entry of the chain
// and the graph root count it exactly once. The root ends up with the total self time of the model.

cpa::bottom_up_graph cpa::build_bottom_up_graph(const cpa::profile_model& model) try {
    cpa::bottom_up_graph graph;

    graph.root_location = std::make_unique<cpa::location>(cpa::location{
        .id         = -1,
        .category   = cpa::category::system,
        .call_frame = {.function_name = "(root)", .script_id = "0", .url = "", .line_number = -1, .column_number = -1},
    });

    graph.root = std::make_unique<cpa::bottom_up_node>(cpa::bottom_up_node{.location = graph.root_location.get()});

    for (const auto& seed : model.nodes) {
        const bool is_leaf = seed.children.empty();
        const bool is_hot  = seed.self_time > cpa::microseconds{};

        if (!is_leaf && !is_hot) continue;

        cpa::bottom_up_node*      aggregate = graph.root.get();
        const cpa::computed_node* node      = &seed;

        while (true) {
            aggregate = &aggregate->child(model.locations.at(node->location_id));

            if (!node->parent || *node->parent == 0) break; // reached the call tree root

            node = &model.nodes.at(*node->parent);
        }

        aggregate->add_node(seed);
    }

    return graph;

} catch (std::exception& e) { throw cpa::exception{"Could not build bottom-up graph, error:\n{}", e.what()}; }
