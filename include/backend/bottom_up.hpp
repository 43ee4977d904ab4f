// ____________________________________ LICENSE ____________________________________
//
// Source repo: https://github.com/DmitriBogdanov/clang-build-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Bottom-up graph of the profile, which groups time by the location that was running
// and then by its callers, regardless of the rest of the call path.
// _________________________________________________________________________________

#pragma once

#include <concepts>
#include <cstdint>
#include <map>
#include <memory>
#include <vector>

#include "backend/model.hpp"


// The bottom-up graph is the call tree turned upside down. First level contains every location
// that was ever on top of the stack, deeper levels contain the callers of their parent:
//
// > (root)                           // synthetic root, sums up everything
// |  > parse    (app.js:10)          // was running in 2 different call stacks
// |  |  > main  (app.js:1)           // called 'parse' directly
// |  |  > render (app.js:20)         // also called 'parse'
// |  |  |  > main (app.js:1)         // called 'render'
//
// Nodes reference locations of the model they were built from, which means the model should outlive the graph.

namespace cpa {

struct bottom_up_node {
    const cpa::location* location = nullptr;
    bottom_up_node*      parent   = nullptr; // non-owning, only used for upwards propagation

    std::map<std::int64_t, std::unique_ptr<bottom_up_node>> children{}; // location id => caller

    microseconds self_time{};
    microseconds aggregate_time{};
    std::int64_t ticks{};

    [[nodiscard]] std::int64_t               id() const { return this->location->id; }
    [[nodiscard]] cpa::category              category() const { return this->location->category; }
    [[nodiscard]] const cpa::call_frame&     call_frame() const { return this->location->call_frame; }
    [[nodiscard]] const std::optional<cpa::source_location>& src() const { return this->location->src; }

    // Adds self time of the node to this entry and all of its ancestors, as both self & aggregate time
    void add_node(const cpa::computed_node& node);

    // Finds or creates a child for the given location
    bottom_up_node& child(const cpa::location& location);

    // Children ordered by aggregate time, heaviest first
    [[nodiscard]] std::vector<const bottom_up_node*> sorted_children() const;

    template <std::invocable<const bottom_up_node&> Func>
    void for_all(Func func) const {
        std::vector<const bottom_up_node*> stack{this};

        while (!stack.empty()) {
            const bottom_up_node* current = stack.back();
            stack.pop_back();

            func(*current);
            for (const auto& [id, child] : current->children) stack.push_back(child.get());
        }
    }
};

struct bottom_up_graph {
    std::unique_ptr<cpa::location>  root_location; // synthetic, heap-allocated so the graph stays movable
    std::unique_ptr<bottom_up_node> root;
};

[[nodiscard]] cpa::bottom_up_graph build_bottom_up_graph(const cpa::profile_model& model);

} // namespace cpa
