// ____________________________________ LICENSE ____________________________________
//
// Source repo: https://github.com/DmitriBogdanov/clang-build-profiler
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "backend/flame.hpp"

#include <algorithm>
#include <map>
#include <optional>

#include "utility/exception.hpp"


cpa::flame_layout cpa::flame_layout_from_name(std::string_view name) {
    if (name == "timeline") return cpa::flame_layout::timeline;
    if (name == "left_heavy") return cpa::flame_layout::left_heavy;

    throw cpa::exception{"Unknown flame graph layout {{ {} }}", name};
}

std::string_view cpa::flame_layout_name(cpa::flame_layout layout) noexcept {
    return layout == cpa::flame_layout::left_heavy ? "left_heavy" : "timeline";
}


// --- Column synthesis ---
// ------------------------

namespace {

// Locations of the stack that has the node on top, ordered from the outermost caller. The call tree
// root is a synthetic '(root)' frame, it is not a part of any stack unless it was the running node itself.
std::vector<std::size_t> stack_locations(const cpa::profile_model& model, std::size_t node_id) {
    const auto& node = model.nodes.at(node_id);

    std::vector<std::size_t> stack{node.location_id};

    for (auto parent = node.parent; parent && *parent != 0; parent = model.nodes.at(*parent).parent)
        stack.push_back(model.nodes.at(*parent).location_id);

    std::reverse(stack.begin(), stack.end());

    return stack;
}

// End of the interior sample range '[1, end)', every interior sample needs a preceding delta. An aborted
// capture has samples but no nodes, it produces no columns.
std::size_t interior_samples_end(const cpa::profile_model& model) {
    if (model.nodes.empty() || model.samples.size() < 2) return 0;

    return std::min(model.samples.size() - 1, model.time_deltas.size() + 1);
}

class column_builder {
    const cpa::profile_model& model;

    std::size_t       graph_id_counter = 0;
    cpa::microseconds time_offset{};

    double to_fraction(cpa::microseconds time) const {
        if (this->model.duration.count() == 0) return 0; // degenerate capture
        return static_cast<double>(time.count()) / static_cast<double>(this->model.duration.count());
    }

public:
    std::vector<cpa::flame_column> columns;

    explicit column_builder(const cpa::profile_model& model) : model(model) {}

    // Running frame gets the column time as 'self', frames that contain it don't run
    // themselves, they only get the column time counted into their 'aggregate'
    void push(const std::vector<std::size_t>& stack, cpa::microseconds self_time) {
        cpa::flame_column column{
            .x1 = this->to_fraction(this->time_offset),
            .x2 = this->to_fraction(this->time_offset + self_time),
        };

        column.rows.reserve(stack.size());

        for (std::size_t depth = 0; depth < stack.size(); ++depth) {
            const bool is_running = (depth + 1 == stack.size());

            cpa::flame_cell cell{.location = this->model.locations.at(stack[depth]), .graph_id = this->graph_id_counter++};

            cell.location.self_time      = is_running ? self_time : cpa::microseconds{};
            cell.location.aggregate_time = is_running ? cpa::microseconds{} : self_time;

            column.rows.emplace_back(std::move(cell));
        }

        this->columns.push_back(std::move(column));
        this->time_offset += self_time;
    }
};

} // namespace

// The first & last samples are skipped, they lack the preceding or following delta needed to form a time slice
std::vector<cpa::flame_column> cpa::build_columns(const cpa::profile_model& model) try {
    column_builder builder{model};

    const std::size_t end = interior_samples_end(model);

    for (std::size_t i = 1; i < end; ++i)
        builder.push(stack_locations(model, model.samples[i]), model.time_deltas.at(i - 1));

    cpa::merge_columns(builder.columns);

    return std::move(builder.columns);

} catch (std::exception& e) { throw cpa::exception{"Could not build flame graph columns, error:\n{}", e.what()}; }


// --- Left-heavy layout ---
// -------------------------

namespace {

struct stack_tree_node {
    std::size_t                        location_id{};
    cpa::microseconds                  self_time{};
    cpa::microseconds                  aggregate_time{};
    std::vector<std::size_t>           children{};          // in order of appearance
    std::map<std::size_t, std::size_t> child_by_location{}; // location id => node index
};

// Merges stacks of all interior samples into a tree, siblings are unique per location, just like in the flame graph
std::vector<stack_tree_node> build_stack_tree(const cpa::profile_model& model) {
    std::vector<stack_tree_node> tree(1); // synthetic root

    const std::size_t end = interior_samples_end(model);

    for (std::size_t i = 1; i < end; ++i) {
        const auto self_time = model.time_deltas.at(i - 1);

        std::size_t current = 0;
        tree[current].aggregate_time += self_time;

        for (const auto location_id : stack_locations(model, model.samples[i])) {
            const std::size_t candidate = tree.size();

            const auto [it, inserted] = tree[current].child_by_location.try_emplace(location_id, candidate);
            const std::size_t next    = it->second; // read before the 'tree' might reallocate

            if (inserted) {
                tree[current].children.push_back(candidate);
                tree.push_back(stack_tree_node{.location_id = location_id});
            }

            current = next;
            tree[current].aggregate_time += self_time;
        }

        tree[current].self_time += self_time;
    }

    return tree;
}

} // namespace

// Walks the stack tree depth-first with heavier subtrees first, every node with self time produces a column
// after its children, since columns of the subtree are contiguous merging collapses them into the same bands
std::vector<cpa::flame_column> cpa::build_left_heavy_columns(const cpa::profile_model& model) try {
    std::vector<stack_tree_node> tree = build_stack_tree(model);

    for (auto& node : tree) {
        std::stable_sort(node.children.begin(), node.children.end(), [&](std::size_t lhs, std::size_t rhs) {
            return tree[lhs].aggregate_time > tree[rhs].aggregate_time;
        });
    }

    column_builder builder{model};

    struct frame {
        std::size_t node;
        std::size_t next_child;
    };

    std::vector<frame>       stack{frame{0, 0}};
    std::vector<std::size_t> path; // location ids of the stack frames, without the synthetic root

    while (!stack.empty()) {
        auto& current = stack.back();
        auto& node    = tree[current.node];

        if (current.next_child < node.children.size()) {
            const std::size_t child = node.children[current.next_child++];

            path.push_back(tree[child].location_id);
            stack.push_back(frame{child, 0}); // invalidates 'current'
            continue;
        }

        if (current.node != 0 && node.self_time.count() != 0) builder.push(path, node.self_time);

        if (current.node != 0) path.pop_back();
        stack.pop_back();
    }

    cpa::merge_columns(builder.columns);

    return std::move(builder.columns);

} catch (std::exception& e) { throw cpa::exception{"Could not build left-heavy flame graph columns, error:\n{}", e.what()}; }

std::vector<cpa::flame_column> cpa::build_layout(const cpa::profile_model& model, cpa::flame_layout layout) {
    return layout == cpa::flame_layout::left_heavy ? cpa::build_left_heavy_columns(model) : cpa::build_columns(model);
}


// --- Merging ---
// ---------------

// Scan columns left to right comparing each row to the same row of the previous column. Stacks are contiguous from
// the root downwards, which means a mismatch at some depth prevents merging at all the deeper ones.
void cpa::merge_columns(std::vector<cpa::flame_column>& columns) {
    for (std::size_t x = 1; x < columns.size(); ++x) {
        auto& rows = columns[x].rows;

        for (std::size_t y = 0; y < rows.size(); ++y) {
            if (std::holds_alternative<std::size_t>(rows[y])) continue; // already merged

            const auto& previous_rows = columns[x - 1].rows;
            if (y >= previous_rows.size()) break; // previous stack is shallower

            const std::size_t authority =
                std::holds_alternative<std::size_t>(previous_rows[y]) ? std::get<std::size_t>(previous_rows[y]) : x - 1;

            auto&       target  = std::get<cpa::flame_cell>(columns[authority].rows[y]);
            const auto& current = std::get<cpa::flame_cell>(rows[y]);

            if (target.location.id != current.location.id) break;

            target.location.self_time += current.location.self_time;
            target.location.aggregate_time += current.location.aggregate_time;

            rows[y] = authority; // destroys 'current'
        }
    }
}

const cpa::flame_cell& cpa::resolve_cell(const std::vector<cpa::flame_column>& columns, std::size_t x, std::size_t y) {
    const auto& row = columns.at(x).rows.at(y);

    if (const auto* cell = std::get_if<cpa::flame_cell>(&row)) return *cell;

    return std::get<cpa::flame_cell>(columns.at(std::get<std::size_t>(row)).rows.at(y));
}


// --- Accessor ---
// ----------------

cpa::location_accessor::location_accessor(const std::vector<cpa::flame_column>& columns, std::size_t x, std::size_t y)
    : columns(&columns), pos_x(x), pos_y(y) {
    if (x >= columns.size() || y >= columns[x].rows.size())
        throw cpa::exception{"Cannot create an accessor at ({}, {}), position is out of bounds", x, y};

    if (std::holds_alternative<std::size_t>(columns[x].rows[y]))
        throw cpa::exception{"Cannot create an accessor at ({}, {}), cell is merged into another column", x, y};
}

const cpa::flame_cell& cpa::location_accessor::cell() const {
    return std::get<cpa::flame_cell>((*this->columns)[this->pos_x].rows[this->pos_y]);
}

std::size_t cpa::location_accessor::span() const {
    const auto spans = [&](std::size_t dx) {
        const auto& rows = (*this->columns)[dx].rows;
        return this->pos_y < rows.size() && std::holds_alternative<std::size_t>(rows[this->pos_y]) &&
               std::get<std::size_t>(rows[this->pos_y]) == this->pos_x;
    };

    std::size_t dx = this->pos_x + 1;
    while (dx < this->columns->size() && spans(dx)) ++dx;

    return dx - this->pos_x;
}

double cpa::location_accessor::x1() const { return (*this->columns)[this->pos_x].x1; }

double cpa::location_accessor::x2() const { return (*this->columns)[this->pos_x + this->span() - 1].x2; }

// Children of a cell are the full cells right below it in every column it spans
std::vector<cpa::location_accessor> cpa::location_accessor::children() const {
    std::vector<location_accessor> result;

    const std::size_t end = this->pos_x + this->span();

    for (std::size_t dx = this->pos_x; dx < end; ++dx) {
        const auto& rows = (*this->columns)[dx].rows;

        if (this->pos_y + 1 < rows.size() && std::holds_alternative<cpa::flame_cell>(rows[this->pos_y + 1]))
            result.emplace_back(*this->columns, dx, this->pos_y + 1);
    }

    return result;
}

std::vector<cpa::location_accessor> cpa::location_accessor::root_accessors(const std::vector<cpa::flame_column>& columns) {
    std::vector<location_accessor> result;

    for (std::size_t x = 0; x < columns.size(); ++x)
        if (!columns[x].rows.empty() && std::holds_alternative<cpa::flame_cell>(columns[x].rows.front()))
            result.emplace_back(columns, x, 0);

    return result;
}

std::vector<cpa::flame_column>
cpa::location_accessor::filter_columns(const std::vector<cpa::flame_column>&      columns,
                                       const std::vector<cpa::location_accessor>& accessors) {
    // Mark the columns we keep
    std::vector<bool> keep(columns.size(), false);

    for (const auto& accessor : accessors) {
        const std::size_t end = accessor.x() + accessor.span();
        for (std::size_t x = accessor.x(); x < end; ++x) keep[x] = true;
    }

    // Produce a fresh array with back-references remapped to new indices. When the column that
    // held the cell got filtered out, the first kept column that referenced it takes over the cell.
    std::vector<std::optional<std::size_t>>                    new_index(columns.size());
    std::map<std::pair<std::size_t, std::size_t>, std::size_t> promoted; // (old x, y) => new x

    std::vector<cpa::flame_column> result;

    for (std::size_t x = 0; x < columns.size(); ++x) {
        if (!keep[x]) continue;

        const std::size_t filtered_x = result.size();
        new_index[x]                 = filtered_x;

        cpa::flame_column column{.x1 = columns[x].x1, .x2 = columns[x].x2};
        column.rows.reserve(columns[x].rows.size());

        for (std::size_t y = 0; y < columns[x].rows.size(); ++y) {
            const auto& row = columns[x].rows[y];

            if (std::holds_alternative<cpa::flame_cell>(row)) {
                column.rows.push_back(row);
                continue;
            }

            const std::size_t target = std::get<std::size_t>(row);

            if (new_index[target]) {
                column.rows.emplace_back(*new_index[target]);
            } else if (const auto it = promoted.find({target, y}); it != promoted.end()) {
                column.rows.emplace_back(it->second);
            } else {
                column.rows.emplace_back(std::get<cpa::flame_cell>(columns[target].rows[y]));
                promoted.emplace(std::pair{target, y}, filtered_x);
            }
        }

        result.push_back(std::move(column));
    }

    return result;
}
