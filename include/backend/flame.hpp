// ____________________________________ LICENSE ____________________________________
//
// Source repo: https://github.com/DmitriBogdanov/clang-build-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Flame graph layout of the profile: columns of stacked frames with adjacent identical
// frames merged into wide bands, and a cursor for querying the resulting grid.
// _________________________________________________________________________________

#pragma once

#include <cstdint>
#include <string_view>
#include <variant>
#include <vector>

#include "backend/model.hpp"


// Every interior sample becomes a column, rows go from the outermost caller down to the running frame.
// When the same frame spans multiple adjacent columns only the first one holds the actual cell,
// the others hold an index of that column instead:
//
//    column:    0        1        2        3
//    row 0:   [main]     0        0        0         <-- 'main' is a single band spanning 4 columns
//    row 1:   [parse]    0     [render]    2
//    row 2:                    [parse]     2         <-- merged with column 2, but not with column 0
//
// Merged cells accumulate the timing of all the columns they span.

namespace cpa {

enum class flame_layout : std::uint8_t {
    timeline,  // columns follow the order of samples
    left_heavy // identical stacks are grouped together & sorted by time, heaviest on the left
};

[[nodiscard]] cpa::flame_layout flame_layout_from_name(std::string_view name);
[[nodiscard]] std::string_view  flame_layout_name(cpa::flame_layout layout) noexcept;

struct flame_cell {
    cpa::location location{}; // copy of the location, timing is local to the cell
    std::size_t   graph_id{};

    // Running frame time is counted as 'self', time of the frames it contains is counted as 'aggregate'
    [[nodiscard]] microseconds total_time() const { return this->location.self_time + this->location.aggregate_time; }

    bool operator==(const flame_cell&) const = default;
};

using flame_row = std::variant<flame_cell, std::size_t>; // a cell, or an index of the column that holds it

struct flame_column {
    double                 x1{}; // normalized to [0, 1]
    double                 x2{}; // |
    std::vector<flame_row> rows{};

    bool operator==(const flame_column&) const = default;
};

[[nodiscard]] std::vector<cpa::flame_column> build_columns(const cpa::profile_model& model);

[[nodiscard]] std::vector<cpa::flame_column> build_left_heavy_columns(const cpa::profile_model& model);

[[nodiscard]] std::vector<cpa::flame_column> build_layout(const cpa::profile_model& model, cpa::flame_layout layout);

// Merges identical adjacent cells, running it on already merged columns changes nothing
void merge_columns(std::vector<cpa::flame_column>& columns);

// Follows the back-reference (if there is one) to the cell that holds the data
[[nodiscard]] const cpa::flame_cell& resolve_cell(const std::vector<cpa::flame_column>& columns, std::size_t x,
                                                  std::size_t y);


// --- Accessor ---
// ----------------

// Read-only cursor over a cell of the columns, the columns should outlive the accessor
class location_accessor {
    const std::vector<cpa::flame_column>* columns;
    std::size_t                           pos_x;
    std::size_t                           pos_y;

public:
    location_accessor(const std::vector<cpa::flame_column>& columns, std::size_t x, std::size_t y);

    [[nodiscard]] std::size_t x() const noexcept { return this->pos_x; }
    [[nodiscard]] std::size_t y() const noexcept { return this->pos_y; }

    [[nodiscard]] const cpa::flame_cell& cell() const;
    [[nodiscard]] const cpa::location&   location() const { return this->cell().location; }

    // Number of columns spanned by the cell
    [[nodiscard]] std::size_t span() const;

    [[nodiscard]] double x1() const;
    [[nodiscard]] double x2() const;

    [[nodiscard]] std::vector<location_accessor> children() const;

    [[nodiscard]] static std::vector<location_accessor> root_accessors(const std::vector<cpa::flame_column>& columns);

    // Leaves only the columns spanned by given accessors, back-references get re-targeted to match the new indices
    [[nodiscard]] static std::vector<cpa::flame_column>
    filter_columns(const std::vector<cpa::flame_column>& columns, const std::vector<location_accessor>& accessors);
};

} // namespace cpa

// Define enum reflection for JSON serialization
template <>
struct glz::meta<cpa::flame_layout> {
    using enum cpa::flame_layout;

    static constexpr auto value = glz::enumerate(timeline, left_heavy);
};

template <>
struct glz::meta<cpa::flame_cell> {
    using T = cpa::flame_cell;

    static constexpr auto value = glz::object( //
        "location", &T::location,              //
        "graphId", &T::graph_id                //
    );                                         //
};

template <>
struct glz::meta<cpa::flame_column> {
    using T = cpa::flame_column;

    static constexpr auto value = glz::object( //
        "x1", &T::x1,                          //
        "x2", &T::x2,                          //
        "rows", &T::rows                       //
    );                                         //
};
