// ____________________________________ LICENSE ____________________________________
//
// Source repo: https://github.com/DmitriBogdanov/clang-build-profiler
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "frontend/terminal.hpp"

#include "fmt/color.h"
#include "fmt/format.h"

#include "frontend/generic.hpp"
#include "utility/exception.hpp"


namespace {

constexpr auto style_header = fmt::fg(fmt::color::dark_turquoise) | fmt::emphasis::bold;

fmt::color color_from_category(cpa::category category) {
    return category == cpa::category::user     ? fmt::color::white
           : category == cpa::category::module ? fmt::color::steel_blue
                                               : fmt::color::gray;
}

void indent(const cpa::output::string_state& state) {
    constexpr auto indent_color = fmt::color::gray;

    for (std::size_t i = 0; i < state.depth; ++i) fmt::print(fmt::fg(indent_color), "|  ");
}

// --- Bottom-up ---
// -----------------

void serialize(cpa::output::string_state& state, const cpa::bottom_up_node& node, const cpa::config& config) {
    const auto& section = config.bottom_up;

    if (!cpa::output::is_displayed(state.depth, node.aggregate_time, state.timeframe, section.max_depth,
                                   section.min_percentage))
        return;

    indent(state);

    // Serialize node
    const auto abs_total = cpa::time::to_ms(node.aggregate_time);
    const auto abs_self  = cpa::time::to_ms(node.self_time);
    const auto rel_total = cpa::time::to_percentage(node.aggregate_time, state.timeframe);
    const auto rel_self  = cpa::time::to_percentage(node.self_time, state.timeframe);

    const std::string name = cpa::output::truncate_name(cpa::output::location_label(*node.location, config));

    constexpr auto fmt = "> {} ({:.2f} ms, {:.2f}%) | self ({:.2f} ms, {:.2f}%)";

    fmt::print(fmt::fg(color_from_category(node.category())), fmt, name, abs_total, rel_total, abs_self, rel_self);
    fmt::print("\n");

    ++state.depth;
    for (const auto* child : node.sorted_children()) serialize(state, *child, config);
    --state.depth;
}

// --- Flame graph ---
// -------------------

void serialize(cpa::output::string_state& state, const cpa::location_accessor& accessor, const cpa::config& config) {
    const auto& section = config.flame;
    const auto& cell    = accessor.cell();

    if (!cpa::output::is_displayed(state.depth, cell.total_time(), state.timeframe, section.max_depth,
                                   section.min_percentage))
        return;

    indent(state);

    // Serialize cell
    const auto abs_total = cpa::time::to_ms(cell.total_time());
    const auto rel_total = cpa::time::to_percentage(cell.total_time(), state.timeframe);

    const std::string name = cpa::output::truncate_name(cpa::output::location_label(cell.location, config));

    constexpr auto fmt = "> {} ({:.2f} ms, {:.2f}%) [{:.1f}% - {:.1f}%]";

    fmt::print(fmt::fg(color_from_category(cell.location.category)), fmt, name, abs_total, rel_total,
               accessor.x1() * 100, accessor.x2() * 100);
    fmt::print("\n");

    ++state.depth;
    for (const auto& child : accessor.children()) serialize(state, child, config);
    --state.depth;
}

} // namespace

void cpa::output::terminal(const cpa::profile& profile) try {
    cpa::output::string_state state{profile};

    // Serialize summary
    fmt::print("\n");
    fmt::print("{}\n", fmt::styled("# Profile summary", style_header));
    fmt::print("\n");
    fmt::print("Duration  -> {:.2f} ms\n", cpa::time::to_ms(profile.model.duration));
    fmt::print("Sampled   -> {:.2f} ms\n", cpa::time::to_ms(state.timeframe));
    fmt::print("Samples   -> {}\n", profile.model.samples.size());
    fmt::print("Nodes     -> {}\n", profile.model.nodes.size());
    fmt::print("Locations -> {}\n", profile.model.locations.size());

    // Serialize bottom-up graph
    if (profile.config.bottom_up.enabled && profile.bottom_up.root) {
        fmt::print("\n");
        fmt::print("{}\n", fmt::styled("# Bottom-up", style_header));
        fmt::print("\n");

        for (const auto* child : profile.bottom_up.root->sorted_children()) serialize(state, *child, profile.config);
    }

    // Serialize flame graph
    if (profile.config.flame.enabled) {
        fmt::print("\n");
        fmt::print("{}\n", fmt::styled(fmt::format("# Flame graph ({})", cpa::flame_layout_name(profile.layout)),
                                       style_header));
        fmt::print("\n");

        for (const auto& root : cpa::location_accessor::root_accessors(profile.columns))
            serialize(state, root, profile.config);
    }

    fmt::print("\n");

} catch (std::exception& e) {
    throw cpa::exception{"Could not output profile results to the terminal, error:\n{}", e.what()};
}
