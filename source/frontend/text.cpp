// ____________________________________ LICENSE ____________________________________
//
// Source repo: https://github.com/DmitriBogdanov/clang-build-profiler
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "frontend/text.hpp"

#include <fstream>

#include "frontend/generic.hpp"
#include "utility/exception.hpp"


namespace {

void indent(cpa::output::string_state& state) {
    for (std::size_t i = 0; i < state.depth; ++i) state.format("|  ");
}

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

    constexpr auto fmt = "> {} [{}] ({:.2f} ms, {:.2f}%) | self ({:.2f} ms, {:.2f}%)\n";

    state.format(fmt, name, cpa::output::category_name(node.category()), abs_total, rel_total, abs_self, rel_self);

    ++state.depth;
    for (const auto* child : node.sorted_children()) serialize(state, *child, config);
    --state.depth;
}

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

    constexpr auto fmt = "> {} [{}] ({:.2f} ms, {:.2f}%) [{:.1f}% - {:.1f}%]\n";

    state.format(fmt, name, cpa::output::category_name(cell.location.category), abs_total, rel_total,
                 accessor.x1() * 100, accessor.x2() * 100);

    ++state.depth;
    for (const auto& child : accessor.children()) serialize(state, child, config);
    --state.depth;
}

} // namespace

void cpa::output::text(const cpa::profile& profile, const std::filesystem::path& output_directory) try {
    // Ensure proper directory structure
    std::filesystem::remove_all(output_directory);
    std::filesystem::create_directories(output_directory);

    // Serialize results to a string
    cpa::output::string_state state{profile};

    state.format("# Profile summary\n\n");
    state.format("Profile   -> {}\n", profile.name);
    state.format("Duration  -> {:.2f} ms\n", cpa::time::to_ms(profile.model.duration));
    state.format("Sampled   -> {:.2f} ms\n", cpa::time::to_ms(state.timeframe));
    state.format("Samples   -> {}\n", profile.model.samples.size());
    state.format("Nodes     -> {}\n", profile.model.nodes.size());
    state.format("Locations -> {}\n", profile.model.locations.size());

    if (profile.config.bottom_up.enabled && profile.bottom_up.root) {
        state.format("\n# Bottom-up\n\n");
        for (const auto* child : profile.bottom_up.root->sorted_children()) serialize(state, *child, profile.config);
    }

    if (profile.config.flame.enabled) {
        state.format("\n# Flame graph ({})\n\n", cpa::flame_layout_name(profile.layout));
        for (const auto& root : cpa::location_accessor::root_accessors(profile.columns))
            serialize(state, root, profile.config);
    }

    // Write to the text file
    const auto    report_path = output_directory / "report.txt";
    std::ofstream file{report_path};
    if (!file.good()) throw cpa::exception{"Could not open file {{ {} }} for writing", report_path.string()};

    file << state.str;

} catch (std::exception& e) { throw cpa::exception{"Could not output profile results as text, error:\n{}", e.what()}; }
