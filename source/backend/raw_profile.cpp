// ____________________________________ LICENSE ____________________________________
//
// Source repo: https://github.com/DmitriBogdanov/clang-build-profiler
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "backend/raw_profile.hpp"

#include <format>


// Function for validating the raw profile & making user-friendly error messages
std::optional<std::string> cpa::validate_raw_profile(const cpa::raw_profile& profile) {
    const auto node_count = static_cast<std::int64_t>(profile.nodes.size());

    const auto is_valid_id = [&](std::int64_t id) { return 1 <= id && id <= node_count; };

    // Validate node ids, model building places nodes by id so they should be a permutation of [1, N]
    std::vector<bool> seen(profile.nodes.size(), false);

    for (const auto& node : profile.nodes) {
        if (!is_valid_id(node.id)) {
            constexpr auto fmt = "node id {{ {} }} is outside of the valid range [1, {}]";
            return std::format(fmt, node.id, node_count);
        }

        if (seen[static_cast<std::size_t>(node.id - 1)]) return std::format("node id {{ {} }} is not unique", node.id);
        seen[static_cast<std::size_t>(node.id - 1)] = true;
    }

    // Validate parent-child links
    std::vector<bool> has_parent(profile.nodes.size(), false);

    for (const auto& node : profile.nodes) {
        for (const auto child : node.children) {
            if (!is_valid_id(child)) {
                constexpr auto fmt = "node {{ {} }} references a non-existent child {{ {} }}";
                return std::format(fmt, node.id, child);
            }

            if (has_parent[static_cast<std::size_t>(child - 1)]) {
                constexpr auto fmt = "node {{ {} }} is listed as a child of multiple nodes, call tree should be a tree";
                return std::format(fmt, child);
            }
            has_parent[static_cast<std::size_t>(child - 1)] = true;
        }
    }

    // Every node should be reachable from a parentless one, otherwise some nodes form a cycle
    std::vector<std::int64_t> stack;
    std::size_t               reachable = 0;

    for (const auto& node : profile.nodes)
        if (!has_parent[static_cast<std::size_t>(node.id - 1)]) stack.push_back(node.id);

    std::vector<std::size_t> position(profile.nodes.size()); // id => index in 'profile.nodes'
    for (std::size_t i = 0; i < profile.nodes.size(); ++i)
        position[static_cast<std::size_t>(profile.nodes[i].id - 1)] = i;

    while (!stack.empty()) {
        const std::int64_t id = stack.back();
        stack.pop_back();
        ++reachable;

        for (const auto child : profile.nodes[position[static_cast<std::size_t>(id - 1)]].children)
            stack.push_back(child);
    }

    if (reachable != profile.nodes.size()) return "call tree contains a cycle";

    // Validate samples
    if (profile.samples) {
        for (std::size_t i = 0; i < profile.samples->size(); ++i) {
            const std::int64_t sample = (*profile.samples)[i];

            if (!is_valid_id(sample)) {
                constexpr auto fmt = "sample {} references a non-existent node {{ {} }}";
                return std::format(fmt, i, sample);
            }
        }
    }

    // Validate precomputed locations
    if (profile.annotations) {
        const std::size_t location_count = profile.annotations->locations.size();

        for (const auto& node : profile.nodes) {
            if (!node.location_id) {
                constexpr auto fmt = "node {{ {} }} has no 'locationId', which is required for annotated profiles";
                return std::format(fmt, node.id);
            }

            if (*node.location_id >= location_count) {
                constexpr auto fmt = "node {{ {} }} references a non-existent location {{ {} }}";
                return std::format(fmt, node.id, *node.location_id);
            }

            for (const auto& tick : node.position_ticks) {
                for (const auto& tick_location : {tick.start_location_id, tick.end_location_id}) {
                    if (tick_location && *tick_location >= location_count) {
                        constexpr auto fmt = "node {{ {} }} has a position tick at line {{ {} }} "
                                             "referencing a non-existent location {{ {} }}";
                        return std::format(fmt, node.id, tick.line, *tick_location);
                    }
                }
            }
        }
    }

    return std::nullopt;
}
