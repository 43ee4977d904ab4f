// ____________________________________ LICENSE ____________________________________
//
// Source repo: https://github.com/DmitriBogdanov/clang-build-profiler
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "backend/model.hpp"

#include <algorithm>
#include <map>
#include <tuple>
#include <utility>

#include "utility/exception.hpp"
#include "utility/filepath.hpp"


// --- Location resolution ---
// ---------------------------

namespace {

struct resolved_locations {
    std::vector<cpa::raw_profile::annotated_location> locations{};

    std::vector<std::size_t>                              node_location{}; // raw node index => location id
    std::vector<std::vector<std::optional<std::size_t>>>  tick_location{}; // raw node index => location id of each tick
};

// Profiles written by the tooling that annotates them already have deduplicated locations
resolved_locations use_annotated_locations(const cpa::raw_profile& profile) {
    resolved_locations resolved;

    resolved.locations = profile.annotations->locations;

    for (const auto& node : profile.nodes) {
        if (!node.location_id) throw cpa::exception{"Annotated profile node {{ {} }} has no location id", node.id};

        resolved.node_location.push_back(*node.location_id);

        auto& ticks = resolved.tick_location.emplace_back();
        for (const auto& tick : node.position_ticks) ticks.push_back(tick.start_location_id);
    }

    return resolved;
}

// Otherwise we deduplicate call frames on the fly, frames are considered the same location
// when their function name, url, script id, line & column all match
class location_deduplicator {
    using key_type = std::tuple<std::string, std::string, std::string, std::int64_t, std::int64_t>;

    std::map<key_type, std::size_t> ids;

public:
    std::vector<cpa::raw_profile::annotated_location> locations;

    std::size_t id_for(const cpa::call_frame& frame) {
        key_type key{frame.function_name, frame.url, frame.script_id, frame.line_number, frame.column_number};

        if (const auto it = this->ids.find(key); it != this->ids.end()) return it->second;

        const std::size_t id = this->locations.size();
        const std::string path = cpa::file_url_to_path(frame.url);

        this->ids.emplace(std::move(key), id);
        this->locations.push_back({
            .call_frame = frame,
            .locations  = {cpa::source_location{
                 .line_number   = frame.line_number,
                 .column_number = frame.column_number,
                 .source        = {.name = path, .path = path, .source_reference = 0},
            }},
        });

        return id;
    }
};

resolved_locations deduplicate_locations(const cpa::raw_profile& profile) {
    resolved_locations     resolved;
    location_deduplicator  deduplicator;

    for (const auto& node : profile.nodes) {
        resolved.node_location.push_back(deduplicator.id_for(node.call_frame));

        // Position ticks only give line-level granularity and their line numbers are 1-based,
        // we 'mark' the entire source range of a tick with a pair of synthetic locations
        auto& ticks = resolved.tick_location.emplace_back();

        for (const auto& tick : node.position_ticks) {
            cpa::call_frame start_frame = node.call_frame;
            start_frame.line_number     = tick.line - 1;
            start_frame.column_number   = 0;

            cpa::call_frame end_frame = node.call_frame;
            end_frame.line_number     = tick.line;
            end_frame.column_number   = 0;

            ticks.push_back(deduplicator.id_for(start_frame)); // ticks are counted at the range start
            deduplicator.id_for(end_frame);
        }
    }

    resolved.locations = std::move(deduplicator.locations);

    return resolved;
}

resolved_locations resolve_locations(const cpa::raw_profile& profile) {
    if (profile.annotations) return use_annotated_locations(profile);
    else return deduplicate_locations(profile);
}

} // namespace

std::optional<cpa::source_location>
cpa::best_source_location(const std::vector<cpa::source_location>& candidates,
                          const std::optional<std::string>&         root_path) {
    // Prefer files that exist on disk over the sources that only exist inside the runtime
    const auto on_disk = std::find_if(candidates.begin(), candidates.end(), [](const cpa::source_location& candidate) {
        return candidate.source.path && !candidate.source.path->empty() && candidate.source.source_reference == 0;
    });

    if (on_disk == candidates.end()) {
        if (candidates.empty()) return std::nullopt;
        return candidates.front();
    }

    cpa::source_location best = *on_disk;

    if (root_path) best.relative_path = cpa::relative_filepath(*root_path, *best.source.path);

    return best;
}

cpa::category cpa::categorize(cpa::call_frame& call_frame, const std::optional<cpa::source_location>& src,
                              const cpa::model_options& options) {
    if (call_frame.function_name.empty()) call_frame.function_name = options.anonymous_name;

    if (call_frame.line_number < 0) return cpa::category::system;

    // Note: This is a plain substring match, which means a user directory that happens to contain
    //       the marker in its name will get categorized as a dependency
    if (call_frame.url.find(options.dependency_marker) != std::string::npos || !src) return cpa::category::module;

    return cpa::category::user;
}


// --- Aggregate time ---
// ----------------------

namespace {

// Iterative post-order traversal, equivalent to a memoized recursion 'total = self + sum(total(child))'
// but doesn't overflow the stack on deep call trees. A node is computed at most once thanks to the
// 'computed' markers, aggregate time of 0 is a valid cached value so we can't use it as a marker.
cpa::microseconds compute_aggregate_time(std::size_t index, std::vector<cpa::computed_node>& nodes,
                                         std::vector<bool>& computed) {
    struct frame {
        std::size_t id;
        bool        expanded;
    };

    std::vector<frame> stack{frame{index, false}};

    while (!stack.empty()) {
        const frame current = stack.back();

        if (computed[current.id]) {
            stack.pop_back();
            continue;
        }

        // Descend into children first
        if (!current.expanded) {
            stack.back().expanded = true;

            for (const auto child : nodes[current.id].children)
                if (!computed[child]) stack.push_back(frame{child, false});

            continue;
        }

        // All children are computed by now
        stack.pop_back();

        auto& node  = nodes[current.id];
        auto  total = node.self_time;
        for (const auto child : node.children) total += nodes[child].aggregate_time;

        node.aggregate_time  = total;
        computed[current.id] = true;
    }

    return nodes[index].aggregate_time;
}

std::vector<std::size_t> to_zero_based(const std::vector<std::int64_t>& ids) {
    std::vector<std::size_t> result;
    result.reserve(ids.size());

    for (const auto id : ids) result.push_back(static_cast<std::size_t>(id - 1));

    return result;
}

} // namespace


// --- Model ---
// -------------

cpa::profile_model cpa::build_model(const cpa::raw_profile& profile, const cpa::model_options& options) try {
    cpa::profile_model model;

    model.duration = profile.end_time - profile.start_time;

    if (options.root_path) model.root_path = options.root_path;
    else if (profile.annotations) model.root_path = profile.annotations->root_path;

    // An aborted capture has no samples, this is a valid state that results in an empty model
    if (!profile.samples || !profile.time_deltas) {
        if (profile.samples) model.samples = to_zero_based(*profile.samples);
        if (profile.time_deltas) model.time_deltas = *profile.time_deltas;
        return model;
    }

    // Resolve, categorize & link source locations
    resolved_locations resolved = resolve_locations(profile);

    model.locations.reserve(resolved.locations.size());

    for (std::size_t id = 0; id < resolved.locations.size(); ++id) {
        auto& source = resolved.locations[id];

        auto src               = cpa::best_source_location(source.locations, model.root_path);
        auto location_category = cpa::categorize(source.call_frame, src, options);

        model.locations.push_back({
            .id         = static_cast<std::int64_t>(id),
            .category   = location_category,
            .call_frame = std::move(source.call_frame),
            .src        = std::move(src),
        });
    }

    // Create a list of 0-based nodes, ordered by id. Profiles seem to always have incrementing ids,
    // however the nodes themselves are not necessarily sorted.
    model.nodes.resize(profile.nodes.size());

    for (std::size_t i = 0; i < profile.nodes.size(); ++i) {
        const auto& raw_node = profile.nodes[i];
        const auto  id       = static_cast<std::size_t>(raw_node.id - 1);

        model.nodes[id] = cpa::computed_node{
            .id          = id,
            .children    = to_zero_based(raw_node.children),
            .location_id = resolved.node_location[i],
        };

        for (std::size_t t = 0; t < raw_node.position_ticks.size(); ++t)
            if (const auto tick_location = resolved.tick_location[i][t])
                model.locations.at(*tick_location).ticks += raw_node.position_ticks[t].ticks;
    }

    // Raw profile has no backlinks, fill them in a second pass
    for (const auto& node : model.nodes)
        for (const auto child : node.children) model.nodes[child].parent = node.id;

    // Samples are the 'bottom-most' node, the code that was running at the time. Each delta
    // is the time elapsed since the previous sample, which means it belongs to the sample following it.
    model.samples     = to_zero_based(*profile.samples);
    model.time_deltas = *profile.time_deltas;

    const std::size_t attributed = std::min(model.samples.size(), model.time_deltas.size() + 1);

    for (std::size_t i = 1; i < attributed; ++i) model.nodes[model.samples[i]].self_time += model.time_deltas[i - 1];

    // Gather aggregate time for nodes & roll up the timings into their locations
    std::vector<bool> computed(model.nodes.size(), false);

    for (std::size_t i = 0; i < model.nodes.size(); ++i) {
        const auto& node     = model.nodes[i];
        auto&       location = model.locations[node.location_id];

        location.aggregate_time += compute_aggregate_time(i, model.nodes, computed);
        location.self_time += node.self_time;
    }

    return model;

} catch (std::exception& e) { throw cpa::exception{"Could not build profile model, error:\n{}", e.what()}; }
