// ____________________________________ LICENSE ____________________________________
//
// Source repo: https://github.com/DmitriBogdanov/clang-build-profiler
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "frontend/json.hpp"

#include <utility>
#include <vector>

#include "frontend/generic.hpp"
#include "utility/exception.hpp"
#include "utility/json.hpp"


// --- JSON schema ---
// -------------------

// Bottom-up graph owns its nodes through pointers and references the model, the dump
// uses a plain value tree instead, which is also easier to consume from other tools
struct bottom_up_entry {
    std::int64_t                 location_id{};
    std::string                  label{};
    cpa::category                category{};
    cpa::microseconds            self_time{};
    cpa::microseconds            aggregate_time{};
    std::vector<bottom_up_entry> callers{};
};

struct json_report {
    std::string                    name{};
    std::string                    version{};
    cpa::microseconds              sampled_time{};
    cpa::profile_model             model{};
    std::optional<bottom_up_entry> bottom_up{};
    cpa::flame_layout              layout{};
    std::vector<cpa::flame_column> columns{};
};

template <>
struct glz::meta<bottom_up_entry> {
    using T = bottom_up_entry;

    static constexpr auto value = glz::object(   //
        "locationId", &T::location_id,           //
        "label", &T::label,                      //
        "category", &T::category,                //
        "selfTime", &T::self_time,               //
        "aggregateTime", &T::aggregate_time,     //
        "callers", &T::callers                   //
    );                                           //
};

template <>
struct glz::meta<json_report> {
    using T = json_report;

    static constexpr auto value = glz::object( //
        "name", &T::name,                      //
        "version", &T::version,                //
        "sampledTime", &T::sampled_time,       //
        "model", &T::model,                    //
        "bottomUp", &T::bottom_up,             //
        "layout", &T::layout,                  //
        "columns", &T::columns                 //
    );                                         //
};

namespace {

bottom_up_entry make_entry(const cpa::bottom_up_node& node, const cpa::config& config) {
    return bottom_up_entry{
        .location_id    = node.id(),
        .label          = cpa::output::location_label(*node.location, config),
        .category       = node.category(),
        .self_time      = node.self_time,
        .aggregate_time = node.aggregate_time,
    };
}

// Converts the graph without recursion, deep call stacks make for equally deep graphs
bottom_up_entry to_entry(const cpa::bottom_up_node& root, const cpa::config& config) {
    bottom_up_entry result = make_entry(root, config);

    std::vector<std::pair<const cpa::bottom_up_node*, bottom_up_entry*>> stack{{&root, &result}};

    while (!stack.empty()) {
        const auto [node, entry] = stack.back();
        stack.pop_back();

        const auto children = node->sorted_children();

        entry->callers.reserve(children.size()); // no reallocations, pointers to callers stay valid
        for (const auto* child : children) entry->callers.push_back(make_entry(*child, config));

        for (std::size_t i = 0; i < children.size(); ++i) stack.emplace_back(children[i], &entry->callers[i]);
    }

    return result;
}

} // namespace

constexpr auto write_options = glz::opts{.prettify = true};

void cpa::output::json(const cpa::profile& profile, const std::filesystem::path& output_directory) try {
    // Ensure proper directory structure
    std::filesystem::remove_all(output_directory);
    std::filesystem::create_directories(output_directory);

    // Assemble the report
    json_report report{
        .name         = profile.name,
        .version      = profile.config.version,
        .sampled_time = cpa::output::sampled_time(profile.model),
        .model        = profile.model,
        .layout       = profile.layout,
        .columns      = profile.columns,
    };

    if (profile.config.bottom_up.enabled && profile.bottom_up.root)
        report.bottom_up = to_entry(*profile.bottom_up.root, profile.config);

    // Serialize the JSON dump of the profile
    cpa::write_file_json<write_options>((output_directory / "profiling.json").string(), report);

} catch (std::exception& e) { throw cpa::exception{"Could not output profile results as JSON, error:\n{}", e.what()}; }
