// ____________________________________ LICENSE ____________________________________
//
// Source repo: https://github.com/DmitriBogdanov/clang-build-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Normalized computation model of the CPU profile and the function that builds it.
// _________________________________________________________________________________

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "backend/raw_profile.hpp"
#include "utility/json.hpp"
#include "utility/time.hpp"


// The raw call tree has a node for every unique call stack, which means the same function called
// from 2 different places will have 2 different nodes:
//
// > (root)                                       // node 0, location 0
// |  > main        (app.js:1)                    // node 1, location 1
// |  |  > parse    (app.js:10)                   // node 2, location 2  <-- same location,
// |  |  > render   (app.js:20)                   // node 3, location 3      different call stacks
// |  |  |  > parse (app.js:10)                   // node 4, location 2  <--
//
// Nodes carry call-path-sensitive timing, while locations sum up timing of all nodes sharing them,
// which makes them call-path-insensitive. Both views are needed by the consumers of the model.

namespace cpa {

enum class category : std::uint8_t { system, user, module };

struct location {
    std::int64_t                        id{}; // dense index into 'profile_model::locations', -1 for synthetic roots
    microseconds                        self_time{};
    microseconds                        aggregate_time{};
    std::int64_t                        ticks{};
    cpa::category                       category = cpa::category::system;
    cpa::call_frame                     call_frame{};
    std::optional<cpa::source_location> src{};

    bool operator==(const location&) const = default;
};

struct computed_node {
    std::size_t                id{};
    microseconds               self_time{};
    microseconds               aggregate_time{};
    std::vector<std::size_t>   children{};
    std::optional<std::size_t> parent{};
    std::size_t                location_id{};
};

struct profile_model {
    std::vector<computed_node> nodes{};
    std::vector<location>      locations{};
    std::vector<std::size_t>   samples{}; // 0-based node ids
    std::vector<microseconds>  time_deltas{};
    std::optional<std::string> root_path{};
    microseconds               duration{};
};

struct model_options {
    std::string                dependency_marker = "node_modules";
    std::string                anonymous_name    = "(anonymous)";
    std::optional<std::string> root_path{}; // overrides the one recorded in the profile
};

[[nodiscard]] cpa::category categorize(cpa::call_frame& call_frame, const std::optional<cpa::source_location>& src,
                                       const cpa::model_options& options = {});

[[nodiscard]] std::optional<cpa::source_location>
best_source_location(const std::vector<cpa::source_location>& candidates, const std::optional<std::string>& root_path);

// Assumes a structurally valid profile, see 'cpa::validate_raw_profile()'
[[nodiscard]] cpa::profile_model build_model(const cpa::raw_profile& profile, const cpa::model_options& options = {});

} // namespace cpa

// Define enum reflection for JSON serialization
template <>
struct glz::meta<cpa::category> {
    using enum cpa::category;

    static constexpr auto value = glz::enumerate(system, user, module);
};

template <>
struct glz::meta<cpa::location> {
    using T = cpa::location;

    static constexpr auto value = glz::object(  //
        "id", &T::id,                           //
        "selfTime", &T::self_time,              //
        "aggregateTime", &T::aggregate_time,    //
        "ticks", &T::ticks,                     //
        "category", &T::category,               //
        "callFrame", &T::call_frame,            //
        "src", &T::src                          //
    );                                          //
};

template <>
struct glz::meta<cpa::computed_node> {
    using T = cpa::computed_node;

    static constexpr auto value = glz::object(  //
        "id", &T::id,                           //
        "selfTime", &T::self_time,              //
        "aggregateTime", &T::aggregate_time,    //
        "children", &T::children,               //
        "parent", &T::parent,                   //
        "locationId", &T::location_id           //
    );                                          //
};

template <>
struct glz::meta<cpa::profile_model> {
    using T = cpa::profile_model;

    static constexpr auto value = glz::object( //
        "nodes", &T::nodes,                    //
        "locations", &T::locations,            //
        "samples", &T::samples,                //
        "timeDeltas", &T::time_deltas,         //
        "rootPath", &T::root_path,             //
        "duration", &T::duration               //
    );                                         //
};
