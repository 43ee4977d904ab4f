// ____________________________________ LICENSE ____________________________________
//
// Source repo: https://github.com/DmitriBogdanov/clang-build-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// A struct that holds an in-memory representation of the raw CPU profile.
// _________________________________________________________________________________

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "utility/json.hpp"
#include "utility/time.hpp"


namespace cpa {

// CPU profiles are stored in the '.cpuprofile' format of the Chrome DevTools protocol, full specification
// can be found here: https://chromedevtools.github.io/devtools-protocol/tot/Profiler/#type-Profile
//
// The gist of it is:
//    - 'nodes' form a call tree, every node is a unique call stack, nodes reference their children by 1-based id
//    - 'samples' list the node that was on top of the stack at each sampling point
//    - 'timeDeltas' list the time elapsed since the previous sample
//
// Profiles written by some tools also carry a '$vscode' annotation block that contains precomputed
// (already deduplicated) source locations, in which case every node has a 'locationId'.

struct call_frame {
    std::string  function_name{};
    std::string  script_id{};
    std::string  url{};
    std::int64_t line_number{};   // 0-based, negative for native frames
    std::int64_t column_number{}; // 0-based

    bool operator==(const call_frame&) const = default;
};

struct source_reference {
    std::string                name{};
    std::optional<std::string> path{};
    std::int64_t               source_reference{}; // non-zero for sources that only exist in the runtime

    bool operator==(const cpa::source_reference&) const = default; // qualified, the member hides the type name
};

struct source_location {
    std::int64_t               line_number{};
    std::int64_t               column_number{};
    cpa::source_reference      source{};
    std::optional<std::string> relative_path{}; // never present in the raw input, filled during model building

    bool operator==(const source_location&) const = default;
};

struct raw_profile {

    struct position_tick {
        std::int64_t               line{}; // 1-based
        std::int64_t               ticks{};
        std::optional<std::size_t> start_location_id{}; // only present in annotated profiles
        std::optional<std::size_t> end_location_id{};   // |
    };

    struct node {
        std::int64_t                id{}; // 1-based
        cpa::call_frame             call_frame{};
        std::optional<std::int64_t> hit_count{};
        std::vector<std::int64_t>   children{};
        std::vector<position_tick>  position_ticks{};
        std::optional<std::size_t>  location_id{}; // only present in annotated profiles
    };

    struct annotated_location {
        cpa::call_frame                   call_frame{};
        std::vector<cpa::source_location> locations{};
    };

    struct annotation_block {
        std::optional<std::string>      root_path{};
        std::vector<annotated_location> locations{};
    };

    std::vector<node>                          nodes{};
    microseconds                               start_time{};
    microseconds                               end_time{};
    std::optional<std::vector<std::int64_t>>   samples{};     // 1-based node ids
    std::optional<std::vector<microseconds>>   time_deltas{}; // time elapsed before each sample
    std::optional<annotation_block>            annotations{};
};

// Checks the structural invariants that model building relies upon, returns a user-friendly
// error message describing the first violation found
[[nodiscard]] std::optional<std::string> validate_raw_profile(const cpa::raw_profile& profile);

} // namespace cpa

// Rename reflected fields so we can use readable names in code, while the profile itself uses camel case
template <>
struct glz::meta<cpa::call_frame> {
    using T = cpa::call_frame;

    static constexpr auto value = glz::object( //
        "functionName", &T::function_name,     //
        "scriptId", &T::script_id,             //
        "url", &T::url,                        //
        "lineNumber", &T::line_number,         //
        "columnNumber", &T::column_number      //
    );                                         //
};

template <>
struct glz::meta<cpa::source_reference> {
    using T = cpa::source_reference;

    static constexpr auto value = glz::object(     //
        "name", &T::name,                          //
        "path", &T::path,                          //
        "sourceReference", &T::source_reference    //
    );                                             //
};

template <>
struct glz::meta<cpa::source_location> {
    using T = cpa::source_location;

    static constexpr auto value = glz::object( //
        "lineNumber", &T::line_number,         //
        "columnNumber", &T::column_number,     //
        "source", &T::source,                  //
        "relativePath", &T::relative_path      //
    );                                         //
};

template <>
struct glz::meta<cpa::raw_profile::position_tick> {
    using T = cpa::raw_profile::position_tick;

    static constexpr auto value = glz::object(       //
        "line", &T::line,                            //
        "ticks", &T::ticks,                          //
        "startLocationId", &T::start_location_id,    //
        "endLocationId", &T::end_location_id         //
    );                                               //
};

template <>
struct glz::meta<cpa::raw_profile::node> {
    using T = cpa::raw_profile::node;

    static constexpr auto value = glz::object(   //
        "id", &T::id,                            //
        "callFrame", &T::call_frame,             //
        "hitCount", &T::hit_count,               //
        "children", &T::children,                //
        "positionTicks", &T::position_ticks,     //
        "locationId", &T::location_id            //
    );                                           //
};

template <>
struct glz::meta<cpa::raw_profile::annotated_location> {
    using T = cpa::raw_profile::annotated_location;

    static constexpr auto value = glz::object( //
        "callFrame", &T::call_frame,           //
        "locations", &T::locations             //
    );                                         //
};

template <>
struct glz::meta<cpa::raw_profile::annotation_block> {
    using T = cpa::raw_profile::annotation_block;

    static constexpr auto value = glz::object( //
        "rootPath", &T::root_path,             //
        "locations", &T::locations             //
    );                                         //
};

template <>
struct glz::meta<cpa::raw_profile> {
    using T = cpa::raw_profile;

    static constexpr auto value = glz::object( //
        "nodes", &T::nodes,                    //
        "startTime", &T::start_time,           //
        "endTime", &T::end_time,               //
        "samples", &T::samples,                //
        "timeDeltas", &T::time_deltas,         //
        "$vscode", &T::annotations             //
    );                                         //
};
