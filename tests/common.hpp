// __________________________________ CONTENTS ___________________________________
//
//    Common utils / includes / namespaces used for testing.
//    Reduces test boilerplate, should not be included anywhere else.
// _______________________________________________________________________________

#pragma once

// ___________________ TEST FRAMEWORK  ____________________

#define DOCTEST_CONFIG_VOID_CAST_EXPRESSIONS // makes 'CHECK_THROWS()' not give warning for discarding [[nodiscard]]
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN   // automatically creates 'main()' that runs tests
#include "doctest/doctest.h"

// ___________________ UTILS  ____________________

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "backend/raw_profile.hpp"

const std::filesystem::path data_dir = "tests/data/";

const std::filesystem::path profiles_dir = data_dir / "profiles";
const std::filesystem::path configs_dir  = data_dir / "configs";

using namespace std::chrono_literals;

// Builds a call frame of a user function at 'file:///project/app.js'
inline cpa::call_frame make_frame(std::string name, std::int64_t line, std::int64_t column = 0,
                                  std::string url = "file:///project/app.js") {
    return cpa::call_frame{
        .function_name = std::move(name),
        .script_id     = "1",
        .url           = std::move(url),
        .line_number   = line,
        .column_number = column,
    };
}

inline cpa::call_frame make_root_frame() {
    return cpa::call_frame{.function_name = "(root)", .script_id = "0", .line_number = -1, .column_number = -1};
}

inline cpa::raw_profile::node make_node(std::int64_t id, cpa::call_frame frame, std::vector<std::int64_t> children = {}) {
    return cpa::raw_profile::node{.id = id, .call_frame = std::move(frame), .children = std::move(children)};
}

inline std::vector<cpa::microseconds> make_deltas(std::initializer_list<std::int64_t> deltas) {
    std::vector<cpa::microseconds> result;
    for (const auto delta : deltas) result.emplace_back(delta);
    return result;
}

// (root) -> main -> parse
//                -> render -> parse
//
// Samples run 'parse' under 'main', then 'render', then 'parse' under 'render', then idle at 'main'
inline cpa::raw_profile make_sample_profile() {
    cpa::raw_profile profile;

    profile.nodes = {
        make_node(1, make_root_frame(), {2}),
        make_node(2, make_frame("main", 0), {3, 4}),
        make_node(3, make_frame("parse", 9, 4)),
        make_node(4, make_frame("render", 19, 4), {5}),
        make_node(5, make_frame("parse", 9, 4)),
    };

    profile.start_time  = cpa::microseconds{1000};
    profile.end_time    = cpa::microseconds{1100};
    profile.samples     = std::vector<std::int64_t>{1, 3, 3, 4, 5, 5, 2, 1};
    profile.time_deltas = make_deltas({10, 20, 10, 15, 15, 20, 10});

    return profile;
}
