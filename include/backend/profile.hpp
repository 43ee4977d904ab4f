// ____________________________________ LICENSE ____________________________________
//
// Source repo: https://github.com/DmitriBogdanov/clang-build-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// A struct representing a total of all profiling results.
// _________________________________________________________________________________

#pragma once

#include <string>
#include <vector>

#include "backend/bottom_up.hpp"
#include "backend/config.hpp"
#include "backend/flame.hpp"
#include "backend/model.hpp"


namespace cpa {

// Graphs reference the model, the struct should be moved as a whole rather than member-by-member
struct profile {
    std::string                    name; // usually the path of the profile
    cpa::config                    config;
    cpa::profile_model             model;
    cpa::bottom_up_graph           bottom_up;
    std::vector<cpa::flame_column> columns;
    cpa::flame_layout              layout = cpa::flame_layout::timeline;
};

} // namespace cpa
