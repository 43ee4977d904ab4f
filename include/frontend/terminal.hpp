// ____________________________________ LICENSE ____________________________________
//
// Source repo: https://github.com/DmitriBogdanov/clang-build-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Output serialization for '--output=terminal'.
// _________________________________________________________________________________

#pragma once

#include "backend/profile.hpp"


namespace cpa::output {

void terminal(const cpa::profile& profile);

} // namespace cpa::output
