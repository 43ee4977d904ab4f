// ____________________________________ LICENSE ____________________________________
//
// Source repo: https://github.com/DmitriBogdanov/clang-build-profiler
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "utility/version.hpp"

#include "fmt/format.h"


std::string cpa::version::format_semantic() { return fmt::format("{}.{}.{}", major, minor, patch); }

std::string cpa::version::format_full() {
    return fmt::format("{} {} ({} {})\n{}", program, format_semantic(), platform, architecture, copyright);
}
