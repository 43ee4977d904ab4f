// ____________________________________ LICENSE ____________________________________
//
// Source repo: https://github.com/DmitriBogdanov/clang-build-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Output serialization for '--output=text'.
// _________________________________________________________________________________

#pragma once

#include <filesystem>

#include "backend/profile.hpp"


namespace cpa::output {

void text(const cpa::profile& profile, const std::filesystem::path& output_directory);

} // namespace cpa::output
