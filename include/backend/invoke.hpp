// ____________________________________ LICENSE ____________________________________
//
// Source repo: https://github.com/DmitriBogdanov/clang-build-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Functions for analyzing profiles, which handle the filesystem & parsing
// and invoke the actual analysis backend.
// _________________________________________________________________________________

#pragma once

#include <string_view>

#include "backend/config.hpp"
#include "backend/profile.hpp"
#include "backend/raw_profile.hpp"


namespace cpa {

[[nodiscard]] cpa::raw_profile read_profile_file(std::string_view path);
[[nodiscard]] cpa::raw_profile read_profile_string(std::string_view json);

[[nodiscard]] cpa::profile analyze_profile(const cpa::raw_profile& raw, const cpa::config& config);
[[nodiscard]] cpa::profile analyze_file(std::string_view path, const cpa::config& config);

} // namespace cpa
