// ____________________________________ LICENSE ____________________________________
//
// Source repo: https://github.com/DmitriBogdanov/clang-build-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Substring replacement functions, we need those in multiple places.
// _________________________________________________________________________________

#pragma once

#include <string>
#include <string_view>


namespace cpa {

void replace_all(std::string& str, std::string_view from, std::string_view to);

void replace_prefix(std::string& str, std::string_view from, std::string_view to);

} // namespace cpa
