// ____________________________________ LICENSE ____________________________________
//
// Source repo: https://github.com/DmitriBogdanov/clang-build-profiler
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "utility/replace.hpp"


void cpa::replace_all(std::string& str, std::string_view from, std::string_view to) {
    if (from.empty()) return; // would never terminate

    std::size_t i = 0;

    while ((i = str.find(from, i)) != std::string::npos) { // locate substring to replace
        str.replace(i, from.size(), to);                   // replace
        i += to.size();                                    // step over the replaced region
    }
}

void cpa::replace_prefix(std::string& str, std::string_view from, std::string_view to) {
    if (str.starts_with(from)) str.replace(0, from.size(), to);
}
