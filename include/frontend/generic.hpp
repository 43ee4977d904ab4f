// ____________________________________ LICENSE ____________________________________
//
// Source repo: https://github.com/DmitriBogdanov/clang-build-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Generic logic & state for serializing profiling results to a string.
// _________________________________________________________________________________

#pragma once

#include <format>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

#include "backend/profile.hpp"


namespace cpa::output {

struct string_state {
    std::size_t       depth{};
    cpa::microseconds timeframe{};
    std::string       str{};

    explicit string_state(const cpa::profile& profile);

    template <class... Args>
    void format(std::format_string<Args...> fmt, Args&&... args) {
        std::format_to(std::back_inserter(this->str), fmt, std::forward<Args>(args)...);
    }
};

// Total sampled time, percentages in the reports are relative to it
[[nodiscard]] cpa::microseconds sampled_time(const cpa::profile_model& model);

// Human-readable name of the location, 'parse (src/app.js:10:5)' for sources, just the function name for natives.
// Paths are prettified according to the 'replace_prefix' rules of the config.
[[nodiscard]] std::string location_label(const cpa::location& location, const cpa::config& config);

[[nodiscard]] std::string_view category_name(cpa::category category) noexcept;

[[nodiscard]] std::string truncate_name(std::string name);

// Whether an entry should be displayed at all, entries are cut off by depth & share of the total time
[[nodiscard]] bool is_displayed(std::size_t depth, cpa::microseconds time, cpa::microseconds timeframe,
                                std::size_t max_depth, double min_percentage);

} // namespace cpa::output
