// ____________________________________ LICENSE ____________________________________
//
// Source repo: https://github.com/DmitriBogdanov/clang-build-profiler
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "frontend/generic.hpp"

#include "utility/replace.hpp"


cpa::output::string_state::string_state(const cpa::profile& profile) : timeframe(sampled_time(profile.model)) {}

cpa::microseconds cpa::output::sampled_time(const cpa::profile_model& model) {
    cpa::microseconds total{};
    for (const auto& node : model.nodes) total += node.self_time;
    return total;
}

std::string cpa::output::location_label(const cpa::location& location, const cpa::config& config) {
    const auto& frame = location.call_frame;

    if (location.category == cpa::category::system || frame.line_number < 0) return frame.function_name;

    // Prefer the path relative to the project root, it's the most readable
    std::string path = frame.url;

    if (location.src) {
        if (location.src->relative_path) path = *location.src->relative_path;
        else if (location.src->source.path) path = *location.src->source.path;
    }

    for (const auto& [from, to] : config.replace_prefix) cpa::replace_prefix(path, from, to);

    // Line & column are 0-based in the profile, editors display them 1-based
    return std::format("{} ({}:{}:{})", frame.function_name, path, frame.line_number + 1, frame.column_number + 1);
}

std::string_view cpa::output::category_name(cpa::category category) noexcept {
    switch (category) {
    case cpa::category::system: return "system";
    case cpa::category::user: return "user";
    case cpa::category::module: return "module";
    }
    return "unknown";
}

std::string cpa::output::truncate_name(std::string name) {
    constexpr std::size_t max_name_width = 117;

    if (name.size() < max_name_width) return name;

    name.resize(max_name_width);
    name += "...";
    return name;
}

bool cpa::output::is_displayed(std::size_t depth, cpa::microseconds time, cpa::microseconds timeframe,
                               std::size_t max_depth, double min_percentage) {
    return depth <= max_depth && cpa::time::to_percentage(time, timeframe) >= min_percentage;
}
