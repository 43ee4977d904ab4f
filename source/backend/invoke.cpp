// ____________________________________ LICENSE ____________________________________
//
// Source repo: https://github.com/DmitriBogdanov/clang-build-profiler
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "backend/invoke.hpp"

#include <filesystem>

#include "utility/exception.hpp"
#include "utility/json.hpp"


cpa::raw_profile cpa::read_profile_file(std::string_view path) try {
    // Handle filesystem errors
    if (!std::filesystem::exists(path) || !std::filesystem::is_regular_file(path))
        throw cpa::exception{"Profile path {{ {} }} does not point to a valid file", path};

    return cpa::read_file_json<cpa::raw_profile>(path);

} catch (std::exception& e) { throw cpa::exception{"Could not read profile {{ {} }}, error:\n{}", path, e.what()}; }

cpa::raw_profile cpa::read_profile_string(std::string_view json) try {
    return cpa::read_json<cpa::raw_profile>(json);
} catch (std::exception& e) { throw cpa::exception{"Could not parse profile, error:\n{}", e.what()}; }

// Model building assumes a structurally valid call tree, so this is the place where malformed input gets rejected
cpa::profile cpa::analyze_profile(const cpa::raw_profile& raw, const cpa::config& config) try {
    if (const auto err = cpa::validate_raw_profile(raw)) throw cpa::exception{"Profile validation error: {}", *err};

    cpa::profile profile;

    profile.config = config;
    profile.layout = config.selected_layout();
    profile.model  = cpa::build_model(raw, config.to_model_options());

    if (config.bottom_up.enabled) profile.bottom_up = cpa::build_bottom_up_graph(profile.model);
    if (config.flame.enabled) profile.columns = cpa::build_layout(profile.model, profile.layout);

    return profile;

} catch (std::exception& e) { throw cpa::exception{"Could not analyze profile, error:\n{}", e.what()}; }

cpa::profile cpa::analyze_file(std::string_view path, const cpa::config& config) try {
    cpa::profile profile = cpa::analyze_profile(cpa::read_profile_file(path), config);

    profile.name = std::string(path);

    return profile;

} catch (std::exception& e) { throw cpa::exception{"Could not analyze file {{ {} }}, error:\n{}", path, e.what()}; }
