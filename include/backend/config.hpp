// ____________________________________ LICENSE ____________________________________
//
// Source repo: https://github.com/DmitriBogdanov/clang-build-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Struct representation of the YAML config and its parsing/serialization.
// _________________________________________________________________________________

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "backend/flame.hpp"
#include "backend/model.hpp"
#include "utility/version.hpp"


namespace cpa {

struct config {

    // --- Subclasses ---
    // ------------------

    struct prefix_replacement {
        std::string from = {};
        std::string to   = {};
    };

    struct model_section {
        std::string dependency_marker = "node_modules";
        std::string anonymous_name    = "(anonymous)";
        std::string root_path         = {}; // empty => use the one recorded in the profile
    };

    struct bottom_up_section {
        bool        enabled        = true;
        std::size_t max_depth      = 6;
        double      min_percentage = 1.0; // entries below this share of total time are not displayed
    };

    struct flame_section {
        bool        enabled        = true;
        std::string layout         = "timeline";
        std::size_t max_depth      = 12;
        double      min_percentage = 1.0;
    };

    // --- Members ---
    // ---------------

    std::string version = version::format_semantic();

    model_section                   model;
    bottom_up_section               bottom_up;
    flame_section                   flame;
    std::vector<prefix_replacement> replace_prefix = {};

    constexpr static auto default_path = ".cpuprofile-analyzer";

    // --- Parsing/serialization ---
    // -----------------------------

    static config from_string(std::string_view str);
    static config from_file(std::string_view path);

    std::string to_string() const;
    void        to_file(std::string_view path) const;

    std::optional<std::string> validate() const;

    // --- Conversions ---
    // -------------------

    [[nodiscard]] cpa::model_options to_model_options() const;
    [[nodiscard]] cpa::flame_layout  selected_layout() const;
};

// Reads the entire file, throws 'cpa::exception' if it can't be opened
[[nodiscard]] std::string read_file_to_string(const std::string& path);

} // namespace cpa
