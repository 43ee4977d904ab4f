// ____________________________________ LICENSE ____________________________________
//
// Source repo: https://github.com/DmitriBogdanov/clang-build-profiler
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "backend/config.hpp"

#include <cstdint>
#include <format>
#include <fstream>
#include <regex>

#include "fkYAML/node.hpp"

#include "utility/exception.hpp"


// More or less the fastest way of reading a text file, implementation taken from
// 'utl::json': https://github.com/DmitriBogdanov/UTL/blob/master/include/UTL/json.hpp
std::string cpa::read_file_to_string(const std::string& path) {
    std::ifstream file(path, std::ios::ate | std::ios::binary); // open file and immediately seek to the end
    // opening file as binary allows us to skip pointless newline re-encoding
    if (!file.good()) throw cpa::exception("Could not open file {{ {} }}", path);

    const auto file_size = file.tellg(); // returns cursor pos, which is the end of file
    file.seekg(std::ios::beg);           // seek to the beginning
    std::string chars(file_size, 0);     // allocate string of appropriate size
    file.read(chars.data(), file_size);  // read into the string
    return chars;
}

namespace {

// YAML leaves 'key:' with no value as null, we treat it as an empty string
std::string read_str(const fkyaml::node& node) { return node.is_null() ? std::string{} : node.as_str(); }

// Integer literals like '1' are valid percentages too
double read_number(const fkyaml::node& node) {
    return node.is_integer() ? static_cast<double>(node.as_int()) : static_cast<double>(node.as_float());
}

std::size_t read_depth(const fkyaml::node& node) {
    const auto value = node.as_int();
    if (value < 0) throw cpa::exception{"Depth should be non-negative, got {{ {} }}", value};
    return static_cast<std::size_t>(value);
}

} // namespace

cpa::config cpa::config::from_string(std::string_view str) try {
    const fkyaml::node root = fkyaml::node::deserialize(str);

    cpa::config config;

    if (root.contains("version")) config.version = read_str(root.at("version"));

    if (root.contains("model")) {
        const auto& model = root.at("model");

        if (model.contains("dependency_marker")) config.model.dependency_marker = read_str(model.at("dependency_marker"));
        if (model.contains("anonymous_name")) config.model.anonymous_name = read_str(model.at("anonymous_name"));
        if (model.contains("root_path")) config.model.root_path = read_str(model.at("root_path"));
    }

    if (root.contains("bottom_up")) {
        const auto& bottom_up = root.at("bottom_up");

        if (bottom_up.contains("enabled")) config.bottom_up.enabled = bottom_up.at("enabled").as_bool();
        if (bottom_up.contains("max_depth")) config.bottom_up.max_depth = read_depth(bottom_up.at("max_depth"));
        if (bottom_up.contains("min_percentage"))
            config.bottom_up.min_percentage = read_number(bottom_up.at("min_percentage"));
    }

    if (root.contains("flame")) {
        const auto& flame = root.at("flame");

        if (flame.contains("enabled")) config.flame.enabled = flame.at("enabled").as_bool();
        if (flame.contains("layout")) config.flame.layout = read_str(flame.at("layout"));
        if (flame.contains("max_depth")) config.flame.max_depth = read_depth(flame.at("max_depth"));
        if (flame.contains("min_percentage")) config.flame.min_percentage = read_number(flame.at("min_percentage"));
    }

    if (root.contains("replace_prefix")) {
        config.replace_prefix.clear();

        for (const auto& node : root.at("replace_prefix").as_seq())
            config.replace_prefix.push_back({.from = read_str(node.at("from")), .to = read_str(node.at("to"))});
    }

    return config;

} catch (std::exception& e) { throw cpa::exception{"Could not parse config, error:\n{}", e.what()}; }

cpa::config cpa::config::from_file(std::string_view path) try {
    return cpa::config::from_string(cpa::read_file_to_string(std::string(path)));
} catch (std::exception& e) { throw cpa::exception{"Could not read config {{ {} }}, error:\n{}", path, e.what()}; }

std::string cpa::config::to_string() const {
    fkyaml::node root;

    root["version"] = this->version;

    root["model"]["dependency_marker"] = this->model.dependency_marker;
    root["model"]["anonymous_name"]    = this->model.anonymous_name;
    if (!this->model.root_path.empty()) root["model"]["root_path"] = this->model.root_path;

    root["bottom_up"]["enabled"]        = this->bottom_up.enabled;
    root["bottom_up"]["max_depth"]      = static_cast<std::int64_t>(this->bottom_up.max_depth);
    root["bottom_up"]["min_percentage"] = this->bottom_up.min_percentage;

    root["flame"]["enabled"]        = this->flame.enabled;
    root["flame"]["layout"]         = this->flame.layout;
    root["flame"]["max_depth"]      = static_cast<std::int64_t>(this->flame.max_depth);
    root["flame"]["min_percentage"] = this->flame.min_percentage;

    auto& replace_prefix_node = (root["replace_prefix"] = fkyaml::node::sequence());

    for (const auto& replacement : this->replace_prefix) {
        fkyaml::node node;
        node["from"] = replacement.from;
        node["to"]   = replacement.to;

        replace_prefix_node.as_seq().emplace_back(std::move(node));
    }

    return fkyaml::node::serialize(root);
}

void cpa::config::to_file(std::string_view path) const {
    std::ofstream file{std::string(path)};
    if (!file.good()) throw cpa::exception{"Could not open file {{ {} }} for writing", path};

    file << this->to_string();
}

// Function for validating the config & making user-friendly error messages
std::optional<std::string> cpa::config::validate() const {

    // Validate version
    if (!std::regex_match(this->version, std::regex{R"(^\d+\.\d+\.\d+$)"})) {
        constexpr auto fmt = "'version' has a value {{ {} }}, which doesn't match the schema <major>.<minor>.<patch>";
        return std::format(fmt, this->version);
    }

    // Validate model
    if (this->model.dependency_marker.empty()) return "'model.dependency_marker' should not be empty";
    if (this->model.anonymous_name.empty()) return "'model.anonymous_name' should not be empty";

    // Validate percentages
    const auto is_percentage = [](double value) { return 0.0 <= value && value <= 100.0; };

    if (!is_percentage(this->bottom_up.min_percentage)) {
        constexpr auto fmt = "'bottom_up.min_percentage' has a value {{ {} }}, which is outside of the range [0, 100]";
        return std::format(fmt, this->bottom_up.min_percentage);
    }

    if (!is_percentage(this->flame.min_percentage)) {
        constexpr auto fmt = "'flame.min_percentage' has a value {{ {} }}, which is outside of the range [0, 100]";
        return std::format(fmt, this->flame.min_percentage);
    }

    // Validate layout
    if (this->flame.layout != cpa::flame_layout_name(cpa::flame_layout::timeline) &&
        this->flame.layout != cpa::flame_layout_name(cpa::flame_layout::left_heavy)) {
        constexpr auto fmt = "'flame.layout' has a value {{ {} }}, expected one of {{ timeline, left_heavy }}";
        return std::format(fmt, this->flame.layout);
    }

    return std::nullopt;
}

cpa::model_options cpa::config::to_model_options() const {
    cpa::model_options options{
        .dependency_marker = this->model.dependency_marker,
        .anonymous_name    = this->model.anonymous_name,
    };

    if (!this->model.root_path.empty()) options.root_path = this->model.root_path;

    return options;
}

cpa::flame_layout cpa::config::selected_layout() const { return cpa::flame_layout_from_name(this->flame.layout); }
