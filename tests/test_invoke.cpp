#include "common.hpp"

#include <fstream>
#include <sstream>

#include "backend/invoke.hpp"
#include "frontend/generic.hpp"
#include "frontend/json.hpp"
#include "frontend/text.hpp"
#include "utility/exception.hpp"


namespace {

std::string read_text(const std::filesystem::path& path) {
    std::ifstream     file{path};
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

const cpa::location& location_named(const cpa::profile_model& model, std::string_view name, std::int64_t line) {
    for (const auto& location : model.locations)
        if (location.call_frame.function_name == name && location.call_frame.line_number == line) return location;

    FAIL("No location {" << name << ":" << line << "}");
    return model.locations.front(); // unreachable, 'FAIL()' throws
}

} // namespace

TEST_CASE("Invoke / Read profile") {
    const cpa::raw_profile raw = cpa::read_profile_file((profiles_dir / "sample.cpuprofile").string());

    REQUIRE(raw.nodes.size() == 5);
    CHECK(raw.start_time == 1000us);
    CHECK(raw.end_time == 1100us);
    REQUIRE(raw.samples.has_value());
    REQUIRE(raw.time_deltas.has_value());
    CHECK(raw.samples->size() == 8);
    CHECK(raw.time_deltas->front() == 10us);

    CHECK(raw.nodes[1].call_frame.function_name == "main");
    CHECK(raw.nodes[1].call_frame.url == "file:///project/app.js");
    CHECK(raw.nodes[1].children == std::vector<std::int64_t>{3, 4});
    CHECK(raw.nodes[2].hit_count == 2);
    REQUIRE(raw.nodes[2].position_ticks.size() == 1);
    CHECK(raw.nodes[2].position_ticks[0].line == 11);

    CHECK_FALSE(raw.annotations.has_value());
    CHECK_FALSE(cpa::validate_raw_profile(raw).has_value());
}

TEST_CASE("Invoke / Read profile from string") {
    const cpa::raw_profile raw = cpa::read_profile_string(R"({
        "nodes": [{ "id": 1, "callFrame": { "functionName": "(root)", "scriptId": "0", "url": "",
                    "lineNumber": -1, "columnNumber": -1 } }],
        "startTime": 0, "endTime": 10, "title": "ignored"
    })");

    REQUIRE(raw.nodes.size() == 1);
    CHECK(raw.nodes[0].children.empty());
    CHECK_FALSE(raw.samples.has_value());
}

TEST_CASE("Invoke / Analyze sample profile") {
    const cpa::profile profile = cpa::analyze_file((profiles_dir / "sample.cpuprofile").string(), cpa::config{});

    CHECK(profile.name == (profiles_dir / "sample.cpuprofile").string());
    CHECK(profile.layout == cpa::flame_layout::timeline);

    // Model
    REQUIRE(profile.model.nodes.size() == 5);
    CHECK(profile.model.locations.size() == 6); // 4 frames + 2 synthetic tick locations
    CHECK(cpa::output::sampled_time(profile.model) == 100us);

    const auto& parse = location_named(profile.model, "parse", 9);
    CHECK(parse.self_time == 60us);
    CHECK(parse.category == cpa::category::user);
    CHECK(location_named(profile.model, "parse", 10).ticks == 2);

    // Graphs
    REQUIRE(profile.bottom_up.root);
    CHECK(profile.bottom_up.root->aggregate_time == 100us); // all of the sampled time

    REQUIRE(profile.columns.size() == 6);
    CHECK(cpa::location_accessor::root_accessors(profile.columns).size() == 1);
}

TEST_CASE("Invoke / Configured analysis") {
    cpa::config config;
    config.flame.layout      = "left_heavy";
    config.bottom_up.enabled = false;

    const cpa::profile profile = cpa::analyze_file((profiles_dir / "sample.cpuprofile").string(), config);

    CHECK(profile.layout == cpa::flame_layout::left_heavy);
    CHECK_FALSE(profile.bottom_up.root);
    CHECK(profile.columns.size() == 4);
}

TEST_CASE("Invoke / Annotated profile") {
    const cpa::profile profile = cpa::analyze_file((profiles_dir / "annotated.cpuprofile").string(), cpa::config{});

    const auto& model = profile.model;

    REQUIRE(model.locations.size() == 5);
    CHECK(model.root_path == "/workspace");

    CHECK(model.locations[1].call_frame.function_name == "(anonymous)");
    CHECK(model.locations[1].category == cpa::category::user);
    REQUIRE(model.locations[1].src.has_value());
    CHECK(model.locations[1].src->relative_path == "src/index.js");

    CHECK(model.locations[2].category == cpa::category::module);
    CHECK(model.locations[2].self_time == 40us);
    CHECK(model.locations[3].ticks == 5);

    // Labels use the relative path & 1-based lines
    CHECK(cpa::output::location_label(model.locations[1], profile.config) == "(anonymous) (src/index.js:3:1)");
    CHECK(cpa::output::location_label(model.locations[0], profile.config) == "(root)");
}

TEST_CASE("Invoke / Empty capture") {
    const cpa::profile profile = cpa::analyze_file((profiles_dir / "empty.cpuprofile").string(), cpa::config{});

    CHECK(profile.model.nodes.empty());
    CHECK(profile.model.duration == 250us);
    CHECK(profile.columns.empty());
    REQUIRE(profile.bottom_up.root);
    CHECK(profile.bottom_up.root->children.empty());
}

TEST_CASE("Invoke / Aborted capture") {
    // Samples were recorded but the capture stopped before any time deltas were written
    cpa::raw_profile raw = make_sample_profile();
    raw.time_deltas.reset();

    cpa::profile profile;
    REQUIRE_NOTHROW(profile = cpa::analyze_profile(raw, cpa::config{}));

    CHECK(profile.model.nodes.empty());
    CHECK(profile.model.samples.size() == 8);
    CHECK(profile.columns.empty());
    REQUIRE(profile.bottom_up.root);
    CHECK(profile.bottom_up.root->children.empty());

    cpa::config config;
    config.flame.layout = "left_heavy";

    REQUIRE_NOTHROW(profile = cpa::analyze_profile(raw, config));
    CHECK(profile.columns.empty());
}

TEST_CASE("Invoke / Errors") {
    // Missing file
    CHECK_THROWS_AS(cpa::read_profile_file((profiles_dir / "missing.cpuprofile").string()), cpa::exception);

    // Malformed JSON
    CHECK_THROWS_AS(cpa::read_profile_file((profiles_dir / "malformed.cpuprofile").string()), cpa::exception);

    // Structurally invalid profile is rejected before analysis
    CHECK_THROWS_AS(cpa::analyze_file((profiles_dir / "dangling_child.cpuprofile").string(), cpa::config{}),
                    cpa::exception);
}

TEST_CASE("Invoke / Validation") {
    cpa::raw_profile profile = make_sample_profile();

    REQUIRE_FALSE(cpa::validate_raw_profile(profile).has_value());

    SUBCASE("Id out of range") {
        profile.nodes[4].id = 9;
        CHECK(cpa::validate_raw_profile(profile).has_value());
    }

    SUBCASE("Duplicate id") {
        profile.nodes[4].id = 4;
        CHECK(cpa::validate_raw_profile(profile).has_value());
    }

    SUBCASE("Multiple parents") {
        profile.nodes[3].children.push_back(3);
        CHECK(cpa::validate_raw_profile(profile).has_value());
    }

    SUBCASE("Cycle") {
        profile.nodes[4].children.push_back(1); // leaves no parentless nodes
        CHECK(cpa::validate_raw_profile(profile).has_value());
    }

    SUBCASE("Sample references a missing node") {
        profile.samples->push_back(6);
        const auto err = cpa::validate_raw_profile(profile);
        REQUIRE(err.has_value());
        CHECK(err->find("sample") != std::string::npos);
    }

    SUBCASE("Position tick references a missing location") {
        profile.annotations = cpa::raw_profile::annotation_block{
            .locations = {{.call_frame = make_root_frame(), .locations = {}}},
        };
        for (auto& node : profile.nodes) node.location_id = 0;

        REQUIRE_FALSE(cpa::validate_raw_profile(profile).has_value());

        profile.nodes[2].position_ticks = {{.line = 11, .ticks = 2, .start_location_id = 5, .end_location_id = 0}};

        auto err = cpa::validate_raw_profile(profile);
        REQUIRE(err.has_value());
        CHECK(err->find("position tick") != std::string::npos);

        profile.nodes[2].position_ticks = {{.line = 11, .ticks = 2, .start_location_id = 0, .end_location_id = 5}};

        err = cpa::validate_raw_profile(profile);
        CHECK(err.has_value());
    }

    SUBCASE("Annotated profile without location ids") {
        profile.annotations = cpa::raw_profile::annotation_block{};
        CHECK(cpa::validate_raw_profile(profile).has_value());
    }
}

TEST_CASE("Invoke / Frontends") {
    cpa::config config;
    config.replace_prefix = {{.from = "/project/", .to = "<project>/"}};

    const cpa::profile profile = cpa::analyze_file((profiles_dir / "sample.cpuprofile").string(), config);

    const auto output_directory = std::filesystem::temp_directory_path() / "cpuprofile-analyzer-tests";

    SUBCASE("Text") {
        cpa::output::text(profile, output_directory);

        const std::string report = read_text(output_directory / "report.txt");

        CHECK(report.find("# Bottom-up") != std::string::npos);
        CHECK(report.find("# Flame graph (timeline)") != std::string::npos);
        CHECK(report.find("parse (<project>/app.js:10:5)") != std::string::npos);
    }

    SUBCASE("JSON") {
        cpa::output::json(profile, output_directory);

        const std::string report = read_text(output_directory / "profiling.json");

        CHECK(report.find("\"bottomUp\"") != std::string::npos);
        CHECK(report.find("\"columns\"") != std::string::npos);
        CHECK(report.find("\"timeline\"") != std::string::npos);

        // Callers are nested into entries, 'main' ends 3 caller chains & runs on its own once
        const auto count = [&](std::string_view label) {
            std::size_t result = 0;
            for (auto i = report.find(label); i != std::string::npos; i = report.find(label, i + 1)) ++result;
            return result;
        };

        CHECK(count("parse (<project>/app.js:10:5)") == 1);
        CHECK(count("render (<project>/app.js:20:5)") == 2);
        CHECK(count("main (<project>/app.js:1:1)") == 4);
    }

    std::filesystem::remove_all(output_directory);
}
