#include "common.hpp"

#include "backend/bottom_up.hpp"


namespace {

const cpa::bottom_up_node& child_named(const cpa::bottom_up_node& node, std::string_view name) {
    for (const auto& [id, child] : node.children)
        if (child->call_frame().function_name == name) return *child;

    FAIL("No child named {" << name << "}");
    return node; // unreachable, 'FAIL()' throws
}

// Entries get the self time of every chain passing through them exactly once
void verify_invariants(const cpa::bottom_up_node& root) {
    root.for_all([](const cpa::bottom_up_node& node) {
        cpa::microseconds children_total{};
        for (const auto& [id, child] : node.children) {
            children_total += child->aggregate_time;
            REQUIRE(child->parent == &node);
            REQUIRE(child->id() == id);
        }

        REQUIRE(node.aggregate_time >= children_total);
        REQUIRE(node.self_time >= cpa::microseconds{});
    });
}

} // namespace

TEST_CASE("Bottom-up / Sample profile") {
    const cpa::profile_model   model = cpa::build_model(make_sample_profile());
    const cpa::bottom_up_graph graph = cpa::build_bottom_up_graph(model);

    REQUIRE(graph.root);
    verify_invariants(*graph.root);

    // Synthetic root
    CHECK(graph.root->id() == -1);
    CHECK(graph.root->category() == cpa::category::system);
    CHECK(graph.root->call_frame().function_name == "(root)");
    CHECK(graph.root->call_frame().line_number == -1);
    CHECK(graph.root->parent == nullptr);

    // Every location that was running at some sample is on the first level
    CHECK(graph.root->aggregate_time == 100us);
    CHECK(graph.root->self_time == 100us);
    REQUIRE(graph.root->children.size() == 4);

    const auto& parse = child_named(*graph.root, "parse");
    CHECK(parse.self_time == 60us);
    CHECK(parse.aggregate_time == 60us);
    REQUIRE(parse.children.size() == 2);

    // Callers get the timing of the frame they called into
    const auto& parse_main = child_named(parse, "main");
    CHECK(parse_main.aggregate_time == 30us);
    CHECK(parse_main.children.empty()); // 'main' is right below the call tree root, which is never inserted

    const auto& parse_render = child_named(parse, "render");
    CHECK(parse_render.aggregate_time == 30us);
    REQUIRE(parse_render.children.size() == 1);

    const auto& parse_render_main = child_named(parse_render, "main");
    CHECK(parse_render_main.aggregate_time == 30us);
    CHECK(parse_render_main.children.empty());

    // Inner nodes count only their own self time, time of their callees lives under the callees
    const auto& render = child_named(*graph.root, "render");
    CHECK(render.aggregate_time == 10us);
    REQUIRE(render.children.size() == 1);
    CHECK(child_named(render, "main").aggregate_time == 10us);

    const auto& main = child_named(*graph.root, "main");
    CHECK(main.aggregate_time == 20us);
    CHECK(main.children.empty());

    // Idle samples at the call tree root are kept as well
    const auto& idle = child_named(*graph.root, "(root)");
    CHECK(idle.aggregate_time == 10us);
    CHECK(idle.children.empty());

    const auto sorted = graph.root->sorted_children();
    REQUIRE(sorted.size() == 4);
    CHECK(sorted[0]->call_frame().function_name == "parse");
    CHECK(sorted[1]->call_frame().function_name == "main");

    // Nodes reference model locations
    CHECK(parse.location == &model.locations[model.nodes[2].location_id]);
}

TEST_CASE("Bottom-up / Root total equals sum of self time") {
    cpa::raw_profile profile;

    profile.nodes = {
        make_node(1, make_root_frame(), {2, 5}),
        make_node(2, make_frame("main", 0), {3, 4}),
        make_node(3, make_frame("read", 10)),
        make_node(4, make_frame("write", 20)),
        make_node(5, make_frame("read", 10)), // called directly from the root
    };
    profile.start_time  = 0us;
    profile.end_time    = 60us;
    profile.samples     = std::vector<std::int64_t>{3, 3, 2, 4, 5, 4, 3}; // one sample lands on 'main' itself
    profile.time_deltas = make_deltas({10, 10, 10, 10, 10, 10});

    const cpa::profile_model   model = cpa::build_model(profile);
    const cpa::bottom_up_graph graph = cpa::build_bottom_up_graph(model);

    verify_invariants(*graph.root);

    cpa::microseconds total_self{};
    for (const auto& node : model.nodes) total_self += node.self_time;

    CHECK(total_self == 60us);
    CHECK(graph.root->aggregate_time == total_self);
    CHECK(graph.root->self_time == total_self);

    // Both 'read' stacks are grouped under the same entry
    const auto& read = child_named(*graph.root, "read");
    CHECK(read.aggregate_time == 30us);
    CHECK(read.children.size() == 1); // 'main', the other stack ends at the call tree root

    const auto& write = child_named(*graph.root, "write");
    CHECK(write.aggregate_time == 20us);

    const auto& main = child_named(*graph.root, "main");
    CHECK(main.self_time == 10us);
    CHECK(main.aggregate_time == 10us);

    // Heaviest first
    const auto sorted = graph.root->sorted_children();
    REQUIRE(sorted.size() == 3);
    CHECK(sorted[0]->call_frame().function_name == "read");
    CHECK(sorted[1]->call_frame().function_name == "write");
    CHECK(sorted[2]->call_frame().function_name == "main");
}

TEST_CASE("Bottom-up / Empty model") {
    const cpa::profile_model   model = cpa::build_model(cpa::raw_profile{});
    const cpa::bottom_up_graph graph = cpa::build_bottom_up_graph(model);

    REQUIRE(graph.root);
    CHECK(graph.root->children.empty());
    CHECK(graph.root->aggregate_time == 0us);
}

TEST_CASE("Bottom-up / Graph is movable") {
    const cpa::profile_model model = cpa::build_model(make_sample_profile());
    cpa::bottom_up_graph     graph = cpa::build_bottom_up_graph(model);

    const cpa::location* root_location = graph.root->location;

    cpa::bottom_up_graph moved = std::move(graph);

    // Synthetic root location is heap-allocated so the root keeps pointing at a valid location
    CHECK(moved.root->location == root_location);
    CHECK(moved.root->call_frame().function_name == "(root)");
}
