#include "common.hpp"

#include "utility/filepath.hpp"
#include "utility/replace.hpp"


TEST_CASE("Filepath / Trim") {
    CHECK(cpa::trim_filepath("/home/user/project/source/model.cpp") == "model.cpp");
    CHECK(cpa::trim_filepath("C:\\project\\model.cpp") == "model.cpp");
    CHECK(cpa::trim_filepath("model.cpp") == "model.cpp");
}

TEST_CASE("Filepath / Relative") {
    CHECK(cpa::relative_filepath("/project", "/project/src/app.js") == "src/app.js");
    CHECK(cpa::relative_filepath("/project/src", "/project/lib/util.js") == "../lib/util.js");

    // Paths with no common root are returned as-is
    CHECK(cpa::relative_filepath("/project", "node:internal/modules") == "node:internal/modules");
}

TEST_CASE("Filepath / File URL to path") {
    CHECK(cpa::file_url_to_path("file:///project/src/app.js") == "/project/src/app.js");
    CHECK(cpa::file_url_to_path("file:///project/my%20app/app.js") == "/project/my app/app.js");
    CHECK(cpa::file_url_to_path("file:///C:/project/app.js") == "C:\\project\\app.js");
    CHECK(cpa::file_url_to_path("file://localhost/project/app.js") == "/project/app.js");
    CHECK(cpa::file_url_to_path("file://server/share/app.js") == "//server/share/app.js");

    // Non-file URLs pass through
    CHECK(cpa::file_url_to_path("node:internal/main") == "node:internal/main");
    CHECK(cpa::file_url_to_path("https://example.com/app.js") == "https://example.com/app.js");
    CHECK(cpa::file_url_to_path("") == "");

    // Malformed escapes are kept
    CHECK(cpa::file_url_to_path("file:///project/100%/app.js") == "/project/100%/app.js");
}

TEST_CASE("Replace / All & prefix") {
    std::string str = "a/b/c";
    cpa::replace_all(str, "/", "::");
    CHECK(str == "a::b::c");

    cpa::replace_all(str, "", "x"); // no-op
    CHECK(str == "a::b::c");

    std::string path = "/home/user/project/src/app.js";
    cpa::replace_prefix(path, "/home/user/project/", "");
    CHECK(path == "src/app.js");

    cpa::replace_prefix(path, "/home/", "~/"); // prefix doesn't match
    CHECK(path == "src/app.js");
}
