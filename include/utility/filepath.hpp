// ____________________________________ LICENSE ____________________________________
//
// Source repo: https://github.com/DmitriBogdanov/clang-build-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Functions for operating on filepath strings, used when resolving the source
// locations of call frames and for prettification of the reports.
// _________________________________________________________________________________

#pragma once

#include <string>
#include <string_view>


namespace cpa {

std::string_view trim_filepath(std::string_view path);

// Path of 'path' relative to 'root' with forward slashes, 'path' is returned
// unchanged when the two don't share a common root (e.g. different drives)
std::string relative_filepath(std::string_view root, std::string_view path);

// Converts 'file://' URLs to local paths, other URLs are returned unchanged
std::string file_url_to_path(std::string_view url);

} // namespace cpa
