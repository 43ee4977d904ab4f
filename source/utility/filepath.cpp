// ____________________________________ LICENSE ____________________________________
//
// Source repo: https://github.com/DmitriBogdanov/clang-build-profiler
//
// This project is licensed under the MIT License.
// _________________________________________________________________________________

#include "utility/filepath.hpp"

#include <cctype>
#include <filesystem>
#include <optional>

#include "utility/replace.hpp"


namespace {

std::optional<char> decode_hex_digit(char c) {
    if (c >= '0' && c <= '9') return static_cast<char>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<char>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<char>(c - 'A' + 10);
    return std::nullopt;
}

std::string percent_decode(std::string_view str) {
    std::string result;
    result.reserve(str.size());

    for (std::size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()) {
            const auto high = decode_hex_digit(str[i + 1]);
            const auto low  = decode_hex_digit(str[i + 2]);

            if (high && low) {
                result.push_back(static_cast<char>((*high << 4) | *low));
                i += 2;
                continue;
            }
        }
        result.push_back(str[i]); // malformed escapes are kept as-is
    }

    return result;
}

bool starts_with_drive_letter(std::string_view path) {
    return path.size() >= 3 && path[0] == '/' && std::isalpha(static_cast<unsigned char>(path[1])) && path[2] == ':';
}

} // namespace


std::string_view cpa::trim_filepath(std::string_view path) {
    const std::size_t last_slash = path.find_last_of("/\\");

    if (last_slash != std::string_view::npos && last_slash + 1 < path.size()) return path.substr(last_slash + 1);
    return path;
}

std::string cpa::relative_filepath(std::string_view root, std::string_view path) {
    const std::filesystem::path root_path{root};
    const std::filesystem::path target_path{path};

    if (root_path.root_name() != target_path.root_name()) return std::string(path);

    const std::filesystem::path relative = target_path.lexically_normal().lexically_relative(root_path.lexically_normal());

    if (relative.empty()) return std::string(path); // no relative path exists, i.e. one is absolute and other isn't

    return relative.generic_string();
}

std::string cpa::file_url_to_path(std::string_view url) {
    constexpr std::string_view scheme = "file://";

    if (!url.starts_with(scheme)) return std::string(url);

    std::string_view remainder = url.substr(scheme.size());

    // 'file://host/share/...' denotes a UNC path, 'file:///...' has an empty host
    std::string host;
    if (!remainder.starts_with('/')) {
        const std::size_t slash = remainder.find('/');
        host      = std::string(remainder.substr(0, slash));
        remainder = (slash == std::string_view::npos) ? std::string_view{} : remainder.substr(slash);
    }

    std::string path = percent_decode(remainder);

    if (starts_with_drive_letter(path)) {
        path.erase(0, 1);                  // '/C:/dir/file.js' => 'C:/dir/file.js'
        cpa::replace_all(path, "/", "\\"); // windows paths use backslashes
        return path;
    }

    if (!host.empty() && host != "localhost") return "//" + host + path;

    return path;
}
