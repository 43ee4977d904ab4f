// ____________________________________ LICENSE ____________________________________
//
// Source repo: https://github.com/DmitriBogdanov/clang-build-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Wraps <glaze/json.hpp> library include and enables <chrono> parsing/serialization.
// Also adds a simpler read/write API with errors through exceptions so can have a
// uniform error handling style throughout the codebase.
// _________________________________________________________________________________

#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>
#include <utility>

#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wmissing-braces" // false positive in 'glaze'
#endif

#include "glaze/json.hpp" // IWYU pragma: export

#ifdef __clang__
#pragma clang diagnostic pop
#endif

#include "utility/exception.hpp"
#include "utility/time.hpp"


// --- <chrono> parsing/serialization support ---
// ----------------------------------------------

namespace glz {

// CPU profiles store timestamps & sample deltas as integer microseconds so we add support for parsing/serializing
// integers directly into 'std::chrono::microseconds', this shouldn't incur any additional overhead,
// see https://stephenberry.github.io/glaze/custom-serialization/
template <>
struct from<JSON, cpa::microseconds> {
    template <auto opts>
    static void op(cpa::microseconds& value, is_context auto&& ctx, auto&& it, auto&& end) noexcept {
        cpa::microseconds::rep representation; // same as 'std::int64_t'
        parse<JSON>::op<opts>(representation, ctx, it, end);
        value = cpa::microseconds{representation};
    }
};

template <>
struct to<JSON, cpa::microseconds> {
    template <auto opts>
    static void op(const cpa::microseconds& value, is_context auto&& ctx, auto&& b, auto&& ix) noexcept {
        serialize<JSON>::op<opts>(value.count(), ctx, b, ix);
    }
};

} // namespace glz


// --- Read/write wrappers ---
// ---------------------------

namespace cpa {

constexpr auto default_read_options = glz::opts{.error_on_unknown_keys = false};

template <glz::read_supported<glz::JSON> T, auto opts = default_read_options>
[[nodiscard]] std::expected<T, std::string> try_read_json(std::string_view str) {
    T                    value{};
    const std::string    buffer{str}; // glaze expects null-terminated input
    const glz::error_ctx err = glz::read<opts>(value, buffer);

    if (err) return std::unexpected{std::format("Could not parse JSON, error:\n{}", glz::format_error(err, buffer))};

    return value;
}

template <glz::read_supported<glz::JSON> T, auto opts = default_read_options>
[[nodiscard]] std::expected<T, std::string> try_read_file_json(std::string_view path) {
    T                    value{};
    std::string          buffer;
    const glz::error_ctx err = glz::read_file_json<opts>(value, path, buffer);

    if (err) {
        std::string context = std::format("Could not read JSON at {{ {} }}, error:\n{}", path, glz::format_error(err, buffer));
        return std::unexpected{std::move(context)};
    }

    return value;
}

template <glz::read_supported<glz::JSON> T, auto opts = default_read_options>
[[nodiscard]] T read_json(std::string_view str) {
    auto result = try_read_json<T, opts>(str);

    if (result) return std::move(result.value());
    else throw cpa::exception{result.error()};
}

template <glz::read_supported<glz::JSON> T, auto opts = default_read_options>
[[nodiscard]] T read_file_json(std::string_view path) {
    auto result = try_read_file_json<T, opts>(path);

    if (result) return std::move(result.value());
    else throw cpa::exception{result.error()};
}

template <auto opts = glz::opts{}, glz::write_supported<glz::JSON> T>
[[nodiscard]] std::string write_json(const T& value) {
    std::string buffer;

    if (const glz::error_ctx err = glz::write<opts>(value, buffer))
        throw cpa::exception{"Could not serialize JSON, error:\n{}", glz::format_error(err)};

    return buffer;
}

template <auto opts = glz::opts{}, glz::write_supported<glz::JSON> T>
void write_file_json(std::string_view path, const T& value) {
    std::string buffer;

    if (const glz::error_ctx err = glz::write_file_json<opts>(value, path, buffer))
        throw cpa::exception{"Could not write JSON at {{ {} }}, error:\n{}", path, glz::format_error(err)};
}

} // namespace cpa
