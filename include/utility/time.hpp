// ____________________________________ LICENSE ____________________________________
//
// Source repo: https://github.com/DmitriBogdanov/clang-build-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Time units and <chrono> utils. CPU profiles record timestamps and sample deltas
// in microseconds, so we use them internally and convert to milliseconds for display.
// _________________________________________________________________________________

#pragma once

#include <chrono>
#include <cstdint>


namespace cpa::time {

using microseconds = std::chrono::microseconds; // used for internal timestamps, signed since deltas can be negative
using milliseconds = std::chrono::milliseconds; // used for display

template <class Rep, class Period>
double to_ms(std::chrono::duration<Rep, Period> duration) {
    return std::chrono::duration<double, milliseconds::period>(duration).count();
}

template <class Rep, class Period>
double to_percentage(std::chrono::duration<Rep, Period> duration, std::chrono::duration<Rep, Period> timeframe) {
    if (timeframe.count() == 0) return 0;

    using ms              = std::chrono::duration<double, milliseconds::period>;
    const double fraction = ms(duration).count() / ms(timeframe).count();
    return fraction * 100;
}

} // namespace cpa::time

namespace cpa {

using time::microseconds;
using time::milliseconds;

} // namespace cpa
