#pragma once

#include <chrono>
#include <type_traits>
#include <utility>

namespace fwb {

class stopwatch {
public:
    using clock      = std::chrono::steady_clock;
    using time_point = clock::time_point;
    using duration   = time_point::duration;

private:
    time_point _start_time = clock::now();

public:
    duration elapsed() const noexcept { return clock::now() - _start_time; }

    template <typename Dur>
    Dur elapsed_as() const noexcept {
        return std::chrono::duration_cast<Dur>(elapsed());
    }
};

template <typename Duration = stopwatch::duration, typename Func>
auto timed(Func&& fn) {
    stopwatch sw;
    using result_type = decltype(((Func &&)(fn))());
    if constexpr (std::is_void_v<result_type>) {
        ((Func &&)(fn))();
        auto elapsed = sw.elapsed_as<Duration>();
        return std::pair(elapsed, nullptr);
    } else {
        decltype(auto) value   = ((Func &&)(fn))();
        auto           elapsed = sw.elapsed_as<Duration>();
        return std::pair<Duration, decltype(value)>(elapsed, ((decltype(value)&&)value));
    }
}

}  // namespace fwb
