#include "time_source.hpp"
#include "generator_error.hpp"
#include <fmt/core.h>

namespace shortid {

std::chrono::nanoseconds system_time_source::since_unix_epoch() const
{
    using std::chrono::duration_cast;
    using std::chrono::nanoseconds;
    using std::chrono::system_clock;

    const auto elapsed = duration_cast<nanoseconds>(system_clock::now().time_since_epoch());
    if (elapsed.count() < 0)
        throw clock_error(fmt::format("system clock reads {} ns, before the Unix epoch", elapsed.count()));

    return elapsed;
}


std::chrono::nanoseconds manual_time_source::since_unix_epoch() const
{
    const auto value = now_.load();
    if (value < 0)
        throw clock_error(fmt::format("manual clock set to {} ns, before the Unix epoch", value));

    return std::chrono::nanoseconds{value};
}


void manual_time_source::set(std::chrono::nanoseconds value)
{
    now_.store(value.count());
}


void manual_time_source::advance(std::chrono::nanoseconds delta)
{
    now_.fetch_add(delta.count());
}

} // namespace shortid
