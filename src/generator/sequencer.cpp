#include "sequencer.hpp"
#include "generator_error.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <thread>

namespace shortid {

sequencer::sequencer(std::string name, tick_reader read_tick, const sequencer_options &options)
    : name_(std::move(name)), read_tick_(std::move(read_tick)), options_(options)
{
    if (!read_tick_)
        throw std::invalid_argument(fmt::format("sequencer '{}' requires a tick reader", name_));
    if (options_.baseline > sequence_mask)
        throw std::invalid_argument(
            fmt::format("sequencer '{}': baseline {} exceeds {} bits", name_, options_.baseline, sequence_bits));
}


sequence_stamp sequencer::next()
{
    std::lock_guard lock(mutex_);

    std::uint64_t now = read_tick_();

    if (!seeded_ || now > tick_) {
        seed(now);
        return {tick_, sequence_};
    }

    if (now < tick_) {
        const std::uint64_t behind = tick_ - now;
        if (behind > options_.backward_tolerance) {
            spdlog::error("{}: clock moved back {} ticks (tolerance {})", name_, behind, options_.backward_tolerance);
            throw clock_error(fmt::format("{}: clock moved backwards by {} ticks", name_, behind));
        }
        spdlog::warn("{}: clock moved back {} ticks, staying on tick {}", name_, behind, tick_);
    }

    if (issued_ >= sequence_space) {
        if (options_.exhaustion == exhaustion_policy::fail) {
            spdlog::error("{}: all {} sequence values of tick {} issued", name_, sequence_space, tick_);
            throw counter_exhausted(fmt::format("{}: sequence exhausted in tick {}", name_, tick_));
        }
        seed(wait_for_tick_after(tick_));
        return {tick_, sequence_};
    }

    sequence_ = static_cast<std::uint16_t>((sequence_ + 1) & sequence_mask);
    ++issued_;
    return {tick_, sequence_};
}


std::optional<sequence_stamp> sequencer::last() const
{
    std::lock_guard lock(mutex_);
    if (!seeded_)
        return std::nullopt;
    return sequence_stamp{tick_, sequence_};
}


void sequencer::seed(std::uint64_t tick)
{
    spdlog::trace("{}: new tick {}", name_, tick);
    seeded_ = true;
    tick_ = tick;
    sequence_ = options_.baseline;
    issued_ = 1;
}


std::uint64_t sequencer::wait_for_tick_after(std::uint64_t tick) const
{
    using std::chrono::steady_clock;

    spdlog::debug("{}: sequence exhausted in tick {}, waiting for the clock", name_, tick);

    const auto deadline = steady_clock::now() + options_.max_wait;
    for (;;) {
        if (const std::uint64_t now = read_tick_(); now > tick)
            return now;

        if (steady_clock::now() >= deadline) {
            spdlog::error("{}: clock did not leave tick {} within {} us", name_, tick, options_.max_wait.count());
            throw counter_exhausted(
                fmt::format("{}: sequence exhausted and clock stuck on tick {} for {} us", name_, tick,
                            options_.max_wait.count()));
        }
        std::this_thread::yield();
    }
}

} // namespace shortid
