#include "id_generator.hpp"
#include "generator_error.hpp"
#include "layout.hpp"
#include <fmt/core.h>
#include <random>
#include <spdlog/spdlog.h>

namespace shortid {

namespace {

constexpr std::uint64_t max_uuid_time = (std::uint64_t{1} << 60) - 1;

std::uint64_t unix_ticks(const time_source &clock)
{
    return static_cast<std::uint64_t>(clock.since_unix_epoch().count()) / 100;
}

sequencer_options make_sequencer_options(const generator_options &options, std::uint16_t baseline,
                                         std::uint64_t backward_tolerance)
{
    sequencer_options result;
    result.baseline = baseline;
    result.exhaustion = options.exhaustion;
    result.max_wait = options.max_wait;
    result.backward_tolerance = backward_tolerance;
    return result;
}

std::uint64_t tolerance_ticks(const generator_options &options)
{
    if (options.backward_tolerance.count() < 0)
        throw std::invalid_argument("backward_tolerance must not be negative");
    return static_cast<std::uint64_t>(options.backward_tolerance.count()) / 100;
}

// time, version, variant and clock sequence shared by uuidv1 and short_128
void encode_v1_header(bytes16 &id, const sequence_stamp &stamp)
{
    using namespace layout::uuid_v1;
    layout::encode(id, time_low, stamp.tick);
    layout::encode(id, time_mid, stamp.tick >> 32);
    layout::encode(id, version, 1);
    layout::encode(id, time_high, stamp.tick >> 48);
    layout::encode(id, variant, 0b10);
    layout::encode(id, clock_sequence, stamp.sequence);
}

} // namespace


id_generator::id_generator(const time_source &clock, const generator_options &options)
    : clock_(clock),
      options_(options),
      clock_sequence_seed_(options.clock_sequence_seed ? *options.clock_sequence_seed : random_clock_sequence()),
      uuid_v1_("uuidv1", [this] { return gregorian_ticks(); },
               make_sequencer_options(options, clock_sequence_seed_, tolerance_ticks(options))),
      short_128_("short_128", [this] { return gregorian_ticks(); },
                 make_sequencer_options(options, 0, tolerance_ticks(options))),
      short_96_("short_96", [this] { return coarse_ticks(); },
                make_sequencer_options(options, 0, tolerance_ticks(options) >> coarse_shift)),
      short_64_("short_64", [this] { return coarse_ticks(); },
                make_sequencer_options(options, 0, tolerance_ticks(options) >> coarse_shift))
{
    spdlog::debug("id generator created: worker_id={}, clock_sequence_seed={}, exhaustion={}", options_.worker_id,
                  clock_sequence_seed_, options_.exhaustion == exhaustion_policy::wait ? "wait" : "fail");
}


bytes16 id_generator::uuidv1(const discriminator<6> &node)
{
    const auto stamp = uuid_v1_.next();

    bytes16 id{};
    encode_v1_header(id, stamp);
    layout::encode(id, layout::uuid_v1::node, layout::to_uint(node));
    return id;
}


bytes16 id_generator::next_short_128(const discriminator<4> &machine)
{
    const auto stamp = short_128_.next();

    bytes16 id{};
    encode_v1_header(id, stamp);
    layout::encode(id, layout::short_128::worker_id, options_.worker_id);
    layout::encode(id, layout::short_128::machine_id, layout::to_uint(machine));
    return id;
}


bytes12 id_generator::next_short_96(const discriminator<3> &machine, std::uint64_t epoch)
{
    const auto stamp = short_96_.next();

    bytes12 id{};
    layout::encode(id, layout::short_96::time, rebase(stamp.tick, epoch));
    layout::encode(id, layout::short_96::sequence, stamp.sequence);
    layout::encode(id, layout::short_96::worker_id, options_.worker_id);
    layout::encode(id, layout::short_96::machine_id, layout::to_uint(machine));
    return id;
}


bytes8 id_generator::next_short_64(std::uint64_t epoch)
{
    if (options_.worker_id > layout::max_value(layout::short_64::worker_id))
        throw worker_id_overflow(
            fmt::format("worker id {} does not fit the 8 bit worker field of short_64", options_.worker_id));

    const auto stamp = short_64_.next();

    bytes8 id{};
    layout::encode(id, layout::short_64::time, rebase(stamp.tick, epoch));
    layout::encode(id, layout::short_64::sequence, stamp.sequence);
    layout::encode(id, layout::short_64::worker_id, options_.worker_id);
    return id;
}


std::optional<sequence_stamp> id_generator::last_stamp(id_kind kind) const
{
    return sequencer_for(kind).last();
}


std::uint64_t id_generator::gregorian_ticks() const
{
    const std::uint64_t ticks = unix_ticks(clock_);
    // unreachable with an int64 nanosecond time_source (at most ~2.1e17 ticks < 2^60)
    if (ticks > max_uuid_time - gregorian_offset)
        throw clock_error(fmt::format("time {} (100 ns since 1970) is beyond the 60 bit UUID time field", ticks));

    return ticks + gregorian_offset;
}


std::uint64_t id_generator::coarse_ticks() const
{
    return unix_ticks(clock_) >> coarse_shift;
}


// Both sides are truncated to coarse ticks so that the rebased time changes
// exactly when the sequencer's tick changes.
std::uint64_t id_generator::rebase(std::uint64_t coarse_tick, std::uint64_t epoch) const
{
    const std::uint64_t origin = epoch >> coarse_shift;
    if (coarse_tick < origin)
        throw invalid_epoch(fmt::format("epoch {} lies in the future", epoch));

    const std::uint64_t rebased = coarse_tick - origin;
    if (rebased > layout::max_value(layout::short_96::time))
        throw invalid_epoch(fmt::format("time since epoch {} overflows the 42 bit time field", epoch));

    return rebased;
}


const sequencer &id_generator::sequencer_for(id_kind kind) const
{
    switch (kind) {
    case id_kind::uuid_v1:
        return uuid_v1_;
    case id_kind::short_128:
        return short_128_;
    case id_kind::short_96:
        return short_96_;
    case id_kind::short_64:
        return short_64_;
    }
    throw std::invalid_argument("unknown id_kind");
}


std::uint16_t id_generator::random_clock_sequence()
{
    std::random_device rd;
    std::uniform_int_distribution<std::uint32_t> uni(0, sequence_mask);
    return static_cast<std::uint16_t>(uni(rd));
}

} // namespace shortid
