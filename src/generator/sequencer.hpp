#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace shortid {

inline constexpr unsigned sequence_bits = 14;
inline constexpr std::uint32_t sequence_space = 1u << sequence_bits;
inline constexpr std::uint16_t sequence_mask = sequence_space - 1;

// What to do when all sequence values of a tick have been issued before the clock moves on
enum class exhaustion_policy {
    wait, // spin until the clock reaches the next tick, bounded by max_wait
    fail // throw counter_exhausted immediately
};

struct sequence_stamp {
    std::uint64_t tick;
    std::uint16_t sequence;
};

struct sequencer_options {
    // first sequence value of every new tick
    std::uint16_t baseline = 0;
    exhaustion_policy exhaustion = exhaustion_policy::wait;
    std::chrono::microseconds max_wait{10000};
    // clock steps backwards up to this many ticks are absorbed into the current tick
    std::uint64_t backward_tolerance = 0;
};


// Hands out unique (tick, sequence) pairs. Thread-safe.
//
// A new tick resets the sequence to the baseline; a repeated tick increments it
// (modulo 2^14). At most 2^14 stamps are issued per tick, after that the
// exhaustion policy applies. A stamp is never issued twice.
class sequencer {
public:
    using tick_reader = std::function<std::uint64_t()>;

    sequencer(std::string name, tick_reader read_tick, const sequencer_options &options);

    sequencer(const sequencer &) = delete;
    sequencer &operator=(const sequencer &) = delete;

    sequence_stamp next();

    // Last stamp issued; empty until the first call to next()
    std::optional<sequence_stamp> last() const;

    const std::string &name() const { return name_; }

private:
    void seed(std::uint64_t tick);
    std::uint64_t wait_for_tick_after(std::uint64_t tick) const;

    const std::string name_;
    const tick_reader read_tick_;
    const sequencer_options options_;

    mutable std::mutex mutex_;
    bool seeded_ = false;
    std::uint64_t tick_ = 0;
    std::uint16_t sequence_ = 0;
    std::uint32_t issued_ = 0;
};

} // namespace shortid
