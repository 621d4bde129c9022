#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>

namespace shortid {

// Source of wall-clock time for the generator. Implementations must be safe
// for concurrent reads. The generator holds a reference, the caller keeps the
// source alive for the generator's lifetime.
class time_source {
public:
    virtual ~time_source() = default;

    // Nanoseconds since 1970-01-01 00:00:00 UTC. Throws clock_error when the
    // clock cannot be read.
    virtual std::chrono::nanoseconds since_unix_epoch() const = 0;
};


class system_time_source final : public time_source {
public:
    std::chrono::nanoseconds since_unix_epoch() const override;
};


// Clock driven explicitly by the caller; used for deterministic ids.
class manual_time_source final : public time_source {
public:
    manual_time_source() = default;
    explicit manual_time_source(std::chrono::nanoseconds start)
        : now_{start.count()}
    { }

    std::chrono::nanoseconds since_unix_epoch() const override;

    void set(std::chrono::nanoseconds value);
    void advance(std::chrono::nanoseconds delta);

private:
    std::atomic<std::int64_t> now_{0};
};

} // namespace shortid
