#pragma once
#include <stdexcept>
#include <string>

namespace shortid {

enum class generator_errc { clock_error, invalid_epoch, counter_exhausted, worker_id_overflow };


class generator_error : public std::runtime_error {
public:
    generator_error(generator_errc code, const std::string &desc)
        : runtime_error{desc}, code_{code}
    { }

    generator_errc code() const noexcept { return code_; }

private:
    generator_errc code_;
};


// time source unreadable, moved backwards beyond tolerance, or out of the representable range
class clock_error final : public generator_error {
public:
    explicit clock_error(const std::string &desc)
        : generator_error{generator_errc::clock_error, desc}
    { }
};


class invalid_epoch final : public generator_error {
public:
    explicit invalid_epoch(const std::string &desc)
        : generator_error{generator_errc::invalid_epoch, desc}
    { }
};


class counter_exhausted final : public generator_error {
public:
    explicit counter_exhausted(const std::string &desc)
        : generator_error{generator_errc::counter_exhausted, desc}
    { }
};


class worker_id_overflow final : public generator_error {
public:
    explicit worker_id_overflow(const std::string &desc)
        : generator_error{generator_errc::worker_id_overflow, desc}
    { }
};

} // namespace shortid
