#pragma once

#include "generator/id_generator.hpp"
#include "section_registry.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace shortid::cfg {

struct GeneralSection : BaseSection {
    std::string log_type = "console";
    std::string log_facility = "user";
    std::string log_priority = "info";

    void validate() const
    {
        if (log_type != "console" && log_type != "syslog")
            throw std::invalid_argument("Section 'general' must set log_type to 'console' or 'syslog'");
    }
};

SHORTID_REGISTER_SECTION(GeneralSection, "general", field("log_type", &GeneralSection::log_type),
                         field("log_facility", &GeneralSection::log_facility),
                         field("log_priority", &GeneralSection::log_priority))


struct GeneratorSection : BaseSection {
    std::string node_id;
    int worker_id = 0;
    unsigned long long epoch = 0;
    std::string exhaustion_policy = "wait";
    long long max_wait_us = 10000;
    long long backward_tolerance_ms = 1000;
    std::optional<int> clock_sequence_seed;

    void validate() const;

    // node_id as bytes; short_128 uses the last 4, short_96 the last 3
    discriminator<6> nodeId() const;

    generator_options options() const;
};

SHORTID_REGISTER_SECTION_MANDATORY(GeneratorSection, "generator", field("node_id", &GeneratorSection::node_id),
                                   field("worker_id", &GeneratorSection::worker_id),
                                   field("epoch", &GeneratorSection::epoch),
                                   field("exhaustion_policy", &GeneratorSection::exhaustion_policy),
                                   field("max_wait_us", &GeneratorSection::max_wait_us),
                                   field("backward_tolerance_ms", &GeneratorSection::backward_tolerance_ms),
                                   field("clock_sequence_seed", &GeneratorSection::clock_sequence_seed))


struct Config {
    GeneralSection general;
    GeneratorSection generator;
};

template<> struct is_deserializable_struct<Config> : std::true_type { };

template<> Config deserialize<Config>(const ConfigNode &node);

// Parses "01:02:03:04:05:06" (':' or '-' separated, two hex digits per byte)
discriminator<6> parseNodeId(const std::string &text);

Config loadConfigFile(const std::filesystem::path &filename);

} // namespace shortid::cfg
