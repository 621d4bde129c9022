#include "config.hpp"
#include "ini_reader.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/algorithm/string/case_conv.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <unordered_set>
#include <vector>

namespace shortid::cfg {

void GeneratorSection::validate() const
{
    if (node_id.empty())
        throw std::invalid_argument("Section 'generator' must define node_id");

    // throws with a precise message on malformed input
    parseNodeId(node_id);

    if (worker_id < 0 || worker_id > 0xFFFF)
        throw std::invalid_argument("Section 'generator' must set worker_id between 0 and 65535");

    const auto policy = boost::algorithm::to_lower_copy(exhaustion_policy);
    if (policy != "wait" && policy != "fail")
        throw std::invalid_argument("Section 'generator' must set exhaustion_policy to 'wait' or 'fail'");

    if (max_wait_us <= 0)
        throw std::invalid_argument("Section 'generator' must set max_wait_us to a positive value");

    if (backward_tolerance_ms < 0)
        throw std::invalid_argument("Section 'generator' must set backward_tolerance_ms >= 0");

    if (clock_sequence_seed && (*clock_sequence_seed < 0 || *clock_sequence_seed > sequence_mask))
        throw std::invalid_argument(
            fmt::format("Section 'generator' must set clock_sequence_seed between 0 and {}", sequence_mask));
}


discriminator<6> GeneratorSection::nodeId() const
{
    return parseNodeId(node_id);
}


generator_options GeneratorSection::options() const
{
    generator_options result;
    result.worker_id = static_cast<std::uint16_t>(worker_id);
    result.exhaustion = boost::algorithm::iequals(exhaustion_policy, "fail") ? shortid::exhaustion_policy::fail
                                                                             : shortid::exhaustion_policy::wait;
    result.max_wait = std::chrono::microseconds{max_wait_us};
    result.backward_tolerance = std::chrono::milliseconds{backward_tolerance_ms};
    if (clock_sequence_seed)
        result.clock_sequence_seed = static_cast<std::uint16_t>(*clock_sequence_seed);
    return result;
}


discriminator<6> parseNodeId(const std::string &text)
{
    std::vector<std::string> parts;
    const auto trimmed = boost::algorithm::trim_copy(text);
    boost::algorithm::split(parts, trimmed, boost::algorithm::is_any_of(":-"));

    if (parts.size() != 6)
        throw std::invalid_argument(fmt::format("node_id '{}' must have 6 bytes", text));

    discriminator<6> result{};
    for (std::size_t i = 0; i < parts.size(); ++i) {
        const auto &part = parts[i];
        if (part.size() != 2 || !boost::algorithm::all(part, boost::algorithm::is_xdigit()))
            throw std::invalid_argument(fmt::format("node_id '{}': '{}' is not a hex byte", text, part));
        result[i] = static_cast<std::uint8_t>(std::stoul(part, nullptr, 16));
    }
    return result;
}


template<> Config deserialize<Config>(const ConfigNode &node)
{
    if (!node.isRoot())
        throw std::invalid_argument("Config deserializer requires a root ConfigNode");

    Config config{};
    std::unordered_set<std::string> foundSections;

    for (const auto &child: node.children) {
        if (!child.isSection())
            throw std::invalid_argument("Global keys are not allowed in configuration; found key: '" + child.key + "'");

        if (!SectionRegistry::hasSection(child.key)) {
            spdlog::warn("Unknown configuration section '[{}]' ignored", child.key);
            continue;
        }

        foundSections.insert(child.key);
        auto section = SectionRegistry::create(child.key, child);

        if (auto *general = dynamic_cast<GeneralSection *>(section.get()))
            config.general = *general;
        else if (auto *generator = dynamic_cast<GeneratorSection *>(section.get()))
            config.generator = *generator;
    }

    for (const auto &mandatorySection: SectionRegistry::getMandatorySections())
        if (foundSections.find(mandatorySection) == foundSections.end())
            throw std::invalid_argument("Required section '[" + mandatorySection + "]' is missing from configuration");

    return config;
}


Config loadConfigFile(const std::filesystem::path &filename)
{
    Config config = deserialize<Config>(parseIniFile(filename));
    spdlog::debug("Configuration loaded from {}", filename.string());
    return config;
}

} // namespace shortid::cfg
