#pragma once

#include <fmt/core.h>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace shortid::cfg {

enum class NodeType {
    ROOT, // whole file
    SECTION, // [section_name]
    VALUE // key = value
};

// Tree produced by the INI reader and consumed by the deserializer
struct ConfigNode {
    std::string key;
    std::string value;
    std::vector<ConfigNode> children;
    NodeType type = NodeType::VALUE;

    const ConfigNode *findChild(const std::string &childKey) const
    {
        if (!isContainer())
            throw std::logic_error(fmt::format("Cannot find child '{}' in value node '{}'", childKey, key));

        for (const auto &child: children)
            if (child.key == childKey)
                return &child;
        return nullptr;
    }

    bool isRoot() const { return type == NodeType::ROOT; }
    bool isSection() const { return type == NodeType::SECTION; }
    bool isValue() const { return type == NodeType::VALUE; }
    bool isContainer() const { return type == NodeType::ROOT || type == NodeType::SECTION; }
};

// --------------------------------------------------------------------------------
// Type conversion utilities

// Strict conversion: surrounding whitespace is allowed, anything else after
// the value is not ("42abc" is rejected). Unsigned targets reject a leading
// minus sign, which istream would otherwise wrap around.
template<typename T> T fromString(const std::string &str)
{
    if constexpr (std::is_same_v<T, std::string>) {
        return str;
    } else {
        if constexpr (std::is_unsigned_v<T>) {
            if (str.find('-') != std::string::npos)
                throw std::runtime_error("Negative value for unsigned option: " + str);
        }

        std::istringstream iss(str);
        T value;
        iss >> value;
        if (iss.fail())
            throw std::runtime_error("Bad conversion from string: " + str);

        iss >> std::ws;
        if (!iss.eof())
            throw std::runtime_error("Bad conversion (trailing characters) from string: " + str);

        return value;
    }
}

// --------------------------------------------------------------------------------
// Type traits

template<typename T> struct is_optional : std::false_type { };

template<typename U> struct is_optional<std::optional<U>> : std::true_type { };

} // namespace shortid::cfg
