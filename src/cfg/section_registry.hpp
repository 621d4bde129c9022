#pragma once

#include "config_node.hpp"
#include "deserializer.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace shortid::cfg {

struct BaseSection {
    std::string sectionName;
    virtual ~BaseSection() = default;
};

using SectionFactory = std::function<std::unique_ptr<BaseSection>(const ConfigNode &)>;

// Maps section names to factories; sections register themselves at static
// initialisation time through the macros below.
class SectionRegistry {
public:
    static void registerFactory(const std::string &sectionName, const SectionFactory &factory, bool mandatory = false);
    static std::unique_ptr<BaseSection> create(const std::string &sectionName, const ConfigNode &node);
    static bool hasSection(const std::string &sectionName);
    static std::vector<std::string> getMandatorySections();
};

#define SHORTID_REGISTER_SECTION_IMPL(Type, SectionName, Mandatory, ...)                                               \
    static_assert(std::is_base_of_v<BaseSection, Type>, #Type " must inherit from BaseSection");                       \
    SHORTID_REGISTER_STRUCT(Type, __VA_ARGS__)                                                                         \
    inline const bool Type##_registered = []() {                                                                       \
        SectionRegistry::registerFactory(                                                                              \
            SectionName,                                                                                               \
            [](const ConfigNode &node) -> std::unique_ptr<BaseSection> {                                               \
                auto obj = std::make_unique<Type>(deserialize<Type>(node));                                            \
                obj->sectionName = node.key;                                                                           \
                return obj;                                                                                            \
            },                                                                                                         \
            (Mandatory));                                                                                              \
        return true;                                                                                                   \
    }();

#define SHORTID_REGISTER_SECTION(Type, SectionName, ...) SHORTID_REGISTER_SECTION_IMPL(Type, SectionName, false, __VA_ARGS__)

#define SHORTID_REGISTER_SECTION_MANDATORY(Type, SectionName, ...)                                                     \
    SHORTID_REGISTER_SECTION_IMPL(Type, SectionName, true, __VA_ARGS__)

} // namespace shortid::cfg
