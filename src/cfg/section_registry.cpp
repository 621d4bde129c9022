#include "section_registry.hpp"
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace shortid::cfg {

namespace {
using Factories = std::unordered_map<std::string, SectionFactory>;
using MandatorySections = std::unordered_set<std::string>;

Factories &factories()
{
    static Factories f;
    return f;
}

MandatorySections &mandatorySections()
{
    static MandatorySections sections;
    return sections;
}
} // namespace

void SectionRegistry::registerFactory(const std::string &sectionName, const SectionFactory &factory, bool mandatory)
{
    auto &f = factories();
    if (f.find(sectionName) != f.end())
        throw std::runtime_error("Duplicate section factory registration: " + sectionName);
    f.emplace(sectionName, factory);
    if (mandatory)
        mandatorySections().insert(sectionName);
}

std::unique_ptr<BaseSection> SectionRegistry::create(const std::string &sectionName, const ConfigNode &node)
{
    auto &f = factories();
    auto it = f.find(sectionName);
    if (it == f.end())
        throw std::runtime_error("Unknown section: " + sectionName);
    return it->second(node);
}

bool SectionRegistry::hasSection(const std::string &sectionName)
{
    auto &f = factories();
    return f.find(sectionName) != f.end();
}

std::vector<std::string> SectionRegistry::getMandatorySections()
{
    auto &m = mandatorySections();
    return std::vector<std::string>(m.begin(), m.end());
}

} // namespace shortid::cfg
