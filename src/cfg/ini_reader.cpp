#include "ini_reader.hpp"
#include <SimpleIni.h>
#include <fmt/core.h>
#include <stdexcept>

namespace shortid::cfg {

ConfigNode parseIniFile(const std::filesystem::path &filename)
{
    CSimpleIniA ini;
    SI_Error rc = ini.LoadFile(filename.c_str());
    if (rc != SI_OK)
        throw std::runtime_error(fmt::format("Failed to parse INI file '{}' (error code: {})", filename.string(), rc));

    ConfigNode root{"config", "", {}, NodeType::ROOT};

    // keys outside of any section
    CSimpleIniA::TNamesDepend globalKeys;
    ini.GetAllKeys("", globalKeys);
    globalKeys.sort([](const auto &a, const auto &b) { return a.nOrder < b.nOrder; });

    for (const auto &key: globalKeys) {
        const char *value = ini.GetValue("", key.pItem, "");
        root.children.emplace_back(ConfigNode{key.pItem, value ? value : "", {}, NodeType::VALUE});
    }

    CSimpleIniA::TNamesDepend sections;
    ini.GetAllSections(sections);
    sections.sort([](const auto &a, const auto &b) { return a.nOrder < b.nOrder; });

    for (const auto &section: sections) {
        // the global pseudo-section was handled above
        if (section.pItem[0] == '\0')
            continue;

        ConfigNode sectionNode{section.pItem, "", {}, NodeType::SECTION};

        CSimpleIniA::TNamesDepend keys;
        ini.GetAllKeys(section.pItem, keys);
        keys.sort([](const auto &a, const auto &b) { return a.nOrder < b.nOrder; });

        for (const auto &key: keys) {
            const char *value = ini.GetValue(section.pItem, key.pItem, "");
            sectionNode.children.emplace_back(ConfigNode{key.pItem, value ? value : "", {}, NodeType::VALUE});
        }

        root.children.push_back(std::move(sectionNode));
    }

    return root;
}

} // namespace shortid::cfg
