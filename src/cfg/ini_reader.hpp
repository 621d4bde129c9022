#pragma once

#include "config_node.hpp"
#include <filesystem>

namespace shortid::cfg {

// Reads an INI file into a ROOT node; sections and keys keep file order.
[[nodiscard]] ConfigNode parseIniFile(const std::filesystem::path &filename);

} // namespace shortid::cfg
