#pragma once

// Single include for the configuration framework

#include "config.hpp"
#include "config_node.hpp"
#include "deserializer.hpp"
#include "ini_reader.hpp"
#include "section_registry.hpp"
