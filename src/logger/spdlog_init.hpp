#pragma once

namespace shortid::cfg {
struct GeneralSection;
}

namespace shortid::logging {

// Installs the default spdlog logger (console or syslog) and its level
void init_spdlog(const cfg::GeneralSection &general_section);

} // namespace shortid::logging
