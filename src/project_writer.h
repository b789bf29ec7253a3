#pragma once

#include <string>
#include <ostream>

namespace klepcbgen {

// Write a minimal .kicad_pro project file that links the PCB and schematic.
bool write_project_file(std::ostream& out, const std::string& project_name);

} // namespace klepcbgen
