#pragma once

#include "pcb_model.h"
#include <string>

namespace klepcbgen {

// Library nickname used in footprint ids ("klepcbgen:SW_MX_1.00u")
extern const char* const FOOTPRINT_LIB;

// Cherry MX switch, relative to the switch center
const Point SWITCH_COL_PAD(2.54, -5.08);    // pad 1, column net
const Point SWITCH_DIODE_PAD(-3.81, -2.54); // pad 2, diode net
constexpr double SWITCH_LEFT = -7.0;        // courtyard, horizontal
constexpr double SWITCH_RIGHT = 7.0;

// DO-35 diode standing vertically, relative to the diode center
const Point DIODE_CATHODE_PAD(0.0, 3.81);   // pad 1, row net
const Point DIODE_ANODE_PAD(0.0, -3.81);    // pad 2, diode net

std::string switch_footprint_name(const std::string& width_class);
Footprint make_switch_footprint(const std::string& width_class);
Footprint make_diode_footprint();

// Control circuit packages
Footprint make_qfn44_footprint();
Footprint make_passive_0805_footprint(const std::string& name);
Footprint make_usb_mini_b_footprint();
Footprint make_crystal_footprint();
Footprint make_tact_switch_footprint();

} // namespace klepcbgen
