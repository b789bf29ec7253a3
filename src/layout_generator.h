#pragma once

#include "keyboard_model.h"
#include "pcb_model.h"
#include "net_table.h"
#include "footprint_library.h"
#include <string>

namespace klepcbgen {

// Board placement, millimetres
constexpr double KEY_PITCH = 19.05;
const Point LAYOUT_ORIGIN(-100.0, 17.78);
const Point DIODE_OFFSET(-6.35, 8.89);

// Row traces join the diode cathodes, column traces the switch column pads
const Point ROW_CONTACT_OFFSET = DIODE_OFFSET + DIODE_CATHODE_PAD;
const Point COL_CONTACT_OFFSET = SWITCH_COL_PAD;
const Point DIODE_TRACE_START = SWITCH_DIODE_PAD;
const Point DIODE_TRACE_END = DIODE_OFFSET + DIODE_ANODE_PAD;

// Vertical distance of a column bend from its key's center
constexpr double COL_BEND_DY = 7.0;
constexpr double TRACE_WIDTH = 0.25;

// Schematic placement, millimetres
constexpr double SCH_GRID = 1.27;
const Point SCH_ORIGIN(25.4, 25.4);
constexpr double SCH_PITCH_X = 20.32;
constexpr double SCH_PITCH_Y = 12.7;
const Point SCH_DIODE_OFFSET(5.08, 2.54);

struct LayoutOptions {
    bool routing = true;
    bool verbose = false;
};

// Turns grouped, net-annotated keys into part placements and traces.
class LayoutGenerator {
public:
    explicit LayoutGenerator(const LayoutOptions& opts = {});

    // Adds switch and diode parts, their footprint definitions and all
    // traces to model. Throws std::logic_error if a key still has an
    // unresolved net.
    void place(const Keyboard& keyboard, PcbModel& model);

    // Switch and diode symbol positions for the schematic.
    void place_schematic(const Keyboard& keyboard, const NetTable& nets,
                         SchematicModel& schematic) const;

    static Point switch_reference(const Key& key);

private:
    LayoutOptions opts_;

    void check_nets(const Key& key) const;
    void place_key(const Key& key, PcbModel& model);
    void route_rows(const Keyboard& keyboard, PcbModel& model);
    void route_columns(const Keyboard& keyboard, PcbModel& model);
    void route_column_pair(const Key& upper, const Key& lower, PcbModel& model);

    static void add_trace(PcbModel& model, TraceSegment::Kind kind,
                          const Point& start, const Point& end,
                          const std::string& layer, int net_id,
                          int target_key = -1, bool end_is_bend = false);

    void log(const std::string& msg);
};

} // namespace klepcbgen
