#include "layout_generator.h"
#include "utils.h"

#include <iostream>
#include <stdexcept>

namespace klepcbgen {

LayoutGenerator::LayoutGenerator(const LayoutOptions& opts)
    : opts_(opts) {}

Point LayoutGenerator::switch_reference(const Key& key) {
    return LAYOUT_ORIGIN + Point(key.x_unit, key.y_unit) * KEY_PITCH;
}

void LayoutGenerator::place(const Keyboard& keyboard, PcbModel& model) {
    for (auto& key : keyboard.keys) {
        check_nets(key);
    }

    for (auto& key : keyboard.keys) {
        place_key(key, model);
    }

    if (opts_.routing) {
        route_rows(keyboard, model);
        route_columns(keyboard, model);
    }

    log("Placed " + std::to_string(keyboard.keys.size()) + " switches with diodes, " +
        std::to_string(model.count_traces(TraceSegment::ROW)) + " row and " +
        std::to_string(model.count_traces(TraceSegment::COLUMN)) + " column segments");
}

void LayoutGenerator::check_nets(const Key& key) const {
    if (key.row_net == 0 || key.col_net == 0 || key.diode_net == 0) {
        throw std::logic_error("key " + std::to_string(key.index) +
                               " has an unresolved net (row " + std::to_string(key.row_net) +
                               ", col " + std::to_string(key.col_net) +
                               ", diode " + std::to_string(key.diode_net) + ")");
    }
}

// --- Switches and diodes ---

void LayoutGenerator::place_key(const Key& key, PcbModel& model) {
    Point ref = switch_reference(key);
    std::string width_class = unit_width_to_footprint_width(key.width);

    std::string sw_fp = switch_footprint_name(width_class);
    if (model.footprint_defs.find(sw_fp) == model.footprint_defs.end()) {
        model.footprint_defs[sw_fp] = make_switch_footprint(width_class);
    }
    Footprint diode_fp = make_diode_footprint();
    if (model.footprint_defs.find(diode_fp.name) == model.footprint_defs.end()) {
        model.footprint_defs[diode_fp.name] = diode_fp;
    }

    PartPlacement sw;
    sw.kind = PartPlacement::SWITCH;
    sw.key_index = key.index;
    sw.refdes = "SW" + std::to_string(key.index);
    sw.value = key.legend;
    sw.footprint_ref = sw_fp;
    sw.position = ref;
    sw.pad_nets["1"] = key.col_net;
    sw.pad_nets["2"] = key.diode_net;
    model.parts.push_back(sw);

    PartPlacement diode;
    diode.kind = PartPlacement::DIODE;
    diode.key_index = key.index;
    diode.refdes = "D" + std::to_string(key.index);
    diode.value = "1N4148";
    diode.footprint_ref = diode_fp.name;
    diode.position = ref + DIODE_OFFSET;
    diode.pad_nets["1"] = key.row_net;
    diode.pad_nets["2"] = key.diode_net;
    model.parts.push_back(diode);

    add_trace(model, TraceSegment::DIODE, ref + DIODE_TRACE_START, ref + DIODE_TRACE_END,
              "B.Cu", key.diode_net, key.index);
}

// --- Routing ---

void LayoutGenerator::route_rows(const Keyboard& keyboard, PcbModel& model) {
    for (auto& row : keyboard.rows.blocks()) {
        for (size_t i = 1; i < row.size(); i++) {
            const Key& left = keyboard.keys[row[i - 1]];
            const Key& right = keyboard.keys[row[i]];
            add_trace(model, TraceSegment::ROW,
                      switch_reference(left) + ROW_CONTACT_OFFSET,
                      switch_reference(right) + ROW_CONTACT_OFFSET,
                      "B.Cu", left.row_net, right.index);
        }
    }
}

void LayoutGenerator::route_columns(const Keyboard& keyboard, PcbModel& model) {
    for (auto& column : keyboard.columns.blocks()) {
        for (size_t i = 1; i < column.size(); i++) {
            route_column_pair(keyboard.keys[column[i - 1]], keyboard.keys[column[i]], model);
        }
    }
}

// Upper contact -> bend inside the upper footprint -> bend inside the lower
// footprint -> lower contact. Each bend's x stays within the courtyard of
// the key that bend belongs to.
void LayoutGenerator::route_column_pair(const Key& upper, const Key& lower, PcbModel& model) {
    Point upper_ref = switch_reference(upper);
    Point lower_ref = switch_reference(lower);
    Point start = upper_ref + COL_CONTACT_OFFSET;
    Point end = lower_ref + COL_CONTACT_OFFSET;

    Point exit_bend(clamp_to_span(end.x, upper_ref.x + SWITCH_LEFT, upper_ref.x + SWITCH_RIGHT),
                    upper_ref.y + COL_BEND_DY);
    Point entry_bend(clamp_to_span(exit_bend.x, lower_ref.x + SWITCH_LEFT,
                                   lower_ref.x + SWITCH_RIGHT),
                     lower_ref.y - COL_BEND_DY);

    int net = upper.col_net;
    add_trace(model, TraceSegment::COLUMN, start, exit_bend, "F.Cu", net, upper.index, true);
    add_trace(model, TraceSegment::COLUMN, exit_bend, entry_bend, "F.Cu", net, lower.index, true);
    add_trace(model, TraceSegment::COLUMN, entry_bend, end, "F.Cu", net, lower.index);
}

void LayoutGenerator::add_trace(PcbModel& model, TraceSegment::Kind kind,
                                const Point& start, const Point& end,
                                const std::string& layer, int net_id,
                                int target_key, bool end_is_bend) {
    TraceSegment t;
    t.kind = kind;
    t.start = start;
    t.end = end;
    t.width = TRACE_WIDTH;
    t.layer = layer;
    t.net_id = net_id;
    t.target_key = target_key;
    t.end_is_bend = end_is_bend;
    model.traces.push_back(t);
}

// --- Schematic ---

void LayoutGenerator::place_schematic(const Keyboard& keyboard, const NetTable& nets,
                                      SchematicModel& schematic) const {
    for (auto& key : keyboard.keys) {
        check_nets(key);

        SchematicPlacement sp;
        sp.key_index = key.index;
        sp.switch_ref = "SW" + std::to_string(key.index);
        sp.diode_ref = "D" + std::to_string(key.index);
        sp.legend = key.legend;
        sp.switch_pos = {snap_to_grid(SCH_ORIGIN.x + key.x_unit * SCH_PITCH_X, SCH_GRID),
                         snap_to_grid(SCH_ORIGIN.y + key.y_unit * SCH_PITCH_Y, SCH_GRID)};
        sp.diode_pos = sp.switch_pos + SCH_DIODE_OFFSET;
        sp.footprint_width = unit_width_to_footprint_width(key.width);
        sp.row_net_name = nets.resolve_name(key.row_net);
        sp.col_net_name = nets.resolve_name(key.col_net);
        schematic.placements.push_back(sp);
    }
}

void LayoutGenerator::log(const std::string& msg) {
    if (opts_.verbose) {
        std::cerr << "[layout] " << msg << "\n";
    }
}

} // namespace klepcbgen
