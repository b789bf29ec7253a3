#pragma once

#include "geometry.h"
#include <string>
#include <vector>
#include <map>

namespace klepcbgen {

struct PadDef {
    std::string name;       // pad number (e.g., "1", "2")
    enum Shape { CIRCLE, RECT, OVAL, ROUNDRECT };
    Shape shape = RECT;
    double width = 0.0;     // X size
    double height = 0.0;    // Y size
    double drill_diameter = 0.0;  // 0 for SMD
    Point offset;           // offset from footprint origin
    enum Type { SMD, THRU_HOLE, NPTH };
    Type type = SMD;
};

// Footprint line on a silkscreen, fab, courtyard or drawing layer
struct GraphicItem {
    Point start, end;
    double width = 0.12;    // line width
    std::string layer;
};

struct Footprint {
    std::string name;       // library item name, e.g. "SW_MX_1.00u"
    std::vector<PadDef> pads;
    std::vector<GraphicItem> graphics; // courtyard, silkscreen, fab
};

// A part placed on the board. Pad nets are net numbers keyed by pad name.
struct PartPlacement {
    enum Kind { SWITCH, DIODE, CONTROL };
    Kind kind = SWITCH;
    int key_index = -1;     // -1 for control-circuit parts
    std::string refdes;
    std::string value;
    std::string footprint_ref;   // key into PcbModel::footprint_defs
    Point position;
    double rotation = 0.0;
    std::string layer = "F.Cu";
    std::map<std::string, int> pad_nets;
};

struct TraceSegment {
    enum Kind { DIODE, ROW, COLUMN };
    Kind kind = DIODE;
    Point start, end;
    double width = 0.25;
    std::string layer;
    int net_id = 0;
    int target_key = -1;     // key whose footprint the segment terminates into
    bool end_is_bend = false;
};

struct NetDef {
    int id = 0;
    std::string name;
};

struct PcbModel {
    std::vector<NetDef> nets;   // ordered by id, starting at 1
    std::map<std::string, Footprint> footprint_defs;
    std::vector<PartPlacement> parts;
    std::vector<TraceSegment> traces;

    int count_traces(TraceSegment::Kind kind) const {
        int n = 0;
        for (auto& t : traces) {
            if (t.kind == kind) n++;
        }
        return n;
    }
};

// Switch + diode symbol pair for one key.
struct SchematicPlacement {
    int key_index = 0;
    std::string switch_ref;
    std::string diode_ref;
    std::string legend;
    Point switch_pos;
    Point diode_pos;
    std::string footprint_width;   // "1.00", "1.25", ...
    std::string row_net_name;
    std::string col_net_name;
};

struct SchematicModel {
    std::string project;    // project name used in symbol instance paths
    std::string title;
    std::string author;
    std::string date;
    std::string comment;
    std::vector<SchematicPlacement> placements;
};

} // namespace klepcbgen
