#include "footprint_library.h"
#include "utils.h"

#include <algorithm>
#include <cstdlib>

namespace klepcbgen {

const char* const FOOTPRINT_LIB = "klepcbgen";

static const double KEY_UNIT_MM = 19.05;

static PadDef tht_pad(const std::string& name, const Point& offset, double size,
                      double drill, PadDef::Shape shape = PadDef::CIRCLE) {
    PadDef pad;
    pad.name = name;
    pad.shape = shape;
    pad.width = size;
    pad.height = size;
    pad.drill_diameter = drill;
    pad.offset = offset;
    pad.type = PadDef::THRU_HOLE;
    return pad;
}

static PadDef npth_hole(const Point& offset, double drill) {
    PadDef pad;
    pad.shape = PadDef::CIRCLE;
    pad.width = drill;
    pad.height = drill;
    pad.drill_diameter = drill;
    pad.offset = offset;
    pad.type = PadDef::NPTH;
    return pad;
}

static PadDef smd_pad(const std::string& name, const Point& offset, double w, double h) {
    PadDef pad;
    pad.name = name;
    pad.shape = PadDef::ROUNDRECT;
    pad.width = w;
    pad.height = h;
    pad.offset = offset;
    pad.type = PadDef::SMD;
    return pad;
}

static void add_lines(Footprint& fp, const std::vector<Segment>& segs) {
    for (auto& s : segs) {
        GraphicItem gi;
        gi.start = s.start;
        gi.end = s.end;
        gi.width = s.width;
        gi.layer = s.layer;
        fp.graphics.push_back(gi);
    }
}

// Rectangle around the pad bounding box, grown by margin on every side
static void add_pad_outline(Footprint& fp, double margin, double width,
                            const std::string& layer) {
    if (fp.pads.empty()) return;

    double x_min = 1e9, x_max = -1e9, y_min = 1e9, y_max = -1e9;
    for (auto& pad : fp.pads) {
        double pw = (pad.width > 0) ? pad.width : 0.5;
        double ph = (pad.height > 0) ? pad.height : 0.5;
        x_min = std::min(x_min, pad.offset.x - pw / 2);
        x_max = std::max(x_max, pad.offset.x + pw / 2);
        y_min = std::min(y_min, pad.offset.y - ph / 2);
        y_max = std::max(y_max, pad.offset.y + ph / 2);
    }

    add_lines(fp, rect_outline({x_min - margin, y_min - margin},
                               {x_max + margin, y_max + margin}, width, layer));
}

// --- Matrix parts ---

std::string switch_footprint_name(const std::string& width_class) {
    return "SW_MX_" + width_class + "u";
}

Footprint make_switch_footprint(const std::string& width_class) {
    Footprint fp;
    fp.name = switch_footprint_name(width_class);

    fp.pads.push_back(tht_pad("1", SWITCH_COL_PAD, 2.2, 1.5));
    fp.pads.push_back(tht_pad("2", SWITCH_DIODE_PAD, 2.2, 1.5));
    fp.pads.push_back(npth_hole({0.0, 0.0}, 4.0));
    fp.pads.push_back(npth_hole({-5.08, 0.0}, 1.7));
    fp.pads.push_back(npth_hole({5.08, 0.0}, 1.7));

    add_lines(fp, rect_outline({SWITCH_LEFT, -7.0}, {SWITCH_RIGHT, 7.0}, 0.05, "F.CrtYd"));
    add_lines(fp, rect_outline({-6.6, -6.6}, {6.6, 6.6}, 0.12, "F.SilkS"));

    // Keycap outline
    double half_w = std::atof(width_class.c_str()) * KEY_UNIT_MM / 2.0;
    double half_h = KEY_UNIT_MM / 2.0;
    add_lines(fp, rect_outline({-half_w, -half_h}, {half_w, half_h}, 0.1, "Dwgs.User"));

    return fp;
}

Footprint make_diode_footprint() {
    Footprint fp;
    fp.name = "D_DO-35_Vertical";

    fp.pads.push_back(tht_pad("1", DIODE_CATHODE_PAD, 1.6, 0.8, PadDef::RECT));
    fp.pads.push_back(tht_pad("2", DIODE_ANODE_PAD, 1.6, 0.8));

    add_lines(fp, rect_outline({-0.9, -2.0}, {0.9, 2.0}, 0.12, "F.SilkS"));
    // Cathode band
    GraphicItem band;
    band.start = {-0.9, 1.6};
    band.end = {0.9, 1.6};
    band.width = 0.12;
    band.layer = "F.SilkS";
    fp.graphics.push_back(band);

    add_pad_outline(fp, 0.5, 0.05, "F.CrtYd");
    return fp;
}

// --- Control circuit parts ---

Footprint make_qfn44_footprint() {
    Footprint fp;
    fp.name = "QFN-44-1EP_7x7mm_P0.5mm";

    const double pitch = 0.5;
    const double edge = 3.4;
    const double first = -2.5;  // 11 pads per side, centered
    for (int i = 0; i < 11; i++) {
        double along = first + i * pitch;
        // Counter-clockwise from the top of the left side
        fp.pads.push_back(smd_pad(std::to_string(1 + i),  {-edge, along}, 0.85, 0.25));
        fp.pads.push_back(smd_pad(std::to_string(12 + i), {along, edge}, 0.25, 0.85));
        fp.pads.push_back(smd_pad(std::to_string(23 + i), {edge, -along}, 0.85, 0.25));
        fp.pads.push_back(smd_pad(std::to_string(34 + i), {-along, -edge}, 0.25, 0.85));
    }
    PadDef ep = smd_pad("45", {0.0, 0.0}, 5.2, 5.2);
    ep.shape = PadDef::RECT;
    fp.pads.push_back(ep);

    std::sort(fp.pads.begin(), fp.pads.end(), [](const PadDef& a, const PadDef& b) {
        return std::atoi(a.name.c_str()) < std::atoi(b.name.c_str());
    });

    add_lines(fp, rect_outline({-3.6, -3.6}, {3.6, 3.6}, 0.1, "F.Fab"));
    add_pad_outline(fp, 0.25, 0.05, "F.CrtYd");
    return fp;
}

Footprint make_passive_0805_footprint(const std::string& name) {
    Footprint fp;
    fp.name = name;
    fp.pads.push_back(smd_pad("1", {-0.95, 0.0}, 1.0, 1.45));
    fp.pads.push_back(smd_pad("2", {0.95, 0.0}, 1.0, 1.45));
    add_pad_outline(fp, 0.1, 0.1, "F.Fab");
    add_pad_outline(fp, 0.25, 0.05, "F.CrtYd");
    return fp;
}

Footprint make_usb_mini_b_footprint() {
    Footprint fp;
    fp.name = "USB_Mini-B";
    for (int i = 0; i < 5; i++) {
        fp.pads.push_back(smd_pad(std::to_string(i + 1), {-1.6 + 0.8 * i, 0.0}, 0.5, 2.25));
    }
    add_pad_outline(fp, 0.1, 0.1, "F.Fab");
    add_pad_outline(fp, 0.25, 0.05, "F.CrtYd");
    return fp;
}

Footprint make_crystal_footprint() {
    Footprint fp;
    fp.name = "Crystal_SMD_3225-4Pin";
    fp.pads.push_back(smd_pad("1", {-1.1, 0.8}, 1.4, 1.2));
    fp.pads.push_back(smd_pad("2", {1.1, 0.8}, 1.4, 1.2));
    fp.pads.push_back(smd_pad("3", {1.1, -0.8}, 1.4, 1.2));
    fp.pads.push_back(smd_pad("4", {-1.1, -0.8}, 1.4, 1.2));
    add_pad_outline(fp, 0.1, 0.1, "F.Fab");
    add_pad_outline(fp, 0.25, 0.05, "F.CrtYd");
    return fp;
}

Footprint make_tact_switch_footprint() {
    Footprint fp;
    fp.name = "SW_SPST_TL3342";
    fp.pads.push_back(smd_pad("1", {-3.1, 0.0}, 1.8, 1.1));
    fp.pads.push_back(smd_pad("2", {3.1, 0.0}, 1.8, 1.1));
    add_lines(fp, rect_outline({-2.5, -2.5}, {2.5, 2.5}, 0.12, "F.SilkS"));
    add_pad_outline(fp, 0.25, 0.05, "F.CrtYd");
    return fp;
}

} // namespace klepcbgen
