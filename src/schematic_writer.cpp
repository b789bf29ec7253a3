#include "schematic_writer.h"
#include "footprint_library.h"
#include "utils.h"

#include <iostream>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace klepcbgen {

// Always double-quote a string for schematic s-expression output.
// KiCad schematic parser is stricter than PCB parser about quoting.
static std::string sq(const std::string& s) {
    std::string result = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\') result += '\\';
        result += c;
    }
    result += '"';
    return result;
}

static const double PIN_LEN = 2.54;
static const double PIN_PITCH = 2.54;
static const double STUB_LEN = 2.54;

static const char* const SWITCH_SYMBOL = "klepcbgen:SW_Push";
static const char* const DIODE_SYMBOL = "klepcbgen:D";

// Connection points relative to the symbol position (Y-down)
static const Point SWITCH_PIN_COL(-5.08, 0.0);
static const Point SWITCH_PIN_DIODE(5.08, 0.0);
static const Point DIODE_PIN_CATHODE(0.0, 3.81);
static const Point DIODE_PIN_ANODE(0.0, -3.81);

SchematicWriter::SchematicWriter(const SchematicWriterOptions& opts)
    : opts_(opts)
    , sheet_uuid_(generate_uuid_from_seed("schematic_sheet_root"))
{}

bool SchematicWriter::write(std::ostream& out, const SchematicModel& schematic,
                            const std::vector<ControlPart>& controls) {
    project_ = schematic.project;
    build_symbol_defs(controls);

    std::string paper = opts_.paper_size.empty()
        ? select_paper(schematic, controls)
        : opts_.paper_size;

    write_header(out, paper);
    write_title_block(out, schematic);
    write_lib_symbols(out);
    out << "\n";
    write_matrix_wires_and_labels(out, schematic);
    write_control_wires_and_labels(out, controls);
    out << "\n";
    write_matrix_symbols(out, schematic);
    write_control_symbols(out, controls);
    out << "\n";
    write_sheet_instances(out);
    out << ")\n";

    log("Wrote schematic with " + std::to_string(schematic.placements.size()) +
        " switch/diode pairs and " + std::to_string(controls.size()) +
        " control parts on " + paper);
    return out.good();
}

// ── Symbol definition building ──────────────────────────────────────

std::string SchematicWriter::ref_prefix(const std::string& refdes) const {
    // Extract alphabetic prefix from refdes like "R1", "C12", "U3"
    std::string prefix;
    for (char c : refdes) {
        if (std::isalpha(static_cast<unsigned char>(c)))
            prefix += c;
        else
            break;
    }
    if (prefix.empty()) prefix = "U";
    return prefix;
}

void SchematicWriter::build_symbol_defs(const std::vector<ControlPart>& controls) {
    symbol_defs_.clear();

    for (auto& part : controls) {
        if (symbol_defs_.count(part.footprint)) continue;

        SymbolDef sym;
        sym.footprint_name = part.footprint;
        sym.ref_prefix = ref_prefix(part.refdes);

        // Split pins: left side vs right side
        int n = static_cast<int>(part.pins.size());
        int left_n = (n + 1) / 2;
        int right_n = n - left_n;

        size_t longest_name = part.footprint.size() / 2;
        for (auto& pin : part.pins) {
            longest_name = std::max(longest_name, pin.name.size());
        }
        double body_w = std::max(5.08, 2.0 * longest_name * 1.27 + 2.54);
        body_w = std::ceil(body_w / (2 * PIN_PITCH)) * 2 * PIN_PITCH;
        double body_h = std::max(left_n, right_n) * PIN_PITCH + PIN_PITCH;

        sym.body_width = body_w;
        sym.body_height = body_h;

        double half_w = body_w / 2.0;
        for (int i = 0; i < n; i++) {
            PinDef pin;
            pin.number = part.pins[i].number;
            pin.name = part.pins[i].name;
            if (i < left_n) {
                pin.side = 0;
                pin.x = -(half_w + PIN_LEN);
                pin.y = -(left_n - 1) * PIN_PITCH / 2.0 + i * PIN_PITCH;
            } else {
                pin.side = 1;
                pin.x = half_w + PIN_LEN;
                pin.y = -(right_n - 1) * PIN_PITCH / 2.0 + (i - left_n) * PIN_PITCH;
            }
            sym.pins.push_back(pin);
        }

        symbol_defs_[part.footprint] = std::move(sym);
    }
}

std::string SchematicWriter::select_paper(const SchematicModel& schematic,
                                          const std::vector<ControlPart>& controls) const {
    double max_x = 0.0, max_y = 0.0;
    for (auto& sp : schematic.placements) {
        max_x = std::max(max_x, sp.diode_pos.x);
        max_y = std::max(max_y, sp.diode_pos.y);
    }
    for (auto& part : controls) {
        auto it = symbol_defs_.find(part.footprint);
        double hw = 0.0, hh = 0.0;
        if (it != symbol_defs_.end()) {
            hw = it->second.body_width / 2.0 + PIN_LEN + STUB_LEN;
            hh = it->second.body_height / 2.0;
        }
        max_x = std::max(max_x, part.sch_position.x + hw);
        max_y = std::max(max_y, part.sch_position.y + hh);
    }

    // Leave room for labels and the title block
    max_x += 25.4;
    max_y += 38.1;

    if (max_x <= 297.0 && max_y <= 210.0) return "A4";
    if (max_x <= 420.0 && max_y <= 297.0) return "A3";
    if (max_x <= 594.0 && max_y <= 420.0) return "A2";
    if (max_x <= 841.0 && max_y <= 594.0) return "A1";
    return "A0";
}

// ── Section writers ─────────────────────────────────────────────────

void SchematicWriter::write_header(std::ostream& out, const std::string& paper) {
    out << "(kicad_sch\n"
        << "  (version 20250114)\n"
        << "  (generator \"klepcbgen\")\n"
        << "  (generator_version \"2.0\")\n"
        << "  (uuid \"" << sheet_uuid_ << "\")\n"
        << "  (paper \"" << paper << "\")\n";
}

void SchematicWriter::write_title_block(std::ostream& out, const SchematicModel& schematic) {
    out << "  (title_block\n"
        << "    (title " << sq(schematic.title) << ")\n"
        << "    (date " << sq(schematic.date) << ")\n"
        << "    (company " << sq(schematic.author) << ")\n"
        << "    (comment 1 " << sq(schematic.comment) << ")\n"
        << "  )\n";
}

void SchematicWriter::write_lib_symbols(std::ostream& out) {
    out << "  (lib_symbols\n";

    write_matrix_symbol_defs(out);

    for (auto& [fp_name, sym] : symbol_defs_) {
        std::string lib_name = std::string(FOOTPRINT_LIB) + ":" + fp_name;

        out << "    (symbol " << sq(lib_name) << "\n";
        out << "      (exclude_from_sim no) (in_bom yes) (on_board yes)\n";

        // Properties
        out << "      (property \"Reference\" \"" << sym.ref_prefix << "\""
            << " (at 0 " << fmt(sym.body_height / 2.0 + 1.27) << " 0)"
            << " (effects (font (size 1.27 1.27))))\n";
        out << "      (property \"Value\" " << sq(fp_name)
            << " (at 0 " << fmt(-(sym.body_height / 2.0 + 1.27)) << " 0)"
            << " (effects (font (size 1.27 1.27))))\n";
        out << "      (property \"Footprint\" " << sq(lib_name)
            << " (at 0 0 0) (effects (font (size 1.27 1.27)) hide))\n";

        // Symbol body (unit 0, style 1): rectangle
        out << "      (symbol " << sq(fp_name + "_0_1") << "\n";
        double hw = sym.body_width / 2.0;
        double hh = sym.body_height / 2.0;
        out << "        (rectangle (start " << fmt(-hw) << " " << fmt(-hh) << ")"
            << " (end " << fmt(hw) << " " << fmt(hh) << ")"
            << " (stroke (width 0.254) (type default))"
            << " (fill (type background)))\n";
        out << "      )\n";

        // Symbol pins (unit 1, style 1). Library coordinates are Y-up.
        out << "      (symbol " << sq(fp_name + "_1_1") << "\n";
        for (auto& pin : sym.pins) {
            int angle = (pin.side == 0) ? 0 : 180;
            out << "        (pin passive line"
                << " (at " << fmt(pin.x) << " " << fmt(-pin.y) << " " << angle << ")"
                << " (length " << fmt(PIN_LEN) << ")"
                << " (name " << sq(pin.name) << " (effects (font (size 1.27 1.27))))"
                << " (number " << sq(pin.number) << " (effects (font (size 1.27 1.27)))))\n";
        }
        out << "      )\n";

        out << "    )\n"; // end symbol
    }

    out << "  )\n"; // end lib_symbols
}

void SchematicWriter::write_matrix_symbol_defs(std::ostream& out) {
    // Push button, pins left and right
    out << "    (symbol " << sq(SWITCH_SYMBOL) << "\n"
        << "      (pin_numbers hide) (pin_names (offset 1.016) hide)\n"
        << "      (exclude_from_sim no) (in_bom yes) (on_board yes)\n"
        << "      (property \"Reference\" \"SW\" (at 1.27 2.54 0)"
        << " (effects (font (size 1.27 1.27)) (justify left)))\n"
        << "      (property \"Value\" \"SW_Push\" (at 0 -1.524 0)"
        << " (effects (font (size 1.27 1.27))))\n"
        << "      (property \"Footprint\" \"\" (at 0 0 0)"
        << " (effects (font (size 1.27 1.27)) hide))\n"
        << "      (symbol \"SW_Push_0_1\"\n"
        << "        (circle (center -2.032 0) (radius 0.508)"
        << " (stroke (width 0) (type default)) (fill (type none)))\n"
        << "        (circle (center 2.032 0) (radius 0.508)"
        << " (stroke (width 0) (type default)) (fill (type none)))\n"
        << "        (polyline (pts (xy 0 1.27) (xy 0 3.048))"
        << " (stroke (width 0) (type default)) (fill (type none)))\n"
        << "        (polyline (pts (xy 2.54 1.27) (xy -2.54 1.27))"
        << " (stroke (width 0) (type default)) (fill (type none)))\n"
        << "      )\n"
        << "      (symbol \"SW_Push_1_1\"\n"
        << "        (pin passive line (at " << fmt(SWITCH_PIN_COL.x) << " 0 0) (length 2.54)"
        << " (name \"1\" (effects (font (size 1.27 1.27))))"
        << " (number \"1\" (effects (font (size 1.27 1.27)))))\n"
        << "        (pin passive line (at " << fmt(SWITCH_PIN_DIODE.x) << " 0 180) (length 2.54)"
        << " (name \"2\" (effects (font (size 1.27 1.27))))"
        << " (number \"2\" (effects (font (size 1.27 1.27)))))\n"
        << "      )\n"
        << "    )\n";

    // Diode drawn vertically, anode on top
    out << "    (symbol " << sq(DIODE_SYMBOL) << "\n"
        << "      (pin_numbers hide) (pin_names (offset 1.016) hide)\n"
        << "      (exclude_from_sim no) (in_bom yes) (on_board yes)\n"
        << "      (property \"Reference\" \"D\" (at 2.54 1.27 0)"
        << " (effects (font (size 1.27 1.27)) (justify left)))\n"
        << "      (property \"Value\" \"D\" (at 2.54 -1.27 0)"
        << " (effects (font (size 1.27 1.27)) (justify left)))\n"
        << "      (property \"Footprint\" \"\" (at 0 0 0)"
        << " (effects (font (size 1.27 1.27)) hide))\n"
        << "      (symbol \"D_0_1\"\n"
        << "        (polyline (pts (xy -1.27 -1.27) (xy 1.27 -1.27))"
        << " (stroke (width 0.254) (type default)) (fill (type none)))\n"
        << "        (polyline (pts (xy -1.27 1.27) (xy 1.27 1.27) (xy 0 -1.27) (xy -1.27 1.27))"
        << " (stroke (width 0.254) (type default)) (fill (type none)))\n"
        << "      )\n"
        << "      (symbol \"D_1_1\"\n"
        << "        (pin passive line (at 0 " << fmt(-DIODE_PIN_CATHODE.y) << " 90) (length 2.54)"
        << " (name \"K\" (effects (font (size 1.27 1.27))))"
        << " (number \"1\" (effects (font (size 1.27 1.27)))))\n"
        << "        (pin passive line (at 0 " << fmt(-DIODE_PIN_ANODE.y) << " 270) (length 2.54)"
        << " (name \"A\" (effects (font (size 1.27 1.27))))"
        << " (number \"2\" (effects (font (size 1.27 1.27)))))\n"
        << "      )\n"
        << "    )\n";
}

void SchematicWriter::write_wire(std::ostream& out, const Point& a, const Point& b,
                                 const std::string& seed) {
    out << "  (wire (pts (xy " << fmt(a.x) << " " << fmt(a.y) << ")"
        << " (xy " << fmt(b.x) << " " << fmt(b.y) << "))\n"
        << "    (stroke (width 0) (type default))\n"
        << "    (uuid \"" << generate_uuid_from_seed(seed) << "\"))\n";
}

// Root-sheet local labels get a "/" prefix from KiCad, so "/Row0" is
// written as label "Row0". Other board nets (GND, Net-(C6-Pad1)) need a
// global label to keep their name unprefixed.
void SchematicWriter::write_label(std::ostream& out, const std::string& net, const Point& at,
                                  int angle, const std::string& seed) {
    std::string justify = (angle == 180 || angle == 270) ? "right" : "left";
    std::string pos = fmt(at.x) + " " + fmt(at.y);

    if (!net.empty() && net[0] == '/') {
        out << "  (label " << sq(net.substr(1))
            << " (at " << pos << " " << angle << ")\n"
            << "    (effects (font (size 1.27 1.27)) (justify " << justify << "))\n"
            << "    (uuid \"" << generate_uuid_from_seed(seed) << "\"))\n";
        return;
    }

    out << "  (global_label " << sq(net) << " (shape passive)"
        << " (at " << pos << " " << angle << ")\n"
        << "    (fields_autoplaced yes)\n"
        << "    (effects (font (size 1.27 1.27)) (justify " << justify << "))\n"
        << "    (uuid \"" << generate_uuid_from_seed(seed) << "\")\n"
        << "    (property \"Intersheetrefs\" \"${INTERSHEET_REFS}\" (at " << pos << " 0)\n"
        << "      (effects (font (size 1.27 1.27)) (justify " << justify << ") (hide yes))))\n";
}

void SchematicWriter::write_matrix_wires_and_labels(std::ostream& out,
                                                    const SchematicModel& schematic) {
    for (auto& sp : schematic.placements) {
        // Switch to diode anode
        write_wire(out, sp.switch_pos + SWITCH_PIN_DIODE, sp.diode_pos + DIODE_PIN_ANODE,
                   "wire_" + sp.switch_ref + "_" + sp.diode_ref);

        // Column label on the switch, row label under the diode cathode
        Point col_pin = sp.switch_pos + SWITCH_PIN_COL;
        Point col_end = col_pin - Point(STUB_LEN, 0.0);
        write_wire(out, col_pin, col_end, "wire_" + sp.switch_ref + "_1");
        write_label(out, sp.col_net_name, col_end, 180, "label_" + sp.switch_ref + "_1");

        Point row_pin = sp.diode_pos + DIODE_PIN_CATHODE;
        Point row_end = row_pin + Point(0.0, STUB_LEN);
        write_wire(out, row_pin, row_end, "wire_" + sp.diode_ref + "_1");
        write_label(out, sp.row_net_name, row_end, 270, "label_" + sp.diode_ref + "_1");
    }
}

void SchematicWriter::write_control_wires_and_labels(std::ostream& out,
                                                     const std::vector<ControlPart>& controls) {
    for (auto& part : controls) {
        auto& sym = symbol_defs_[part.footprint];

        for (size_t i = 0; i < sym.pins.size() && i < part.pins.size(); i++) {
            auto& pin = sym.pins[i];
            Point p = part.sch_position + Point(pin.x, pin.y);

            // Wire stub extends outward from pin
            Point w = (pin.side == 0) ? p - Point(STUB_LEN, 0.0) : p + Point(STUB_LEN, 0.0);
            write_wire(out, p, w, "wire_" + part.refdes + "_" + pin.number);
            write_label(out, part.pins[i].net_name, w, (pin.side == 0) ? 180 : 0,
                        "label_" + part.refdes + "_" + pin.number);
        }
    }
}

void SchematicWriter::write_instance_path(std::ostream& out, const std::string& refdes) {
    out << "    (instances\n"
        << "      (project " << sq(project_) << "\n"
        << "        (path \"/" << sheet_uuid_ << "\"\n"
        << "          (reference " << sq(refdes) << ")"
        << " (unit 1))))\n";
}

void SchematicWriter::write_matrix_symbols(std::ostream& out, const SchematicModel& schematic) {
    for (auto& sp : schematic.placements) {
        std::string sw_fp = std::string(FOOTPRINT_LIB) + ":" +
                            switch_footprint_name(sp.footprint_width);

        out << "  (symbol\n"
            << "    (lib_id " << sq(SWITCH_SYMBOL) << ")\n"
            << "    (at " << fmt(sp.switch_pos.x) << " " << fmt(sp.switch_pos.y) << " 0)\n"
            << "    (uuid \"" << generate_uuid_from_seed("sym_" + sp.switch_ref) << "\")\n";
        out << "    (property \"Reference\" " << sq(sp.switch_ref)
            << " (at " << fmt(sp.switch_pos.x) << " " << fmt(sp.switch_pos.y - 2.54) << " 0)"
            << " (effects (font (size 1.27 1.27))))\n";
        // Legends are stored escaped; emit them as-is between quotes
        out << "    (property \"Value\" \"" << sp.legend << "\""
            << " (at " << fmt(sp.switch_pos.x) << " " << fmt(sp.switch_pos.y + 2.54) << " 0)"
            << " (effects (font (size 1.27 1.27))))\n";
        out << "    (property \"Footprint\" " << sq(sw_fp)
            << " (at 0 0 0) (effects (font (size 1.27 1.27)) hide))\n";
        for (const char* pin : {"1", "2"}) {
            out << "    (pin \"" << pin << "\" (uuid \""
                << generate_uuid_from_seed("pin_" + sp.switch_ref + "_" + pin) << "\"))\n";
        }
        write_instance_path(out, sp.switch_ref);
        out << "  )\n";

        std::string d_fp = std::string(FOOTPRINT_LIB) + ":" + make_diode_footprint().name;
        out << "  (symbol\n"
            << "    (lib_id " << sq(DIODE_SYMBOL) << ")\n"
            << "    (at " << fmt(sp.diode_pos.x) << " " << fmt(sp.diode_pos.y) << " 0)\n"
            << "    (uuid \"" << generate_uuid_from_seed("sym_" + sp.diode_ref) << "\")\n";
        out << "    (property \"Reference\" " << sq(sp.diode_ref)
            << " (at " << fmt(sp.diode_pos.x + 2.54) << " " << fmt(sp.diode_pos.y - 1.27) << " 0)"
            << " (effects (font (size 1.27 1.27)) (justify left)))\n";
        out << "    (property \"Value\" \"1N4148\""
            << " (at " << fmt(sp.diode_pos.x + 2.54) << " " << fmt(sp.diode_pos.y + 1.27) << " 0)"
            << " (effects (font (size 1.27 1.27)) (justify left)))\n";
        out << "    (property \"Footprint\" " << sq(d_fp)
            << " (at 0 0 0) (effects (font (size 1.27 1.27)) hide))\n";
        for (const char* pin : {"1", "2"}) {
            out << "    (pin \"" << pin << "\" (uuid \""
                << generate_uuid_from_seed("pin_" + sp.diode_ref + "_" + pin) << "\"))\n";
        }
        write_instance_path(out, sp.diode_ref);
        out << "  )\n";
    }
}

void SchematicWriter::write_control_symbols(std::ostream& out,
                                            const std::vector<ControlPart>& controls) {
    for (auto& part : controls) {
        auto& sym = symbol_defs_[part.footprint];
        std::string lib_id = std::string(FOOTPRINT_LIB) + ":" + part.footprint;
        const Point& at = part.sch_position;

        out << "  (symbol\n"
            << "    (lib_id " << sq(lib_id) << ")\n"
            << "    (at " << fmt(at.x) << " " << fmt(at.y) << " 0)\n"
            << "    (uuid \"" << generate_uuid_from_seed("sym_" + part.refdes) << "\")\n";

        // Properties
        out << "    (property \"Reference\" " << sq(part.refdes)
            << " (at " << fmt(at.x) << " "
            << fmt(at.y - sym.body_height / 2.0 - 2.54) << " 0)"
            << " (effects (font (size 1.27 1.27))))\n";
        out << "    (property \"Value\" " << sq(part.value)
            << " (at " << fmt(at.x) << " "
            << fmt(at.y + sym.body_height / 2.0 + 2.54) << " 0)"
            << " (effects (font (size 1.27 1.27))))\n";
        out << "    (property \"Footprint\" " << sq(lib_id)
            << " (at 0 0 0) (effects (font (size 1.27 1.27)) hide))\n";

        // Pin UUIDs
        for (auto& pin : sym.pins) {
            std::string pin_uuid = generate_uuid_from_seed(
                "pin_" + part.refdes + "_" + pin.number);
            out << "    (pin " << sq(pin.number)
                << " (uuid \"" << pin_uuid << "\"))\n";
        }

        write_instance_path(out, part.refdes);
        out << "  )\n"; // end symbol
    }
}

void SchematicWriter::write_sheet_instances(std::ostream& out) {
    out << "  (sheet_instances\n"
        << "    (path \"/\" (page \"1\")))\n"
        << "  (embedded_fonts no)\n";
}

void SchematicWriter::log(const std::string& msg) {
    if (opts_.verbose) {
        std::cerr << "[schematic] " << msg << "\n";
    }
}

} // namespace klepcbgen
