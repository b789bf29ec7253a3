#include "kicad_writer.h"
#include "footprint_library.h"
#include "utils.h"

#include <iostream>

namespace klepcbgen {

KicadWriter::KicadWriter(const WriterOptions& opts)
    : opts_(opts) {}

bool KicadWriter::write(std::ostream& out, const PcbModel& model) {
    out << "(kicad_pcb ";
    write_header(out);
    out << "\n";
    write_general(out);
    write_paper(out);
    write_layers(out);
    write_setup(out);
    out << "\n";
    write_nets(out, model);
    out << "\n";
    write_footprints(out, model);
    out << "\n";
    write_traces(out, model);
    out << ")\n";

    log("Board written: " + std::to_string(model.parts.size()) + " footprints, " +
        std::to_string(model.traces.size()) + " segments, " +
        std::to_string(model.nets.size()) + " nets");
    return out.good();
}

// --- Header ---

void KicadWriter::write_header(std::ostream& out) {
    out << "(version 20241229) (generator \"klepcbgen\") "
           "(generator_version \"2.0\")";
}

// --- General ---

void KicadWriter::write_general(std::ostream& out) {
    out << "  (general\n";
    out << "    (thickness 1.6)\n";
    out << "    (legacy_teardrops no)\n";
    out << "  )\n\n";
}

// --- Paper ---

void KicadWriter::write_paper(std::ostream& out) {
    out << "  (paper \"A3\")\n\n";
}

// --- Layers ---

void KicadWriter::write_layers(std::ostream& out) {
    out << "  (layers\n";
    out << "    (0 \"F.Cu\" signal)\n";
    out << "    (2 \"B.Cu\" signal)\n";
    out << "    (1 \"F.Mask\" user)\n";
    out << "    (3 \"B.Mask\" user)\n";
    out << "    (5 \"F.SilkS\" user \"F.Silkscreen\")\n";
    out << "    (7 \"B.SilkS\" user \"B.Silkscreen\")\n";
    out << "    (9 \"F.Adhes\" user \"F.Adhesive\")\n";
    out << "    (11 \"B.Adhes\" user \"B.Adhesive\")\n";
    out << "    (13 \"F.Paste\" user)\n";
    out << "    (15 \"B.Paste\" user)\n";
    out << "    (17 \"Dwgs.User\" user \"User.Drawings\")\n";
    out << "    (19 \"Cmts.User\" user \"User.Comments\")\n";
    out << "    (21 \"Eco1.User\" user \"User.Eco1\")\n";
    out << "    (23 \"Eco2.User\" user \"User.Eco2\")\n";
    out << "    (25 \"Edge.Cuts\" user)\n";
    out << "    (27 \"Margin\" user)\n";
    out << "    (29 \"B.CrtYd\" user \"B.Courtyard\")\n";
    out << "    (31 \"F.CrtYd\" user \"F.Courtyard\")\n";
    out << "    (33 \"B.Fab\" user)\n";
    out << "    (35 \"F.Fab\" user)\n";
    out << "  )\n\n";
}

// --- Setup ---

void KicadWriter::write_setup(std::ostream& out) {
    out << "  (setup\n";
    out << "    (pad_to_mask_clearance 0)\n";
    out << "    (allow_soldermask_bridges_in_footprints no)\n";
    out << "    (tenting front back)\n";
    out << "    (pcbplotparams\n";
    out << "      (layerselection 0x00010fc_ffffffff)\n";
    out << "      (plot_on_all_layers_selection 0x0000000_00000000)\n";
    out << "      (disableapertmacros no)\n";
    out << "      (usegerberextensions false)\n";
    out << "      (usegerberattributes true)\n";
    out << "      (usegerberadvancedattributes true)\n";
    out << "      (creategerberjobfile true)\n";
    out << "      (svgprecision 4)\n";
    out << "      (plotframeref false)\n";
    out << "      (mode 1)\n";
    out << "      (useauxorigin false)\n";
    out << "      (pdf_front_fp_property_popups true)\n";
    out << "      (pdf_back_fp_property_popups true)\n";
    out << "      (pdf_metadata yes)\n";
    out << "      (pdf_single_document no)\n";
    out << "      (dxfpolygonmode true)\n";
    out << "      (dxfimperialunits true)\n";
    out << "      (dxfusepcbnewfont true)\n";
    out << "      (psnegative false)\n";
    out << "      (psa4output false)\n";
    out << "      (plotinvisibletext false)\n";
    out << "      (sketchpadsonfab false)\n";
    out << "      (subtractmaskfromsilk false)\n";
    out << "      (outputformat 1)\n";
    out << "      (mirror false)\n";
    out << "      (drillshape 1)\n";
    out << "      (scaleselection 1)\n";
    out << "      (outputdirectory \"\")\n";
    out << "    )\n";
    out << "  )\n";
}

// --- Nets ---

void KicadWriter::write_nets(std::ostream& out, const PcbModel& model) {
    out << "  (net 0 \"\")\n";
    for (auto& net : model.nets) {
        out << "  (net " << net.id << " " << sexp_quote(net.name) << ")\n";
    }
}

std::string KicadWriter::net_name(const PcbModel& model, int net_id) const {
    if (net_id >= 1 && net_id <= static_cast<int>(model.nets.size())) {
        return model.nets[net_id - 1].name;
    }
    return "";
}

// --- Footprints ---

void KicadWriter::write_footprints(std::ostream& out, const PcbModel& model) {
    for (auto& part : model.parts) {
        auto it = model.footprint_defs.find(part.footprint_ref);
        if (it == model.footprint_defs.end()) {
            log("Warning: footprint '" + part.footprint_ref + "' not found for " + part.refdes);
            continue;
        }
        write_footprint(out, model, part, it->second);
    }
}

void KicadWriter::write_footprint(std::ostream& out, const PcbModel& model,
                                  const PartPlacement& part,
                                  const Footprint& fp) {
    std::string lib_id = std::string(FOOTPRINT_LIB) + ":" + fp.name;

    out << "  (footprint " << sexp_quote(lib_id) << "\n";
    out << "    (layer \"" << part.layer << "\")\n";
    out << "    (uuid " << uuid_fmt("fp_" + part.refdes) << ")\n";
    out << "    (at " << fmt(part.position.x) << " " << fmt(part.position.y);
    if (part.rotation != 0.0) {
        out << " " << fmt(part.rotation);
    }
    out << ")\n";

    // Properties
    out << "    (property \"Reference\" " << sexp_quote(part.refdes) << "\n";
    out << "      (at 0 " << (part.kind == PartPlacement::SWITCH ? "3.175" : "-2") << " 0)\n";
    out << "      (layer \"F.SilkS\")\n";
    out << "      (uuid " << uuid_fmt("ref_" + part.refdes) << ")\n";
    out << "      (effects (font (size 1 1) (thickness 0.15)))\n";
    out << "    )\n";

    // Values are stored escaped; emit them as-is between quotes
    out << "    (property \"Value\" \"" << part.value << "\"\n";
    out << "      (at 0 " << (part.kind == PartPlacement::SWITCH ? "-7.9375" : "2") << " 0)\n";
    out << "      (layer \"F.Fab\")\n";
    out << "      (uuid " << uuid_fmt("val_" + part.refdes) << ")\n";
    out << "      (effects (font (size 1 1) (thickness 0.15)))\n";
    out << "    )\n";

    out << "    (property \"Footprint\" " << sexp_quote(lib_id) << "\n";
    out << "      (at 0 0 0)\n";
    out << "      (layer \"F.Fab\")\n";
    out << "      (hide yes)\n";
    out << "      (uuid " << uuid_fmt("fprop_" + part.refdes) << ")\n";
    out << "      (effects (font (size 1.27 1.27) (thickness 0.15)))\n";
    out << "    )\n";

    if (part.kind != PartPlacement::CONTROL) {
        out << "    (attr through_hole)\n";
    } else {
        out << "    (attr smd)\n";
    }

    // Footprint graphics (silkscreen, fab, courtyard lines)
    for (size_t i = 0; i < fp.graphics.size(); i++) {
        auto& gi = fp.graphics[i];
        out << "    (fp_line (start " << fmt(gi.start.x) << " " << fmt(gi.start.y) << ")"
            << " (end " << fmt(gi.end.x) << " " << fmt(gi.end.y) << ")"
            << " (stroke (width " << fmt(gi.width) << ") (type solid))"
            << " (layer \"" << gi.layer << "\")"
            << " (uuid " << uuid_fmt("fpline_" + part.refdes + "_" + std::to_string(i)) << "))\n";
    }

    // Pads
    for (auto& pad : fp.pads) {
        write_pad(out, pad, part, model);
    }

    out << "  )\n\n";
}

void KicadWriter::write_pad(std::ostream& out, const PadDef& pad,
                            const PartPlacement& part,
                            const PcbModel& model) {
    // Determine pad type string
    std::string type_str;
    switch (pad.type) {
        case PadDef::SMD:       type_str = "smd"; break;
        case PadDef::THRU_HOLE: type_str = "thru_hole"; break;
        case PadDef::NPTH:      type_str = "np_thru_hole"; break;
    }

    // Determine shape string
    std::string shape_str;
    switch (pad.shape) {
        case PadDef::CIRCLE:    shape_str = "circle"; break;
        case PadDef::RECT:      shape_str = "rect"; break;
        case PadDef::OVAL:      shape_str = "oval"; break;
        case PadDef::ROUNDRECT: shape_str = "roundrect"; break;
    }

    out << "    (pad \"" << pad.name << "\" " << type_str << " " << shape_str;
    out << " (at " << fmt(pad.offset.x) << " " << fmt(pad.offset.y) << ")";
    out << " (size " << fmt(pad.width) << " " << fmt(pad.height) << ")";

    if (pad.drill_diameter > 0) {
        out << " (drill " << fmt(pad.drill_diameter) << ")";
    }

    // Layers
    out << " (layers";
    if (pad.type == PadDef::THRU_HOLE || pad.type == PadDef::NPTH) {
        out << " \"*.Cu\" \"*.Mask\"";
    } else {
        out << " \"F.Cu\" \"F.Paste\" \"F.Mask\"";
    }
    out << ")";

    if (pad.type == PadDef::THRU_HOLE) {
        out << " (remove_unused_layers no)";
    }

    if (pad.shape == PadDef::ROUNDRECT) {
        out << " (roundrect_rratio 0.25)";
    }

    // Net
    auto net_it = part.pad_nets.find(pad.name);
    if (!pad.name.empty() && net_it != part.pad_nets.end() && net_it->second > 0) {
        out << " (net " << net_it->second << " "
            << sexp_quote(net_name(model, net_it->second)) << ")";
    }

    std::string pad_seed = pad.name.empty()
        ? "hole_" + part.refdes + "_" + fmt(pad.offset.x) + "_" + fmt(pad.offset.y)
        : "pad_" + part.refdes + "_" + pad.name;
    out << " (uuid " << uuid_fmt(pad_seed) << ")";

    out << ")\n";
}

// --- Traces ---

void KicadWriter::write_traces(std::ostream& out, const PcbModel& model) {
    for (size_t i = 0; i < model.traces.size(); i++) {
        auto& t = model.traces[i];
        out << "  (segment (start " << fmt(t.start.x) << " " << fmt(t.start.y) << ")"
            << " (end " << fmt(t.end.x) << " " << fmt(t.end.y) << ")"
            << " (width " << fmt(t.width) << ")"
            << " (layer \"" << t.layer << "\")"
            << " (net " << t.net_id << ")"
            << " (uuid " << uuid_fmt("seg_" + std::to_string(i)) << "))\n";
    }
}

std::string KicadWriter::uuid_fmt(const std::string& seed) const {
    return "\"" + generate_uuid_from_seed(seed) + "\"";
}

void KicadWriter::log(const std::string& msg) {
    if (opts_.verbose) {
        std::cout << "[KiCad] " << msg << std::endl;
    }
}

} // namespace klepcbgen
