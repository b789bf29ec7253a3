#pragma once

#include "control_circuit.h"
#include "pcb_model.h"
#include <string>
#include <ostream>
#include <vector>
#include <map>

namespace klepcbgen {

struct SchematicWriterOptions {
    bool verbose = false;
    std::string paper_size; // empty = auto-select
};

// Serializes the key matrix and the control circuit as a KiCad 9 .kicad_sch.
class SchematicWriter {
public:
    explicit SchematicWriter(const SchematicWriterOptions& opts = {});

    bool write(std::ostream& out, const SchematicModel& schematic,
               const std::vector<ControlPart>& controls);

private:
    struct PinDef {
        std::string number;
        std::string name;
        double x = 0, y = 0;    // offset from symbol center (Y-down)
        int side = 0;            // 0=left, 1=right
    };

    // Box symbol generated for a control-circuit footprint
    struct SymbolDef {
        std::string footprint_name;
        std::string ref_prefix;   // "R", "C", "U", etc.
        double body_width = 5.08;
        double body_height = 5.08;
        std::vector<PinDef> pins;
    };

    SchematicWriterOptions opts_;
    std::string sheet_uuid_;
    std::string project_;
    std::map<std::string, SymbolDef> symbol_defs_; // keyed by footprint name

    void build_symbol_defs(const std::vector<ControlPart>& controls);
    std::string select_paper(const SchematicModel& schematic,
                             const std::vector<ControlPart>& controls) const;
    std::string ref_prefix(const std::string& refdes) const;

    void write_header(std::ostream& out, const std::string& paper);
    void write_title_block(std::ostream& out, const SchematicModel& schematic);
    void write_lib_symbols(std::ostream& out);
    void write_matrix_symbol_defs(std::ostream& out);
    void write_matrix_wires_and_labels(std::ostream& out, const SchematicModel& schematic);
    void write_matrix_symbols(std::ostream& out, const SchematicModel& schematic);
    void write_control_wires_and_labels(std::ostream& out,
                                        const std::vector<ControlPart>& controls);
    void write_control_symbols(std::ostream& out, const std::vector<ControlPart>& controls);
    void write_sheet_instances(std::ostream& out);

    void write_wire(std::ostream& out, const Point& a, const Point& b,
                    const std::string& seed);
    void write_label(std::ostream& out, const std::string& net, const Point& at,
                     int angle, const std::string& seed);
    void write_instance_path(std::ostream& out, const std::string& refdes);

    void log(const std::string& msg);
};

} // namespace klepcbgen
