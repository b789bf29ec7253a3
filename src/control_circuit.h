#pragma once

#include "net_table.h"
#include "pcb_model.h"
#include <string>
#include <vector>

namespace klepcbgen {

struct ControlPin {
    std::string number;     // pad number
    std::string name;       // function, e.g. "PF0", "VCC"
    int net_id = 0;
    std::string net_name;
};

struct ControlPart {
    std::string refdes;
    std::string value;
    std::string footprint;  // footprint name, see footprint_library.h
    Point pcb_position;     // absolute board position
    Point sch_position;     // absolute schematic position
    std::vector<ControlPin> pins;
};

struct ControlCircuitOptions {
    Point pcb_origin{-100.0, 0.0};
    Point sch_origin{25.4, 177.8};
    bool verbose = false;
};

// Controller, USB connector and support passives that scan the matrix.
// Pins address nets by position: the fixed control nets first, then the
// MAX_ROWS row nets, then the MAX_COLS column nets.
class ControlCircuit {
public:
    explicit ControlCircuit(const ControlCircuitOptions& opts = {});

    // Resolve every pin against the table. start_net is the number of
    // nets that precede the control nets (0 when they are declared first).
    // Throws std::logic_error if a referenced net is not in the table.
    std::vector<ControlPart> build(const NetTable& nets, int start_net) const;

    // Add the parts and their footprint definitions to the board.
    void place(const std::vector<ControlPart>& parts, PcbModel& model) const;

private:
    ControlCircuitOptions opts_;

    void log(const std::string& msg) const;
};

} // namespace klepcbgen
