#include "control_circuit.h"
#include "footprint_library.h"

#include <iostream>
#include <stdexcept>

namespace klepcbgen {

namespace {

// How a pin finds its net
enum class NetRef { FIXED, ROW, COL };

struct PinDef {
    const char* number;
    const char* name;
    NetRef ref;
    int index;      // into CONTROL_CIRCUIT_NETS, or row/column number
};

struct PartDef {
    const char* refdes;
    const char* value;
    const char* footprint;
    double pcb_x, pcb_y;    // relative to the board origin of the block
    double sch_x, sch_y;    // relative to the schematic origin of the block
    std::vector<PinDef> pins;
};

// Positions in CONTROL_CIRCUIT_NETS
constexpr int GND = 0;
constexpr int VCC = 1;
constexpr int UCAP = 2;       // Net-(C6-Pad1)
constexpr int XTAL1 = 3;      // Net-(C7-Pad1)
constexpr int XTAL2 = 4;      // Net-(C8-Pad1)
constexpr int USB_ID = 5;     // Net-(J1-Pad4)
constexpr int USB_DP = 6;     // Net-(J1-Pad3)
constexpr int USB_DM = 7;     // Net-(J1-Pad2)
constexpr int MCU_DM = 8;     // Net-(R1-Pad1)
constexpr int MCU_DP = 9;     // Net-(R2-Pad1)
constexpr int HWB = 10;       // Net-(R3-Pad1)
constexpr int PULLUP = 11;    // Net-(R4-Pad2)
constexpr int AREF = 12;      // Net-(U1-Pad42)
constexpr int RESET = 13;     // /Reset

const std::vector<PartDef>& part_table() {
    static const std::vector<PartDef> parts = {
        {"U1", "ATmega32U4-MU", "QFN-44-1EP_7x7mm_P0.5mm", 20.0, 6.0, 76.2, 0.0, {
            {"1", "PE6", NetRef::ROW, 6},
            {"2", "UVCC", NetRef::FIXED, VCC},
            {"3", "D-", NetRef::FIXED, MCU_DM},
            {"4", "D+", NetRef::FIXED, MCU_DP},
            {"5", "UGND", NetRef::FIXED, GND},
            {"6", "UCAP", NetRef::FIXED, UCAP},
            {"7", "VBUS", NetRef::FIXED, VCC},
            {"8", "PB0", NetRef::COL, 0},
            {"9", "PB1", NetRef::COL, 1},
            {"10", "PB2", NetRef::COL, 2},
            {"11", "PB3", NetRef::COL, 3},
            {"12", "PB7", NetRef::COL, 7},
            {"13", "~{RESET}", NetRef::FIXED, RESET},
            {"14", "VCC", NetRef::FIXED, VCC},
            {"15", "GND", NetRef::FIXED, GND},
            {"16", "XTAL2", NetRef::FIXED, XTAL2},
            {"17", "XTAL1", NetRef::FIXED, XTAL1},
            {"18", "PD0", NetRef::COL, 8},
            {"19", "PD1", NetRef::COL, 9},
            {"20", "PD2", NetRef::COL, 10},
            {"21", "PD3", NetRef::COL, 11},
            {"22", "PD5", NetRef::COL, 13},
            {"23", "GND", NetRef::FIXED, GND},
            {"24", "AVCC", NetRef::FIXED, VCC},
            {"25", "PD4", NetRef::COL, 12},
            {"26", "PD6", NetRef::COL, 14},
            {"27", "PD7", NetRef::COL, 15},
            {"28", "PB4", NetRef::COL, 4},
            {"29", "PB5", NetRef::COL, 5},
            {"30", "PB6", NetRef::COL, 6},
            {"31", "PC6", NetRef::COL, 16},
            {"32", "PC7", NetRef::COL, 17},
            {"33", "~{HWB}/PE2", NetRef::FIXED, HWB},
            {"34", "VCC", NetRef::FIXED, VCC},
            {"35", "GND", NetRef::FIXED, GND},
            {"36", "PF7", NetRef::ROW, 5},
            {"37", "PF6", NetRef::ROW, 4},
            {"38", "PF5", NetRef::ROW, 3},
            {"39", "PF4", NetRef::ROW, 2},
            {"40", "PF1", NetRef::ROW, 1},
            {"41", "PF0", NetRef::ROW, 0},
            {"42", "AREF", NetRef::FIXED, AREF},
            {"43", "GND", NetRef::FIXED, GND},
            {"44", "AVCC", NetRef::FIXED, VCC},
            {"45", "EP", NetRef::FIXED, GND},
        }},
        {"J1", "USB_Mini-B", "USB_Mini-B", 5.0, 6.0, 0.0, 0.0, {
            {"1", "VBUS", NetRef::FIXED, VCC},
            {"2", "D-", NetRef::FIXED, USB_DM},
            {"3", "D+", NetRef::FIXED, USB_DP},
            {"4", "ID", NetRef::FIXED, USB_ID},
            {"5", "GND", NetRef::FIXED, GND},
        }},
        {"R1", "22", "R_0805", 11.0, 4.0, 25.4, 0.0, {
            {"1", "1", NetRef::FIXED, MCU_DM},
            {"2", "2", NetRef::FIXED, USB_DM},
        }},
        {"R2", "22", "R_0805", 11.0, 8.0, 25.4, 15.24, {
            {"1", "1", NetRef::FIXED, MCU_DP},
            {"2", "2", NetRef::FIXED, USB_DP},
        }},
        {"R3", "10k", "R_0805", 29.0, 2.0, 127.0, 0.0, {
            {"1", "1", NetRef::FIXED, HWB},
            {"2", "2", NetRef::FIXED, GND},
        }},
        {"R4", "10k", "R_0805", 29.0, 6.0, 127.0, 15.24, {
            {"1", "1", NetRef::FIXED, VCC},
            {"2", "2", NetRef::FIXED, PULLUP},
        }},
        {"C6", "1u", "C_0805", 29.0, 10.0, 127.0, 30.48, {
            {"1", "1", NetRef::FIXED, UCAP},
            {"2", "2", NetRef::FIXED, GND},
        }},
        {"C7", "22p", "C_0805", 35.0, 2.0, 152.4, 0.0, {
            {"1", "1", NetRef::FIXED, XTAL1},
            {"2", "2", NetRef::FIXED, GND},
        }},
        {"C8", "22p", "C_0805", 35.0, 6.0, 152.4, 15.24, {
            {"1", "1", NetRef::FIXED, XTAL2},
            {"2", "2", NetRef::FIXED, GND},
        }},
        {"C9", "100n", "C_0805", 35.0, 10.0, 152.4, 30.48, {
            {"1", "1", NetRef::FIXED, AREF},
            {"2", "2", NetRef::FIXED, GND},
        }},
        {"Y1", "16MHz", "Crystal_SMD_3225-4Pin", 42.0, 6.0, 177.8, 0.0, {
            {"1", "1", NetRef::FIXED, XTAL1},
            {"2", "GND", NetRef::FIXED, GND},
            {"3", "3", NetRef::FIXED, XTAL2},
            {"4", "GND", NetRef::FIXED, GND},
        }},
        {"SW_RST", "Reset", "SW_SPST_TL3342", 50.0, 6.0, 177.8, 25.4, {
            {"1", "1", NetRef::FIXED, RESET},
            {"2", "2", NetRef::FIXED, GND},
        }},
    };
    return parts;
}

Footprint make_footprint(const std::string& name) {
    if (name == "QFN-44-1EP_7x7mm_P0.5mm") return make_qfn44_footprint();
    if (name == "USB_Mini-B")              return make_usb_mini_b_footprint();
    if (name == "Crystal_SMD_3225-4Pin")   return make_crystal_footprint();
    if (name == "SW_SPST_TL3342")          return make_tact_switch_footprint();
    return make_passive_0805_footprint(name);
}

} // namespace

ControlCircuit::ControlCircuit(const ControlCircuitOptions& opts)
    : opts_(opts) {}

std::vector<ControlPart> ControlCircuit::build(const NetTable& nets, int start_net) const {
    const int fixed_count = static_cast<int>(CONTROL_CIRCUIT_NETS.size());

    std::vector<ControlPart> parts;
    for (auto& def : part_table()) {
        ControlPart part;
        part.refdes = def.refdes;
        part.value = def.value;
        part.footprint = def.footprint;
        part.pcb_position = opts_.pcb_origin + Point(def.pcb_x, def.pcb_y);
        part.sch_position = opts_.sch_origin + Point(def.sch_x, def.sch_y);

        for (auto& pd : def.pins) {
            int net = start_net + 1;
            switch (pd.ref) {
                case NetRef::FIXED: net += pd.index; break;
                case NetRef::ROW:   net += fixed_count + pd.index; break;
                case NetRef::COL:   net += fixed_count + MAX_ROWS + pd.index; break;
            }

            ControlPin pin;
            pin.number = pd.number;
            pin.name = pd.name;
            pin.net_id = net;
            pin.net_name = nets.resolve_name(net);
            if (pin.net_name == NetTable::UNKNOWN) {
                throw std::logic_error("control circuit pin " + part.refdes + "." +
                                       pin.number + " refers to net " +
                                       std::to_string(net) + ", which is not declared");
            }
            part.pins.push_back(pin);
        }
        parts.push_back(part);
    }

    log("Built " + std::to_string(parts.size()) + " control circuit parts");
    return parts;
}

void ControlCircuit::place(const std::vector<ControlPart>& parts, PcbModel& model) const {
    for (auto& part : parts) {
        if (model.footprint_defs.find(part.footprint) == model.footprint_defs.end()) {
            model.footprint_defs[part.footprint] = make_footprint(part.footprint);
        }

        PartPlacement pp;
        pp.kind = PartPlacement::CONTROL;
        pp.refdes = part.refdes;
        pp.value = part.value;
        pp.footprint_ref = part.footprint;
        pp.position = part.pcb_position;
        for (auto& pin : part.pins) {
            pp.pad_nets[pin.number] = pin.net_id;
        }
        model.parts.push_back(pp);
    }
}

void ControlCircuit::log(const std::string& msg) const {
    if (opts_.verbose) {
        std::cerr << "[control] " << msg << "\n";
    }
}

} // namespace klepcbgen
