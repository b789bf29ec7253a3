#include "net_table.h"

#include <iostream>

namespace klepcbgen {

const std::vector<std::string> CONTROL_CIRCUIT_NETS = {
    "GND",
    "VCC",
    "Net-(C6-Pad1)",
    "Net-(C7-Pad1)",
    "Net-(C8-Pad1)",
    "Net-(J1-Pad4)",
    "Net-(J1-Pad3)",
    "Net-(J1-Pad2)",
    "Net-(R1-Pad1)",
    "Net-(R2-Pad1)",
    "Net-(R3-Pad1)",
    "Net-(R4-Pad2)",
    "Net-(U1-Pad42)",
    "/Reset",
};

const std::string NetTable::UNKNOWN = "UNKNOWN";

std::string row_net_name(int row) {
    return "/Row" + std::to_string(row);
}

std::string col_net_name(int col) {
    return "/Col" + std::to_string(col);
}

std::string diode_net_name(int key_index) {
    return "Net-(D" + std::to_string(key_index) + "-Pad2)";
}

NetTable::NetTable(const NetTableOptions& opts)
    : opts_(opts) {}

int NetTable::add_net(const std::string& name) {
    auto it = number_by_name_.find(name);
    if (it != number_by_name_.end()) return it->second;

    names_.push_back(name);
    int number = static_cast<int>(names_.size());
    number_by_name_[name] = number;
    return number;
}

int NetTable::resolve_number(const std::string& name) const {
    auto it = number_by_name_.find(name);
    return (it != number_by_name_.end()) ? it->second : 0;
}

const std::string& NetTable::resolve_name(int number) const {
    if (number < 1 || number > static_cast<int>(names_.size())) return UNKNOWN;
    return names_[number - 1];
}

void NetTable::define_nets(const Keyboard& keyboard) {
    for (auto& name : CONTROL_CIRCUIT_NETS) {
        add_net(name);
    }

    // Always declare every row and column net, since the control circuit
    // refers to them whether or not the keyboard uses them
    for (int row = 0; row < MAX_ROWS; row++) {
        add_net(row_net_name(row));
    }
    for (int col = 0; col < MAX_COLS; col++) {
        add_net(col_net_name(col));
    }

    for (auto& key : keyboard.keys) {
        add_net(diode_net_name(key.index));
    }

    log("Defined " + std::to_string(names_.size()) + " nets");
}

void NetTable::annotate_keys(Keyboard& keyboard) const {
    for (auto& key : keyboard.keys) {
        key.row_net   = resolve_number(row_net_name(key.row));
        key.col_net   = resolve_number(col_net_name(key.col));
        key.diode_net = resolve_number(diode_net_name(key.index));
    }
}

void NetTable::log(const std::string& msg) const {
    if (opts_.verbose) {
        std::cerr << "[nets] " << msg << "\n";
    }
}

} // namespace klepcbgen
