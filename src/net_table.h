#pragma once

#include "keyboard_model.h"
#include <map>
#include <string>
#include <vector>

namespace klepcbgen {

// Nets of the fixed control circuit, in declaration order. The control
// circuit refers to the matrix nets that follow them by position.
extern const std::vector<std::string> CONTROL_CIRCUIT_NETS;

std::string row_net_name(int row);
std::string col_net_name(int col);
std::string diode_net_name(int key_index);

struct NetTableOptions {
    bool verbose = false;
};

// Insertion-ordered registry of net names. Net number = 1 + insertion index.
class NetTable {
public:
    static const std::string UNKNOWN;

    explicit NetTable(const NetTableOptions& opts = {});

    // Register a net; re-adding a known name returns its existing number.
    int add_net(const std::string& name);

    // 0 for names that were never added
    int resolve_number(const std::string& name) const;

    // UNKNOWN for numbers outside 1..size()
    const std::string& resolve_name(int number) const;

    int size() const { return static_cast<int>(names_.size()); }
    const std::vector<std::string>& names() const { return names_; }

    // Control nets, MAX_ROWS row nets, MAX_COLS column nets, then one diode
    // net per key. The order fixes every net number.
    void define_nets(const Keyboard& keyboard);

    // Resolve each key's row, column and diode net numbers.
    void annotate_keys(Keyboard& keyboard) const;

private:
    NetTableOptions opts_;
    std::vector<std::string> names_;
    std::map<std::string, int> number_by_name_;

    void log(const std::string& msg) const;
};

} // namespace klepcbgen
