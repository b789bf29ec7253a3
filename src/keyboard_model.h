#pragma once

#include <string>
#include <vector>

namespace klepcbgen {

// Physical capacity of the matrix driver
constexpr int MAX_ROWS = 7;
constexpr int MAX_COLS = 18;

struct Key {
    int index = 0;          // parse order, fixed for the life of the run
    double x_unit = 0.0;    // center, keyboard units
    double y_unit = 0.0;
    double width = 1.0;
    double height = 1.0;
    std::string legend;     // already escaped for KiCad string output

    int row = 0;
    int col = 0;

    // Net numbers, 0 = unresolved
    int row_net = 0;
    int col_net = 0;
    int diode_net = 0;
};

// Ordered buckets of key indices (one bucket per row or per column).
class KeyBlockCollection {
public:
    // Append key_index to bucket block_index, creating any missing buckets
    // up to and including block_index.
    void add_key_to_block(int block_index, int key_index);

    // Throws std::out_of_range for a bucket that was never created.
    const std::vector<int>& block(int block_index) const;

    int size() const { return static_cast<int>(blocks_.size()); }
    bool empty() const { return blocks_.empty(); }

    const std::vector<std::vector<int>>& blocks() const { return blocks_; }

private:
    std::vector<std::vector<int>> blocks_;
};

struct Keyboard {
    std::vector<Key> keys;
    KeyBlockCollection rows;
    KeyBlockCollection columns;
    std::string name;
    std::string author;

    void add_key_to_row(int row_index, int key_index) {
        rows.add_key_to_block(row_index, key_index);
    }
    void add_key_to_col(int col_index, int key_index) {
        columns.add_key_to_block(col_index, key_index);
    }

    // One-paragraph summary: name, author, key/row/column counts
    std::string summary() const;
};

} // namespace klepcbgen
