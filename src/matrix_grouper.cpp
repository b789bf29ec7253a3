#include "matrix_grouper.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

namespace klepcbgen {

// Grid index of a key centre; may be far outside the int range
static double grid_index(double unit) {
    return std::floor(unit - 0.5);
}

static std::string index_str(double index) {
    std::ostringstream ss;
    ss << index;
    return ss.str();
}

MatrixGrouper::MatrixGrouper(const GroupingOptions& opts)
    : opts_(opts) {}

bool MatrixGrouper::group(Keyboard& keyboard) {
    error_ = GroupingError::NONE;
    message_.clear();

    // Assign into scratch storage; the keyboard is only touched on success
    Assignment result;
    if (!assign_rows(keyboard, result)) return false;

    bool ok = (opts_.policy == ColumnPolicy::SEQUENTIAL)
        ? assign_sequential_columns(keyboard, result)
        : assign_positional_columns(keyboard, result);
    if (!ok) return false;

    for (size_t i = 0; i < keyboard.keys.size(); i++) {
        keyboard.keys[i].row = result.key_rows[i];
        keyboard.keys[i].col = result.key_cols[i];
    }
    keyboard.rows = result.rows;
    keyboard.columns = result.columns;

    log("Grouped " + std::to_string(keyboard.keys.size()) + " keys into " +
        std::to_string(keyboard.rows.size()) + " rows and " +
        std::to_string(keyboard.columns.size()) + " columns");
    return true;
}

// --- Rows ---

bool MatrixGrouper::assign_rows(const Keyboard& keyboard, Assignment& result) {
    result.keys_by_row.assign(MAX_ROWS, {});
    result.key_rows.assign(keyboard.keys.size(), 0);

    for (size_t i = 0; i < keyboard.keys.size(); i++) {
        const Key& key = keyboard.keys[i];
        double row = grid_index(key.y_unit);
        if (!(row >= 0.0 && row < MAX_ROWS)) {
            fail(GroupingError::TOO_MANY_ROWS,
                 "Key placement produced too many rows (key " + std::to_string(key.index) +
                 " lands in row " + index_str(row) + ", the matrix supports rows 0-" +
                 std::to_string(MAX_ROWS - 1) + "). Cannot generate a valid KiCad "
                 "project for this keyboard layout.");
            return false;
        }
        result.key_rows[i] = static_cast<int>(row);
        result.keys_by_row[result.key_rows[i]].push_back(key.index);
    }
    return true;
}

void MatrixGrouper::sort_by_x(const Keyboard& keyboard, std::vector<int>& key_indices) const {
    std::stable_sort(key_indices.begin(), key_indices.end(),
        [&keyboard](int a, int b) {
            return keyboard.keys[a].x_unit < keyboard.keys[b].x_unit;
        });
}

// --- Columns ---

bool MatrixGrouper::assign_sequential_columns(const Keyboard& keyboard, Assignment& result) {
    for (int row = 0; row < MAX_ROWS; row++) {
        if (static_cast<int>(result.keys_by_row[row].size()) >= MAX_COLS) {
            fail(GroupingError::TOO_MANY_COLUMNS,
                 "Key placement produced too many columns (row " + std::to_string(row) +
                 " holds " + std::to_string(result.keys_by_row[row].size()) + " keys, the "
                 "matrix supports fewer than " + std::to_string(MAX_COLS) + " per row). "
                 "Cannot generate a valid KiCad project for this keyboard layout.");
            return false;
        }
    }

    result.key_cols.assign(keyboard.keys.size(), 0);
    for (int row = 0; row < MAX_ROWS; row++) {
        std::vector<int> ordered = result.keys_by_row[row];
        sort_by_x(keyboard, ordered);

        int col = 0;
        for (int key_index : ordered) {
            result.key_cols[key_index] = col;
            result.rows.add_key_to_block(row, key_index);
            result.columns.add_key_to_block(col, key_index);
            col++;
        }
    }
    return true;
}

bool MatrixGrouper::assign_positional_columns(const Keyboard& keyboard, Assignment& result) {
    result.key_cols.assign(keyboard.keys.size(), 0);

    for (size_t i = 0; i < keyboard.keys.size(); i++) {
        const Key& key = keyboard.keys[i];
        double col = grid_index(key.x_unit);
        if (!(col >= 0.0 && col < MAX_COLS)) {
            fail(GroupingError::TOO_MANY_COLUMNS,
                 "Key placement produced too many columns (key " + std::to_string(key.index) +
                 " lands in column " + index_str(col) + ", the matrix supports "
                 "columns 0-" + std::to_string(MAX_COLS - 1) + "). Cannot generate a "
                 "valid KiCad project for this keyboard layout.");
            return false;
        }
        result.key_cols[i] = static_cast<int>(col);
    }

    // Rows keep parse order
    for (size_t i = 0; i < keyboard.keys.size(); i++) {
        result.rows.add_key_to_block(result.key_rows[i], keyboard.keys[i].index);
    }

    // Columns are filled row by row, left to right within a row
    for (int row = 0; row < MAX_ROWS; row++) {
        std::vector<int> ordered = result.keys_by_row[row];
        sort_by_x(keyboard, ordered);
        for (int key_index : ordered) {
            result.columns.add_key_to_block(result.key_cols[key_index], key_index);
        }
    }
    return true;
}

void MatrixGrouper::fail(GroupingError kind, const std::string& msg) {
    error_ = kind;
    message_ = msg;
    log("Error: " + msg);
}

void MatrixGrouper::log(const std::string& msg) {
    if (opts_.verbose) {
        std::cerr << "[grouping] " << msg << "\n";
    }
}

} // namespace klepcbgen
