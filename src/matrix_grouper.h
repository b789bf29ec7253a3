#pragma once

#include "keyboard_model.h"
#include <string>

namespace klepcbgen {

enum class ColumnPolicy {
    SEQUENTIAL,  // columns numbered by x order within each row
    POSITIONAL   // columns taken from the horizontal grid position
};

enum class GroupingError {
    NONE,
    TOO_MANY_ROWS,
    TOO_MANY_COLUMNS
};

struct GroupingOptions {
    ColumnPolicy policy = ColumnPolicy::SEQUENTIAL;
    bool verbose = false;
};

// Assigns every key of a parsed keyboard to a matrix row and column and
// fills the keyboard's row/column collections.
class MatrixGrouper {
public:
    explicit MatrixGrouper(const GroupingOptions& opts = {});

    // Returns false if the layout does not fit the MAX_ROWS x MAX_COLS
    // matrix; error() and message() then describe the overflow. Key rows,
    // key columns and the row/column collections are only written on
    // success.
    bool group(Keyboard& keyboard);

    GroupingError error() const { return error_; }
    const std::string& message() const { return message_; }

private:
    GroupingOptions opts_;
    GroupingError error_ = GroupingError::NONE;
    std::string message_;

    // Work in progress of one group() call, indexed like keyboard.keys
    struct Assignment {
        std::vector<int> key_rows;
        std::vector<int> key_cols;
        std::vector<std::vector<int>> keys_by_row;
        KeyBlockCollection rows;
        KeyBlockCollection columns;
    };

    bool assign_rows(const Keyboard& keyboard, Assignment& result);
    bool assign_sequential_columns(const Keyboard& keyboard, Assignment& result);
    bool assign_positional_columns(const Keyboard& keyboard, Assignment& result);

    void sort_by_x(const Keyboard& keyboard, std::vector<int>& key_indices) const;

    void fail(GroupingError kind, const std::string& msg);
    void log(const std::string& msg);
};

} // namespace klepcbgen
