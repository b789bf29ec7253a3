#include "keyboard_model.h"

#include <sstream>
#include <stdexcept>

namespace klepcbgen {

void KeyBlockCollection::add_key_to_block(int block_index, int key_index) {
    if (block_index < 0) {
        throw std::out_of_range("negative block index " + std::to_string(block_index));
    }
    if (block_index >= static_cast<int>(blocks_.size())) {
        blocks_.resize(block_index + 1);
    }
    blocks_[block_index].push_back(key_index);
}

const std::vector<int>& KeyBlockCollection::block(int block_index) const {
    if (block_index < 0 || block_index >= static_cast<int>(blocks_.size())) {
        throw std::out_of_range("no block at index " + std::to_string(block_index));
    }
    return blocks_[block_index];
}

std::string Keyboard::summary() const {
    std::ostringstream oss;
    oss << "Keyboard information:\n"
        << "Name: " << name << "\n"
        << "Author: " << author << "\n"
        << "Contains: " << keys.size() << " keys, grouped into "
        << rows.size() << " rows and " << columns.size() << " columns\n";
    return oss.str();
}

} // namespace klepcbgen
