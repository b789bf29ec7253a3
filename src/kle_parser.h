#pragma once

#include "keyboard_model.h"
#include <nlohmann/json.hpp>
#include <istream>
#include <string>
#include <variant>
#include <vector>

namespace klepcbgen {

struct ParserOptions {
    bool verbose = false;
};

// One top-level element of a KLE document.
struct RowList {
    const nlohmann::json* items = nullptr;
};

struct MetaBlock {
    const nlohmann::json* fields = nullptr;
};

using LayoutElement = std::variant<RowList, MetaBlock>;

class KleParser {
public:
    explicit KleParser(const ParserOptions& opts = {});

    // Parse a KLE JSON file. Returns true on success; on failure the
    // keyboard is left untouched and errors() says why.
    bool parse_file(const std::string& filename, Keyboard& keyboard);
    bool parse(std::istream& in, Keyboard& keyboard);
    bool parse(const nlohmann::json& doc, Keyboard& keyboard);

    const std::vector<std::string>& errors() const { return errors_; }

private:
    ParserOptions opts_;
    std::vector<std::string> errors_;

    // Cursor state while walking the rows
    double cursor_x_ = 0.0;
    double cursor_y_ = 0.0;

    bool decode_element(const nlohmann::json& elem, size_t index, LayoutElement& out);
    bool parse_row(const RowList& row, size_t row_index, Keyboard& keyboard);
    bool apply_modifiers(const nlohmann::json& mods, size_t row_index, size_t item_index,
                         double& width, double& height);
    bool parse_meta(const MetaBlock& meta, size_t index, Keyboard& keyboard);

    void log(const std::string& msg);
    void fail(const std::string& msg);
};

} // namespace klepcbgen
