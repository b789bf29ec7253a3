#include "kle_parser.h"
#include "utils.h"

#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace klepcbgen {

static std::string describe(const json& j) {
    std::string text = j.dump();
    if (text.size() > 40) text = text.substr(0, 37) + "...";
    return text;
}

KleParser::KleParser(const ParserOptions& opts)
    : opts_(opts) {}

bool KleParser::parse_file(const std::string& filename, Keyboard& keyboard) {
    errors_.clear();
    std::ifstream in(filename);
    if (!in.is_open()) {
        fail("cannot open " + filename);
        return false;
    }
    log("Reading " + filename);
    return parse(in, keyboard);
}

bool KleParser::parse(std::istream& in, Keyboard& keyboard) {
    errors_.clear();
    json doc;
    try {
        doc = json::parse(in);
    } catch (const json::exception& e) {
        fail(std::string("JSON parse error: ") + e.what());
        return false;
    }
    return parse(doc, keyboard);
}

bool KleParser::parse(const json& doc, Keyboard& keyboard) {
    errors_.clear();
    cursor_x_ = 0.0;
    cursor_y_ = 0.0;

    if (!doc.is_array()) {
        fail("layout must be a JSON array of rows, got " + std::string(doc.type_name()));
        return false;
    }

    // Build into a scratch keyboard so a failed parse leaves nothing behind
    Keyboard parsed;

    for (size_t i = 0; i < doc.size(); i++) {
        LayoutElement elem;
        if (!decode_element(doc[i], i, elem)) return false;

        if (auto* row = std::get_if<RowList>(&elem)) {
            if (!parse_row(*row, i, parsed)) return false;
        } else if (!parse_meta(std::get<MetaBlock>(elem), i, parsed)) {
            return false;
        }
    }

    log("Parsed " + std::to_string(parsed.keys.size()) + " keys");

    keyboard.keys = std::move(parsed.keys);
    keyboard.name = parsed.name;
    keyboard.author = parsed.author;
    return true;
}

bool KleParser::decode_element(const json& elem, size_t index, LayoutElement& out) {
    if (elem.is_array()) {
        out = RowList{&elem};
        return true;
    }
    if (elem.is_object()) {
        out = MetaBlock{&elem};
        return true;
    }
    fail("unexpected JSON element " + describe(elem) + " at position " +
         std::to_string(index) + " (expected a row list or metadata object)");
    return false;
}

bool KleParser::parse_row(const RowList& row, size_t row_index, Keyboard& keyboard) {
    // Default keysize is 1x1
    double width = 1.0;
    double height = 1.0;

    const json& items = *row.items;
    for (size_t i = 0; i < items.size(); i++) {
        const json& item = items[i];

        if (item.is_object()) {
            if (!apply_modifiers(item, row_index, i, width, height)) return false;
        } else if (item.is_string()) {
            Key key;
            key.index  = static_cast<int>(keyboard.keys.size());
            key.x_unit = cursor_x_ + width / 2.0;
            key.y_unit = cursor_y_ + height / 2.0;
            key.width  = width;
            key.height = height;
            key.legend = escape_legend(item.get<std::string>());
            keyboard.keys.push_back(key);

            cursor_x_ += width;
            width = 1.0;
            height = 1.0;
        } else {
            fail("unexpected JSON element " + describe(item) + " in row " +
                 std::to_string(row_index) + ", item " + std::to_string(i));
            return false;
        }
    }

    cursor_y_ += 1.0;
    cursor_x_ = 0.0;
    return true;
}

bool KleParser::apply_modifiers(const json& mods, size_t row_index, size_t item_index,
                                double& width, double& height) {
    // Only position and size matter for the matrix; colors, fonts,
    // rotation and secondary sizes are ignored.
    for (auto& [name, value] : mods.items()) {
        if (name != "x" && name != "y" && name != "w" && name != "h") continue;

        if (!value.is_number()) {
            fail("modifier '" + name + "' must be a number, got " + describe(value) +
                 " in row " + std::to_string(row_index) + ", item " +
                 std::to_string(item_index));
            return false;
        }

        double v = value.get<double>();
        if (name == "x")      cursor_x_ += v;
        else if (name == "y") cursor_y_ += v;
        else if (name == "w") width = v;
        else                  height = v;
    }
    return true;
}

bool KleParser::parse_meta(const MetaBlock& meta, size_t index, Keyboard& keyboard) {
    const json& fields = *meta.fields;

    for (const char* field : {"name", "author"}) {
        if (!fields.contains(field)) continue;
        const json& value = fields[field];
        if (!value.is_string()) {
            fail(std::string("metadata field '") + field + "' at position " +
                 std::to_string(index) + " must be a string");
            return false;
        }
        if (std::string(field) == "name") {
            keyboard.name = value.get<std::string>();
        } else {
            keyboard.author = value.get<std::string>();
        }
    }

    log("Metadata: name='" + keyboard.name + "' author='" + keyboard.author + "'");
    return true;
}

void KleParser::log(const std::string& msg) {
    if (opts_.verbose) {
        std::cerr << "[parser] " << msg << "\n";
    }
}

void KleParser::fail(const std::string& msg) {
    errors_.push_back(msg);
    log("Error: " + msg);
}

} // namespace klepcbgen
