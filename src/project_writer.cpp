#include "project_writer.h"
#include "utils.h"

#include <nlohmann/json.hpp>

namespace klepcbgen {

using json = nlohmann::json;

bool write_project_file(std::ostream& out, const std::string& project_name) {
    // Minimal KiCad 9 project file. The sheet entry must carry the root
    // sheet uuid of the schematic.
    json pro;
    pro["meta"] = {{"filename", project_name + ".kicad_pro"}, {"version", 1}};
    pro["board"] = {
        {"3dviewports", json::array()},
        {"design_settings", json::object()},
        {"layer_presets", json::array()},
        {"viewports", json::array()},
    };
    pro["schematic"] = {
        {"drawing", json::object()},
        {"meta", {{"version", 1}}},
    };
    pro["sheets"] = json::array({
        json::array({generate_uuid_from_seed("schematic_sheet_root"), ""}),
    });
    pro["text_variables"] = json::object();

    out << pro.dump(2) << "\n";
    return out.good();
}

} // namespace klepcbgen
