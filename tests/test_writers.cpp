#include "control_circuit.h"
#include "kicad_writer.h"
#include "layout_generator.h"
#include "project_writer.h"
#include "schematic_writer.h"
#include "test_helpers.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <set>
#include <sstream>

using namespace klepcbgen;
using klepcbgen::test_support::annotated_layout;
using klepcbgen::test_support::count_occurrences;

namespace {

struct Rendered {
    std::string pcb;
    std::string sch;
};

Rendered render(const std::string& layout_json, bool routing = true) {
    NetTable nets;
    Keyboard keyboard = annotated_layout(layout_json, nets);
    keyboard.name = "Test \"board\"";
    keyboard.author = "tester";

    PcbModel board;
    for (int i = 0; i < nets.size(); i++) {
        board.nets.push_back({i + 1, nets.names()[i]});
    }
    LayoutOptions layout_opts;
    layout_opts.routing = routing;
    LayoutGenerator layout(layout_opts);
    ControlCircuit control;
    auto controls = control.build(nets, 0);
    layout.place(keyboard, board);
    control.place(controls, board);

    SchematicModel schematic;
    schematic.project = "test";
    schematic.title = keyboard.name;
    schematic.author = keyboard.author;
    schematic.date = "2024-01-01";
    schematic.comment = "Generated by klepcbgen v2.0";
    layout.place_schematic(keyboard, nets, schematic);

    Rendered out;
    std::ostringstream pcb;
    EXPECT_TRUE(KicadWriter().write(pcb, board));
    out.pcb = pcb.str();
    std::ostringstream sch;
    EXPECT_TRUE(SchematicWriter().write(sch, schematic, controls));
    out.sch = sch.str();
    return out;
}

bool balanced(const std::string& text) {
    int depth = 0;
    bool in_string = false;
    for (size_t i = 0; i < text.size(); i++) {
        char c = text[i];
        if (in_string) {
            if (c == '\\') i++;
            else if (c == '"') in_string = false;
        } else if (c == '"') {
            in_string = true;
        } else if (c == '(') {
            depth++;
        } else if (c == ')') {
            if (--depth < 0) return false;
        }
    }
    return depth == 0 && !in_string;
}

// Quoted or bare strings following each occurrence of `head`
std::set<std::string> names_after(const std::string& text, const std::string& head) {
    std::set<std::string> names;
    size_t pos = 0;
    while ((pos = text.find(head, pos)) != std::string::npos) {
        pos += head.size();
        std::string name;
        if (pos < text.size() && text[pos] == '"') {
            for (pos++; pos < text.size() && text[pos] != '"'; pos++) {
                if (text[pos] == '\\') pos++;
                name += text[pos];
            }
        } else {
            for (; pos < text.size() && text[pos] != ')' && text[pos] != ' '; pos++) {
                name += text[pos];
            }
        }
        names.insert(name);
    }
    return names;
}

// Net names declared in the board header, from "  (net <n> <name>)"
std::set<std::string> board_net_names(const std::string& pcb) {
    std::set<std::string> names;
    std::istringstream in(pcb);
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("  (net ", 0) != 0) continue;
        size_t name_start = line.find(' ', 7) + 1;
        std::string name = line.substr(name_start, line.rfind(')') - name_start);
        if (name.size() >= 2 && name.front() == '"') {
            name = name.substr(1, name.size() - 2);
        }
        names.insert(name);
    }
    return names;
}

} // namespace

TEST(KicadWriter, BoardStructure) {
    Rendered out = render(R"([["Q","W"],["A"]])");
    EXPECT_EQ(out.pcb.rfind("(kicad_pcb (version 20241229)", 0), 0u);
    EXPECT_TRUE(balanced(out.pcb));

    EXPECT_NE(out.pcb.find("(net 0 \"\")"), std::string::npos);
    EXPECT_NE(out.pcb.find("(net 1 GND)"), std::string::npos);
    EXPECT_NE(out.pcb.find("(net 15 /Row0)"), std::string::npos);
    EXPECT_NE(out.pcb.find("(footprint \"klepcbgen:SW_MX_1.00u\""), std::string::npos);
    EXPECT_NE(out.pcb.find("(property \"Reference\" SW0"), std::string::npos);
    EXPECT_NE(out.pcb.find("(property \"Value\" \"Q\""), std::string::npos);
    EXPECT_NE(out.pcb.find("(footprint \"klepcbgen:QFN-44-1EP_7x7mm_P0.5mm\""),
              std::string::npos);
}

TEST(KicadWriter, SegmentCounts) {
    Rendered routed = render(R"([["Q","W"],["A","S"]])");
    // 4 diode traces, 2 row traces, 2 column pairs of 3 segments
    EXPECT_EQ(count_occurrences(routed.pcb, "(segment "), 12u);

    Rendered plain = render(R"([["Q","W"],["A","S"]])", false);
    EXPECT_EQ(count_occurrences(plain.pcb, "(segment "), 4u);
}

TEST(KicadWriter, PadsCarryNetNames) {
    Rendered out = render(R"([["Q"]])");
    EXPECT_NE(out.pcb.find("(net 40 \"Net-(D0-Pad2)\")"), std::string::npos);
    EXPECT_NE(out.pcb.find("(net 22 /Col0)"), std::string::npos);
}

TEST(KicadWriter, EscapedLegendKeepsQuotesBalanced) {
    Rendered out = render(R"([["\"", "\\", "(", "a\nb"]])");
    EXPECT_TRUE(balanced(out.pcb));
    EXPECT_TRUE(balanced(out.sch));
    EXPECT_NE(out.pcb.find("(property \"Value\" \"a,b\""), std::string::npos);
}

TEST(KicadWriter, Deterministic) {
    const char* layout = R"([["Q","W","E"],["A","S","D"]])";
    EXPECT_EQ(render(layout).pcb, render(layout).pcb);
}

TEST(SchematicWriter, SchematicStructure) {
    Rendered out = render(R"([["Q","W"],["A"]])");
    EXPECT_EQ(out.sch.rfind("(kicad_sch", 0), 0u);
    EXPECT_TRUE(balanced(out.sch));

    EXPECT_NE(out.sch.find("(title \"Test \\\"board\\\"\")"), std::string::npos);
    EXPECT_NE(out.sch.find("(company \"tester\")"), std::string::npos);
    EXPECT_NE(out.sch.find("(date \"2024-01-01\")"), std::string::npos);
    EXPECT_NE(out.sch.find("(comment 1 \"Generated by klepcbgen v2.0\")"), std::string::npos);

    EXPECT_EQ(count_occurrences(out.sch, "(lib_id \"klepcbgen:SW_Push\")"), 3u);
    EXPECT_EQ(count_occurrences(out.sch, "(lib_id \"klepcbgen:D\")"), 3u);
    EXPECT_NE(out.sch.find("(label \"Row1\""), std::string::npos);
    EXPECT_NE(out.sch.find("(label \"Col1\""), std::string::npos);
    EXPECT_NE(out.sch.find("(global_label \"GND\""), std::string::npos);
    EXPECT_NE(out.sch.find("(reference \"U1\")"), std::string::npos);
    EXPECT_NE(out.sch.find("(project \"test\""), std::string::npos);
}

TEST(SchematicWriter, LabelsNameTheBoardNets) {
    Rendered out = render(R"([["Q","W"],["A","S"]])");
    std::set<std::string> board_nets = board_net_names(out.pcb);
    ASSERT_TRUE(board_nets.count("/Row1"));
    ASSERT_TRUE(board_nets.count("/Col1"));

    // A root-sheet label "X" makes net "/X"
    std::set<std::string> labels = names_after(out.sch, "(label ");
    EXPECT_TRUE(labels.count("Row0"));
    EXPECT_TRUE(labels.count("Row1"));
    EXPECT_TRUE(labels.count("Col0"));
    EXPECT_TRUE(labels.count("Col1"));
    EXPECT_TRUE(labels.count("Reset"));
    for (auto& label : labels) {
        EXPECT_NE(label[0], '/') << label;
        EXPECT_TRUE(board_nets.count("/" + label)) << label;
    }

    // A global label "X" makes net "X"
    std::set<std::string> globals = names_after(out.sch, "(global_label ");
    EXPECT_TRUE(globals.count("GND"));
    EXPECT_TRUE(globals.count("VCC"));
    EXPECT_TRUE(globals.count("Net-(C6-Pad1)"));
    for (auto& label : globals) {
        EXPECT_TRUE(board_nets.count(label)) << label;
    }
}

TEST(SchematicWriter, Deterministic) {
    const char* layout = R"([["Q","W","E"],["A","S","D"]])";
    EXPECT_EQ(render(layout).sch, render(layout).sch);
}

TEST(ProjectWriter, NamesProject) {
    std::ostringstream out;
    ASSERT_TRUE(write_project_file(out, "macropad"));
    auto pro = nlohmann::json::parse(out.str());
    EXPECT_EQ(pro["meta"]["filename"], "macropad.kicad_pro");
    ASSERT_TRUE(pro["sheets"].is_array());
    EXPECT_EQ(pro["sheets"].size(), 1u);
}
