#include "generator.h"
#include "control_circuit.h"
#include "kicad_writer.h"
#include "kle_parser.h"
#include "layout_generator.h"
#include "net_table.h"
#include "project_writer.h"
#include "schematic_writer.h"
#include "utils.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>
#include <vector>

#include <sys/stat.h>
#include <sys/types.h>

namespace klepcbgen {

static bool is_directory(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

Generator::Generator(const GeneratorOptions& opts)
    : opts_(opts) {}

bool Generator::run(const std::string& infile, const std::string& outname) {
    error_.clear();

    std::cout << "Reading input file " << infile << " ...\n";
    std::ifstream in(infile);
    if (!in.is_open()) {
        error_ = "cannot open " + infile;
        return false;
    }

    std::string basename = path_basename(outname);
    if (basename.empty() || basename == "." || basename == "..") {
        error_ = "invalid output name '" + outname + "'";
        return false;
    }

    GeneratedFiles files;
    if (!generate(in, basename, files)) return false;

    return write_files(outname, basename, files);
}

bool Generator::generate(std::istream& in, const std::string& project_name,
                         GeneratedFiles& files) {
    error_.clear();
    grouping_error_ = GroupingError::NONE;
    keyboard_ = Keyboard();

    // ── Parse ───────────────────────────────────────────────────────
    ParserOptions parser_opts;
    parser_opts.verbose = opts_.verbose;
    KleParser parser(parser_opts);
    if (!parser.parse(in, keyboard_)) {
        error_ = "failed to parse layout";
        for (auto& e : parser.errors()) {
            error_ += "\n  " + e;
        }
        return false;
    }

    // ── Group ───────────────────────────────────────────────────────
    std::cout << "Grouping keys in rows and columns ...\n";
    GroupingOptions grouping_opts;
    grouping_opts.policy = opts_.policy;
    grouping_opts.verbose = opts_.verbose;
    MatrixGrouper grouper(grouping_opts);
    if (!grouper.group(keyboard_)) {
        grouping_error_ = grouper.error();
        error_ = grouper.message();
        return false;
    }

    // ── Nets ────────────────────────────────────────────────────────
    NetTableOptions net_opts;
    net_opts.verbose = opts_.verbose;
    NetTable nets(net_opts);
    nets.define_nets(keyboard_);
    nets.annotate_keys(keyboard_);

    PcbModel board;
    for (int i = 0; i < nets.size(); i++) {
        board.nets.push_back({i + 1, nets.names()[i]});
    }

    LayoutOptions layout_opts;
    layout_opts.routing = opts_.routing;
    layout_opts.verbose = opts_.verbose;
    LayoutGenerator layout(layout_opts);

    ControlCircuitOptions control_opts;
    control_opts.verbose = opts_.verbose;
    ControlCircuit control(control_opts);
    std::vector<ControlPart> controls = control.build(nets, 0);

    // ── Schematic ───────────────────────────────────────────────────
    std::cout << "Generating schematic ...\n";
    SchematicModel schematic;
    schematic.project = project_name;
    schematic.title = keyboard_.name;
    schematic.author = keyboard_.author;
    schematic.date = schematic_date();
    schematic.comment = std::string("Generated by klepcbgen v") + VERSION;
    layout.place_schematic(keyboard_, nets, schematic);

    SchematicWriterOptions sch_opts;
    sch_opts.verbose = opts_.verbose;
    SchematicWriter sch_writer(sch_opts);
    std::ostringstream sch_out;
    if (!sch_writer.write(sch_out, schematic, controls)) {
        error_ = "failed to render schematic";
        return false;
    }

    // ── Board ───────────────────────────────────────────────────────
    std::cout << "Generating PCB layout ...\n";
    layout.place(keyboard_, board);
    control.place(controls, board);

    WriterOptions pcb_opts;
    pcb_opts.verbose = opts_.verbose;
    KicadWriter pcb_writer(pcb_opts);
    std::ostringstream pcb_out;
    if (!pcb_writer.write(pcb_out, board)) {
        error_ = "failed to render board";
        return false;
    }

    std::ostringstream pro_out;
    if (!write_project_file(pro_out, project_name)) {
        error_ = "failed to render project file";
        return false;
    }

    files.schematic = sch_out.str();
    files.pcb = pcb_out.str();
    files.project = pro_out.str();
    return true;
}

bool Generator::write_files(const std::string& outname, const std::string& basename,
                            const GeneratedFiles& files) {
    if (!is_directory(outname)) {
        if (mkdir(outname.c_str(), 0755) != 0) {
            error_ = "cannot create directory " + outname + ": " + std::strerror(errno);
            return false;
        }
        log("Created " + outname);
    }

    std::string stem = outname + "/" + basename;
    const std::pair<std::string, const std::string*> outputs[] = {
        {stem + ".kicad_sch", &files.schematic},
        {stem + ".kicad_pcb", &files.pcb},
        {stem + ".kicad_pro", &files.project},
    };

    std::vector<std::string> written;
    for (auto& [path, content] : outputs) {
        std::ofstream out(path, std::ios::binary);
        bool ok = out.is_open();
        if (ok) {
            written.push_back(path);
            out << *content;
            out.close();
            ok = !out.fail();
        }
        if (!ok) {
            error_ = "cannot write " + path;
            for (auto& w : written) {
                std::remove(w.c_str());
            }
            return false;
        }
        log("Wrote " + path + " (" + std::to_string(content->size()) + " bytes)");
    }
    return true;
}

std::string Generator::schematic_date() const {
    if (!opts_.date.empty()) return opts_.date;

    std::time_t now = std::time(nullptr);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", std::localtime(&now));
    return buf;
}

void Generator::log(const std::string& msg) {
    if (opts_.verbose) {
        std::cerr << "[generator] " << msg << "\n";
    }
}

} // namespace klepcbgen
