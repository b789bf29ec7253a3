#pragma once

#include "keyboard_model.h"
#include "matrix_grouper.h"
#include <istream>
#include <string>

namespace klepcbgen {

constexpr const char* VERSION = "2.0";

struct GeneratorOptions {
    ColumnPolicy policy = ColumnPolicy::SEQUENTIAL;
    bool routing = true;        // add row and column traces
    bool verbose = false;
    std::string date;           // schematic date, empty = today (YYYY-MM-DD)
};

// The three documents of one KiCad project, rendered in memory
struct GeneratedFiles {
    std::string schematic;      // .kicad_sch
    std::string pcb;            // .kicad_pcb
    std::string project;        // .kicad_pro
};

// Runs the whole KLE -> KiCad pipeline for one layout.
class Generator {
public:
    explicit Generator(const GeneratorOptions& opts = {});

    // Read infile and write <outname>/<basename>.kicad_{sch,pcb,pro}.
    // Returns false on any error; error() then says why. Nothing is left
    // on disk by a failed run except a created output directory.
    bool run(const std::string& infile, const std::string& outname);

    // Parse, group and place the layout read from in, and render the three
    // documents for a project called project_name. Returns false on
    // malformed input or matrix overflow.
    // Throws std::logic_error if placement meets an unresolved net.
    bool generate(std::istream& in, const std::string& project_name, GeneratedFiles& files);

    const Keyboard& keyboard() const { return keyboard_; }
    GroupingError grouping_error() const { return grouping_error_; }
    const std::string& error() const { return error_; }

private:
    GeneratorOptions opts_;
    Keyboard keyboard_;
    GroupingError grouping_error_ = GroupingError::NONE;
    std::string error_;

    bool write_files(const std::string& outname, const std::string& basename,
                     const GeneratedFiles& files);
    std::string schematic_date() const;

    void log(const std::string& msg);
};

} // namespace klepcbgen
