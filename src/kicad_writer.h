#pragma once

#include "pcb_model.h"
#include <string>
#include <ostream>

namespace klepcbgen {

struct WriterOptions {
    bool verbose = false;
};

// Serializes a PcbModel as a KiCad 9 .kicad_pcb board.
class KicadWriter {
public:
    explicit KicadWriter(const WriterOptions& opts = {});

    // Write the model to an output stream. Returns true on success.
    bool write(std::ostream& out, const PcbModel& model);

private:
    WriterOptions opts_;

    // Section writers
    void write_header(std::ostream& out);
    void write_general(std::ostream& out);
    void write_paper(std::ostream& out);
    void write_layers(std::ostream& out);
    void write_setup(std::ostream& out);
    void write_nets(std::ostream& out, const PcbModel& model);
    void write_footprints(std::ostream& out, const PcbModel& model);
    void write_footprint(std::ostream& out, const PcbModel& model,
                         const PartPlacement& part, const Footprint& fp);
    void write_pad(std::ostream& out, const PadDef& pad,
                   const PartPlacement& part, const PcbModel& model);
    void write_traces(std::ostream& out, const PcbModel& model);

    std::string uuid_fmt(const std::string& seed) const;
    std::string net_name(const PcbModel& model, int net_id) const;

    void log(const std::string& msg);
};

} // namespace klepcbgen
