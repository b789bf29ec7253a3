#include "generator.h"

#include <iostream>
#include <stdexcept>
#include <string>

static void print_help() {
    std::cout << "Usage: klepcbgen [options] -o <outname> <infile>\n"
              << "\n"
              << "Generate a KiCad project (schematic, PCB and project file) for the\n"
              << "switch matrix of a keyboard-layout-editor.com JSON layout.\n"
              << "\n"
              << "Options:\n"
              << "  -o <outname>        Output directory and base name of the KiCad files\n"
              << "  -c <seq|pos>        Column grouping: key order within each row (seq,\n"
              << "                      default) or horizontal key position (pos)\n"
              << "  -n                  Do not add row and column traces to the PCB\n"
              << "  -V, --verbose       Verbose output during generation\n"
              << "  -v, --version       Print version and exit\n"
              << "  -h, --help          Show help\n";
}

int main(int argc, char* argv[]) {
    std::string input_file;
    std::string output_name;
    klepcbgen::GeneratorOptions opts;

    // Parse arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_help();
            return 0;
        } else if (arg == "-v" || arg == "--version") {
            std::cout << "klepcbgen " << klepcbgen::VERSION << "\n";
            return 0;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 >= argc) {
                std::cerr << "Error: -o requires an argument\n";
                return 1;
            }
            output_name = argv[++i];
        } else if (arg == "-c" || arg == "--columns") {
            if (i + 1 >= argc) {
                std::cerr << "Error: -c requires an argument (seq or pos)\n";
                return 1;
            }
            std::string policy = argv[++i];
            if (policy == "seq") {
                opts.policy = klepcbgen::ColumnPolicy::SEQUENTIAL;
            } else if (policy == "pos") {
                opts.policy = klepcbgen::ColumnPolicy::POSITIONAL;
            } else {
                std::cerr << "Error: column grouping must be seq or pos\n";
                return 1;
            }
        } else if (arg == "-n" || arg == "--no-traces") {
            opts.routing = false;
        } else if (arg == "-V" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg[0] == '-') {
            std::cerr << "Error: unknown option '" << arg << "'\n";
            print_help();
            return 1;
        } else {
            input_file = arg;
        }
    }

    if (input_file.empty()) {
        std::cerr << "Error: no input file specified\n";
        print_help();
        return 1;
    }
    if (output_name.empty()) {
        std::cerr << "Error: no output name specified (-o)\n";
        print_help();
        return 1;
    }

    klepcbgen::Generator generator(opts);
    try {
        if (!generator.run(input_file, output_name)) {
            std::cerr << "Error: " << generator.error() << "\n";
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Internal error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n" << generator.keyboard().summary();
    return 0;
}
