#include "generator.h"
#include "test_helpers.h"

#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <sys/stat.h>
#include <unistd.h>

using namespace klepcbgen;
using klepcbgen::test_support::count_occurrences;

namespace {

const char* const LAYOUT =
    R"([{"name":"Numpad","author":"klepcbgen"},)"
    R"(["Num","/","*","-"],["7","8","9",{"h":2},"+"],["4","5","6"],)"
    R"(["1","2","3",{"h":2},"Enter"],[{"w":2},"0","."]])";

GeneratorOptions fixed_date() {
    GeneratorOptions opts;
    opts.date = "2024-05-01";
    return opts;
}

bool file_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::string write_temp_layout(const std::string& name, const std::string& text) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << text;
    return path;
}

} // namespace

TEST(Generator, RendersAllDocuments) {
    Generator generator(fixed_date());
    std::istringstream in(LAYOUT);
    GeneratedFiles files;
    ASSERT_TRUE(generator.generate(in, "numpad", files)) << generator.error();

    EXPECT_EQ(generator.keyboard().keys.size(), 17u);
    EXPECT_EQ(generator.keyboard().rows.size(), 5);
    EXPECT_EQ(generator.keyboard().name, "Numpad");

    EXPECT_EQ(files.pcb.rfind("(kicad_pcb", 0), 0u);
    EXPECT_EQ(files.schematic.rfind("(kicad_sch", 0), 0u);
    EXPECT_NE(files.schematic.find("(date \"2024-05-01\")"), std::string::npos);
    EXPECT_NE(files.project.find("numpad.kicad_pro"), std::string::npos);
    EXPECT_EQ(count_occurrences(files.pcb, "(footprint \"klepcbgen:SW_MX_"), 17u);
}

TEST(Generator, DeterministicOutput) {
    GeneratedFiles first, second;
    std::istringstream in1(LAYOUT), in2(LAYOUT);
    Generator a(fixed_date()), b(fixed_date());
    ASSERT_TRUE(a.generate(in1, "numpad", first));
    ASSERT_TRUE(b.generate(in2, "numpad", second));
    EXPECT_EQ(first.pcb, second.pcb);
    EXPECT_EQ(first.schematic, second.schematic);
    EXPECT_EQ(first.project, second.project);
}

TEST(Generator, NoRoutingOption) {
    GeneratorOptions opts = fixed_date();
    opts.routing = false;
    Generator generator(opts);
    std::istringstream in(R"([["Q","W"],["A","S"]])");
    GeneratedFiles files;
    ASSERT_TRUE(generator.generate(in, "p", files));
    EXPECT_EQ(count_occurrences(files.pcb, "(segment "), 4u);
}

TEST(Generator, ReportsParseErrors) {
    Generator generator;
    std::istringstream in(R"([["A"], 7])");
    GeneratedFiles files;
    EXPECT_FALSE(generator.generate(in, "p", files));
    EXPECT_NE(generator.error().find("failed to parse"), std::string::npos);
    EXPECT_TRUE(files.pcb.empty());
}

TEST(Generator, ReportsMatrixOverflow) {
    Generator generator;
    std::istringstream in(R"([["1"],["2"],["3"],["4"],["5"],["6"],["7"],["8"]])");
    GeneratedFiles files;
    EXPECT_FALSE(generator.generate(in, "p", files));
    EXPECT_EQ(generator.grouping_error(), GroupingError::TOO_MANY_ROWS);
    EXPECT_FALSE(generator.error().empty());
}

TEST(Generator, RunWritesProjectDirectory) {
    std::string input = write_temp_layout("klepcbgen_numpad.json", LAYOUT);
    std::string outname = ::testing::TempDir() + "klepcbgen_numpad_out";

    Generator generator(fixed_date());
    ASSERT_TRUE(generator.run(input, outname)) << generator.error();

    std::string stem = outname + "/klepcbgen_numpad_out";
    ASSERT_TRUE(file_exists(stem + ".kicad_sch"));
    ASSERT_TRUE(file_exists(stem + ".kicad_pcb"));
    ASSERT_TRUE(file_exists(stem + ".kicad_pro"));

    std::istringstream in(LAYOUT);
    GeneratedFiles files;
    ASSERT_TRUE(Generator(fixed_date()).generate(in, "klepcbgen_numpad_out", files));
    EXPECT_EQ(read_file(stem + ".kicad_pcb"), files.pcb);

    // Running again over an existing directory works
    EXPECT_TRUE(generator.run(input, outname)) << generator.error();

    for (auto ext : {".kicad_sch", ".kicad_pcb", ".kicad_pro"}) {
        std::remove((stem + ext).c_str());
    }
    rmdir(outname.c_str());
    std::remove(input.c_str());
}

TEST(Generator, FailedRunWritesNothing) {
    std::string input = write_temp_layout("klepcbgen_overflow.json",
        R"([["1"],["2"],["3"],["4"],["5"],["6"],["7"],["8"]])");
    std::string outname = ::testing::TempDir() + "klepcbgen_overflow_out";

    Generator generator;
    EXPECT_FALSE(generator.run(input, outname));
    EXPECT_FALSE(file_exists(outname));
    std::remove(input.c_str());
}

TEST(Generator, MissingInput) {
    Generator generator;
    EXPECT_FALSE(generator.run("/nonexistent/layout.json", ::testing::TempDir() + "x"));
    EXPECT_NE(generator.error().find("cannot open"), std::string::npos);
}
