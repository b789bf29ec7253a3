#pragma once

#include "keyboard_model.h"
#include "kle_parser.h"
#include "matrix_grouper.h"
#include "net_table.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>

namespace klepcbgen {
namespace test_support {

// Parse a KLE document given as JSON text; fails the test on a parse error.
inline Keyboard parse_layout(const std::string& text) {
    Keyboard keyboard;
    KleParser parser;
    bool ok = parser.parse(nlohmann::json::parse(text), keyboard);
    EXPECT_TRUE(ok) << (parser.errors().empty() ? "" : parser.errors().front());
    return keyboard;
}

inline Keyboard grouped_layout(const std::string& text,
                               ColumnPolicy policy = ColumnPolicy::SEQUENTIAL) {
    Keyboard keyboard = parse_layout(text);
    GroupingOptions opts;
    opts.policy = policy;
    MatrixGrouper grouper(opts);
    EXPECT_TRUE(grouper.group(keyboard)) << grouper.message();
    return keyboard;
}

// Grouped keyboard with every key's nets resolved against nets
inline Keyboard annotated_layout(const std::string& text, NetTable& nets,
                                 ColumnPolicy policy = ColumnPolicy::SEQUENTIAL) {
    Keyboard keyboard = grouped_layout(text, policy);
    nets.define_nets(keyboard);
    nets.annotate_keys(keyboard);
    return keyboard;
}

inline size_t count_occurrences(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        count++;
    }
    return count;
}

} // namespace test_support
} // namespace klepcbgen
