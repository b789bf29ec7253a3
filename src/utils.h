#pragma once

#include <string>

namespace klepcbgen {

// Format a double for KiCad output (6 decimal places, trailing zeros trimmed)
std::string fmt(double val);

// Generate a UUID string (v4-like, deterministic from seed)
std::string generate_uuid_from_seed(const std::string& seed);

// Escape a string for S-expression output
std::string sexp_quote(const std::string& s);

// Turn a raw KLE legend into display text that can be placed between
// double quotes in a KiCad file as-is.
std::string escape_legend(const std::string& raw);

// Width class of the switch footprint to use for a key of the given width
std::string unit_width_to_footprint_width(double unit_width);

// Last path component of a directory or file path ("a/b/" -> "b")
std::string path_basename(const std::string& path);

} // namespace klepcbgen
