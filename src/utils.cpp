#include "utils.h"
#include <cstdint>
#include <cstdio>
#include <functional>
#include <sstream>
#include <iomanip>

namespace klepcbgen {

std::string fmt(double val) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6) << val;
    std::string s = oss.str();
    // Trim trailing zeros after decimal point
    if (s.find('.') != std::string::npos) {
        size_t last_nonzero = s.find_last_not_of('0');
        if (last_nonzero != std::string::npos && s[last_nonzero] == '.') {
            s.erase(last_nonzero); // remove the dot too
        } else {
            s.erase(last_nonzero + 1);
        }
    }
    // Avoid "-0"
    if (s == "-0") s = "0";
    return s;
}

static std::string format_uuid(uint64_t a, uint64_t b) {
    char buf[40];
    std::snprintf(buf, sizeof(buf),
        "%08x-%04x-%04x-%04x-%012llx",
        (unsigned)(a >> 32),
        (unsigned)((a >> 16) & 0xFFFF),
        (unsigned)(a & 0x0FFF) | 0x4000,  // version 4
        (unsigned)((b >> 48) & 0x3FFF) | 0x8000, // variant
        (unsigned long long)(b & 0xFFFFFFFFFFFFULL));
    return std::string(buf);
}

std::string generate_uuid_from_seed(const std::string& seed) {
    std::hash<std::string> hasher;
    uint64_t h1 = hasher(seed);
    uint64_t h2 = hasher(seed + "_2");
    return format_uuid(h1, h2);
}

std::string sexp_quote(const std::string& s) {
    // If string contains spaces, quotes, or parens, wrap in quotes and escape
    bool needs_quoting = s.empty();
    for (char c : s) {
        if (c == ' ' || c == '(' || c == ')' || c == '"' || c == '\\') {
            needs_quoting = true;
            break;
        }
    }
    if (!needs_quoting) return s;

    std::string result = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\') result += '\\';
        result += c;
    }
    result += '"';
    return result;
}

std::string escape_legend(const std::string& raw) {
    if (raw.empty()) return "Blank";
    if (raw == " ") return "Space";

    std::string out;
    out.reserve(raw.size() + 4);
    for (char c : raw) {
        switch (c) {
            case '\n': out += ',';    break;
            case '\r':                break;
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '~':  out += "~~";   break;
            default:   out += c;
        }
    }
    return out;
}

std::string unit_width_to_footprint_width(double unit_width) {
    if (unit_width < 1.25) return "1.00";
    if (unit_width < 1.5)  return "1.25";
    if (unit_width < 1.75) return "1.50";
    if (unit_width < 2.0)  return "1.75";
    if (unit_width < 2.25) return "2.00";
    if (unit_width < 2.75) return "2.25";
    // Everything up to a spacebar shares the 2.75u footprint
    if (unit_width < 6.25) return "2.75";
    return "6.25";
}

std::string path_basename(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && (p.back() == '/' || p.back() == '\\')) {
        p.pop_back();
    }
    auto slash = p.find_last_of("/\\");
    if (slash == std::string::npos) return p;
    return p.substr(slash + 1);
}

} // namespace klepcbgen
