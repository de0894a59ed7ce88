#pragma once

#include <cstdint>
#include <cstdlib>
#include <string>

namespace asmhom {

// Parse a byte count with optional binary suffix (K, M, G).
// "100M" -> 104857600, "512K" -> 524288, "1024" -> 1024.
// Returns false for empty, negative, zero or unparseable values.
inline bool parse_size_string(const std::string& s, uint64_t& out) {
    if (s.empty()) return false;

    char* end = nullptr;
    double val = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || val <= 0) return false;

    uint64_t multiplier = 1;
    if (*end != '\0') {
        switch (*end) {
            case 'K': case 'k': multiplier = uint64_t(1) << 10; break;
            case 'M': case 'm': multiplier = uint64_t(1) << 20; break;
            case 'G': case 'g': multiplier = uint64_t(1) << 30; break;
            default: return false;
        }
        if (*(end + 1) != '\0') return false;
    }
    out = static_cast<uint64_t>(val * static_cast<double>(multiplier));
    return out > 0;
}

} // namespace asmhom
