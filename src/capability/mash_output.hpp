#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace asmhom {

// Parse the output of `mash info -H <sketch>`:
//
//   Header:
//     Hash function (seed):          MurmurHash3_x64_128 (42)
//     K-mer size:                    21 (64-bit hashes)
//     Alphabet:                      ACGT (canonical)
//     Target min-hashes per sketch:  1000
//     Sketches:                      1
//
// Returns false and sets error_msg if a required field is missing.
bool parse_mash_info_header(const std::string& text,
                            ParameterSet& params,
                            uint64_t& sketch_count,
                            std::string& error_msg);

// Parse `mash dist <reference> <query>` tab output
// (reference-ID, query-ID, distance, p-value, shared-hashes) into records
// tagged with db_name. Blank lines are skipped.
bool parse_mash_dist_output(const std::string& text,
                            const std::string& db_name,
                            std::vector<DistanceRecord>& out,
                            std::string& error_msg);

// Extract the version from `mash --version` output ("2.3" or
// "Mash version 2.3"). Returns an empty string if none is found.
std::string parse_mash_version(const std::string& text);

// True if mash's stderr indicates the input file is not a readable sketch.
bool mash_stderr_indicates_not_a_sketch(const std::string& stderr_text);

// Collect mash "WARNING" lines from stderr, without the prefix.
std::vector<std::string> parse_mash_warnings(const std::string& stderr_text);

} // namespace asmhom
