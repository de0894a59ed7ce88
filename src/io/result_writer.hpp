#pragma once

#include <ostream>
#include <string>
#include <vector>

#include <json/json.h>

#include "core/types.hpp"

namespace asmhom {

enum class OutputFormat { kTab, kJson };

// Parse an output format string ("tab", "json").
// Returns true on success. On failure, out is unchanged and error_msg is set.
bool parse_output_format(const std::string& str, OutputFormat& out,
                         std::string& error_msg);

Json::Value namespace_to_json(const Namespace& ns);
Json::Value matches_to_json(const SequenceMatches& matches);

// Pretty-printed JSON followed by a newline.
void write_json(std::ostream& out, const Json::Value& v);

// One line per match, preceded by "# warning:" lines.
void write_matches_tab(std::ostream& out, const SequenceMatches& matches);

void write_namespaces_tab(std::ostream& out, const std::vector<Namespace>& namespaces);

void write_matches(std::ostream& out, const SequenceMatches& matches, OutputFormat fmt);
void write_namespaces(std::ostream& out, const std::vector<Namespace>& namespaces,
                      OutputFormat fmt);

} // namespace asmhom
