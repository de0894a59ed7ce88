#pragma once

#include <string>
#include <vector>

#include "core/types.hpp"

namespace asmhom {

// Bundle the parts of a distance search into a response. Warnings are
// sorted and deduplicated; matches keep their order.
SequenceMatches assemble_response(std::vector<Namespace> namespaces,
                                  ImplementationInfo implementation,
                                  std::vector<MatchResult> matches,
                                  std::vector<std::string> warnings);

} // namespace asmhom
