#include "matching/response_assembler.hpp"

#include <algorithm>

namespace asmhom {

SequenceMatches assemble_response(std::vector<Namespace> namespaces,
                                  ImplementationInfo implementation,
                                  std::vector<MatchResult> matches,
                                  std::vector<std::string> warnings) {
    std::sort(warnings.begin(), warnings.end());
    warnings.erase(std::unique(warnings.begin(), warnings.end()), warnings.end());

    SequenceMatches r;
    r.namespaces = std::move(namespaces);
    r.implementation = std::move(implementation);
    r.matches = std::move(matches);
    r.warnings = std::move(warnings);
    return r;
}

} // namespace asmhom
