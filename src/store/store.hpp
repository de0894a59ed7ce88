#pragma once

#include <string>
#include <vector>

#include "core/error.hpp"
#include "core/types.hpp"

namespace asmhom {

// Read access to namespace and sequence metadata records.
// Implementations must be safe for concurrent const calls.
class Store {
public:
    virtual ~Store() = default;

    // All namespaces, sorted by ID.
    virtual bool list_namespaces(std::vector<Namespace>& out, Error& err) const = 0;

    // Fails with kNoSuchNamespace.
    virtual bool get_namespace(const std::string& id, Namespace& out,
                               Error& err) const = 0;

    // Metadata for `sequence_ids` in the given load of a namespace, in the
    // order requested. Fails with kNoSuchSequence if any ID is absent.
    virtual bool get_sequence_metadata(const std::string& namespace_id,
                                       const std::string& load_id,
                                       const std::vector<std::string>& sequence_ids,
                                       std::vector<SequenceMetadata>& out,
                                       Error& err) const = 0;
};

} // namespace asmhom
