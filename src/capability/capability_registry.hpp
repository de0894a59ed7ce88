#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "capability/capability.hpp"
#include "core/error.hpp"

namespace asmhom {

// Table of comparison capability providers keyed by lower-cased
// implementation name. Populated at startup, then shared read-only
// (const) with the engine; const members are safe to call concurrently.
class CapabilityRegistry {
public:
    // Fails with kDuplicateImplementation if a provider with the same
    // case-insensitive name is already registered.
    bool add(std::shared_ptr<const CapabilityProvider> provider, Error& err);

    // Returns nullptr and sets kNoSuchImplementation if absent.
    const CapabilityProvider* lookup(const std::string& name, Error& err) const;

    bool contains(const std::string& name) const;

    // Fails as lookup() for unknown names.
    bool expected_file_extension(const std::string& name,
                                 std::optional<std::string>& out,
                                 Error& err) const;

    // Registered names (lower case, sorted).
    std::vector<std::string> names() const;

    size_t size() const { return providers_.size(); }

private:
    std::unordered_map<std::string, std::shared_ptr<const CapabilityProvider>> providers_;
};

// Lower-case ASCII copy of s.
std::string to_lower(const std::string& s);

} // namespace asmhom
