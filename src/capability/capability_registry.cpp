#include "capability/capability_registry.hpp"

#include <algorithm>
#include <cctype>

namespace asmhom {

std::string to_lower(const std::string& s) {
    std::string r = s;
    for (auto& c : r) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return r;
}

bool CapabilityRegistry::add(std::shared_ptr<const CapabilityProvider> provider,
                             Error& err) {
    if (!provider) {
        err = make_error(ErrorKind::kInvalidArgument, "Null capability provider");
        return false;
    }
    std::string key = to_lower(provider->implementation_name());
    if (key.empty()) {
        err = make_error(ErrorKind::kInvalidArgument,
                         "Capability provider has an empty implementation name");
        return false;
    }
    if (providers_.count(key) > 0) {
        err = make_error(ErrorKind::kDuplicateImplementation,
                         "Duplicate implementation: " + key);
        err.implementation = key;
        return false;
    }
    providers_.emplace(std::move(key), std::move(provider));
    return true;
}

const CapabilityProvider* CapabilityRegistry::lookup(const std::string& name,
                                                     Error& err) const {
    auto it = providers_.find(to_lower(name));
    if (it == providers_.end()) {
        err = make_error(ErrorKind::kNoSuchImplementation,
                         "Unknown implementation: " + name);
        err.implementation = name;
        return nullptr;
    }
    return it->second.get();
}

bool CapabilityRegistry::contains(const std::string& name) const {
    return providers_.count(to_lower(name)) > 0;
}

bool CapabilityRegistry::expected_file_extension(const std::string& name,
                                                 std::optional<std::string>& out,
                                                 Error& err) const {
    const CapabilityProvider* p = lookup(name, err);
    if (!p) return false;
    out = p->expected_file_extension();
    return true;
}

std::vector<std::string> CapabilityRegistry::names() const {
    std::vector<std::string> r;
    r.reserve(providers_.size());
    for (const auto& [name, provider] : providers_) {
        r.push_back(name);
    }
    std::sort(r.begin(), r.end());
    return r;
}

} // namespace asmhom
