#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "capability/capability.hpp"
#include "util/logger.hpp"

namespace asmhom {

inline constexpr const char* kMashImplementationName = "mash";
inline constexpr const char* kMashFileExtension = ".msh";

// Comparison capability driving the external `mash` executable.
class MashProvider : public CapabilityProvider {
public:
    explicit MashProvider(std::string mash_path = "mash",
                          Logger logger = Logger(Logger::kInfo));

    std::string implementation_name() const override { return kMashImplementationName; }
    std::optional<std::string> expected_file_extension() const override {
        return std::string(kMashFileExtension);
    }

    bool instantiate(const std::string& temp_dir,
                     std::unique_ptr<CapabilityInstance>& out,
                     Error& err) const override;

private:
    std::string mash_path_;
    Logger logger_;
};

class MashInstance : public CapabilityInstance {
public:
    MashInstance(std::string mash_path, std::string version,
                 std::string temp_dir, Logger logger);

    ImplementationInfo implementation_info() const override;

    bool load_sketch_database(const std::string& name,
                              const std::string& location,
                              SketchDatabase& out,
                              Error& err) override;

    // Runs one `mash dist` per target concurrently and keeps the `count`
    // nearest records overall.
    bool compute_distances(const SketchDatabase& query,
                           const std::vector<SketchDatabase>& targets,
                           int count,
                           bool strict,
                           DistanceSet& out,
                           Error& err) override;

private:
    std::string mash_path_;
    std::string version_;
    std::string temp_dir_;
    Logger logger_;
};

} // namespace asmhom
