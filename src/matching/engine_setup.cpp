#include "matching/engine_setup.hpp"

#include "capability/capability_registry.hpp"
#include "capability/mash_capability.hpp"
#include "store/json_store.hpp"
#include "util/temp_dir.hpp"

namespace asmhom {

bool parse_engine_options(const CliParser& cli, EngineOptions& opts,
                          std::string& error_msg) {
    opts.store_dir = cli.get_string("-store");
    if (opts.store_dir.empty()) {
        error_msg = "Error: -store is required";
        return false;
    }
    opts.temp_root = cli.get_string("-temp_dir", default_temp_root());
    opts.mash_path = cli.get_string("-mash", "mash");
    return true;
}

std::unique_ptr<MatchEngine> build_engine(const EngineOptions& opts,
                                          const Logger& logger,
                                          Error& err) {
    auto store = std::make_shared<JsonStore>();
    if (!store->open(opts.store_dir, err)) {
        logger.error("Cannot open store %s: %s", opts.store_dir.c_str(),
                     err.message.c_str());
        return nullptr;
    }

    auto registry = std::make_shared<CapabilityRegistry>();
    if (!registry->add(std::make_shared<MashProvider>(opts.mash_path, logger), err)) {
        logger.error("Cannot register capability: %s", err.message.c_str());
        return nullptr;
    }

    std::vector<Namespace> namespaces;
    if (!store->list_namespaces(namespaces, err)) {
        logger.error("Cannot list namespaces: %s", err.message.c_str());
        return nullptr;
    }
    for (const auto& ns : namespaces) {
        if (!registry->contains(ns.sketch_db.implementation)) {
            logger.warn("Namespace %s uses unregistered implementation %s",
                        ns.id.c_str(), ns.sketch_db.implementation.c_str());
        }
    }
    logger.info("Loaded %zu namespace(s) from %s", namespaces.size(),
                opts.store_dir.c_str());

    return std::make_unique<MatchEngine>(store, registry, opts.temp_root, logger);
}

} // namespace asmhom
