#pragma once

#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <json/json.h>

#include "store/store.hpp"

namespace asmhom {

// Read-only store backed by JSON files under a root directory:
//
//   <root>/namespaces/<any>.json                    one namespace record per file
//   <root>/sequences/<namespace_id>/<load_id>.jsonl one sequence record per line
//
// Everything is loaded by open(); the store is immutable afterwards.
class JsonStore : public Store {
public:
    bool open(const std::string& root, Error& err);

    bool list_namespaces(std::vector<Namespace>& out, Error& err) const override;
    bool get_namespace(const std::string& id, Namespace& out,
                       Error& err) const override;
    bool get_sequence_metadata(const std::string& namespace_id,
                               const std::string& load_id,
                               const std::vector<std::string>& sequence_ids,
                               std::vector<SequenceMetadata>& out,
                               Error& err) const override;

    const std::string& root() const { return root_; }

private:
    using SequenceMap = std::unordered_map<std::string, SequenceMetadata>;

    std::string root_;
    std::map<std::string, Namespace> namespaces_;
    std::map<std::pair<std::string, std::string>, SequenceMap> sequences_;

    bool load_sequences(const Namespace& ns, Error& err);
};

// Parse one stored record. Returns false and sets error_msg on a malformed record.
bool namespace_from_json(const Json::Value& v, Namespace& out, std::string& error_msg);
bool sequence_metadata_from_json(const Json::Value& v, SequenceMetadata& out,
                                 std::string& error_msg);

} // namespace asmhom
