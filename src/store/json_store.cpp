#include "store/json_store.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

namespace asmhom {

namespace fs = std::filesystem;

static bool get_string(const Json::Value& v, const char* key, bool required,
                       std::string& out, std::string& error_msg) {
    if (!v.isMember(key)) {
        if (required) {
            error_msg = std::string("missing field '") + key + "'";
            return false;
        }
        return true;
    }
    if (!v[key].isString()) {
        error_msg = std::string("field '") + key + "' must be a string";
        return false;
    }
    out = v[key].asString();
    return true;
}

static bool get_uint(const Json::Value& v, const char* key, bool required,
                     uint64_t& out, bool& present, std::string& error_msg) {
    present = v.isMember(key);
    if (!present) {
        if (required) {
            error_msg = std::string("missing field '") + key + "'";
            return false;
        }
        return true;
    }
    if (!v[key].isUInt64()) {
        error_msg = std::string("field '") + key + "' must be a non-negative integer";
        return false;
    }
    out = v[key].asUInt64();
    return true;
}

static bool get_time(const Json::Value& v, const char* key, int64_t& out,
                     std::string& error_msg) {
    if (!v.isMember(key)) return true;
    if (!v[key].isInt64()) {
        error_msg = std::string("field '") + key + "' must be an integer";
        return false;
    }
    out = v[key].asInt64();
    return true;
}

bool namespace_from_json(const Json::Value& v, Namespace& out, std::string& error_msg) {
    if (!v.isObject()) {
        error_msg = "namespace record must be a JSON object";
        return false;
    }
    Namespace ns;
    if (!get_string(v, "id", true, ns.id, error_msg)) return false;
    if (!is_valid_namespace_id(ns.id)) {
        error_msg = "illegal namespace ID: " + ns.id;
        return false;
    }
    if (!get_string(v, "load_id", true, ns.load_id, error_msg)) return false;
    if (ns.load_id.empty()) {
        error_msg = "empty load_id";
        return false;
    }
    if (!get_string(v, "data_source_id", false, ns.data_source_id, error_msg)) return false;
    if (!get_string(v, "source_database_id", false, ns.source_database_id, error_msg)) {
        return false;
    }
    if (!get_string(v, "description", false, ns.description, error_msg)) return false;
    if (!get_time(v, "modification_time", ns.modification_time, error_msg)) return false;

    if (!v.isMember("sketch_database") || !v["sketch_database"].isObject()) {
        error_msg = "missing object 'sketch_database'";
        return false;
    }
    const Json::Value& s = v["sketch_database"];
    SketchDatabase& db = ns.sketch_db;
    db.name = ns.id;
    if (!get_string(s, "implementation", true, db.implementation, error_msg)) return false;
    if (db.implementation.empty()) {
        error_msg = "empty sketch_database.implementation";
        return false;
    }
    if (!get_string(s, "location", true, db.location, error_msg)) return false;

    uint64_t val = 0;
    bool present = false;
    if (!get_uint(s, "kmer_size", true, val, present, error_msg)) return false;
    if (val == 0 || val > 1024) {
        error_msg = "sketch_database.kmer_size out of range";
        return false;
    }
    db.params.kmer_size = static_cast<int>(val);

    if (!get_uint(s, "sketch_size", false, val, present, error_msg)) return false;
    if (present) {
        if (val == 0 || val > UINT32_MAX) {
            error_msg = "sketch_database.sketch_size out of range";
            return false;
        }
        db.params.sketch_size = static_cast<uint32_t>(val);
    }
    if (!get_uint(s, "scaling", false, val, present, error_msg)) return false;
    if (present) {
        if (val == 0 || val > UINT32_MAX) {
            error_msg = "sketch_database.scaling out of range";
            return false;
        }
        db.params.scaling = static_cast<uint32_t>(val);
    }
    if (db.params.sketch_size.has_value() == db.params.scaling.has_value()) {
        error_msg = "exactly one of sketch_database.sketch_size and "
                    "sketch_database.scaling is required";
        return false;
    }
    if (!get_uint(s, "hash_seed", false, val, present, error_msg)) return false;
    if (present) db.params.hash_seed = val;

    if (!get_uint(s, "sequence_count", true, db.sequence_count, present, error_msg)) {
        return false;
    }

    out = std::move(ns);
    return true;
}

bool sequence_metadata_from_json(const Json::Value& v, SequenceMetadata& out,
                                 std::string& error_msg) {
    if (!v.isObject()) {
        error_msg = "sequence record must be a JSON object";
        return false;
    }
    SequenceMetadata m;
    if (!get_string(v, "id", true, m.id, error_msg)) return false;
    if (m.id.empty()) {
        error_msg = "empty sequence id";
        return false;
    }
    if (!get_string(v, "source_id", true, m.source_id, error_msg)) return false;
    if (v.isMember("scientific_name")) {
        std::string name;
        if (!get_string(v, "scientific_name", true, name, error_msg)) return false;
        m.scientific_name = std::move(name);
    }
    if (v.isMember("related_ids")) {
        const Json::Value& rel = v["related_ids"];
        if (!rel.isObject()) {
            error_msg = "field 'related_ids' must be an object";
            return false;
        }
        for (const auto& key : rel.getMemberNames()) {
            if (!rel[key].isString()) {
                error_msg = "related_ids." + key + " must be a string";
                return false;
            }
            m.related_ids[key] = rel[key].asString();
        }
    }
    if (!get_time(v, "creation_time", m.creation_time, error_msg)) return false;
    out = std::move(m);
    return true;
}

static bool parse_json_file(const std::string& path, Json::Value& root,
                            std::string& error_msg) {
    std::ifstream in(path);
    if (!in.is_open()) {
        error_msg = "cannot open " + path;
        return false;
    }
    Json::CharReaderBuilder builder;
    std::string errs;
    if (!Json::parseFromStream(builder, in, &root, &errs)) {
        error_msg = path + ": " + errs;
        return false;
    }
    return true;
}

bool JsonStore::open(const std::string& root, Error& err) {
    root_ = root;
    namespaces_.clear();
    sequences_.clear();

    std::error_code ec;
    fs::path ns_dir = fs::path(root) / "namespaces";
    if (!fs::is_directory(ns_dir, ec)) {
        err = make_error(ErrorKind::kStorageFailure,
                         "Store has no namespaces directory: " + ns_dir.string());
        return false;
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(ns_dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        err = make_error(ErrorKind::kStorageFailure,
                         "Cannot list " + ns_dir.string() + ": " + ec.message());
        return false;
    }
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        Json::Value v;
        std::string msg;
        Namespace ns;
        if (!parse_json_file(file.string(), v, msg) ||
            !namespace_from_json(v, ns, msg)) {
            err = make_error(ErrorKind::kStorageFailure,
                             "Bad namespace record " + file.string() + ": " + msg);
            return false;
        }
        if (namespaces_.count(ns.id) > 0) {
            err = make_error(ErrorKind::kStorageFailure,
                             "Duplicate namespace " + ns.id + " in " + file.string());
            err.namespace_id = ns.id;
            return false;
        }

        fs::path loc(ns.sketch_db.location);
        if (loc.is_relative()) loc = fs::path(root) / loc;
        if (!fs::is_regular_file(loc, ec)) {
            err = make_error(ErrorKind::kStorageFailure,
                             "Sketch database for namespace " + ns.id +
                             " not found: " + loc.string());
            err.namespace_id = ns.id;
            return false;
        }
        ns.sketch_db.location = loc.string();

        if (!load_sequences(ns, err)) return false;
        std::string id = ns.id;
        namespaces_.emplace(std::move(id), std::move(ns));
    }
    return true;
}

bool JsonStore::load_sequences(const Namespace& ns, Error& err) {
    fs::path path = fs::path(root_) / "sequences" / ns.id / (ns.load_id + ".jsonl");
    std::ifstream in(path);
    if (!in.is_open()) {
        err = make_error(ErrorKind::kStorageFailure,
                         "Cannot open sequence metadata " + path.string());
        err.namespace_id = ns.id;
        return false;
    }

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    SequenceMap& seqs = sequences_[{ns.id, ns.load_id}];
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

        Json::Value v;
        std::string msg;
        SequenceMetadata m;
        bool ok = reader->parse(line.data(), line.data() + line.size(), &v, &msg) &&
                  sequence_metadata_from_json(v, m, msg);
        if (!ok || seqs.count(m.id) > 0) {
            if (ok) msg = "duplicate sequence id " + m.id;
            err = make_error(ErrorKind::kStorageFailure,
                             path.string() + ":" + std::to_string(line_no) + ": " + msg);
            err.namespace_id = ns.id;
            return false;
        }
        std::string id = m.id;
        seqs.emplace(std::move(id), std::move(m));
    }
    return true;
}

bool JsonStore::list_namespaces(std::vector<Namespace>& out, Error& /*err*/) const {
    out.clear();
    out.reserve(namespaces_.size());
    for (const auto& [id, ns] : namespaces_) {
        out.push_back(ns);
    }
    return true;
}

bool JsonStore::get_namespace(const std::string& id, Namespace& out, Error& err) const {
    auto it = namespaces_.find(id);
    if (it == namespaces_.end()) {
        err = make_error(ErrorKind::kNoSuchNamespace, "No such namespace: " + id);
        err.namespace_id = id;
        return false;
    }
    out = it->second;
    return true;
}

bool JsonStore::get_sequence_metadata(const std::string& namespace_id,
                                      const std::string& load_id,
                                      const std::vector<std::string>& sequence_ids,
                                      std::vector<SequenceMetadata>& out,
                                      Error& err) const {
    auto it = sequences_.find({namespace_id, load_id});
    if (it == sequences_.end()) {
        err = make_error(ErrorKind::kNoSuchNamespace,
                         "No such namespace / load: " + namespace_id + " / " + load_id);
        err.namespace_id = namespace_id;
        return false;
    }

    out.clear();
    out.reserve(sequence_ids.size());
    std::vector<std::string> missing;
    for (const auto& id : sequence_ids) {
        auto sit = it->second.find(id);
        if (sit == it->second.end()) {
            missing.push_back(id);
        } else {
            out.push_back(sit->second);
        }
    }
    if (!missing.empty()) {
        std::ostringstream msg;
        msg << "Missing sequence(s) in namespace " << namespace_id
            << " load " << load_id << ":";
        for (size_t i = 0; i < missing.size() && i < 10; i++) msg << ' ' << missing[i];
        if (missing.size() > 10) msg << " ...";
        err = make_error(ErrorKind::kNoSuchSequence, msg.str());
        err.namespace_id = namespace_id;
        return false;
    }
    return true;
}

} // namespace asmhom
