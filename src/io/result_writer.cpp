#include "io/result_writer.hpp"

#include <memory>

namespace asmhom {

bool parse_output_format(const std::string& str, OutputFormat& out,
                         std::string& error_msg) {
    if (str == "tab") {
        out = OutputFormat::kTab;
        return true;
    }
    if (str == "json") {
        out = OutputFormat::kJson;
        return true;
    }
    error_msg = "Error: unknown output format '" + str + "' (expected tab or json)";
    return false;
}

Json::Value namespace_to_json(const Namespace& ns) {
    Json::Value v;
    v["id"] = ns.id;
    v["description"] = ns.description;
    v["datasource"] = ns.data_source_id;
    v["sourcedatabaseid"] = ns.source_database_id;
    v["lastmod"] = static_cast<Json::Int64>(ns.modification_time);
    v["impl"] = ns.sketch_db.implementation;
    v["seqcount"] = static_cast<Json::UInt64>(ns.sketch_db.sequence_count);
    v["kmersize"] = ns.sketch_db.params.kmer_size;
    if (ns.sketch_db.params.sketch_size) {
        v["sketchsize"] = *ns.sketch_db.params.sketch_size;
    }
    if (ns.sketch_db.params.scaling) {
        v["scaling"] = *ns.sketch_db.params.scaling;
    }
    return v;
}

Json::Value matches_to_json(const SequenceMatches& matches) {
    Json::Value v;

    Json::Value ns_arr(Json::arrayValue);
    for (const auto& ns : matches.namespaces) {
        ns_arr.append(namespace_to_json(ns));
    }
    v["namespaces"] = std::move(ns_arr);
    v["impl"] = matches.implementation.name;
    v["implver"] = matches.implementation.version;

    Json::Value dist_arr(Json::arrayValue);
    for (const auto& m : matches.matches) {
        Json::Value d;
        d["namespaceid"] = m.namespace_id;
        d["sequenceid"] = m.metadata.id;
        d["sourceid"] = m.metadata.source_id;
        d["dist"] = m.distance.distance;
        if (m.metadata.scientific_name) {
            d["sciname"] = *m.metadata.scientific_name;
        } else {
            d["sciname"] = Json::Value::null;
        }
        Json::Value rel(Json::objectValue);
        for (const auto& [k, id] : m.metadata.related_ids) {
            rel[k] = id;
        }
        d["relatedids"] = std::move(rel);
        dist_arr.append(std::move(d));
    }
    v["distances"] = std::move(dist_arr);

    Json::Value warn_arr(Json::arrayValue);
    for (const auto& w : matches.warnings) {
        warn_arr.append(w);
    }
    v["warnings"] = std::move(warn_arr);
    return v;
}

void write_json(std::ostream& out, const Json::Value& v) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(v, &out);
    out << '\n';
}

void write_matches_tab(std::ostream& out, const SequenceMatches& matches) {
    out << "# impl\t" << matches.implementation.name
        << '\t' << matches.implementation.version << '\n';
    for (const auto& w : matches.warnings) {
        out << "# warning: " << w << '\n';
    }
    out << "# namespaceid\tsequenceid\tsourceid\tdist\tsciname\n";
    for (const auto& m : matches.matches) {
        out << m.namespace_id << '\t'
            << m.metadata.id << '\t'
            << m.metadata.source_id << '\t'
            << m.distance.distance << '\t'
            << (m.metadata.scientific_name ? *m.metadata.scientific_name : "-") << '\n';
    }
}

void write_namespaces_tab(std::ostream& out, const std::vector<Namespace>& namespaces) {
    out << "# id\timpl\tkmersize\tsketchsize\tscaling\tseqcount\tdatasource\tdescription\n";
    for (const auto& ns : namespaces) {
        const ParameterSet& p = ns.sketch_db.params;
        out << ns.id << '\t'
            << ns.sketch_db.implementation << '\t'
            << p.kmer_size << '\t';
        if (p.sketch_size) out << *p.sketch_size; else out << '-';
        out << '\t';
        if (p.scaling) out << *p.scaling; else out << '-';
        out << '\t'
            << ns.sketch_db.sequence_count << '\t'
            << ns.data_source_id << '\t'
            << ns.description << '\n';
    }
}

void write_matches(std::ostream& out, const SequenceMatches& matches, OutputFormat fmt) {
    if (fmt == OutputFormat::kJson) {
        write_json(out, matches_to_json(matches));
    } else {
        write_matches_tab(out, matches);
    }
}

void write_namespaces(std::ostream& out, const std::vector<Namespace>& namespaces,
                      OutputFormat fmt) {
    if (fmt == OutputFormat::kJson) {
        Json::Value arr(Json::arrayValue);
        for (const auto& ns : namespaces) arr.append(namespace_to_json(ns));
        write_json(out, arr);
    } else {
        write_namespaces_tab(out, namespaces);
    }
}

} // namespace asmhom
