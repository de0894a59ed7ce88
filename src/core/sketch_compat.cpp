#include "core/sketch_compat.hpp"

#include <cstdio>

namespace asmhom {

static std::string fmt_mismatch(const char* what, unsigned long long q,
                                unsigned long long t) {
    char buf[160];
    std::snprintf(buf, sizeof(buf), "%s of query (%llu) and target (%llu) differ",
                  what, q, t);
    return buf;
}

bool check_query_compatibility(const SketchDatabase& target,
                               const SketchDatabase& query,
                               bool strict,
                               std::vector<std::string>& warnings,
                               std::string& reason) {
    const ParameterSet& t = target.params;
    const ParameterSet& q = query.params;

    if (q.kmer_size != t.kmer_size) {
        reason = fmt_mismatch("K-mer sizes", q.kmer_size, t.kmer_size);
        return false;
    }
    if (q.hash_seed && t.hash_seed && *q.hash_seed != *t.hash_seed) {
        reason = fmt_mismatch("Hash seeds", *q.hash_seed, *t.hash_seed);
        return false;
    }
    if (q.sketch_size.has_value() != t.sketch_size.has_value() ||
        q.scaling.has_value() != t.scaling.has_value()) {
        reason = "Query and target sketches use different sizing methods "
                 "(sketch size vs. scaling factor)";
        return false;
    }

    if (q.sketch_size && *q.sketch_size != *t.sketch_size) {
        if (strict) {
            reason = fmt_mismatch("Sketch sizes", *q.sketch_size, *t.sketch_size);
            return false;
        }
        if (*q.sketch_size < *t.sketch_size) {
            char buf[160];
            std::snprintf(buf, sizeof(buf),
                          "Query sketch size %u may not be smaller than the "
                          "target sketch size %u",
                          *q.sketch_size, *t.sketch_size);
            reason = buf;
            return false;
        }
        char buf[160];
        std::snprintf(buf, sizeof(buf),
                      "Query sketch size %u is larger than target sketch size %u",
                      *q.sketch_size, *t.sketch_size);
        warnings.push_back(buf);
    }

    if (q.scaling && *q.scaling != *t.scaling) {
        if (strict) {
            reason = fmt_mismatch("Scaling factors", *q.scaling, *t.scaling);
            return false;
        }
        if (*q.scaling > *t.scaling) {
            char buf[160];
            std::snprintf(buf, sizeof(buf),
                          "Query scaling factor %u may not be larger than the "
                          "target scaling factor %u",
                          *q.scaling, *t.scaling);
            reason = buf;
            return false;
        }
        char buf[160];
        std::snprintf(buf, sizeof(buf),
                      "Query scaling factor %u is smaller than target scaling factor %u",
                      *q.scaling, *t.scaling);
        warnings.push_back(buf);
    }
    return true;
}

std::string describe_parameters(const ParameterSet& params) {
    std::string s = "k=" + std::to_string(params.kmer_size);
    if (params.sketch_size) s += " size=" + std::to_string(*params.sketch_size);
    if (params.scaling) s += " scaling=" + std::to_string(*params.scaling);
    if (params.hash_seed) s += " seed=" + std::to_string(*params.hash_seed);
    return s;
}

} // namespace asmhom
