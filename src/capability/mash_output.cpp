#include "capability/mash_output.hpp"

#include <cctype>
#include <cstdlib>
#include <sstream>

namespace asmhom {

static std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
    return s.substr(b, e - b);
}

static std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// Parse the leading unsigned integer of s. Returns false if there is none.
static bool leading_uint(const std::string& s, uint64_t& out) {
    const char* p = s.c_str();
    char* end = nullptr;
    unsigned long long v = std::strtoull(p, &end, 10);
    if (end == p) return false;
    out = v;
    return true;
}

bool parse_mash_info_header(const std::string& text,
                            ParameterSet& params,
                            uint64_t& sketch_count,
                            std::string& error_msg) {
    bool have_k = false;
    bool have_size = false;
    bool have_count = false;
    ParameterSet p;
    uint64_t count = 0;

    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string key = lower(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));
        uint64_t v = 0;

        if (key == "k-mer size" || key == "kmer size") {
            if (!leading_uint(value, v)) break;
            p.kmer_size = static_cast<int>(v);
            have_k = true;
        } else if (key == "target min-hashes per sketch") {
            if (!leading_uint(value, v)) break;
            p.sketch_size = static_cast<uint32_t>(v);
            have_size = true;
        } else if (key == "sketches") {
            if (!leading_uint(value, v)) break;
            count = v;
            have_count = true;
        } else if (key == "hash function (seed)") {
            // "MurmurHash3_x64_128 (42)"
            auto open = value.rfind('(');
            if (open != std::string::npos &&
                leading_uint(value.substr(open + 1), v)) {
                p.hash_seed = v;
            }
        }
    }

    if (!have_k || !have_size || !have_count) {
        error_msg = "mash info output lacks ";
        if (!have_k) error_msg += "k-mer size";
        else if (!have_size) error_msg += "sketch size";
        else error_msg += "sketch count";
        return false;
    }
    params = p;
    sketch_count = count;
    return true;
}

bool parse_mash_dist_output(const std::string& text,
                            const std::string& db_name,
                            std::vector<DistanceRecord>& out,
                            std::string& error_msg) {
    std::istringstream in(text);
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim(line).empty()) continue;

        std::vector<std::string> fields;
        size_t start = 0;
        while (true) {
            auto tab = line.find('\t', start);
            fields.push_back(line.substr(start, tab - start));
            if (tab == std::string::npos) break;
            start = tab + 1;
        }
        if (fields.size() < 3 || fields[0].empty()) {
            error_msg = "malformed mash dist line " + std::to_string(line_no) +
                        ": " + line;
            return false;
        }

        const char* p = fields[2].c_str();
        char* end = nullptr;
        double dist = std::strtod(p, &end);
        if (end == p || *end != '\0') {
            error_msg = "bad distance on mash dist line " +
                        std::to_string(line_no) + ": " + fields[2];
            return false;
        }

        DistanceRecord rec;
        rec.reference_db = db_name;
        rec.sequence_id = fields[0];
        rec.distance = dist;
        out.push_back(std::move(rec));
    }
    return true;
}

std::string parse_mash_version(const std::string& text) {
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        std::string t = trim(line);
        if (t.empty()) continue;
        const std::string marker = "version";
        auto pos = lower(t).find(marker);
        if (pos != std::string::npos) {
            std::string rest = trim(t.substr(pos + marker.size()));
            if (!rest.empty() && std::isdigit(static_cast<unsigned char>(rest[0]))) {
                return rest.substr(0, rest.find_first_of(" \t"));
            }
            continue;
        }
        if (std::isdigit(static_cast<unsigned char>(t[0])) &&
            t.find(' ') == std::string::npos) {
            return t;
        }
    }
    return {};
}

bool mash_stderr_indicates_not_a_sketch(const std::string& stderr_text) {
    return stderr_text.find("does not look like a sketch") != std::string::npos ||
           stderr_text.find("kj::ExceptionImpl") != std::string::npos ||
           stderr_text.find("capnp") != std::string::npos ||
           stderr_text.find("Premature EOF") != std::string::npos;
}

std::vector<std::string> parse_mash_warnings(const std::string& stderr_text) {
    std::vector<std::string> warnings;
    std::istringstream in(stderr_text);
    std::string line;
    const std::string prefix = "WARNING:";
    while (std::getline(in, line)) {
        std::string t = trim(line);
        if (t.compare(0, prefix.size(), prefix) == 0) {
            warnings.push_back(trim(t.substr(prefix.size())));
        }
    }
    return warnings;
}

} // namespace asmhom
