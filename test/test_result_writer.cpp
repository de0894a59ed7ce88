#include "test_util.hpp"
#include "match_test_fixture.hpp"
#include "io/result_writer.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace asmhom;
using namespace match_fixture;

static SequenceMatches sample_matches() {
    SequenceMatches m;
    m.namespaces.push_back(make_namespace("ns1", "mash", sized_params(21, 1000)));
    m.implementation = ImplementationInfo{"mash", "2.3"};

    MatchResult r1;
    r1.namespace_id = "ns1";
    r1.distance = DistanceRecord{"ns1", "a", 0.125};
    r1.metadata = make_sequence("a");
    m.matches.push_back(r1);

    MatchResult r2;
    r2.namespace_id = "ns1";
    r2.distance = DistanceRecord{"ns1", "b", 0.5};
    r2.metadata = make_sequence("b");
    r2.metadata.scientific_name.reset();
    r2.metadata.related_ids.clear();
    m.matches.push_back(r2);

    m.warnings = {"Namespace ns1: drift"};
    return m;
}

static void test_parse_output_format() {
    std::fprintf(stderr, "-- test_parse_output_format\n");

    OutputFormat fmt = OutputFormat::kTab;
    std::string err;
    CHECK(parse_output_format("json", fmt, err));
    CHECK(fmt == OutputFormat::kJson);
    CHECK(parse_output_format("tab", fmt, err));
    CHECK(fmt == OutputFormat::kTab);
    CHECK(!parse_output_format("xml", fmt, err));
    CHECK(fmt == OutputFormat::kTab);
    CHECK_CONTAINS(err, "xml");
}

static void test_namespace_json() {
    std::fprintf(stderr, "-- test_namespace_json\n");

    Json::Value v = namespace_to_json(make_namespace("ns1", "mash", sized_params(21, 1000), 42));
    CHECK_STR_EQ(v["id"].asString(), "ns1");
    CHECK_STR_EQ(v["impl"].asString(), "mash");
    CHECK_STR_EQ(v["datasource"].asString(), "KBase");
    CHECK_STR_EQ(v["sourcedatabaseid"].asString(), "RefSeq");
    CHECK_EQ(v["lastmod"].asInt64(), 1500000000000LL);
    CHECK_EQ(v["seqcount"].asUInt64(), 42u);
    CHECK_EQ(v["kmersize"].asInt(), 21);
    CHECK_EQ(v["sketchsize"].asUInt(), 1000u);
    CHECK(!v.isMember("scaling"));
}

static void test_matches_json() {
    std::fprintf(stderr, "-- test_matches_json\n");

    Json::Value v = matches_to_json(sample_matches());
    CHECK_STR_EQ(v["impl"].asString(), "mash");
    CHECK_STR_EQ(v["implver"].asString(), "2.3");
    CHECK_EQ(v["namespaces"].size(), 1u);
    CHECK_EQ(v["distances"].size(), 2u);

    const Json::Value& d0 = v["distances"][0];
    CHECK_STR_EQ(d0["namespaceid"].asString(), "ns1");
    CHECK_STR_EQ(d0["sequenceid"].asString(), "a");
    CHECK_STR_EQ(d0["sourceid"].asString(), "src_a");
    CHECK(d0["dist"].asDouble() == 0.125);
    CHECK_STR_EQ(d0["sciname"].asString(), "Genus species a");
    CHECK_STR_EQ(d0["relatedids"]["ncbi"].asString(), "GCF_a");

    const Json::Value& d1 = v["distances"][1];
    CHECK(d1["sciname"].isNull());
    CHECK(d1["relatedids"].isObject());
    CHECK_EQ(d1["relatedids"].size(), 0u);

    CHECK_EQ(v["warnings"].size(), 1u);
    CHECK_STR_EQ(v["warnings"][0].asString(), "Namespace ns1: drift");
}

static void test_write_json_parses_back() {
    std::fprintf(stderr, "-- test_write_json_parses_back\n");

    std::ostringstream out;
    write_matches(out, sample_matches(), OutputFormat::kJson);

    Json::CharReaderBuilder builder;
    Json::Value parsed;
    std::string errs;
    std::istringstream in(out.str());
    CHECK(Json::parseFromStream(builder, in, &parsed, &errs));
    CHECK_EQ(parsed["distances"].size(), 2u);
    CHECK(out.str().back() == '\n');
}

static void test_matches_tab() {
    std::fprintf(stderr, "-- test_matches_tab\n");

    std::ostringstream out;
    write_matches(out, sample_matches(), OutputFormat::kTab);
    CHECK_STR_EQ(out.str(),
        "# impl\tmash\t2.3\n"
        "# warning: Namespace ns1: drift\n"
        "# namespaceid\tsequenceid\tsourceid\tdist\tsciname\n"
        "ns1\ta\tsrc_a\t0.125\tGenus species a\n"
        "ns1\tb\tsrc_b\t0.5\t-\n");
}

static void test_namespaces_output() {
    std::fprintf(stderr, "-- test_namespaces_output\n");

    ParameterSet scaled;
    scaled.kmer_size = 31;
    scaled.scaling = 200;
    std::vector<Namespace> nss = {
        make_namespace("ns1", "mash", sized_params(21, 1000), 7),
        make_namespace("ns2", "mash", scaled, 3),
    };

    std::ostringstream tab;
    write_namespaces(tab, nss, OutputFormat::kTab);
    CHECK_CONTAINS(tab.str(), "ns1\tmash\t21\t1000\t-\t7\tKBase\ttest namespace ns1\n");
    CHECK_CONTAINS(tab.str(), "ns2\tmash\t31\t-\t200\t3\t");

    std::ostringstream json;
    write_namespaces(json, nss, OutputFormat::kJson);
    Json::CharReaderBuilder builder;
    Json::Value parsed;
    std::string errs;
    std::istringstream in(json.str());
    CHECK(Json::parseFromStream(builder, in, &parsed, &errs));
    CHECK(parsed.isArray());
    CHECK_EQ(parsed.size(), 2u);
    CHECK_EQ(parsed[1]["scaling"].asUInt(), 200u);
}

int main() {
    test_parse_output_format();
    test_namespace_json();
    test_matches_json();
    test_write_json_parses_back();
    test_matches_tab();
    test_namespaces_output();

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
