#include "test_util.hpp"
#include "core/sketch_compat.hpp"
#include "core/types.hpp"

#include <string>
#include <vector>

using namespace asmhom;

static SketchDatabase sized(int k, uint32_t size, uint64_t seed = 42) {
    SketchDatabase db;
    db.params.kmer_size = k;
    db.params.sketch_size = size;
    db.params.hash_seed = seed;
    db.sequence_count = 1;
    return db;
}

static SketchDatabase scaled(int k, uint32_t scaling) {
    SketchDatabase db;
    db.params.kmer_size = k;
    db.params.scaling = scaling;
    db.sequence_count = 1;
    return db;
}

static void test_identical_parameters() {
    std::fprintf(stderr, "-- test_identical_parameters\n");

    for (bool strict : {true, false}) {
        std::vector<std::string> warnings;
        std::string reason;
        CHECK(check_query_compatibility(sized(21, 1000), sized(21, 1000), strict,
                                        warnings, reason));
        CHECK(warnings.empty());
        CHECK(reason.empty());
    }
}

static void test_kmer_size_mismatch_is_fatal() {
    std::fprintf(stderr, "-- test_kmer_size_mismatch_is_fatal\n");

    for (bool strict : {true, false}) {
        std::vector<std::string> warnings;
        std::string reason;
        CHECK(!check_query_compatibility(sized(31, 1000), sized(21, 1000), strict,
                                         warnings, reason));
        CHECK_STR_EQ(reason, "K-mer sizes of query (21) and target (31) differ");
        CHECK(warnings.empty());
    }
}

static void test_hash_seed_mismatch() {
    std::fprintf(stderr, "-- test_hash_seed_mismatch\n");

    std::vector<std::string> warnings;
    std::string reason;
    CHECK(!check_query_compatibility(sized(21, 1000, 42), sized(21, 1000, 7), false,
                                     warnings, reason));
    CHECK_CONTAINS(reason, "Hash seeds");

    // A seed known on one side only is not a conflict
    SketchDatabase q = sized(21, 1000);
    q.params.hash_seed.reset();
    reason.clear();
    CHECK(check_query_compatibility(sized(21, 1000), q, true, warnings, reason));
}

static void test_mixed_sizing_methods() {
    std::fprintf(stderr, "-- test_mixed_sizing_methods\n");

    for (bool strict : {true, false}) {
        std::vector<std::string> warnings;
        std::string reason;
        CHECK(!check_query_compatibility(sized(21, 1000), scaled(21, 1000), strict,
                                         warnings, reason));
        CHECK_CONTAINS(reason, "different sizing methods");
    }
}

static void test_sketch_size_strict() {
    std::fprintf(stderr, "-- test_sketch_size_strict\n");

    std::vector<std::string> warnings;
    std::string reason;
    CHECK(!check_query_compatibility(sized(21, 1000), sized(21, 2000), true,
                                     warnings, reason));
    CHECK_STR_EQ(reason, "Sketch sizes of query (2000) and target (1000) differ");
    CHECK(warnings.empty());
}

static void test_sketch_size_lenient() {
    std::fprintf(stderr, "-- test_sketch_size_lenient\n");

    // Larger query: comparable at the target's resolution
    std::vector<std::string> warnings;
    std::string reason;
    CHECK(check_query_compatibility(sized(21, 1000), sized(21, 2000), false,
                                    warnings, reason));
    CHECK_EQ(warnings.size(), 1u);
    CHECK_STR_EQ(warnings[0], "Query sketch size 2000 is larger than target sketch size 1000");

    // Smaller query: not comparable
    warnings.clear();
    CHECK(!check_query_compatibility(sized(21, 1000), sized(21, 500), false,
                                     warnings, reason));
    CHECK_STR_EQ(reason,
                 "Query sketch size 500 may not be smaller than the target sketch size 1000");
    CHECK(warnings.empty());
}

static void test_scaling_rules() {
    std::fprintf(stderr, "-- test_scaling_rules\n");

    std::vector<std::string> warnings;
    std::string reason;
    CHECK(!check_query_compatibility(scaled(21, 1000), scaled(21, 500), true,
                                     warnings, reason));
    CHECK_CONTAINS(reason, "Scaling factors");

    reason.clear();
    CHECK(check_query_compatibility(scaled(21, 1000), scaled(21, 500), false,
                                    warnings, reason));
    CHECK_EQ(warnings.size(), 1u);
    CHECK_STR_EQ(warnings[0],
                 "Query scaling factor 500 is smaller than target scaling factor 1000");

    warnings.clear();
    CHECK(!check_query_compatibility(scaled(21, 1000), scaled(21, 2000), false,
                                     warnings, reason));
    CHECK_CONTAINS(reason, "may not be larger");
    CHECK(warnings.empty());
}

static void test_describe_parameters() {
    std::fprintf(stderr, "-- test_describe_parameters\n");

    CHECK_STR_EQ(describe_parameters(sized(21, 1000, 42).params), "k=21 size=1000 seed=42");
    CHECK_STR_EQ(describe_parameters(scaled(31, 200).params), "k=31 scaling=200");
}

static void test_namespace_id_validation() {
    std::fprintf(stderr, "-- test_namespace_id_validation\n");

    CHECK(is_valid_namespace_id("RefSeq_2023"));
    CHECK(is_valid_namespace_id("a"));
    CHECK(!is_valid_namespace_id(""));
    CHECK(!is_valid_namespace_id("ref-seq"));
    CHECK(!is_valid_namespace_id("a b"));
    CHECK(!is_valid_namespace_id("<query>"));
    CHECK(is_valid_namespace_id(std::string(kMaxNamespaceIdLength, 'x')));
    CHECK(!is_valid_namespace_id(std::string(kMaxNamespaceIdLength + 1, 'x')));
}

static void test_distance_order() {
    std::fprintf(stderr, "-- test_distance_order\n");

    DistanceRecord a{"ns1", "s2", 0.1};
    DistanceRecord b{"ns1", "s1", 0.2};
    DistanceRecord c{"ns2", "s0", 0.1};
    DistanceRecord d{"ns1", "s1", 0.1};

    CHECK(distance_less(a, b));
    CHECK(!distance_less(b, a));
    CHECK(distance_less(a, c));   // tie on distance: namespace decides
    CHECK(distance_less(d, a));   // then sequence ID
    CHECK(!distance_less(a, a));
}

int main() {
    test_identical_parameters();
    test_kmer_size_mismatch_is_fatal();
    test_hash_seed_mismatch();
    test_mixed_sizing_methods();
    test_sketch_size_strict();
    test_sketch_size_lenient();
    test_scaling_rules();
    test_describe_parameters();
    test_namespace_id_validation();
    test_distance_order();

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
