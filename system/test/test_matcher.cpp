// ============= test/test_matcher.cpp =============
#include "matching/matcher.hpp"
#include "matching/distance_metric.hpp"
#include "test_common.hpp"

using namespace facematch;

// -----------------------------------------------------
// Metrics
// -----------------------------------------------------
void test_euclidean_metric() {
    EuclideanMetric m;
    CHECK_NEAR(m.distance({1, 0, 0}, {0.95f, 0, 0}), 0.05f, 1e-5f);
    CHECK_NEAR(m.distance({0, 0}, {3, 4}), 5.0f, 1e-5f);
    CHECK(m.distance({1, 2, 3}, {1, 2, 3}) == 0.0f);

    bool threw = false;
    try {
        m.distance({1, 2}, {1, 2, 3});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    CHECK(threw);
}

void test_histogram_metrics() {
    ChiSquareMetric chi;
    std::vector<float> h1 = {0.25f, 0.25f, 0.25f, 0.25f};
    std::vector<float> h2 = {0.5f, 0.5f, 0.0f, 0.0f};

    CHECK(chi.distance(h1, h1) == 0.0f);
    CHECK(chi.distance(h1, h2) > 0.0f);
    // Simetrica (CHISQR_ALT)
    CHECK_NEAR(chi.distance(h1, h2), chi.distance(h2, h1), 1e-5f);

    BhattacharyyaMetric bh;
    CHECK_NEAR(bh.distance(h1, h1), 0.0f, 1e-4f);
    float d = bh.distance(h1, h2);
    CHECK(d > 0.0f && d <= 1.0f);

    CHECK(make_metric(DistanceMetricType::ChiSquare)->type() == DistanceMetricType::ChiSquare);
    CHECK(make_metric(DistanceMetricType::Euclidean)->type() == DistanceMetricType::Euclidean);
}

// -----------------------------------------------------
// Matcher
// -----------------------------------------------------
void test_empty_gallery() {
    LinearScanMatcher matcher;
    auto gallery = Gallery::empty(DescriptorKind::embedding(3));

    auto r = matcher.match(Descriptor(DescriptorType::Embedding, {1, 0, 0}), *gallery, 0.6f);

    CHECK(!r.is_known);
    CHECK(r.confidence == 0.0f);
    CHECK(!r.raw_distance.has_value());
    CHECK(!r.matched_entry_id.has_value());
}

void test_alice_example() {
    LinearScanMatcher matcher;
    auto alice = test::make_entry(1, "Alice", {1, 0, 0});
    alice.attributes["employee_id"] = "E-001";
    auto gallery = Gallery::build({alice}, DescriptorKind::embedding(3), 1);

    auto r = matcher.match(Descriptor(DescriptorType::Embedding, {0.95f, 0, 0}), *gallery, 0.6f);

    CHECK(r.is_known);
    CHECK(r.matched_entry_id && *r.matched_entry_id == 1);
    CHECK(r.matched_label == "Alice");
    CHECK(r.attributes["employee_id"] == "E-001");
    CHECK(r.raw_distance && std::abs(*r.raw_distance - 0.05f) < 1e-5f);
    CHECK(r.confidence >= 90.0f);
}

void test_rejects_above_threshold() {
    LinearScanMatcher matcher;
    auto gallery = Gallery::build({test::make_entry(1, "Alice", {1, 0, 0})},
                                  DescriptorKind::embedding(3), 1);

    auto r = matcher.match(Descriptor(DescriptorType::Embedding, {0, 1, 0}), *gallery, 0.6f);

    CHECK(!r.is_known);
    CHECK(!r.matched_entry_id.has_value());
    CHECK(r.confidence == 0.0f);
    // La distancia minima se reporta igual
    CHECK(r.raw_distance && *r.raw_distance > 0.6f);
}

void test_threshold_is_inclusive() {
    LinearScanMatcher matcher;
    auto gallery = Gallery::build({test::make_entry(1, "Alice", {0, 0})},
                                  DescriptorKind::embedding(2), 1);

    // distancia exacta 0.5
    auto r = matcher.match(Descriptor(DescriptorType::Embedding, {0, 0.5f}), *gallery, 0.5f);
    CHECK(r.is_known);
}

void test_picks_closest() {
    LinearScanMatcher matcher;
    auto gallery = Gallery::build({test::make_entry(1, "Alice", {1, 0, 0}),
                                   test::make_entry(2, "Bob", {0, 1, 0}),
                                   test::make_entry(3, "Carol", {0, 0, 1})},
                                  DescriptorKind::embedding(3), 1);

    auto r = matcher.match(Descriptor(DescriptorType::Embedding, {0.1f, 0.1f, 0.9f}), *gallery, 0.6f);
    CHECK(r.is_known);
    CHECK(r.matched_label == "Carol");
}

void test_tie_breaks_to_lower_id() {
    LinearScanMatcher matcher;
    // Mismo descriptor, ids desordenados
    auto gallery = Gallery::build({test::make_entry(9, "Twin B", {0, 1}),
                                   test::make_entry(4, "Twin A", {0, 1}),
                                   test::make_entry(7, "Twin C", {0, 1})},
                                  DescriptorKind::embedding(2), 1);

    auto r = matcher.match(Descriptor(DescriptorType::Embedding, {0, 0.9f}), *gallery, 0.6f);
    CHECK(r.matched_entry_id && *r.matched_entry_id == 4);
}

void test_deterministic() {
    LinearScanMatcher matcher;
    auto gallery = Gallery::build({test::make_entry(1, "Alice", {1, 0, 0}),
                                   test::make_entry(2, "Bob", {0.9f, 0.1f, 0})},
                                  DescriptorKind::embedding(3), 1);
    Descriptor q(DescriptorType::Embedding, {0.95f, 0.05f, 0});

    auto first = matcher.match(q, *gallery, 0.6f);
    for (int i = 0; i < 20; i++) {
        auto again = matcher.match(q, *gallery, 0.6f);
        CHECK(again.matched_entry_id == first.matched_entry_id);
        CHECK(again.raw_distance == first.raw_distance);
        CHECK(again.confidence == first.confidence);
    }
}

void test_query_kind_mismatch() {
    LinearScanMatcher matcher;
    auto gallery = Gallery::build({test::make_entry(1, "Alice", {1, 0, 0})},
                                  DescriptorKind::embedding(3), 1);

    CHECK_THROWS_CODE(matcher.match(Descriptor(DescriptorType::Embedding, {1, 0}), *gallery, 0.6f),
                      ErrorCode::MixedDescriptorKind);
    CHECK_THROWS_CODE(matcher.match(Descriptor(DescriptorType::Histogram, {1, 0, 0}), *gallery, 0.6f),
                      ErrorCode::MixedDescriptorKind);
}

void test_histogram_gallery() {
    LinearScanMatcher matcher;
    auto kind = DescriptorKind::histogram(4);
    auto gallery = Gallery::build(
        {test::make_entry(1, "Alice", {0.25f, 0.25f, 0.25f, 0.25f}, DescriptorType::Histogram),
         test::make_entry(2, "Bob", {0.7f, 0.1f, 0.1f, 0.1f}, DescriptorType::Histogram)},
        kind, 1);

    auto r = matcher.match(Descriptor(DescriptorType::Histogram, {0.26f, 0.24f, 0.25f, 0.25f}),
                           *gallery, 100.0f);
    CHECK(r.is_known);
    CHECK(r.matched_label == "Alice");
    CHECK(r.confidence > 99.0f && r.confidence <= 100.0f);
}

int main() {
    test::setup();
    spdlog::info("🧪 Matcher tests");

    test::run_case("euclidean metric", test_euclidean_metric);
    test::run_case("histogram metrics", test_histogram_metrics);
    test::run_case("empty gallery -> unknown, no distance", test_empty_gallery);
    test::run_case("Alice [1,0,0] vs [0.95,0,0]", test_alice_example);
    test::run_case("reject above threshold", test_rejects_above_threshold);
    test::run_case("threshold is inclusive", test_threshold_is_inclusive);
    test::run_case("picks closest entry", test_picks_closest);
    test::run_case("tie -> lower entry id", test_tie_breaks_to_lower_id);
    test::run_case("deterministic", test_deterministic);
    test::run_case("query kind mismatch", test_query_kind_mismatch);
    test::run_case("histogram gallery (chi-square)", test_histogram_gallery);

    return test::summary("test_matcher");
}
