#include <catch2/catch.hpp>
#include "memory/similarity_index.hpp"
#include "memory/vector.hpp"
#include <cmath>
#include <limits>

using namespace taleweave;

// ── Cosine similarity ────────────────────────────────────────

TEST_CASE("cosine_similarity: identical vectors", "[index]") {
    Embedding a = {1.0f, 0.0f, 0.0f};
    REQUIRE(std::abs(cosine_similarity(a, a) - 1.0) < 1e-6);
}

TEST_CASE("cosine_similarity: orthogonal and opposite vectors", "[index]") {
    Embedding a = {1.0f, 0.0f, 0.0f};
    Embedding b = {0.0f, 1.0f, 0.0f};
    Embedding c = {-1.0f, 0.0f, 0.0f};
    REQUIRE(std::abs(cosine_similarity(a, b)) < 1e-6);
    REQUIRE(std::abs(cosine_similarity(a, c) + 1.0) < 1e-6);
}

TEST_CASE("cosine_similarity: degenerate inputs return 0", "[index]") {
    REQUIRE(cosine_similarity({}, {}) == 0.0);
    REQUIRE(cosine_similarity({1.0f, 2.0f}, {1.0f, 2.0f, 3.0f}) == 0.0);
    REQUIRE(cosine_similarity({0.0f, 0.0f}, {1.0f, 2.0f}) == 0.0);
}

TEST_CASE("normalized_similarity maps onto [0,1]", "[index]") {
    REQUIRE(normalized_similarity(-1.0) == 0.0);
    REQUIRE(normalized_similarity(0.0) == 0.5);
    REQUIRE(normalized_similarity(1.0) == 1.0);
}

TEST_CASE("embedding_to_blob: blob preserves values", "[index]") {
    Embedding v = {0.25f, -1.5f, 3.0f};
    auto blob = embedding_to_blob(v);
    REQUIRE(blob.size() == 3 * sizeof(float));
    REQUIRE(embedding_from_blob(blob.data(), blob.size()) == v);
    REQUIRE(embedding_from_blob("abc", 3).empty());
    REQUIRE(embedding_from_blob(nullptr, 0).empty());
}

TEST_CASE("representable_as_float: rejects values outside float range", "[index]") {
    REQUIRE(representable_as_float(0.5));
    REQUIRE(representable_as_float(-3.0e38));
    REQUIRE_FALSE(representable_as_float(1e300));
    REQUIRE_FALSE(representable_as_float(-1e39));
    REQUIRE_FALSE(representable_as_float(std::numeric_limits<double>::infinity()));
    REQUIRE_FALSE(representable_as_float(std::numeric_limits<double>::quiet_NaN()));
}

// ── Similarity queries ───────────────────────────────────────

TEST_CASE("SimilarityIndex: query ranks by cosine", "[index]") {
    SimilarityIndex index;
    index.insert("north", {0.0f, 1.0f}, "npc_1", 10);
    index.insert("east", {1.0f, 0.0f}, "npc_1", 20);
    index.insert("northeast", {1.0f, 1.0f}, "npc_1", 30);

    auto results = index.query({0.1f, 1.0f}, "npc_1", 3);
    REQUIRE(results.size() == 3);
    REQUIRE(results[0].id == "north");
    REQUIRE(results[1].id == "northeast");
    REQUIRE(results[2].id == "east");
    REQUIRE(results[0].score >= results[1].score);
}

TEST_CASE("SimilarityIndex: ties go to the most recent record", "[index]") {
    SimilarityIndex index;
    index.insert("old", {1.0f, 0.0f}, "npc_1", 100);
    index.insert("new", {2.0f, 0.0f}, "npc_1", 200);

    auto results = index.query({1.0f, 0.0f}, "npc_1", 2);
    REQUIRE(results.size() == 2);
    REQUIRE(results[0].id == "new");
    REQUIRE(results[1].id == "old");
}

TEST_CASE("SimilarityIndex: k limits the result count", "[index]") {
    SimilarityIndex index;
    for (int i = 0; i < 5; i++) {
        index.insert("m" + std::to_string(i), {1.0f, static_cast<float>(i)}, "npc_1", i);
    }
    REQUIRE(index.query({1.0f, 0.0f}, "npc_1", 2).size() == 2);
    REQUIRE(index.query({1.0f, 0.0f}, "npc_1", 10).size() == 5);
    REQUIRE(index.query({1.0f, 0.0f}, "npc_1", 0).empty());
}

TEST_CASE("SimilarityIndex: owner scoping includes shared records", "[index]") {
    SimilarityIndex index;
    index.insert("mine", {1.0f, 0.0f}, "npc_1", 1);
    index.insert("theirs", {1.0f, 0.0f}, "npc_2", 2);
    index.insert("shared", {1.0f, 0.0f}, kAllAgents, 3);

    auto results = index.query({1.0f, 0.0f}, "npc_1", 10);
    REQUIRE(results.size() == 2);
    for (const auto& r : results) {
        REQUIRE(r.id != "theirs");
    }

    REQUIRE(index.query({1.0f, 0.0f}, "", 10).size() == 3);
}

TEST_CASE("SimilarityIndex: first vector fixes dimensionality", "[index]") {
    SimilarityIndex index;
    REQUIRE(index.dimensions() == 0);
    REQUIRE(index.insert("a", {1.0f, 0.0f, 0.0f}, "npc_1", 1));
    REQUIRE(index.dimensions() == 3);

    // Mismatched vector: registered, but only for the recency path
    REQUIRE_FALSE(index.insert("b", {1.0f, 0.0f}, "npc_1", 2));
    REQUIRE(index.contains("b"));
    REQUIRE_FALSE(index.has_vector("b"));
    REQUIRE(index.vector_count() == 1);

    REQUIRE(index.query({1.0f, 0.0f, 0.0f}, "npc_1", 10).size() == 1);
    REQUIRE(index.query({1.0f, 0.0f}, "npc_1", 10).empty());
    REQUIRE(index.query_recent("npc_1", 10).size() == 2);
}

TEST_CASE("SimilarityIndex: fixed dimensionality rejects other sizes", "[index]") {
    SimilarityIndex index(2);
    REQUIRE_FALSE(index.insert("a", {1.0f, 0.0f, 0.0f}, "npc_1", 1));
    REQUIRE(index.insert("b", {1.0f, 0.0f}, "npc_1", 2));
}

TEST_CASE("SimilarityIndex: set_vector attaches a vector later", "[index]") {
    SimilarityIndex index;
    index.insert("a", {}, "npc_1", 1);
    REQUIRE_FALSE(index.has_vector("a"));
    REQUIRE(index.set_vector("a", {0.5f, 0.5f}));
    REQUIRE(index.has_vector("a"));
    REQUIRE_FALSE(index.set_vector("missing", {0.5f, 0.5f}));
}

TEST_CASE("SimilarityIndex: remove and clear", "[index]") {
    SimilarityIndex index;
    index.insert("a", {1.0f}, "npc_1", 1);
    index.insert("b", {1.0f}, "npc_1", 2);

    REQUIRE(index.remove("a"));
    REQUIRE_FALSE(index.remove("a"));
    REQUIRE(index.size() == 1);
    REQUIRE(index.query({1.0f}, "npc_1", 10).size() == 1);

    index.clear();
    REQUIRE(index.size() == 0);
    REQUIRE(index.query_recent("npc_1", 10).empty());
}

// ── Recency fallback ─────────────────────────────────────────

TEST_CASE("SimilarityIndex: empty query vector orders by recency", "[index]") {
    SimilarityIndex index;
    index.insert("first", {0.0f, 1.0f}, "npc_1", 100);
    index.insert("third", {}, "npc_1", 300);
    index.insert("second", {1.0f, 0.0f}, "npc_1", 200);
    index.insert("other", {1.0f, 0.0f}, "npc_2", 400);

    auto results = index.query({}, "npc_1", 10);
    REQUIRE(results.size() == 3);
    REQUIRE(results[0].id == "third");
    REQUIRE(results[1].id == "second");
    REQUIRE(results[2].id == "first");
    REQUIRE(results[0].score == 0.0);
}

TEST_CASE("SimilarityIndex: recency ties break by id", "[index]") {
    SimilarityIndex index;
    index.insert("b", {}, "npc_1", 100);
    index.insert("a", {}, "npc_1", 100);

    auto results = index.query_recent("npc_1", 10);
    REQUIRE(results.size() == 2);
    REQUIRE(results[0].id == "a");
    REQUIRE(results[1].id == "b");
}
