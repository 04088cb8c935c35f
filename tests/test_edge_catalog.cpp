#include <catch2/catch_test_macros.hpp>
#include "roadfleet/core/edge_catalog.hpp"

using namespace roadfleet::core;

TEST_CASE("EdgeCatalog lookups", "[catalog]") {
    EdgeCatalog catalog(3, {
        {0, 0, 1, 120.0, 50.0},
        {1, 1, 2, 0.0, 30.0},
        {7, 2, 0, 80.5, 40.0}
    });

    SECTION("Counts") {
        REQUIRE(catalog.num_nodes() == 3);
        REQUIRE(catalog.num_edges() == 3);
    }

    SECTION("Find known edges") {
        const Edge* edge = catalog.find(7);
        REQUIRE(edge != nullptr);
        REQUIRE(edge->from_node == 2);
        REQUIRE(edge->to_node == 0);
        REQUIRE(edge->length == 80.5);
        REQUIRE(edge->speed_limit == 40.0);
        REQUIRE(catalog.contains(1));
    }

    SECTION("Unknown edges are absent") {
        REQUIRE(catalog.find(2) == nullptr);
        REQUIRE(!catalog.contains(-1));
    }
}

TEST_CASE("EdgeCatalog keeps the last definition of a duplicated id", "[catalog]") {
    EdgeCatalog catalog(2, {
        {0, 0, 1, 10.0, 5.0},
        {0, 1, 0, 20.0, 6.0}
    });

    REQUIRE(catalog.num_edges() == 1);
    REQUIRE(catalog.find(0)->length == 20.0);
}

TEST_CASE("Default catalog is empty", "[catalog]") {
    EdgeCatalog catalog;
    REQUIRE(catalog.num_nodes() == 0);
    REQUIRE(catalog.num_edges() == 0);
    REQUIRE(catalog.find(0) == nullptr);
}
