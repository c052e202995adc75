#include <limits>
#include <stdexcept>

#include <catch2/catch.hpp>

#include "tile_timeline/grid_size_resolver.hpp"

using namespace tile_timeline;

TEST_CASE("GridSizeResolver returns the exact root of perfect squares") {
    const GridSizeResolver resolver{};
    for (std::size_t root = 1; root <= 64; ++root) {
        const auto grid_size = resolver.resolve(root * root);
        REQUIRE(grid_size.has_value());
        REQUIRE(grid_size.value() == root);
    }
}

TEST_CASE("GridSizeResolver falls back to a 4x4 grid for irregular counts") {
    const GridSizeResolver resolver{};
    for (const std::size_t tile_count : {2u, 3u, 5u, 10u, 15u, 17u, 99u, 1000u}) {
        REQUIRE(resolver.resolve(tile_count) == std::optional<std::size_t>{4});
    }
}

TEST_CASE("GridSizeResolver honours a configured fallback grid size") {
    const GridSizeResolver resolver{GridSizePolicy{IrregularGridPolicy::Fallback, 3}};
    REQUIRE(resolver.resolve(7) == std::optional<std::size_t>{3});
    REQUIRE(resolver.resolve(25) == std::optional<std::size_t>{5});
}

TEST_CASE("GridSizeResolver refuses irregular counts under the strict policy") {
    const GridSizeResolver resolver{GridSizePolicy{IrregularGridPolicy::Strict, 4}};
    REQUIRE_FALSE(resolver.resolve(10).has_value());
    REQUIRE(resolver.resolve(9) == std::optional<std::size_t>{3});
}

TEST_CASE("GridSizeResolver rejects empty tile sets and zero fallbacks") {
    const GridSizeResolver resolver{};
    REQUIRE_THROWS_AS(resolver.resolve(0), std::invalid_argument);
    REQUIRE_THROWS_AS(GridSizeResolver(GridSizePolicy{IrregularGridPolicy::Fallback, 0}), std::invalid_argument);
}

TEST_CASE("integer_sqrt floors without floating point error") {
    REQUIRE(integer_sqrt(0) == 0);
    REQUIRE(integer_sqrt(1) == 1);
    REQUIRE(integer_sqrt(15) == 3);
    REQUIRE(integer_sqrt(16) == 4);
    REQUIRE(integer_sqrt(4'294'967'295ULL) == 65'535);
    REQUIRE(integer_sqrt(4'294'967'296ULL) == 65'536);
}

TEST_CASE("integer_sqrt stays in range at the top of size_t") {
    const std::size_t largest = std::numeric_limits<std::size_t>::max();
    const std::size_t root = integer_sqrt(largest);
    REQUIRE(root == (std::size_t{1} << (std::numeric_limits<std::size_t>::digits / 2)) - 1);
    REQUIRE(integer_sqrt(largest - 1) == root);

    const GridSizeResolver resolver{};
    REQUIRE(resolver.resolve(largest) == std::optional<std::size_t>{4});
}
