#include <catch2/catch.hpp>
#include <algorithm>
#include "lunar_habitat/random/rng.hpp"

using namespace lunar_habitat;
using Catch::Detail::Approx;

TEST_CASE("RNG", "[rng]") {
    SECTION("Reproducibility") {
        RNG rng1(42);
        RNG rng2(42);

        for (int i = 0; i < 100; ++i) {
            REQUIRE(rng1.next() == rng2.next());
        }
    }

    SECTION("Different seeds diverge") {
        RNG rng1(1);
        RNG rng2(2);
        bool differs = false;
        for (int i = 0; i < 10; ++i) {
            if (rng1.next() != rng2.next()) differs = true;
        }
        REQUIRE(differs);
    }

    SECTION("Uniform distribution") {
        RNG rng(123);
        double sum = 0.0;
        int n = 10000;

        for (int i = 0; i < n; ++i) {
            double v = rng.uniform();
            REQUIRE(v >= 0.0);
            REQUIRE(v < 1.0);
            sum += v;
        }

        double mean = sum / n;
        REQUIRE(mean == Approx(0.5).margin(0.05));
    }

    SECTION("Uniform range") {
        RNG rng(9);
        for (int i = 0; i < 1000; ++i) {
            double v = rng.uniform(-0.05, 0.08);
            REQUIRE(v >= -0.05);
            REQUIRE(v < 0.08);
        }
    }

    SECTION("Randint is inclusive") {
        RNG rng(5);
        bool saw_min = false;
        bool saw_max = false;
        for (int i = 0; i < 1000; ++i) {
            int v = rng.randint(-1, 2);
            REQUIRE(v >= -1);
            REQUIRE(v <= 2);
            if (v == -1) saw_min = true;
            if (v == 2) saw_max = true;
        }
        REQUIRE(saw_min);
        REQUIRE(saw_max);
    }

    SECTION("Choice picks distinct indices") {
        RNG rng(42);
        for (int i = 0; i < 100; ++i) {
            auto picked = rng.choice(7, 2);
            REQUIRE(picked.size() == 2);
            REQUIRE(picked[0] != picked[1]);
            REQUIRE(picked[0] >= 0);
            REQUIRE(picked[1] < 7);
        }
    }

    SECTION("Permutation") {
        RNG rng(42);
        auto perm = rng.permutation(10);
        REQUIRE(perm.size() == 10);
        std::sort(perm.begin(), perm.end());
        for (int i = 0; i < 10; ++i) {
            REQUIRE(perm[i] == i);
        }
    }
}
