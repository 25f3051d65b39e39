#include <doctest/doctest.h>
#include <algorithm>
#include <set>
#include <vector>

#include "settlegen/utils/SeededRandom.h"

using settlegen::utils::SeededRandom;

TEST_SUITE("SeededRandom") {
    TEST_CASE("next returns values in [0, 1)") {
        SeededRandom rng(12345);
        for (int i = 0; i < 10000; ++i) {
            double v = rng.next();
            CHECK(v >= 0.0);
            CHECK(v < 1.0);
        }
    }

    TEST_CASE("first draw follows the LCG recurrence") {
        SeededRandom rng(1);
        // (1 * 1103515245 + 12345) & 0x7fffffff
        uint32_t expected = (1103515245u + 12345u) & 0x7fffffffu;
        double v = rng.next();
        CHECK(rng.state() == expected);
        CHECK(v == doctest::Approx(static_cast<double>(expected) / 2147483648.0));
    }

    TEST_CASE("same seed gives the same sequence") {
        SeededRandom a(42);
        SeededRandom b(42);
        for (int i = 0; i < 100; ++i) {
            CHECK(a.next() == b.next());
        }
    }

    TEST_CASE("different seeds diverge") {
        SeededRandom a(1);
        SeededRandom b(2);
        int same = 0;
        for (int i = 0; i < 20; ++i) {
            if (a.next() == b.next()) ++same;
        }
        CHECK(same < 20);
    }

    TEST_CASE("reseed restarts the stream") {
        SeededRandom rng(7);
        std::vector<double> first;
        for (int i = 0; i < 10; ++i) first.push_back(rng.next());

        rng.reseed(7);
        for (int i = 0; i < 10; ++i) {
            CHECK(rng.next() == first[i]);
        }
    }

    TEST_CASE("range stays within bounds") {
        SeededRandom rng(99);
        for (int i = 0; i < 1000; ++i) {
            float v = rng.range(-5.0f, 15.0f);
            CHECK(v >= -5.0f);
            CHECK(v <= 15.0f);
        }
    }

    TEST_CASE("rangeInt is inclusive and covers the range") {
        SeededRandom rng(3);
        std::set<int> seen;
        for (int i = 0; i < 2000; ++i) {
            int v = rng.rangeInt(5, 9);
            CHECK(v >= 5);
            CHECK(v <= 9);
            seen.insert(v);
        }
        CHECK(seen.size() == 5);
    }

    TEST_CASE("rangeInt with an empty range returns min without drawing") {
        SeededRandom rng(11);
        uint32_t before = rng.state();
        CHECK(rng.rangeInt(4, 4) == 4);
        CHECK(rng.rangeInt(6, 2) == 6);
        CHECK(rng.state() == before);
    }

    TEST_CASE("index stays below count") {
        SeededRandom rng(5);
        for (int i = 0; i < 1000; ++i) {
            CHECK(rng.index(7) < 7);
        }
        CHECK(rng.index(0) == 0);
    }

    TEST_CASE("chance honours the extremes") {
        SeededRandom rng(8);
        for (int i = 0; i < 100; ++i) {
            CHECK_FALSE(rng.chance(0.0));
            CHECK(rng.chance(1.0));
        }
    }

    TEST_CASE("shuffle is a deterministic permutation") {
        std::vector<int> a{0, 1, 2, 3, 4, 5, 6, 7, 8, 9};
        std::vector<int> b = a;

        SeededRandom r1(21);
        SeededRandom r2(21);
        r1.shuffle(a);
        r2.shuffle(b);
        CHECK(a == b);

        std::vector<int> sorted = a;
        std::sort(sorted.begin(), sorted.end());
        CHECK(sorted == std::vector<int>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9});
    }
}
