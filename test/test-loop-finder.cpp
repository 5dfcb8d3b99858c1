#include <boost/test/unit_test.hpp>

#include "loop-finder.hpp"
#include "test-util.hpp"

using namespace transportation;

/* Initial Vogel basis of the 3x4 example, in allocation order */
static void vogelBasis(Basis& basis) {
    basis.insert(0, 0, 20);
    basis.insert(0, 1, 20);
    basis.insert(1, 2, 50);
    basis.insert(1, 3, 10);
    basis.insert(2, 3, 40);
    basis.insert(2, 1, 10);
}

static void checkLoop(const Loop& loop, const std::vector<std::pair<int, int>>& expected) {
    BOOST_REQUIRE_EQUAL(loop.size(), expected.size());
    for (size_t k = 0; k < expected.size(); ++k) {
        BOOST_CHECK_EQUAL(loop[k].row, expected[k].first);
        BOOST_CHECK_EQUAL(loop[k].col, expected[k].second);
    }
}

/* Alternating row/column moves, closed, through basic cells only */
static void checkLoopShape(const Basis& basis, const Loop& loop, int row, int col) {
    BOOST_REQUIRE_GE(loop.size(), 4u);
    BOOST_CHECK_EQUAL(loop.size() % 2, 0u);
    BOOST_CHECK_EQUAL((loop.size() - 1) % 2, 1u);
    BOOST_CHECK_EQUAL(loop[0].row, row);
    BOOST_CHECK_EQUAL(loop[0].col, col);
    for (size_t k = 0; k < loop.size(); ++k) {
        const auto& a = loop[k];
        const auto& b = loop[(k + 1) % loop.size()];
        if (k % 2 == 0)
            BOOST_CHECK_EQUAL(a.row, b.row);
        else
            BOOST_CHECK_EQUAL(a.col, b.col);
        if (k > 0)
            BOOST_CHECK(basis.contains(a.row, a.col));
        for (size_t l = 0; l < k; ++l)
            BOOST_CHECK(loop[l].row != a.row || loop[l].col != a.col);
    }
}

BOOST_AUTO_TEST_SUITE(LoopFinderTests)

    BOOST_AUTO_TEST_CASE(FourCellLoops) {
        Basis basis{3, 4};
        vogelBasis(basis);
        checkLoop(FindLoop(basis, 2, 2), { {2, 2}, {2, 3}, {1, 3}, {1, 2} });
        checkLoop(FindLoop(basis, 0, 3), { {0, 3}, {0, 1}, {2, 1}, {2, 3} });
        checkLoop(FindLoop(basis, 1, 1), { {1, 1}, {1, 3}, {2, 3}, {2, 1} });
        checkLoop(FindLoop(basis, 2, 0), { {2, 0}, {2, 1}, {0, 1}, {0, 0} });
    }

    BOOST_AUTO_TEST_CASE(SixCellLoops) {
        Basis basis{3, 4};
        vogelBasis(basis);
        checkLoop(FindLoop(basis, 0, 2), { {0, 2}, {0, 1}, {2, 1}, {2, 3}, {1, 3}, {1, 2} });
        checkLoop(FindLoop(basis, 1, 0), { {1, 0}, {1, 3}, {2, 3}, {2, 1}, {0, 1}, {0, 0} });
    }

    BOOST_AUTO_TEST_CASE(EveryNonBasicCellHasAValidLoop) {
        RandomProblem p{9, 11, 7, 40, 25};
        auto alloc = RussellApproximation(p.costs, p.supply, p.demand, TransportParams{});
        Basis basis{9, 11};
        for (const auto& a : alloc)
            basis.insert(a.row, a.col, a.flow);
        BOOST_REQUIRE_GE(RepairDegeneracy(basis), 0);
        BOOST_REQUIRE_EQUAL(basis.size(), basis.requiredSize());

        for (int i = 0; i < 9; ++i) {
            for (int j = 0; j < 11; ++j) {
                if (basis.contains(i, j))
                    continue;
                auto loop = FindLoop(basis, i, j);
                checkLoopShape(basis, loop, i, j);
                // Search state is restored between calls
                auto again = FindLoop(basis, i, j);
                BOOST_CHECK_EQUAL(again.size(), loop.size());
            }
        }
    }

    BOOST_AUTO_TEST_CASE(NoLoopWhenRowAndColumnAreDisconnected) {
        Basis basis{3, 3};
        basis.insert(0, 0, 1);
        basis.insert(0, 1, 1);
        basis.insert(1, 1, 1);
        BOOST_CHECK(FindLoop(basis, 2, 2).empty());
        BOOST_CHECK(FindLoop(basis, 1, 2).empty());
        BOOST_CHECK(!FindLoop(basis, 1, 0).empty());
    }

    BOOST_AUTO_TEST_CASE(RejectsBasicCell) {
        Basis basis{2, 2};
        basis.insert(0, 0, 1);
        BOOST_CHECK_THROW(FindLoop(basis, 0, 0), TransportAssertion);
    }

BOOST_AUTO_TEST_SUITE_END()
