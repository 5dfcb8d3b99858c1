#include <boost/test/unit_test.hpp>

#include "problem-table.hpp"
#include "test-util.hpp"

using namespace transportation;

BOOST_AUTO_TEST_SUITE(ProblemTableTests)

    BOOST_AUTO_TEST_CASE(SupplyExhaustedRemovesRow) {
        auto costs = makeCosts({ {1, 2, 3}, {4, 5, 6} });
        ProblemTable table{costs, {5, 10}, {3, 4, 8}, 1.0e-9};

        auto a = table.allocate(0, 2);
        BOOST_CHECK_EQUAL(a.row, 0);
        BOOST_CHECK_EQUAL(a.col, 2);
        BOOST_CHECK_EQUAL(a.flow, 5.0);
        BOOST_CHECK(table.activeRows() == std::vector<int>({1}));
        BOOST_CHECK(table.activeCols() == std::vector<int>({0, 1, 2}));
        BOOST_CHECK_EQUAL(table.demand(2), 3.0);
        BOOST_CHECK(!table.finished());
    }

    BOOST_AUTO_TEST_CASE(DemandExhaustedRemovesColumn) {
        auto costs = makeCosts({ {1, 2, 3}, {4, 5, 6} });
        ProblemTable table{costs, {5, 10}, {3, 4, 8}, 1.0e-9};

        auto a = table.allocate(1, 1);
        BOOST_CHECK_EQUAL(a.flow, 4.0);
        BOOST_CHECK(table.activeRows() == std::vector<int>({0, 1}));
        BOOST_CHECK(table.activeCols() == std::vector<int>({0, 2}));
        BOOST_CHECK_EQUAL(table.supply(1), 6.0);
        BOOST_CHECK_EQUAL(table.capacity(1, 2), 6.0);
    }

    BOOST_AUTO_TEST_CASE(TieRemovesRowAndColumn) {
        auto costs = makeCosts({ {1, 2}, {3, 4} });
        ProblemTable table{costs, {5, 5}, {5, 5}, 1.0e-9};

        table.allocate(0, 0);
        BOOST_CHECK(table.activeRows() == std::vector<int>({1}));
        BOOST_CHECK(table.activeCols() == std::vector<int>({1}));
        BOOST_CHECK(!table.finished());

        auto a = table.allocate(1, 1);
        BOOST_CHECK_EQUAL(a.flow, 5.0);
        BOOST_CHECK(table.finished());
        BOOST_CHECK_EQUAL(table.numSteps(), 2);
    }

    BOOST_AUTO_TEST_CASE(OriginalIndicesSurviveRemoval) {
        auto costs = makeCosts({ {1, 2, 3}, {4, 5, 6}, {7, 8, 9} });
        ProblemTable table{costs, {2, 2, 2}, {1, 1, 4}, 1.0e-9};

        table.allocate(1, 0);
        table.allocate(1, 1);
        BOOST_CHECK(table.activeRows() == std::vector<int>({0, 2}));
        BOOST_CHECK(table.activeCols() == std::vector<int>({2}));
        BOOST_CHECK_EQUAL(table.cost(2, 2), 9.0);
        BOOST_CHECK_EQUAL(table.demand(2), 4.0);
    }

    BOOST_AUTO_TEST_CASE(ImbalanceWithinToleranceClosesTable) {
        auto costs = makeCosts({ {1}, {2} });
        ProblemTable table{costs, {5, 5.005}, {10}, 1.0e-9};

        table.allocate(0, 0);
        BOOST_CHECK(!table.finished());
        auto a = table.allocate(1, 0);
        BOOST_CHECK_EQUAL(a.flow, 5.0);
        BOOST_CHECK(table.finished());
    }

BOOST_AUTO_TEST_SUITE_END()
