#include <boost/test/unit_test.hpp>

#include "transportation.hpp"
#include "test-util.hpp"

#include <limits>

using namespace transportation;

BOOST_AUTO_TEST_SUITE(InitialSolutionTests)

    BOOST_AUTO_TEST_CASE(Vogel3x4) {
        Problem3x4 p;
        auto alloc = VogelApproximation(p.costs, p.supply, p.demand, TransportParams{});
        checkAllocations(alloc, {
            {0, 0, 20}, {0, 1, 20}, {1, 2, 50}, {1, 3, 10}, {2, 3, 40}, {2, 1, 10}
        });
        BOOST_CHECK_CLOSE(TotalCost(p.costs, alloc), 960.0, 1.0e-9);
        checkFeasible(alloc, p.supply, p.demand);
    }

    BOOST_AUTO_TEST_CASE(Russell3x4) {
        Problem3x4 p;
        auto alloc = RussellApproximation(p.costs, p.supply, p.demand, TransportParams{});
        checkAllocations(alloc, {
            {0, 0, 20}, {0, 1, 20}, {1, 3, 50}, {1, 1, 10}, {2, 2, 50}
        });
        BOOST_CHECK_CLOSE(TotalCost(p.costs, alloc), 930.0, 1.0e-9);
        checkFeasible(alloc, p.supply, p.demand);
    }

    BOOST_AUTO_TEST_CASE(Textbook3x4) {
        auto costs = makeCosts({
            {19, 30, 50, 10},
            {70, 30, 40, 60},
            {40,  8, 70, 20}
        });
        std::vector<double> supply = { 7, 9, 18 };
        std::vector<double> demand = { 5, 8, 7, 14 };

        auto vogel = InitialSolution(InitialMethod::Vogel, costs, supply, demand, TransportParams{});
        checkAllocations(vogel, {
            {2, 1, 8}, {0, 0, 5}, {2, 3, 10}, {0, 3, 2}, {1, 3, 2}, {1, 2, 7}
        });
        BOOST_CHECK_CLOSE(TotalCost(costs, vogel), 779.0, 1.0e-9);

        auto russell = InitialSolution(InitialMethod::Russell, costs, supply, demand, TransportParams{});
        checkAllocations(russell, {
            {2, 3, 14}, {0, 0, 5}, {2, 1, 4}, {0, 1, 2}, {1, 1, 2}, {1, 2, 7}
        });
        BOOST_CHECK_CLOSE(TotalCost(costs, russell), 807.0, 1.0e-9);
    }

    BOOST_AUTO_TEST_CASE(SingleCellLinePenaltyAgainstZero) {
        // Each column has one row, so its penalty is its own cost
        auto costs = makeCosts({ {3, 1, 2} });
        auto alloc = VogelApproximation(costs, {6}, {1, 2, 3}, TransportParams{});
        checkAllocations(alloc, { {0, 0, 1}, {0, 2, 3}, {0, 1, 2} });
    }

    BOOST_AUTO_TEST_CASE(VogelPenaltyTieTakesLargestAllocation) {
        auto costs = makeCosts({ {1, 2}, {2, 1} });
        auto alloc = VogelApproximation(costs, {2, 8}, {3, 7}, TransportParams{});
        checkAllocations(alloc, { {1, 1, 7}, {1, 0, 1}, {0, 0, 2} });
    }

    BOOST_AUTO_TEST_CASE(MinimalDegenerate2x2) {
        auto costs = makeCosts({ {1, 2}, {3, 4} });
        for (auto method : { InitialMethod::Vogel, InitialMethod::Russell }) {
            auto alloc = InitialSolution(method, costs, {5, 5}, {5, 5}, TransportParams{});
            checkAllocations(alloc, { {0, 0, 5}, {1, 1, 5} });
        }
    }

    BOOST_AUTO_TEST_CASE(RejectsBadInput) {
        TransportParams params;
        auto costs = makeCosts({ {1, 2}, {3, 4} });
        BOOST_CHECK_THROW(VogelApproximation(costs, {5, 5}, {5, 6}, params), PreconditionError);
        BOOST_CHECK_THROW(RussellApproximation(costs, {5, 5}, {5, 6}, params), PreconditionError);
        BOOST_CHECK_THROW(VogelApproximation(costs, {5, 5, 0}, {5, 5}, params), PreconditionError);
        BOOST_CHECK_THROW(VogelApproximation(costs, {-5, 15}, {5, 5}, params), PreconditionError);

        auto negative = makeCosts({ {1, -2}, {3, 4} });
        BOOST_CHECK_THROW(VogelApproximation(negative, {5, 5}, {5, 5}, params), PreconditionError);
        auto nan = makeCosts({ {1, std::numeric_limits<double>::quiet_NaN()}, {3, 4} });
        BOOST_CHECK_THROW(RussellApproximation(nan, {5, 5}, {5, 5}, params), PreconditionError);

        CostMatrix empty{boost::extents[0][0]};
        BOOST_CHECK_THROW(VogelApproximation(empty, {}, {}, params), PreconditionError);
    }

    BOOST_AUTO_TEST_CASE(BalanceTolerance) {
        TransportParams params;
        auto costs = makeCosts({ {1, 2}, {3, 4} });
        BOOST_CHECK_NO_THROW(ValidateProblem(costs, {5, 5.005}, {5, 5}, params));
        params.balanceTolerance = 1.0e-4;
        BOOST_CHECK_THROW(ValidateProblem(costs, {5, 5.005}, {5, 5}, params), PreconditionError);
    }

    BOOST_AUTO_TEST_CASE(MethodNames) {
        BOOST_CHECK(ParseMethod("vogel") == InitialMethod::Vogel);
        BOOST_CHECK(ParseMethod("ram") == InitialMethod::Russell);
        BOOST_CHECK_EQUAL(std::string(MethodName(InitialMethod::Russell)), "russell");
        BOOST_CHECK_THROW(ParseMethod("northwest"), PreconditionError);
    }

    BOOST_AUTO_TEST_CASE(RandomInstancesAreFeasible) {
        for (uint32_t seed = 1; seed <= 5; ++seed) {
            RandomProblem p{12, 17, seed, 50, 30};
            for (auto method : { InitialMethod::Vogel, InitialMethod::Russell }) {
                auto alloc = InitialSolution(method, p.costs, p.supply, p.demand, TransportParams{});
                BOOST_CHECK_LE(static_cast<int>(alloc.size()), 12 + 17 - 1);
                checkFeasible(alloc, p.supply, p.demand);
            }
        }
    }

BOOST_AUTO_TEST_SUITE_END()
