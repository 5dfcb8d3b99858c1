#ifndef _TRANSPORTATION_HPP_
#define _TRANSPORTATION_HPP_

#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#ifdef NDEBUG
#define BOOST_DISABLE_ASSERTS
#endif
#include <boost/multi_array.hpp>


namespace transportation {

class TransportAssertion : public std::logic_error {
    public:
        TransportAssertion(const char* what) : logic_error(what) { }
};

#ifndef NDEBUG_TRANSPORT
#define TRANSPORT_ASSERT_S1(x) #x
#define TRANSPORT_ASSERT_S2(x) TRANSPORT_ASSERT_S1(x)
#define TRANSPORT_ASSERT_LINE TRANSPORT_ASSERT_S2( __LINE__ )
#define TRANSPORT_ASSERT(x) ((void)(!(x) && (throw TransportAssertion( "Assertion Failed: " #x " at " __FILE__ ":" TRANSPORT_ASSERT_LINE), 1)))
#else
#define TRANSPORT_ASSERT(x) ((void)sizeof(x))
#endif

using CostMatrix = boost::multi_array<double, 2>;

/* One basic cell: original row (source) index, original column
 * (destination) index and the flow shipped along it. */
struct Allocation {
    int row;
    int col;
    double flow;
};

using AllocationList = std::vector<Allocation>;

/* Rejected input: bad shapes, negative or non-finite values, unbalanced
 * totals, or a malformed starting basis. */
class PreconditionError : public std::invalid_argument {
    public:
        PreconditionError(const std::string& what) : invalid_argument(what) { }
};

/* The basis stopped being a spanning tree of the row/column graph. Not
 * recoverable by the caller; carries the state at the point of failure. */
class InternalError : public std::logic_error {
    public:
        InternalError(const std::string& what, AllocationList basis,
                int iteration, std::string state)
            : logic_error(what)
            , _basis(std::move(basis))
            , _iteration(iteration)
            , _state(std::move(state))
        { }

        const AllocationList& basis() const { return _basis; }
        int iteration() const { return _iteration; }
        const std::string& state() const { return _state; }

    private:
        AllocationList _basis;
        int _iteration;
        std::string _state;
};

enum class InitialMethod { Vogel, Russell };

const char* MethodName(InitialMethod method);
InitialMethod ParseMethod(const std::string& name);

struct TransportParams {
    double balanceTolerance {1.0e-2};
    double tieTolerance {1.0e-9};
    double optimalityTolerance {1.0e-9};
    int maxIterations {0}; // 0 selects 10*(n+m)
    int parallelThreshold {10000};
    bool verbose {false};
};

enum class SolveStatus { Optimal, NotConverged };

struct TransportStats {
    double constructionTime = 0;
    double dualTime = 0;
    double scanTime = 0;
    double pivotTime = 0;
};

struct TransportResult {
    AllocationList allocations;
    double totalCost = 0;
    SolveStatus status = SolveStatus::Optimal;
    int iterations = 0;
    int repairInsertions = 0;
    std::vector<double> u;
    std::vector<double> v;

    // Only filled in by Solve
    AllocationList initialAllocations;
    double initialCost = 0;

    TransportStats stats;

    bool optimal() const { return status == SolveStatus::Optimal; }
};

using ProgressCallback = std::function<void(int iteration, const Allocation& entering, double opportunity, double theta, double totalCost)>;

/*
 * Check that costs is n x m with n,m > 0, that supply has n and demand m
 * entries, that every value is finite and non-negative, and that the
 * totals agree within params.balanceTolerance. Throws PreconditionError.
 */
void ValidateProblem(const CostMatrix& costs, const std::vector<double>& supply,
        const std::vector<double>& demand, const TransportParams& params);

/*
 * Initial basic feasible solutions. Both consume the problem one row or
 * column at a time and return the allocations in the order they were made.
 * The result may hold fewer than n+m-1 cells when supply and demand tie.
 */
AllocationList VogelApproximation(const CostMatrix& costs,
        const std::vector<double>& supply, const std::vector<double>& demand,
        const TransportParams& params);

AllocationList RussellApproximation(const CostMatrix& costs,
        const std::vector<double>& supply, const std::vector<double>& demand,
        const TransportParams& params);

AllocationList InitialSolution(InitialMethod method, const CostMatrix& costs,
        const std::vector<double>& supply, const std::vector<double>& demand,
        const TransportParams& params);

double TotalCost(const CostMatrix& costs, const AllocationList& allocations);

/*
 * MODI (u-v) refinement of a basic feasible solution to optimality.
 *
 * min \sum_{i,j} c_{i,j} x_{i,j}
 * s.t. \sum_j x_{i,j} = s_i
 *      \sum_i x_{i,j} = d_j
 *      x_{i,j} >= 0
 *
 * The starting basis is padded with zero cells up to n+m-1 if needed.
 * Throws PreconditionError for a malformed starting basis and
 * InternalError if the basis degenerates into a non-tree.
 */
TransportResult Refine(const CostMatrix& costs, const AllocationList& initial,
        const TransportParams& params,
        const ProgressCallback& pc = ProgressCallback{});

TransportResult Solve(InitialMethod method, const CostMatrix& costs,
        const std::vector<double>& supply, const std::vector<double>& demand,
        const TransportParams& params,
        const ProgressCallback& pc = ProgressCallback{});

} // namespace transportation



#endif
