#include "transportation.hpp"
#include "basis.hpp"
#include "loop-finder.hpp"
#include "potentials.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>
#include <sstream>

#include "tbb/tbb.h"

namespace transportation {

enum class RefineState {
    ComputeDuals,
    SelectEntering,
    FindLoop,
    Reallocate,
    Optimal,
    Failed
};

static const char* stateName(RefineState s) {
    switch (s) {
        case RefineState::ComputeDuals: return "COMPUTE_DUALS";
        case RefineState::SelectEntering: return "SELECT_ENTERING";
        case RefineState::FindLoop: return "FIND_LOOP";
        case RefineState::Reallocate: return "REALLOCATE";
        case RefineState::Optimal: return "OPTIMAL";
        case RefineState::Failed: return "FAILED";
    }
    return "UNKNOWN";
}

static void checkBasis(const CostMatrix& costs, const AllocationList& initial) {
    const int n = costs.shape()[0];
    const int m = costs.shape()[1];
    if (n == 0 || m == 0)
        throw PreconditionError("Cost matrix must have at least one row and one column");
    for (int i = 0; i < n; ++i) {
        for (int j = 0; j < m; ++j) {
            if (!std::isfinite(costs[i][j]) || costs[i][j] < 0) {
                std::ostringstream msg;
                msg << "cost[" << i << "][" << j << "] = " << costs[i][j]
                    << " must be finite and non-negative";
                throw PreconditionError(msg.str());
            }
        }
    }
    if (static_cast<int>(initial.size()) > n + m - 1) {
        std::ostringstream msg;
        msg << "Initial basis has " << initial.size() << " cells, at most "
            << n + m - 1 << " allowed";
        throw PreconditionError(msg.str());
    }
    std::vector<bool> seen(n*m, false);
    for (const auto& a : initial) {
        std::ostringstream msg;
        if (a.row < 0 || a.row >= n || a.col < 0 || a.col >= m) {
            msg << "Allocation (" << a.row << ", " << a.col << ") outside "
                << n << "x" << m << " problem";
            throw PreconditionError(msg.str());
        }
        if (!std::isfinite(a.flow) || a.flow < 0) {
            msg << "Allocation (" << a.row << ", " << a.col << ") has flow " << a.flow;
            throw PreconditionError(msg.str());
        }
        if (seen[a.row*m+a.col]) {
            msg << "Allocation (" << a.row << ", " << a.col << ") given twice";
            throw PreconditionError(msg.str());
        }
        seen[a.row*m+a.col] = true;
    }
}

namespace {

struct Entering {
    double value;
    int idx;
};

}

static Entering scanRange(const Basis& basis, const CostMatrix& costs,
        const Potentials& p, int begin, int end, Entering best) {
    const int m = basis.numCols();
    for (int idx = begin; idx < end; ++idx) {
        const int i = idx / m;
        const int j = idx % m;
        if (basis.contains(i, j))
            continue;
        double value = Opportunity(p, costs, i, j);
        if (value > best.value)
            best = {value, idx};
    }
    return best;
}

/*
 * Non-basic cell with the largest opportunity value above the tolerance,
 * first in row-major order on ties; idx == -1 if there is none.
 */
static Entering selectEntering(const Basis& basis, const CostMatrix& costs,
        const Potentials& p, const TransportParams& params) {
    const int numCells = basis.numRows()*basis.numCols();
    const Entering none {params.optimalityTolerance, -1};
    if (params.parallelThreshold <= 0 || numCells < params.parallelThreshold)
        return scanRange(basis, costs, p, 0, numCells, none);

    return tbb::parallel_reduce(tbb::blocked_range<int>(0, numCells), none,
        [&](const tbb::blocked_range<int>& r, Entering best) {
            return scanRange(basis, costs, p, r.begin(), r.end(), best);
        },
        [](const Entering& left, const Entering& right) {
            if (right.idx == -1)
                return left;
            if (left.idx == -1 || right.value > left.value
                    || (right.value == left.value && right.idx < left.idx))
                return right;
            return left;
        });
}

static double currentCost(const Basis& basis, const CostMatrix& costs) {
    double total = 0;
    for (const auto& c : basis.cells())
        total += costs[c.row][c.col] * c.flow;
    return total;
}

TransportResult Refine(const CostMatrix& costs, const AllocationList& initial,
        const TransportParams& params, const ProgressCallback& pc) {
    checkBasis(costs, initial);

    const int n = costs.shape()[0];
    const int m = costs.shape()[1];
    Basis basis{n, m};
    for (const auto& a : initial)
        basis.insert(a.row, a.col, a.flow);

    TransportResult result;
    result.repairInsertions = RepairDegeneracy(basis);
    if (result.repairInsertions < 0) {
        throw InternalError("Degeneracy repair could not complete the basis: the starting allocation contains a loop",
                basis.allocations(), 0, stateName(RefineState::ComputeDuals));
    }

    const int maxIterations = params.maxIterations > 0 ? params.maxIterations : 10*(n+m);
    auto& stats = result.stats;
    auto elapsed = [](std::chrono::steady_clock::time_point start) {
        return std::chrono::duration<double>{std::chrono::steady_clock::now() - start}.count();
    };

    Potentials p;
    Entering entering {0, -1};
    Loop loop;
    int iter = 0;
    RefineState state = RefineState::ComputeDuals;
    while (state != RefineState::Optimal && state != RefineState::Failed) {
        switch (state) {
            case RefineState::ComputeDuals:
            {
                auto start = std::chrono::steady_clock::now();
                bool connected = ComputePotentials(basis, costs, p);
                stats.dualTime += elapsed(start);
                if (!connected) {
                    throw InternalError("Basis is not connected: potentials cannot be determined",
                            basis.allocations(), iter, stateName(state));
                }
                state = RefineState::SelectEntering;
                break;
            }
            case RefineState::SelectEntering:
            {
                auto start = std::chrono::steady_clock::now();
                entering = selectEntering(basis, costs, p, params);
                stats.scanTime += elapsed(start);
                if (entering.idx == -1) {
                    state = RefineState::Optimal;
                } else if (iter >= maxIterations) {
                    if (params.verbose)
                        std::cout << "MODI: no convergence after " << iter << " iterations\n";
                    result.status = SolveStatus::NotConverged;
                    state = RefineState::Failed;
                } else {
                    state = RefineState::FindLoop;
                }
                break;
            }
            case RefineState::FindLoop:
            {
                auto start = std::chrono::steady_clock::now();
                loop = FindLoop(basis, entering.idx / m, entering.idx % m);
                stats.pivotTime += elapsed(start);
                if (loop.empty()) {
                    std::ostringstream msg;
                    msg << "No stepping-stone loop through entering cell ("
                        << entering.idx / m << ", " << entering.idx % m << ")";
                    throw InternalError(msg.str(), basis.allocations(), iter, stateName(state));
                }
                state = RefineState::Reallocate;
                break;
            }
            case RefineState::Reallocate:
            {
                auto start = std::chrono::steady_clock::now();
                double theta = std::numeric_limits<double>::infinity();
                for (size_t k = 1; k < loop.size(); k += 2)
                    theta = std::min(theta, basis.flow(loop[k].row, loop[k].col));

                basis.insert(loop[0].row, loop[0].col, theta);
                for (size_t k = 1; k < loop.size(); ++k) {
                    const auto& c = loop[k];
                    double f = basis.flow(c.row, c.col);
                    basis.setFlow(c.row, c.col, (k % 2 == 0) ? f + theta : f - theta);
                }
                // Exactly one emptied cell leaves; further ties stay as zero cells
                bool left = false;
                for (size_t k = 1; k < loop.size() && !left; k += 2) {
                    if (basis.flow(loop[k].row, loop[k].col) == 0) {
                        basis.remove(loop[k].row, loop[k].col);
                        left = true;
                    }
                }
                TRANSPORT_ASSERT(left);
                TRANSPORT_ASSERT(basis.size() == basis.requiredSize());
                stats.pivotTime += elapsed(start);

                ++iter;
                if (params.verbose || pc) {
                    double cost = currentCost(basis, costs);
                    if (params.verbose) {
                        std::cout << "MODI Iteration " << iter << "\tentering ("
                            << loop[0].row << ", " << loop[0].col << ")"
                            << "\topportunity " << entering.value
                            << "\ttheta " << theta
                            << "\tcost " << cost << "\n";
                    }
                    if (pc)
                        pc(iter, Allocation{loop[0].row, loop[0].col, theta}, entering.value, theta, cost);
                }
                state = RefineState::ComputeDuals;
                break;
            }
            case RefineState::Optimal:
            case RefineState::Failed:
                break;
        }
    }

    result.iterations = iter;
    result.allocations = basis.allocations();
    result.totalCost = currentCost(basis, costs);
    result.u = std::move(p.u);
    result.v = std::move(p.v);
    return result;
}

} // namespace transportation
