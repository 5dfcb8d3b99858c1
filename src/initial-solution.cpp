#include "transportation.hpp"
#include "problem-table.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>
#include <sstream>

namespace transportation {

const char* MethodName(InitialMethod method) {
    switch (method) {
        case InitialMethod::Vogel: return "vogel";
        case InitialMethod::Russell: return "russell";
    }
    return "unknown";
}

InitialMethod ParseMethod(const std::string& name) {
    if (name == "vogel" || name == "vam")
        return InitialMethod::Vogel;
    if (name == "russell" || name == "ram")
        return InitialMethod::Russell;
    throw PreconditionError("Unknown initial solution method: " + name);
}

static void checkValues(const std::vector<double>& values, const char* what) {
    for (size_t k = 0; k < values.size(); ++k) {
        if (!std::isfinite(values[k]) || values[k] < 0) {
            std::ostringstream msg;
            msg << what << "[" << k << "] = " << values[k]
                << " must be finite and non-negative";
            throw PreconditionError(msg.str());
        }
    }
}

void ValidateProblem(const CostMatrix& costs, const std::vector<double>& supply,
        const std::vector<double>& demand, const TransportParams& params) {
    const auto n = costs.shape()[0];
    const auto m = costs.shape()[1];
    if (n == 0 || m == 0)
        throw PreconditionError("Cost matrix must have at least one row and one column");
    if (supply.size() != n || demand.size() != m) {
        std::ostringstream msg;
        msg << "Cost matrix is " << n << "x" << m << " but supply has "
            << supply.size() << " and demand " << demand.size() << " entries";
        throw PreconditionError(msg.str());
    }
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < m; ++j) {
            double c = costs[i][j];
            if (!std::isfinite(c) || c < 0) {
                std::ostringstream msg;
                msg << "cost[" << i << "][" << j << "] = " << c
                    << " must be finite and non-negative";
                throw PreconditionError(msg.str());
            }
        }
    }
    checkValues(supply, "supply");
    checkValues(demand, "demand");

    double sumSupply = 0;
    for (auto s : supply)
        sumSupply += s;
    double sumDemand = 0;
    for (auto d : demand)
        sumDemand += d;
    if (std::abs(sumSupply - sumDemand) > params.balanceTolerance) {
        std::ostringstream msg;
        msg << "Unbalanced problem: total supply " << sumSupply
            << " != total demand " << sumDemand;
        throw PreconditionError(msg.str());
    }
}

/*
 * Vogel's penalty: gap between the two cheapest active cells of a line.
 * A line with a single active cell is measured against 0.
 */
static double penalty(double min1, double min2, int count) {
    if (count < 2)
        return std::abs(min1);
    return std::abs(min2 - min1);
}

struct LinePenalty {
    bool isRow;
    int idx;
    double penalty;
};

static std::pair<int, int> vogelSelect(const ProblemTable& table) {
    const auto& rows = table.activeRows();
    const auto& cols = table.activeCols();
    const double inf = std::numeric_limits<double>::infinity();

    std::vector<LinePenalty> penalties;
    penalties.reserve(rows.size() + cols.size());
    for (int i : rows) {
        double min1 = inf, min2 = inf;
        for (int j : cols) {
            double c = table.cost(i, j);
            if (c < min1) {
                min2 = min1;
                min1 = c;
            } else if (c < min2) {
                min2 = c;
            }
        }
        penalties.push_back({true, i, penalty(min1, min2, cols.size())});
    }
    for (int j : cols) {
        double min1 = inf, min2 = inf;
        for (int i : rows) {
            double c = table.cost(i, j);
            if (c < min1) {
                min2 = min1;
                min1 = c;
            } else if (c < min2) {
                min2 = c;
            }
        }
        penalties.push_back({false, j, penalty(min1, min2, rows.size())});
    }

    double maxPenalty = -inf;
    for (const auto& p : penalties)
        maxPenalty = std::max(maxPenalty, p.penalty);

    // Ties in penalty go to the cell that can take the largest allocation
    double maxAlloc = -inf;
    std::pair<int, int> best {rows.front(), cols.front()};
    for (const auto& p : penalties) {
        if (p.penalty != maxPenalty)
            continue;
        const auto& line = p.isRow ? cols : rows;
        double minCost = inf;
        for (int k : line) {
            double c = p.isRow ? table.cost(p.idx, k) : table.cost(k, p.idx);
            minCost = std::min(minCost, c);
        }
        for (int k : line) {
            int i = p.isRow ? p.idx : k;
            int j = p.isRow ? k : p.idx;
            if (table.cost(i, j) != minCost)
                continue;
            double alloc = table.capacity(i, j);
            if (alloc > maxAlloc) {
                maxAlloc = alloc;
                best = {i, j};
            }
        }
    }
    return best;
}

static std::pair<int, int> russellSelect(const ProblemTable& table) {
    const auto& rows = table.activeRows();
    const auto& cols = table.activeCols();
    const double inf = std::numeric_limits<double>::infinity();

    std::vector<double> U(rows.size(), -inf);
    std::vector<double> V(cols.size(), -inf);
    for (size_t a = 0; a < rows.size(); ++a) {
        for (size_t b = 0; b < cols.size(); ++b) {
            double c = table.cost(rows[a], cols[b]);
            U[a] = std::max(U[a], c);
            V[b] = std::max(V[b], c);
        }
    }

    double minDelta = inf;
    std::pair<int, int> best {rows.front(), cols.front()};
    for (size_t a = 0; a < rows.size(); ++a) {
        for (size_t b = 0; b < cols.size(); ++b) {
            double delta = table.cost(rows[a], cols[b]) - (U[a] + V[b]);
            if (delta < minDelta) {
                minDelta = delta;
                best = {rows[a], cols[b]};
            }
        }
    }
    return best;
}

template <typename Select>
static AllocationList buildInitial(const char* name, Select select,
        const CostMatrix& costs, const std::vector<double>& supply,
        const std::vector<double>& demand, const TransportParams& params) {
    ValidateProblem(costs, supply, demand, params);

    ProblemTable table{costs, supply, demand, params.tieTolerance};
    AllocationList result;
    while (!table.finished()) {
        auto cell = select(table);
        auto a = table.allocate(cell.first, cell.second);
        if (params.verbose) {
            std::cout << name << " step " << table.numSteps() << ": ("
                << a.row << ", " << a.col << ") <- " << a.flow << "\n";
        }
        result.push_back(a);
    }
    return result;
}

AllocationList VogelApproximation(const CostMatrix& costs,
        const std::vector<double>& supply, const std::vector<double>& demand,
        const TransportParams& params) {
    return buildInitial("Vogel", vogelSelect, costs, supply, demand, params);
}

AllocationList RussellApproximation(const CostMatrix& costs,
        const std::vector<double>& supply, const std::vector<double>& demand,
        const TransportParams& params) {
    return buildInitial("Russell", russellSelect, costs, supply, demand, params);
}

AllocationList InitialSolution(InitialMethod method, const CostMatrix& costs,
        const std::vector<double>& supply, const std::vector<double>& demand,
        const TransportParams& params) {
    switch (method) {
        case InitialMethod::Vogel:
            return VogelApproximation(costs, supply, demand, params);
        case InitialMethod::Russell:
            return RussellApproximation(costs, supply, demand, params);
    }
    throw PreconditionError("Unknown initial solution method");
}

double TotalCost(const CostMatrix& costs, const AllocationList& allocations) {
    double total = 0;
    for (const auto& a : allocations)
        total += costs[a.row][a.col] * a.flow;
    return total;
}

TransportResult Solve(InitialMethod method, const CostMatrix& costs,
        const std::vector<double>& supply, const std::vector<double>& demand,
        const TransportParams& params, const ProgressCallback& pc) {
    auto startTime = std::chrono::steady_clock::now();
    auto initial = InitialSolution(method, costs, supply, demand, params);
    double constructionTime = std::chrono::duration<double>{
        std::chrono::steady_clock::now() - startTime}.count();

    auto result = Refine(costs, initial, params, pc);
    result.initialCost = TotalCost(costs, initial);
    result.initialAllocations = std::move(initial);
    result.stats.constructionTime = constructionTime;
    return result;
}

} // namespace transportation
