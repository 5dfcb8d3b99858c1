#include "problem-table.hpp"

#include <algorithm>
#include <cmath>

namespace transportation {

static void removeIndex(std::vector<int>& active, int idx) {
    auto it = std::find(active.begin(), active.end(), idx);
    TRANSPORT_ASSERT(it != active.end());
    active.erase(it);
}

ProblemTable::ProblemTable(const CostMatrix& costs,
        const std::vector<double>& supply, const std::vector<double>& demand,
        double tieTolerance)
    : _costs(costs)
    , _supply(supply)
    , _demand(demand)
    , _tieTolerance(tieTolerance)
{
    TRANSPORT_ASSERT(costs.shape()[0] == supply.size());
    TRANSPORT_ASSERT(costs.shape()[1] == demand.size());
    for (int i = 0; i < static_cast<int>(supply.size()); ++i)
        _activeRows.push_back(i);
    for (int j = 0; j < static_cast<int>(demand.size()); ++j)
        _activeCols.push_back(j);
}

double ProblemTable::capacity(int row, int col) const {
    return std::min(_supply[row], _demand[col]);
}

Allocation ProblemTable::allocate(int row, int col) {
    const double s = _supply[row];
    const double d = _demand[col];
    Allocation a {row, col, std::min(s, d)};

    if (std::abs(s - d) <= _tieTolerance) {
        _supply[row] = 0;
        _demand[col] = 0;
        removeIndex(_activeRows, row);
        removeIndex(_activeCols, col);
    } else if (s < d) {
        _supply[row] = 0;
        _demand[col] -= a.flow;
        removeIndex(_activeRows, row);
    } else {
        _demand[col] = 0;
        _supply[row] -= a.flow;
        removeIndex(_activeCols, col);
    }
    ++_numSteps;

    if (_activeRows.empty())
        _activeCols.clear();
    if (_activeCols.empty())
        _activeRows.clear();
    return a;
}

} // namespace transportation
