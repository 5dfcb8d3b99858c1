#include "sensitivity.hpp"

#include <algorithm>
#include <cmath>

namespace transportation {

static const double minFuzzyPoint = 0.01;

FuzzyCost ShiftedFuzzyCost(double x, double level) {
    const double shift = x*level;
    const double width = 0.4*x;

    FuzzyCost f;
    f.upper.points = {{ x - width/2 + shift, x - width/4 + shift,
        x + width/4 + shift, x + width/2 + shift }};
    f.upper.height = 1.0;
    f.lower.points = {{ x - width/3 + shift, x - width/6 + shift,
        x + width/6 + shift, x + width/3 + shift }};
    f.lower.height = 0.7;

    f.upper.points[0] = std::max(minFuzzyPoint, f.upper.points[0]);
    f.lower.points[0] = std::max(minFuzzyPoint, f.lower.points[0]);
    return f;
}

double Defuzzify(const FuzzyCost& f) {
    double sum = 0;
    for (auto p : f.upper.points)
        sum += p;
    for (auto p : f.lower.points)
        sum += p;
    return sum / 8;
}

CellContribution WorstCell(const CostMatrix& costs, const AllocationList& allocations) {
    CellContribution worst {-1, -1, 0.0};
    double maxContribution = -1;
    for (const auto& a : allocations) {
        double contribution = costs[a.row][a.col] * a.flow;
        if (contribution > maxContribution) {
            maxContribution = contribution;
            worst = {a.row, a.col, contribution};
        }
    }
    return worst;
}

CostMatrix PerturbCost(const CostMatrix& costs, int row, int col, double level) {
    TRANSPORT_ASSERT(row >= 0 && row < static_cast<int>(costs.shape()[0]));
    TRANSPORT_ASSERT(col >= 0 && col < static_cast<int>(costs.shape()[1]));
    CostMatrix perturbed = costs;
    perturbed[row][col] = Defuzzify(ShiftedFuzzyCost(costs[row][col], level));
    return perturbed;
}

SensitivityReport AnalyzeSensitivity(InitialMethod method, const CostMatrix& costs,
        const std::vector<double>& supply, const std::vector<double>& demand,
        const std::vector<double>& levels, const TransportParams& params) {
    auto base = Solve(method, costs, supply, demand, params);

    SensitivityReport report;
    report.method = method;
    report.initialCost = base.initialCost;
    report.optimalCost = base.totalCost;
    report.worst = WorstCell(costs, base.initialAllocations);
    report.averageChange = 0;

    const int row = report.worst.row;
    const int col = report.worst.col;
    for (auto level : levels) {
        auto perturbed = PerturbCost(costs, row, col, level);
        auto r = Solve(method, perturbed, supply, demand, params);
        SensitivityLevel s;
        s.level = level;
        s.originalCost = costs[row][col];
        s.perturbedCost = perturbed[row][col];
        s.optimalCost = r.totalCost;
        s.change = std::abs(r.totalCost - base.totalCost);
        report.levels.push_back(s);
        report.averageChange += s.change;
    }
    if (!report.levels.empty())
        report.averageChange /= report.levels.size();
    return report;
}

} // namespace transportation
