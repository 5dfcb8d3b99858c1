#ifndef _SENSITIVITY_HPP_
#define _SENSITIVITY_HPP_

#include "transportation.hpp"

#include <array>
#include <vector>

namespace transportation {

/* Trapezoid (a, b, c, d) with its height */
struct Trapezoid {
    std::array<double, 4> points;
    double height;
};

/* Interval type-2 fuzzy number: upper and lower membership functions */
struct FuzzyCost {
    Trapezoid upper;
    Trapezoid lower;
};

/*
 * Fuzzy version of cost x shifted right by x*level. The upper trapezoid
 * spans 0.4x, the lower one two thirds of that; the leftmost point of
 * each is kept at or above 0.01.
 */
FuzzyCost ShiftedFuzzyCost(double x, double level);

/* Mean of the eight trapezoid points */
double Defuzzify(const FuzzyCost& f);

struct CellContribution {
    int row;
    int col;
    double contribution;
};

/* Allocated cell with the largest cost*flow, first one on ties */
CellContribution WorstCell(const CostMatrix& costs, const AllocationList& allocations);

/* Copy of costs with (row, col) replaced by its defuzzified shifted cost */
CostMatrix PerturbCost(const CostMatrix& costs, int row, int col, double level);

struct SensitivityLevel {
    double level;
    double originalCost;
    double perturbedCost;
    double optimalCost;
    double change;
};

struct SensitivityReport {
    InitialMethod method;
    double initialCost;
    double optimalCost;
    CellContribution worst;
    std::vector<SensitivityLevel> levels;
    double averageChange;
};

/*
 * One-at-a-time sensitivity of the optimal cost: the costliest cell of the
 * method's initial solution is perturbed at each level and the problem is
 * solved again with the same method.
 */
SensitivityReport AnalyzeSensitivity(InitialMethod method, const CostMatrix& costs,
        const std::vector<double>& supply, const std::vector<double>& demand,
        const std::vector<double>& levels, const TransportParams& params);

} // namespace transportation

#endif
