#ifndef _PROBLEM_TABLE_HPP_
#define _PROBLEM_TABLE_HPP_

#include "transportation.hpp"

#include <vector>

namespace transportation {

/*
 * Working table for building an initial basic feasible solution.
 *
 * The cost matrix is never copied or resized: the table is the set of
 * rows and columns still active, together with their remaining supply and
 * demand, so indices always refer to the original problem.
 */
class ProblemTable {
    public:
        ProblemTable(const CostMatrix& costs, const std::vector<double>& supply,
                const std::vector<double>& demand, double tieTolerance);

        const std::vector<int>& activeRows() const { return _activeRows; }
        const std::vector<int>& activeCols() const { return _activeCols; }

        double cost(int row, int col) const { return _costs[row][col]; }
        double supply(int row) const { return _supply[row]; }
        double demand(int col) const { return _demand[col]; }

        /* Largest amount that can be shipped through (row, col) right now */
        double capacity(int row, int col) const;

        /*
         * Ship min(supply, demand) through (row, col) and eliminate the
         * exhausted row, column, or both on a tie. Once either side runs
         * out the other side is closed as well, its remainder being the
         * imbalance allowed by the balance tolerance.
         */
        Allocation allocate(int row, int col);

        bool finished() const { return _activeRows.empty() && _activeCols.empty(); }
        int numSteps() const { return _numSteps; }

    private:
        const CostMatrix& _costs;
        std::vector<double> _supply;
        std::vector<double> _demand;
        std::vector<int> _activeRows;
        std::vector<int> _activeCols;
        double _tieTolerance;
        int _numSteps = 0;
};

} // namespace transportation

#endif
