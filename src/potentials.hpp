#ifndef _POTENTIALS_HPP_
#define _POTENTIALS_HPP_

#include "basis.hpp"

#include <vector>

namespace transportation {

struct Potentials {
    std::vector<double> u;
    std::vector<double> v;
};

/*
 * Solve u[i] + v[j] = cost[i][j] over the basic cells with u[0] = 0.
 *
 * Returns false, leaving the unreached potentials at 0, if some row or
 * column cannot be reached from row 0 through the basis.
 */
bool ComputePotentials(const Basis& basis, const CostMatrix& costs, Potentials& p);

/* u[i] + v[j] - cost[i][j]: positive means entering (i,j) lowers the cost */
inline double Opportunity(const Potentials& p, const CostMatrix& costs, int i, int j) {
    return p.u[i] + p.v[j] - costs[i][j];
}

} // namespace transportation

#endif
