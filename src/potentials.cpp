#include "potentials.hpp"

namespace transportation {

bool ComputePotentials(const Basis& basis, const CostMatrix& costs, Potentials& p) {
    const int n = basis.numRows();
    const int m = basis.numCols();
    p.u.assign(n, 0);
    p.v.assign(m, 0);
    std::vector<bool> knownU(n, false);
    std::vector<bool> knownV(m, false);

    // Nodes 0..n-1 are rows, n..n+m-1 columns
    std::vector<int> stack;
    knownU[0] = true;
    stack.push_back(0);
    int numKnown = 1;
    while (!stack.empty()) {
        int node = stack.back();
        stack.pop_back();
        if (node < n) {
            for (const auto& c : basis.rowCells(node)) {
                if (knownV[c.col])
                    continue;
                p.v[c.col] = costs[c.row][c.col] - p.u[node];
                knownV[c.col] = true;
                ++numKnown;
                stack.push_back(n + c.col);
            }
        } else {
            int col = node - n;
            for (const auto& c : basis.colCells(col)) {
                if (knownU[c.row])
                    continue;
                p.u[c.row] = costs[c.row][c.col] - p.v[col];
                knownU[c.row] = true;
                ++numKnown;
                stack.push_back(c.row);
            }
        }
    }
    return numKnown == n + m;
}

} // namespace transportation
