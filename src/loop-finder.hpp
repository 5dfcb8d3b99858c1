#ifndef _LOOP_FINDER_HPP_
#define _LOOP_FINDER_HPP_

#include "basis.hpp"

#include <vector>

namespace transportation {

struct CellIndex {
    int row;
    int col;
};

using Loop = std::vector<CellIndex>;

/*
 * Find the stepping-stone loop closed by adding the non-basic cell
 * (row, col) to the basis.
 *
 * The loop starts at (row, col), moves along its row, then alternates
 * column and row moves through basic cells until it returns. Positions
 * 0, 2, 4, ... gain flow, positions 1, 3, 5, ... lose it. An empty loop
 * means the cell closes no cycle, i.e. its row and column are not yet
 * connected through the basis.
 */
Loop FindLoop(const Basis& basis, int row, int col);

} // namespace transportation

#endif
