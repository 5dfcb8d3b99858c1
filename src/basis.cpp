#include "basis.hpp"
#include "loop-finder.hpp"

namespace transportation {

Basis::Basis(int numRows, int numCols)
    : _numRows(numRows)
    , _numCols(numCols)
    , _cells(numRows*numCols)
    , _rows(numRows)
    , _cols(numCols)
{
    for (int i = 0; i < _numRows; ++i) {
        for (int j = 0; j < _numCols; ++j) {
            Cell& c = _cell(i, j);
            c.row = i;
            c.col = j;
        }
    }
}

double Basis::flow(int row, int col) const {
    const Cell& c = cell(row, col);
    TRANSPORT_ASSERT(c.inBasis);
    return c.flow;
}

void Basis::insert(int row, int col, double flow) {
    Cell& c = _cell(row, col);
    TRANSPORT_ASSERT(!c.inBasis);
    c.flow = flow;
    c.inBasis = true;
    _rows[row].push_back(c);
    _cols[col].push_back(c);
    _order.push_back(c);
}

void Basis::remove(int row, int col) {
    Cell& c = _cell(row, col);
    TRANSPORT_ASSERT(c.inBasis);
    _rows[row].erase(_rows[row].iterator_to(c));
    _cols[col].erase(_cols[col].iterator_to(c));
    _order.erase(_order.iterator_to(c));
    c.inBasis = false;
    c.flow = 0;
}

void Basis::setFlow(int row, int col, double flow) {
    Cell& c = _cell(row, col);
    TRANSPORT_ASSERT(c.inBasis);
    c.flow = flow;
}

AllocationList Basis::allocations() const {
    AllocationList result;
    result.reserve(_order.size());
    for (const auto& c : _order)
        result.push_back({c.row, c.col, c.flow});
    return result;
}

int RepairDegeneracy(Basis& basis) {
    int inserted = 0;
    for (int i = 0; i < basis.numRows(); ++i) {
        for (int j = 0; j < basis.numCols(); ++j) {
            if (basis.size() >= basis.requiredSize())
                return inserted;
            if (basis.contains(i, j))
                continue;
            if (FindLoop(basis, i, j).empty()) {
                basis.insert(i, j, 0.0);
                ++inserted;
            }
        }
    }
    return basis.size() >= basis.requiredSize() ? inserted : -1;
}

} // namespace transportation
