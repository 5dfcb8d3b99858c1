#ifndef _BASIS_HPP_
#define _BASIS_HPP_

#include "transportation.hpp"

#include <vector>

#include <boost/intrusive/list.hpp>

namespace transportation {

/*
 * Set of basic cells with their flows.
 *
 * Every cell of the n x m problem has a fixed slot in an arena; a basic
 * cell is linked into the list of its row, the list of its column and the
 * list of all basic cells in insertion order. Lists keep insertion order,
 * which is the order all scans and tie-breaks see.
 */
class Basis {
    public:
        typedef boost::intrusive::list_member_hook<
            boost::intrusive::link_mode<boost::intrusive::normal_link>
            > Hook;

        struct Cell {
            int row = 0;
            int col = 0;
            double flow = 0;
            bool inBasis = false;
            mutable bool onPath = false;
            Hook rowHook;
            Hook colHook;
            Hook orderHook;
        };

        typedef boost::intrusive::list<Cell,
                boost::intrusive::member_hook<Cell, Hook, &Cell::rowHook>
                > RowList;
        typedef boost::intrusive::list<Cell,
                boost::intrusive::member_hook<Cell, Hook, &Cell::colHook>
                > ColList;
        typedef boost::intrusive::list<Cell,
                boost::intrusive::member_hook<Cell, Hook, &Cell::orderHook>
                > OrderList;

        Basis(int numRows, int numCols);
        Basis(const Basis&) = delete;
        Basis& operator=(const Basis&) = delete;

        int numRows() const { return _numRows; }
        int numCols() const { return _numCols; }
        int size() const { return static_cast<int>(_order.size()); }
        int requiredSize() const { return _numRows + _numCols - 1; }

        bool contains(int row, int col) const { return cell(row, col).inBasis; }
        double flow(int row, int col) const;

        void insert(int row, int col, double flow);
        void remove(int row, int col);
        void setFlow(int row, int col, double flow);

        const Cell& cell(int row, int col) const { return _cells[row*_numCols+col]; }
        const RowList& rowCells(int row) const { return _rows[row]; }
        const ColList& colCells(int col) const { return _cols[col]; }
        const OrderList& cells() const { return _order; }

        AllocationList allocations() const;

    private:
        Cell& _cell(int row, int col) { return _cells[row*_numCols+col]; }

        int _numRows;
        int _numCols;
        std::vector<Cell> _cells;
        std::vector<RowList> _rows;
        std::vector<ColList> _cols;
        OrderList _order;
};

/*
 * Pad a degenerate basis with zero-flow cells, scanning non-basic cells in
 * row-major order and taking each one that closes no loop, until the basis
 * holds n+m-1 cells. Returns the number of cells inserted, or -1 if the
 * scan ends short of n+m-1 (the basis already contains a loop).
 */
int RepairDegeneracy(Basis& basis);

} // namespace transportation

#endif
