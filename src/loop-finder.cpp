#include "loop-finder.hpp"

namespace transportation {

typedef Basis::Cell Cell;

namespace {

struct Frame {
    const Cell* cell;
    std::vector<const Cell*> candidates;
    size_t next;
};

}

/*
 * Cells reachable from c by one move along its row (rowMove) or column,
 * in basis insertion order. The start cell closes the loop and is only
 * offered once the path holds at least three cells.
 */
static std::vector<const Cell*> candidates(const Basis& basis, const Cell& start,
        const Cell& c, bool rowMove, size_t pathLength) {
    std::vector<const Cell*> result;
    if (rowMove) {
        for (const auto& b : basis.rowCells(c.row))
            if (&b != &c)
                result.push_back(&b);
    } else {
        for (const auto& b : basis.colCells(c.col))
            if (&b != &c)
                result.push_back(&b);
    }
    bool sharesLine = rowMove ? (start.row == c.row) : (start.col == c.col);
    if (sharesLine && &c != &start && pathLength > 2)
        result.push_back(&start);
    return result;
}

Loop FindLoop(const Basis& basis, int row, int col) {
    const Cell& start = basis.cell(row, col);
    TRANSPORT_ASSERT(!start.inBasis);

    std::vector<Frame> stack;
    start.onPath = true;
    stack.push_back({&start, candidates(basis, start, start, true, 1), 0});

    Loop loop;
    while (!stack.empty()) {
        Frame& f = stack.back();
        if (f.next == f.candidates.size()) {
            f.cell->onPath = false;
            stack.pop_back();
            continue;
        }
        const Cell* next = f.candidates[f.next++];
        if (next == &start) {
            for (const auto& fr : stack)
                loop.push_back({fr.cell->row, fr.cell->col});
            break;
        }
        if (next->onPath)
            continue;

        next->onPath = true;
        bool rowMove = (stack.size() % 2) == 0;
        auto nextCandidates = candidates(basis, start, *next, rowMove, stack.size() + 1);
        stack.push_back({next, std::move(nextCandidates), 0});
    }

    for (const auto& fr : stack)
        fr.cell->onPath = false;
    return loop;
}

} // namespace transportation
