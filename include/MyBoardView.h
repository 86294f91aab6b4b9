#pragma once

#include "common/BoardView.h"
#include "Board.h"

namespace naval {

/*
  A concrete BoardView over a live Board. It holds a reference, so every
  query reads the board as it is at that moment. Ship cells that have not
  been shot read as Unresolved, exactly like open water.
*/
class MyBoardView : public common::BoardView {
public:
    explicit MyBoardView(const Board& board)
        : board_(board)
    {}

    int size() const override {
        return board_.getSize();
    }

    common::ObservedCell getStateAt(int row, int col) const override {
        if (!board_.inBounds(row, col)) return common::ObservedCell::OutOfBounds;
        switch (board_.getCell(row, col).state) {
            case CellState::HIT:  return common::ObservedCell::Hit;
            case CellState::MISS: return common::ObservedCell::Miss;
            default:              return common::ObservedCell::Unresolved;
        }
    }

private:
    const Board& board_;
};

} // namespace naval
