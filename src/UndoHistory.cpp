#include "UndoHistory.hpp"
#include <stdexcept>

void UndoHistory::reset(const PositionIndex& base, int jumps) {
    red_stack.assign(1, base.of(PieceColor::Red));
    blue_stack.assign(1, base.of(PieceColor::Blue));
    jump_stack.assign(1, jumps);
    plies.clear();
}

void UndoHistory::push(const Ply& ply, const PositionIndex& after, int jumps) {
    red_stack.push_back(after.of(PieceColor::Red));
    blue_stack.push_back(after.of(PieceColor::Blue));
    jump_stack.push_back(jumps);
    plies.push_back(ply);
}

UndoHistory::Ply UndoHistory::pop() {
    if (plies.empty()) {
        throw std::logic_error("undo history holds only the base position");
    }
    Ply last = plies.back();
    plies.pop_back();
    red_stack.pop_back();
    blue_stack.pop_back();
    jump_stack.pop_back();
    return last;
}

const std::vector<int>& UndoHistory::top(PieceColor color) const {
    return color == PieceColor::Red ? red_stack.back() : blue_stack.back();
}
