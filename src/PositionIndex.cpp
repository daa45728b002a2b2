#include "PositionIndex.hpp"
#include <algorithm>
#include <stdexcept>

const std::vector<int>& PositionIndex::of(PieceColor color) const {
    switch (color) {
        case PieceColor::Red:  return red;
        case PieceColor::Blue: return blue;
        default: break;
    }
    throw std::invalid_argument("position index only tracks Red and Blue");
}

std::vector<int>& PositionIndex::list_for(PieceColor color) {
    return const_cast<std::vector<int>&>(
        static_cast<const PositionIndex&>(*this).of(color));
}

void PositionIndex::add(PieceColor color, int sq) {
    auto& lst = list_for(color);
    if (std::find(lst.begin(), lst.end(), sq) == lst.end()) {
        lst.push_back(sq);
    }
}

void PositionIndex::remove(PieceColor color, int sq) {
    auto& lst = list_for(color);
    lst.erase(std::remove(lst.begin(), lst.end(), sq), lst.end());
}

bool PositionIndex::contains(PieceColor color, int sq) const {
    const auto& lst = of(color);
    return std::find(lst.begin(), lst.end(), sq) != lst.end();
}

void PositionIndex::clear() {
    red.clear();
    blue.clear();
}
