#ifndef POSITION_INDEX_HPP
#define POSITION_INDEX_HPP

#pragma once
#include "PieceColor.hpp"
#include <vector>

// Listas, por cor, dos índices ocupados (pela ordem de inserção).
// Só o Board::set escreve aqui, para que a grelha e as listas nunca divirjam.
class PositionIndex {
public:
    const std::vector<int>& of(PieceColor color) const;

    void add(PieceColor color, int sq);
    void remove(PieceColor color, int sq);
    bool contains(PieceColor color, int sq) const;
    int count(PieceColor color) const { return static_cast<int>(of(color).size()); }

    void clear();

    bool operator==(const PositionIndex& o) const {
        return red == o.red && blue == o.blue;
    }

private:
    std::vector<int> red;
    std::vector<int> blue;

    std::vector<int>& list_for(PieceColor color);
};

#endif // POSITION_INDEX_HPP
