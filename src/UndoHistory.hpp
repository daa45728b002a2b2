#ifndef UNDO_HISTORY_HPP
#define UNDO_HISTORY_HPP

#pragma once
#include "PieceColor.hpp"
#include "PositionIndex.hpp"
#include <cstddef>
#include <vector>

/**
 * @class UndoHistory
 * Pilhas de estados para desfazer jogadas, uma entrada por ply:
 *  - posições das peças vermelhas e azuis depois do ply;
 *  - contador de saltos depois do ply;
 *  - quem jogou e se foi passagem.
 *
 * A entrada de base (posição inicial) nunca é retirada; undo com apenas a
 * base é ignorado pelo Board.
 * Guardam-se as duas cores em cada ply porque uma captura altera também a
 * lista do adversário.
 */
class UndoHistory {
public:
    struct Ply {
        PieceColor mover = PieceColor::Empty;
        bool was_pass = false;
    };

    // Trunca tudo para uma única entrada de base.
    void reset(const PositionIndex& base, int jumps);
    void push(const Ply& ply, const PositionIndex& after, int jumps);

    // Retira o ply mais recente e devolve quem o jogou.
    Ply pop();

    bool can_undo() const { return !plies.empty(); }
    std::size_t size() const { return plies.size(); }

    const std::vector<int>& top(PieceColor color) const;
    int top_jumps() const { return jump_stack.back(); }

private:
    std::vector<std::vector<int>> red_stack;
    std::vector<std::vector<int>> blue_stack;
    std::vector<int> jump_stack;
    std::vector<Ply> plies;
};

#endif // UNDO_HISTORY_HPP
