#include "Evaluator.hpp"

int piece_difference(const Board& board, PieceColor for_color) {
    return board.num_pieces(for_color) - board.num_pieces(opposite(for_color));
}

int static_score(const Board& board, PieceColor for_color) {
    int diff = piece_difference(board, for_color);
    if (board.game_over()) {
        if (diff > 0) return INFTY;
        if (diff < 0) return -INFTY;
        return 0;
    }
    return diff;
}
