#ifndef EVALUATOR_HPP
#define EVALUATOR_HPP

#include "Board.hpp"
#include <limits>

// Magnitude acima de qualquer valor normal; também é o valor de vitória.
constexpr int INFTY = std::numeric_limits<int>::max();

// Avaliação estática da posição do ponto de vista de 'for_color':
// - jogo terminado: +INFTY se tem mais peças, -INFTY se tem menos, 0 empate;
// - caso contrário: diferença de peças.
int static_score(const Board& board, PieceColor for_color);

// Diferença de peças (for_color - adversário)
int piece_difference(const Board& board, PieceColor for_color);

#endif
