#ifndef MOVE_HPP
#define MOVE_HPP

#pragma once
#include <optional>
#include <string>

/**
 * @struct Move
 * Jogada de Ataxx: passagem ou par (origem, destino) em índices lineares
 * da grelha estendida (ver Board::index).
 *
 * - Distância de Chebyshev 1 -> clone (origem mantém a peça).
 * - Distância de Chebyshev 2 -> salto (a peça muda de casa).
 * - Origem e destino estão sempre dentro da área jogável 7x7; os
 *   construtores estáticos garantem isso.
 */
struct Move {
    int from = -1;
    int to = -1;
    bool is_pass = false;

    static Move pass();
    // Jogada C0R0-C1R1; lança std::invalid_argument se fora de a..g / 1..7.
    static Move move(char c0, char r0, char c1, char r1);
    // Jogada entre dois índices já validados
    static Move between(int from_sq, int to_sq);

    // Interpreta "a7-b6" ou "-". Devolve nullopt se a notação for inválida.
    static std::optional<Move> parse(const std::string& text);

    int distance() const;
    bool is_jump() const { return !is_pass && distance() == 2; }
    bool is_clone() const { return !is_pass && distance() == 1; }

    char col0() const;
    char row0() const;
    char col1() const;
    char row1() const;

    std::string to_string() const;

    bool operator==(const Move& o) const {
        return is_pass == o.is_pass && (is_pass || (from == o.from && to == o.to));
    }
    bool operator!=(const Move& o) const { return !(*this == o); }
};

#endif // MOVE_HPP
