// ============================================================================
// Board.hpp — Interface do tabuleiro de Ataxx
// ----------------------------------------------------------------------------
// - Grelha 7x7 guardada num array linear 11x11: a área jogável fica rodeada
//   por uma moldura de 2 casas sempre bloqueadas, o que evita testes de
//   limites ao olhar para vizinhos até distância 2.
// - Índice linear: index(c, r) = (r - '1' + 2) * 11 + (c - 'a' + 2).
//   a1 = 24, g1 = 30, a7 = 90, g7 = 96.
// - Duas cores: Red (começa) e Blue. Jogadas de distância 1 clonam,
//   de distância 2 saltam; as peças adversárias adjacentes ao destino
//   passam para a cor de quem jogou.
// - O jogo termina com 25 saltos seguidos, quando uma cor fica sem peças,
//   ou quando nenhuma das cores se pode mexer.
// ============================================================================
#ifndef BOARD_HPP
#define BOARD_HPP

#pragma once
#include "Move.hpp"
#include "PieceColor.hpp"
#include "PositionIndex.hpp"
#include "UndoHistory.hpp"
#include <array>
#include <functional>
#include <string>
#include <utility>
#include <vector>

/**
 * @class Board
 * Representa o estado do tabuleiro e as regras do jogo.
 *
 * Responsabilidades:
 * - Manter a grelha, as listas de posições por cor e a cor a jogar.
 * - Validar e aplicar jogadas (clone/salto, capturas, passagem).
 * - Guardar o histórico para undo exato, ply a ply.
 * - Avisar os listeners registados depois de cada alteração.
 *
 * Uma instância pertence a quem a está a alterar; a AI trabalha sempre
 * sobre um clone().
 */
class Board {

public:
    static constexpr int SIDE = 7;
    // Lado + moldura de 2 casas de cada lado
    static constexpr int EXTENDED_SIDE = SIDE + 4;
    static constexpr int CELLS = EXTENDED_SIDE * EXTENDED_SIDE;
    // Saltos seguidos (sem clones) que terminam o jogo
    static constexpr int JUMP_LIMIT = 25;

    using Listener = std::function<void()>;

    // Tabuleiro novo, já na posição inicial.
    Board();

    // Cópia profunda sem listeners (usada pela AI).
    Board clone() const;

    // Conversões entre notação (coluna, linha) e índice linear.
    // index() não valida: usar só com a..g / 1..7.
    static int index(char col, char row);
    static char col(int sq);
    static char row(int sq);
    static int neighbor(int sq, int dc, int dr);
    // true se sq pertence à área jogável 7x7
    static bool in_bounds(int sq);

    PieceColor get(int sq) const { return grid[sq]; }
    // Lança std::invalid_argument fora de a..g / 1..7.
    PieceColor get(char c, char r) const;

    int num_pieces(PieceColor color) const { return pieces.count(color); }
    const std::vector<int>& positions(PieceColor color) const { return pieces.of(color); }

    // Passagem é sempre legal; restantes jogadas exigem origem da cor a jogar,
    // destino vazio e distância 1 ou 2.
    bool legal_move(const Move& move) const;

    // Casas vazias a distância de Chebyshev <= radius (sem o centro).
    std::vector<int> neighbors_within(int sq, int radius) const;

    // Alguma peça de 'color' tem uma casa vazia a distância <= 2?
    bool can_move(PieceColor color) const;
    bool game_over() const;

    PieceColor whose_move() const { return current_player; }
    int num_jumps() const { return jump_count; }
    // Plies aplicados desde o último clear (inclui passagens).
    int num_moves() const { return static_cast<int>(history.size()); }
    const std::vector<Move>& all_moves() const { return move_log; }

    // Aplica MOVE, assumindo legal_move(move) (e !can_move para passagem).
    void make_move(const Move& move);
    // Jogada C0R0-C1R1, ou passagem se C0 == '-'.
    void make_move(char c0, char r0, char c1, char r1);
    void pass();
    void undo();
    // Repõe a posição inicial, sem blocos e com o histórico truncado.
    void clear();

    bool legal_block(char c, char r) const;
    // Coloca bloco em CR e nos reflexos livres; lança std::invalid_argument
    // se CR não estiver vazia. Como place_piece, o histórico de undo passa a
    // ter esta posição como base.
    void set_block(char c, char r);
    void set_block(const std::string& cr);


    // // Helpers de setup (testes/UI)
    // ------------------------------------------------------------------------
    // Coloca (ou retira, com Empty) uma peça em CR. O histórico de undo
    // passa a ter esta posição como base.
    void place_piece(char c, char r, PieceColor color);
    void set_whose_move(PieceColor color);

    int add_listener(Listener listener);
    void remove_listener(int id);

    // Representação textual (dump). Com legend, inclui linhas e colunas.
    std::string to_string(bool legend = false) const;

    // getter para WASM/JS - grelha 7x7 "flat", linha 7 primeiro
    // (0 vazio, 1 Red, 2 Blue, 3 bloqueado)
    std::vector<int> get_flat_grid() const;

    // Igualdade casa a casa
    bool operator==(const Board& o) const { return grid == o.grid; }
    bool operator!=(const Board& o) const { return !(*this == o); }

private:
    std::array<PieceColor, CELLS> grid;
    PieceColor current_player = PieceColor::Red;
    PositionIndex pieces;
    UndoHistory history;
    int jump_count = 0;
    std::vector<Move> move_log;

    std::vector<std::pair<int, Listener>> listeners;
    int next_listener_id = 0;

    // Único ponto de escrita na grelha; mantém as listas de posições.
    void set(int sq, PieceColor v);
    bool has_empty_within(int sq, int radius) const;
    void notify();
};

#endif // BOARD_HPP
