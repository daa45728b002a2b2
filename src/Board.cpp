// ============================================================================
// Board.cpp — Implementação do tabuleiro de Ataxx
// ----------------------------------------------------------------------------
// - A grelha é um array linear 11x11 de PieceColor; as 2 linhas/colunas
//   exteriores são sempre Blocked.
// - current_player = cor a jogar (Red no início).
// - 'pieces' guarda, por cor, os índices ocupados pela ordem de inserção.
//   A AI percorre as peças por esta ordem.
// - Cada ply aplicado empilha um estado no 'history'; undo() repinta a
//   grelha a partir do topo anterior.
// ============================================================================

#include "Board.hpp"
#include <cassert>
#include <sstream>
#include <stdexcept>

namespace {
    bool on_board(char c, char r) {
        return c >= 'a' && c <= 'g' && r >= '1' && r <= '7';
    }
}

Board::Board() {
    grid.fill(PieceColor::Blocked);
    clear();
}

Board Board::clone() const {
    Board copy(*this);
    copy.listeners.clear();
    return copy;
}

// ============================================================================
// GEOMETRIA
// ============================================================================

int Board::index(char col, char row) {
    return (row - '1' + 2) * EXTENDED_SIDE + (col - 'a' + 2);
}

char Board::col(int sq) {
    return static_cast<char>(sq % EXTENDED_SIDE - 2 + 'a');
}

char Board::row(int sq) {
    return static_cast<char>(sq / EXTENDED_SIDE - 2 + '1');
}

int Board::neighbor(int sq, int dc, int dr) {
    return sq + dc + dr * EXTENDED_SIDE;
}

PieceColor Board::get(char c, char r) const {
    if (!on_board(c, r)) {
        throw std::invalid_argument("square outside the board");
    }
    return grid[index(c, r)];
}

bool Board::in_bounds(int sq) {
    if (sq < 0 || sq >= CELLS) return false;
    return on_board(col(sq), row(sq));
}

// ============================================================================
// REGRAS DE MOVIMENTO E TRANSIÇÕES DE ESTADO
// ============================================================================

void Board::set(int sq, PieceColor v) {
    PieceColor old = grid[sq];
    if (old == v) return;
    if (is_piece(old)) pieces.remove(old, sq);
    grid[sq] = v;
    if (is_piece(v)) pieces.add(v, sq);
}

bool Board::legal_move(const Move& move) const {
    if (move.is_pass) return true;
    if (!in_bounds(move.from) || !in_bounds(move.to)) return false;
    if (grid[move.from] != current_player) return false;
    if (grid[move.to] != PieceColor::Empty) return false;
    int d = move.distance();
    return d == 1 || d == 2;
}

std::vector<int> Board::neighbors_within(int sq, int radius) const {
    // A moldura tem 2 casas, por isso radius <= 2 nunca sai do array.
    std::vector<int> empty;
    for (int dc = -radius; dc <= radius; ++dc) {
        for (int dr = -radius; dr <= radius; ++dr) {
            if (dc == 0 && dr == 0) continue;
            int n = neighbor(sq, dc, dr);
            if (grid[n] == PieceColor::Empty) empty.push_back(n);
        }
    }
    return empty;
}

bool Board::has_empty_within(int sq, int radius) const {
    for (int dc = -radius; dc <= radius; ++dc) {
        for (int dr = -radius; dr <= radius; ++dr) {
            if (dc == 0 && dr == 0) continue;
            if (grid[neighbor(sq, dc, dr)] == PieceColor::Empty) return true;
        }
    }
    return false;
}

bool Board::can_move(PieceColor color) const {
    if (!is_piece(color)) return false;
    for (int sq : pieces.of(color)) {
        if (has_empty_within(sq, 2)) return true;
    }
    return false;
}

bool Board::game_over() const {
    // O jogo termina se:
    // 1) houve JUMP_LIMIT saltos seguidos, ou
    // 2) uma das cores ficou sem peças, ou
    // 3) nenhuma das cores se pode mexer.
    if (jump_count >= JUMP_LIMIT) return true;
    if (num_pieces(PieceColor::Red) == 0 || num_pieces(PieceColor::Blue) == 0) return true;
    return !can_move(PieceColor::Red) && !can_move(PieceColor::Blue);
}

void Board::make_move(const Move& move) {
    const PieceColor mover = current_player;

    if (move.is_pass) {
        assert(!can_move(mover) && "pass while a move is available");
        history.push({mover, true}, pieces, jump_count);
        current_player = opposite(mover);
        notify();
        return;
    }

    assert(legal_move(move) && "make_move called with an illegal move");
    move_log.push_back(move);

    if (move.is_jump()) {
        set(move.from, PieceColor::Empty);
        jump_count++;
    } else {
        jump_count = 0;
    }
    set(move.to, mover);

    // Captura: todas as peças adversárias adjacentes ao destino mudam de cor
    const PieceColor opp = opposite(mover);
    for (int dc = -1; dc <= 1; ++dc) {
        for (int dr = -1; dr <= 1; ++dr) {
            if (dc == 0 && dr == 0) continue;
            int n = neighbor(move.to, dc, dr);
            if (grid[n] == opp) set(n, mover);
        }
    }

    history.push({mover, false}, pieces, jump_count);
    current_player = opp;
    notify();
}

void Board::make_move(char c0, char r0, char c1, char r1) {
    if (c0 == '-') {
        make_move(Move::pass());
    } else {
        make_move(Move::move(c0, r0, c1, r1));
    }
}

void Board::pass() {
    make_move(Move::pass());
}

void Board::undo() {
    if (!history.can_undo()) return;

    UndoHistory::Ply undone = history.pop();

    // Esvazia as casas ocupadas (os blocos ficam) e repinta a partir do topo.
    for (PieceColor c : {PieceColor::Red, PieceColor::Blue}) {
        const std::vector<int> occupied = pieces.of(c);
        for (int sq : occupied) set(sq, PieceColor::Empty);
    }
    for (PieceColor c : {PieceColor::Red, PieceColor::Blue}) {
        for (int sq : history.top(c)) set(sq, c);
    }

    jump_count = history.top_jumps();
    current_player = undone.mover;
    if (!undone.was_pass && !move_log.empty()) {
        move_log.pop_back();
    }
    notify();
}

void Board::clear() {
    // set() retira as peças das listas; os blocos passam a vazio
    for (char c = 'a'; c <= 'g'; ++c) {
        for (char r = '1'; r <= '7'; ++r) {
            set(index(c, r), PieceColor::Empty);
        }
    }

    current_player = PieceColor::Red;
    jump_count = 0;
    move_log.clear();

    set(index('a', '7'), PieceColor::Red);
    set(index('g', '1'), PieceColor::Red);
    set(index('a', '1'), PieceColor::Blue);
    set(index('g', '7'), PieceColor::Blue);

    history.reset(pieces, jump_count);
    notify();
}

// ============================================================================
// BLOCOS E HELPERS DE SETUP
// ============================================================================

bool Board::legal_block(char c, char r) const {
    return on_board(c, r) && grid[index(c, r)] == PieceColor::Empty;
}

void Board::set_block(char c, char r) {
    if (!legal_block(c, r)) {
        throw std::invalid_argument("illegal block placement");
    }

    const int sq = index(c, r);
    const bool corner = sq == index('a', '1') || sq == index('g', '1') ||
                        sq == index('a', '7') || sq == index('g', '7');
    if (!corner) {
        const char mirror_c = static_cast<char>('a' + 'g' - c);
        const char mirror_r = static_cast<char>('1' + '7' - r);
        const std::pair<char, char> targets[4] = {
            {c, r}, {mirror_c, r}, {c, mirror_r}, {mirror_c, mirror_r}
        };
        for (const auto& t : targets) {
            if (legal_block(t.first, t.second)) {
                set(index(t.first, t.second), PieceColor::Blocked);
            }
        }
        // os snapshots só têm peças: a posição com o bloco passa a ser a base
        move_log.clear();
        history.reset(pieces, jump_count);
    }
    notify();
}

void Board::set_block(const std::string& cr) {
    if (cr.size() != 2) {
        throw std::invalid_argument("illegal block placement");
    }
    set_block(cr[0], cr[1]);
}

void Board::place_piece(char c, char r, PieceColor color) {
    if (!on_board(c, r) || color == PieceColor::Blocked) {
        throw std::invalid_argument("illegal piece placement");
    }
    set(index(c, r), color);
    move_log.clear();
    history.reset(pieces, jump_count);
    notify();
}

void Board::set_whose_move(PieceColor color) {
    if (!is_piece(color)) {
        throw std::invalid_argument("only Red or Blue can be on move");
    }
    current_player = color;
    notify();
}

// ============================================================================
// LISTENERS
// ============================================================================

int Board::add_listener(Listener listener) {
    int id = next_listener_id++;
    listeners.emplace_back(id, std::move(listener));
    return id;
}

void Board::remove_listener(int id) {
    for (auto it = listeners.begin(); it != listeners.end(); ++it) {
        if (it->first == id) {
            listeners.erase(it);
            return;
        }
    }
}

void Board::notify() {
    // cópia: um listener pode remover-se durante a notificação
    const auto snapshot = listeners;
    for (const auto& l : snapshot) l.second();
}

// ============================================================================
// REPRESENTAÇÕES
// ============================================================================

std::string Board::to_string(bool legend) const {
    std::ostringstream out;
    out << "===\n";
    for (char r = '7'; r >= '1'; --r) {
        out << (legend ? std::string(1, r) + " " : std::string("  "));
        for (char c = 'a'; c <= 'g'; ++c) {
            if (c != 'a') out << ' ';
            out << color_symbol(get(c, r));
        }
        out << "\n";
    }
    if (legend) {
        out << "  a b c d e f g\n";
    }
    out << "===";
    return out.str();
}

std::vector<int> Board::get_flat_grid() const {
    std::vector<int> flat;
    flat.reserve(static_cast<size_t>(SIDE * SIDE));
    for (char r = '7'; r >= '1'; --r) {
        for (char c = 'a'; c <= 'g'; ++c) {
            flat.push_back(static_cast<int>(get(c, r)));
        }
    }
    return flat;
}
