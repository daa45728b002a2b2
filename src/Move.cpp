#include "Move.hpp"
#include "Board.hpp"
#include <algorithm>
#include <cstdlib>
#include <regex>
#include <stdexcept>

namespace {
    bool on_board(char c, char r) {
        return c >= 'a' && c <= 'g' && r >= '1' && r <= '7';
    }
}

Move Move::pass() {
    Move m;
    m.is_pass = true;
    return m;
}

Move Move::move(char c0, char r0, char c1, char r1) {
    if (!on_board(c0, r0) || !on_board(c1, r1)) {
        throw std::invalid_argument("square outside the board");
    }
    return between(Board::index(c0, r0), Board::index(c1, r1));
}

Move Move::between(int from_sq, int to_sq) {
    Move m;
    m.from = from_sq;
    m.to = to_sq;
    return m;
}

std::optional<Move> Move::parse(const std::string& text) {
    static const std::regex pass_pattern(R"(^\s*-\s*$)");
    static const std::regex move_pattern(R"(^\s*([a-g])([1-7])-([a-g])([1-7])\s*$)");

    if (std::regex_match(text, pass_pattern)) {
        return Move::pass();
    }
    std::smatch m;
    if (!std::regex_match(text, m, move_pattern)) {
        return std::nullopt;
    }
    return Move::move(m.str(1)[0], m.str(2)[0], m.str(3)[0], m.str(4)[0]);
}

// Distância de Chebyshev entre origem e destino
int Move::distance() const {
    if (is_pass) return 0;
    int dc = std::abs(Board::col(from) - Board::col(to));
    int dr = std::abs(Board::row(from) - Board::row(to));
    return std::max(dc, dr);
}

char Move::col0() const { return Board::col(from); }
char Move::row0() const { return Board::row(from); }
char Move::col1() const { return Board::col(to); }
char Move::row1() const { return Board::row(to); }

std::string Move::to_string() const {
    if (is_pass) return "-";
    std::string s;
    s.reserve(5);
    s += col0();
    s += row0();
    s += '-';
    s += col1();
    s += row1();
    return s;
}
