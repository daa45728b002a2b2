#ifndef PIECE_COLOR_HPP
#define PIECE_COLOR_HPP

#pragma once
#include <cstdint>
#include <string>

// Conteúdo de uma casa da grelha.
// Red e Blue são as duas cores de jogadores; Blocked cobre tanto os blocos
// colocados no setup como a moldura de 2 casas à volta do tabuleiro.
enum class PieceColor : std::uint8_t {
    Empty,
    Red,
    Blue,
    Blocked
};

// Cor do adversário (Empty/Blocked devolvem-se a si próprios).
inline PieceColor opposite(PieceColor c) {
    switch (c) {
        case PieceColor::Red:  return PieceColor::Blue;
        case PieceColor::Blue: return PieceColor::Red;
        default:               return c;
    }
}

inline bool is_piece(PieceColor c) {
    return c == PieceColor::Red || c == PieceColor::Blue;
}

// Nome usado nas mensagens ("Red moves a7-b6.", "Blue wins.")
inline std::string color_name(PieceColor c) {
    switch (c) {
        case PieceColor::Red:     return "Red";
        case PieceColor::Blue:    return "Blue";
        case PieceColor::Blocked: return "Blocked";
        case PieceColor::Empty:   return "Empty";
    }
    return "?";
}

// Símbolo usado no dump do tabuleiro
inline char color_symbol(PieceColor c) {
    switch (c) {
        case PieceColor::Red:     return 'r';
        case PieceColor::Blue:    return 'b';
        case PieceColor::Blocked: return 'X';
        case PieceColor::Empty:   return '-';
    }
    return '?';
}

#endif // PIECE_COLOR_HPP
