#include <emscripten/bind.h>
#include "Board.hpp"
#include "AI.hpp"
#include "GameController.hpp"
#include <memory>
#include <string>

using namespace emscripten;

namespace {

// Helpers para JS: cores como inteiros (0 vazio, 1 Red, 2 Blue, 3 bloqueado)
PieceColor color_from_int(int c) {
    switch (c) {
        case 1: return PieceColor::Red;
        case 2: return PieceColor::Blue;
        case 3: return PieceColor::Blocked;
        default: return PieceColor::Empty;
    }
}

int whose_move_int(const Board& b) { return static_cast<int>(b.whose_move()); }
int num_pieces_int(const Board& b, int c) { return b.num_pieces(color_from_int(c)); }
int winner_int(const Board& b) { return static_cast<int>(GameController::winner(b)); }

bool is_legal(const Board& b, const std::string& text) {
    auto mv = Move::parse(text);
    return mv && b.legal_move(*mv);
}

// Aplica a jogada em notação "a7-b6" ou "-"; false se for ilegal.
bool play(Board& b, const std::string& text) {
    auto mv = Move::parse(text);
    if (!mv) return false;
    if (mv->is_pass ? b.can_move(b.whose_move()) : !b.legal_move(*mv)) return false;
    b.make_move(*mv);
    return true;
}

bool block_cell(Board& b, const std::string& cr) {
    if (cr.size() != 2 || !b.legal_block(cr[0], cr[1])) return false;
    b.set_block(cr);
    return true;
}

std::shared_ptr<AI> create_ai(int color, int depth) {
    return std::make_shared<AI>(color_from_int(color), depth);
}

std::string dump_text(const Board& b) { return b.to_string(true); }

// "" quando o jogo terminou ou a cor não tem peças
std::string choose_move_text(AI& ai, const Board& b) {
    auto mv = ai.choose_move(b);
    return mv ? mv->to_string() : std::string();
}

} // namespace

EMSCRIPTEN_BINDINGS(std_types) {
    register_vector<int>("VectorInt");
}

EMSCRIPTEN_BINDINGS(ataxx_module) {
    function("createAI", &create_ai);

    class_<Board>("Board")
        .constructor<>()
        .function("getFlatGrid", &Board::get_flat_grid)
        .function("whoseMove", &whose_move_int)
        .function("numPieces", &num_pieces_int)
        .function("numJumps", &Board::num_jumps)
        .function("numMoves", &Board::num_moves)
        .function("isLegal", &is_legal)
        .function("play", &play)
        .function("undo", &Board::undo)
        .function("clear", &Board::clear)
        .function("blockCell", &block_cell)
        .function("gameOver", &Board::game_over)
        .function("getWinner", &winner_int)
        .function("dump", &dump_text)
        ;

    class_<AI>("AI")
        .smart_ptr<std::shared_ptr<AI>>("AIPtr")
        .function("chooseMove", &choose_move_text)
        .function("setDebugLevel", &AI::set_debug_level)
        .function("getDebugLevel", &AI::get_debug_level);
}
