// ============================================================================
// AI.cpp — Motor de IA para Ataxx (Minimax + Alpha-Beta)
// ----------------------------------------------------------------------------
//
// - Escolha de jogada (choose_move): passagem/sem jogada ou minimax sobre
//   um clone privado do tabuleiro.
// - Minimax com poda alfa–beta, profundidade fixa, sem ordenação de
//   sucessores: as peças são visitadas pela ordem da lista de posições.
// - Cada sucessor é aplicado e desfeito (undo) no mesmo clone.
// - Versão sem poda para comparação (testes e ATAXX_MINIMAX_NO_PRUNE).
// ============================================================================


#include "AI.hpp"
#include "Evaluator.hpp"
#include "LogMsgs.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <stdexcept>
#include <string>


//para debug tree
static inline std::string indent_rails(int depth) {
    std::string p;
    for (int i = 0; i < depth; ++i) p += "│ ";
    return p;
}
static inline std::string branch_prefix(int depth, bool last) {
    return indent_rails(depth) + (last ? "└── " : "├── ");
}


// ----------------------------------------------------------------------------
// Construtor:
// - 'color' é a cor jogada por esta instância (MAX na procura).
// - 'max_depth' define a profundidade do minimax; nunca inferior a 1.
// - 'debug_level' controla a verbosidade (0..4) dos logs.
// ----------------------------------------------------------------------------
AI::AI(PieceColor color, int max_depth, int debug_level)
    : color(color), max_depth(max_depth < 1 ? 1 : max_depth), debug_level(debug_level) {
    if (!is_piece(color)) {
        throw std::invalid_argument("AI must play Red or Blue");
    }
}

void AI::reset_stats() {
    eval_successors = 0;
    gen_successors = 0;
    prunes = 0;
}


// ----------------------------------------------------------------------------
// choose_move():
// - Ponto de entrada para a decisão de jogada da IA.
// - Jogo terminado: não há jogada (nullopt).
// - Se a cor não se pode mexer: passa se ainda tiver peças, senão não há
//   jogada (nullopt).
// - Caso contrário corre o minimax sobre um clone e devolve a jogada
//   registada na raiz.
// ----------------------------------------------------------------------------
std::optional<Move> AI::choose_move(const Board& board) {
    if (board.whose_move() != color) {
        throw std::invalid_argument("AI asked to move out of turn");
    }

    const auto start_time = std::chrono::steady_clock::now();
    const std::string player = color_name(color);

    auto log_move_time = [&]() {
        if (debug_level >= 1) {
            auto elapsed = std::chrono::duration<double>(
                std::chrono::steady_clock::now() - start_time
            ).count();  // seconds as double

            LogMsgs::out() << "[" << std::fixed << std::setprecision(4)
                    << elapsed << " s]";
        }
    };

    if (board.game_over()) {
        return std::nullopt;
    }

    if (!board.can_move(color)) {
        if (board.num_pieces(color) > 0) {
            if (debug_level >= 1) {
                LogMsgs::AI::log_pass(player);
                LogMsgs::out() << "\n";
            }
            return Move::pass();
        }
        return std::nullopt;
    }

    Board work = board.clone();
    reset_stats();

    if (debug_level >= 2) {
        #if defined(ATAXX_MINIMAX_NO_PRUNE)
        LogMsgs::AI::log_algo_tag("alg:minimax_no_pruning");
        #else
        LogMsgs::AI::log_algo_tag("alg:minimax_alphabeta");
        #endif
        std::vector<std::string> root;
        for (const auto& mv : candidate_moves(work, color)) root.push_back(mv.to_string());
        LogMsgs::AI::log_root_moves(player, root, max_depth);
    }

    #if defined(ATAXX_MINIMAX_NO_PRUNE)
    int score = search_no_pruning(work, max_depth);
    #else
    int score = search(work, max_depth);
    #endif

    if (debug_level >= 1 && last_found_move) {
        LogMsgs::AI::log_best_move(player, last_found_move->to_string(), score, max_depth);
        log_move_time();
        LogMsgs::out() << "\n";
    }
    if (debug_level >= 2) {
        LogMsgs::AI::log_search_stats(eval_successors, gen_successors, prunes);
    }

    return last_found_move;
}

int AI::search(Board& board, int depth) {
    if (board.whose_move() != color) {
        throw std::invalid_argument("AI asked to search out of turn");
    }
    last_found_move.reset();
    root_depth = depth;
    return minimax(board, depth, /*save_move=*/true, /*sense=*/1, -INFTY, INFTY);
}

int AI::search_no_pruning(Board& board, int depth) {
    if (board.whose_move() != color) {
        throw std::invalid_argument("AI asked to search out of turn");
    }
    last_found_move.reset();
    root_depth = depth;
    return minimax_no_pruning(board, depth, /*save_move=*/true, /*sense=*/1);
}

std::vector<Move> AI::candidate_moves(const Board& board, PieceColor mover) const {
    std::vector<Move> moves;
    for (int from : board.positions(mover)) {
        for (int to : board.neighbors_within(from, 2)) {
            Move mv = Move::between(from, to);
            if (Board::in_bounds(to) && board.legal_move(mv)) {
                moves.push_back(mv);
            }
        }
    }
    return moves;
}

void AI::trace_child(int depth, const Move& mv, int score, bool last) const {
    if (root_depth - depth == 0 && debug_level >= 2 && debug_level < 3) {
        LogMsgs::AI::log_root_score(mv.to_string(), score, last);
    }
    if (debug_level >= 3) {
        LogMsgs::out() << branch_prefix(root_depth - depth, last)
                       << mv.to_string() << " " << score << "\n";
    }
}


// ----------------------------------------------------------------------------
// minimax(board, depth, save_move, sense, alpha, beta):
// - Folha (depth == 0 ou jogo terminado): avaliação estática da cor da AI.
// - sense = +1 nó MAX (joga a cor da AI), sense = -1 nó MIN (adversário).
// - Todos os sucessores usam o mesmo tabuleiro: make_move, recursão, undo.
// - Na raiz (save_move) regista a primeira jogada e cada melhoria estrita.
// - Corte em ambos os ramos quando beta <= alpha.
// ----------------------------------------------------------------------------
int AI::minimax(Board& board, int depth, bool save_move, int sense, int alpha, int beta) {
    eval_successors++;

    if (depth == 0 || board.game_over()) {
        return static_score(board, color);
    }

    const auto moves = candidate_moves(board, color_for(sense));
    gen_successors += static_cast<int>(moves.size());

    if (moves.empty()) {
        // a cor a jogar teria de passar; fica a avaliação estática
        return static_score(board, color);
    }

    int best = sense == 1 ? -INFTY : INFTY;

    for (std::size_t i = 0; i < moves.size(); ++i) {
        const Move& mv = moves[i];

        board.make_move(mv);
        int score = minimax(board, depth - 1, false, -sense, alpha, beta);
        board.undo();

        trace_child(depth, mv, score, i + 1 == moves.size());

        if (sense == 1) {
            if (score >= best) {
                if (save_move && (score > best || !last_found_move)) {
                    last_found_move = mv;
                }
                best = score;
                alpha = std::max(alpha, score);
            }
        } else {
            if (score <= best) {
                best = score;
                beta = std::min(beta, score);
            }
        }

        if (beta <= alpha) {
            prunes++;
            if (debug_level >= 4) {
                LogMsgs::out() << indent_rails(root_depth - depth)
                               << (sense == 1 ? "beta cut: " : "alpha cut: ")
                               << score << "\n";
            }
            break;
        }
    }

    return best;
}


// para comparação sem poda alfa-beta (testes / ATAXX_MINIMAX_NO_PRUNE)
int AI::minimax_no_pruning(Board& board, int depth, bool save_move, int sense) {
    eval_successors++;

    // ----- TERMINAL / FRONTIER ----------------------------------------------
    if (depth == 0 || board.game_over()) {
        return static_score(board, color);
    }

    const auto moves = candidate_moves(board, color_for(sense));
    gen_successors += static_cast<int>(moves.size());

    if (moves.empty()) {
        return static_score(board, color);
    }

    int best = sense == 1 ? -INFTY : INFTY;

    // Evaluate all children in position-list order
    for (std::size_t i = 0; i < moves.size(); ++i) {
        const Move& mv = moves[i];

        board.make_move(mv);
        int score = minimax_no_pruning(board, depth - 1, false, -sense);
        board.undo();

        trace_child(depth, mv, score, i + 1 == moves.size());

        if (sense == 1) {
            if (score > best || i == 0) {
                best = score;
                if (save_move) last_found_move = mv;
            }
        } else {
            best = std::min(best, score);
        }
    }

    return best;
}
