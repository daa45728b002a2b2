#ifndef AI_HPP
#define AI_HPP

#include "Board.hpp"
#include "Evaluator.hpp"
#include "LogMsgs.hpp"
#include <optional>
#include <vector>


class AI {
public:
    // Profundidade máxima do minimax antes da avaliação estática.
    static constexpr int MAX_DEPTH = 4;

    AI(PieceColor color, int max_depth = MAX_DEPTH, int debug_level = 0);

    // Interface pública de decisão
    // - jogo terminado ou cor sem peças -> nullopt;
    // - cor sem jogadas mas com peças -> passagem;
    // - caso contrário, minimax alfa-beta sobre um clone do tabuleiro.
    // Lança std::invalid_argument se não for a vez desta cor.
    std::optional<Move> choose_move(const Board& board);

    // Valor minimax (com / sem poda) de 'board' para esta cor, a 'depth'
    // plies. O tabuleiro é alterado durante a procura e reposto no fim.
    // Tornados públicos para permitir comparação nos testes.
    int search(Board& board, int depth);
    int search_no_pruning(Board& board, int depth);

    // Melhor jogada registada pela última procura
    const std::optional<Move>& last_move() const { return last_found_move; }

    void set_debug_level(int lvl) { debug_level = lvl; } // define verbosidade
    void reset_stats();

    // Getters simples
    PieceColor get_color() const { return color; }
    int max_depth_limit() const { return max_depth; }
    int get_debug_level() const { return debug_level; }
    int get_eval_successors() const { return eval_successors; }
    int get_generated_successors() const { return gen_successors; }
    int get_prunes() const { return prunes; }

private:
    PieceColor color;
    int max_depth;
    int debug_level = 0;

    int eval_successors = 0;
    int gen_successors = 0;
    int prunes = 0;

    // profundidade da raiz da procura em curso (para indentação dos logs)
    int root_depth = 0;
    std::optional<Move> last_found_move;

    //minimax + versão sem alfa-beta para testes comparativos
    int minimax(Board& board, int depth, bool save_move, int sense, int alpha, int beta);
    int minimax_no_pruning(Board& board, int depth, bool save_move, int sense);

    // Jogadas legais de 'mover', peça a peça pela ordem da lista de posições.
    std::vector<Move> candidate_moves(const Board& board, PieceColor mover) const;

    // sense = +1 -> esta AI (MAX); sense = -1 -> adversário (MIN)
    PieceColor color_for(int sense) const { return sense == 1 ? color : opposite(color); }

    void trace_child(int depth, const Move& mv, int score, bool last) const;
};

#endif // AI_HPP
