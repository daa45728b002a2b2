#ifndef LOGMSGS_HPP
#define LOGMSGS_HPP

#include <ostream>
#include <string>
#include <vector>

namespace LogMsgs {
// Stream configurável (por defeito std::cout)
void set_stream(std::ostream& os);
std::ostream& out();

namespace AI {
// Helpers específicos da AI
void log_algo_tag(const std::string& tag);
void log_root_moves(const std::string& player,
                    const std::vector<std::string>& moves,
                    int depth);
void log_root_score(const std::string& mv, int score, bool is_last);
void log_best_move(const std::string& player,
                   const std::string& mv,
                   int score,
                   int depth_limit);
void log_pass(const std::string& player);
void log_search_stats(int evaluated, int generated, int prunes);
} // namespace AI

namespace Game {
// Mensagens da sessão de jogo
void prompt(const std::string& text);
void log_move(const std::string& player, const std::string& mv);
void log_pass(const std::string& player);
void log_outcome(const std::string& text);
void log_illegal_move();
void log_error(const std::string& what);
void log_board(const std::string& dump);
void log_help();
} // namespace Game

} // namespace LogMsgs

#endif
