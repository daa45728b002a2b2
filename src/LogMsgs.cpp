#include "LogMsgs.hpp"
#include <iostream>

namespace {
    std::ostream* g_log_stream = &std::cout;
}

namespace LogMsgs {
void set_stream(std::ostream& os) { g_log_stream = &os; }
std::ostream& out() { return *g_log_stream; }

namespace AI {
void log_algo_tag(const std::string& tag) {
    out() << tag << "\n\n";
}

void log_root_moves(const std::string& player,
                    const std::vector<std::string>& moves,
                    int depth) {
    out() << "[" << player << "]->";
    for (const auto& m : moves) {
        out() << m << ", ";
    }
    out() << "\n";
    out() << "depth: " << depth << "\n";
}

void log_root_score(const std::string& mv, int score, bool is_last) {
    out() << (is_last ? "└── " : "├── ")
          << "score for: " << mv << "-> " << score << "\n";
}

void log_best_move(const std::string& player,
                   const std::string& mv,
                   int score,
                   int depth_limit) {
    out() << "****[" << player << "] Best move selected: " << mv
          << " " << score << " [depth: " << depth_limit << "] ";
}

void log_pass(const std::string& player) {
    out() << "****[" << player << "] No move available, passing ";
}

void log_search_stats(int evaluated, int generated, int prunes) {
    out() << "[search] evaluated=" << evaluated
          << " generated=" << generated
          << " prunes=" << prunes << "\n";
}
} // namespace AI

namespace Game {
void prompt(const std::string& text) {
    out() << text << std::flush;
}

void log_move(const std::string& player, const std::string& mv) {
    out() << player << " moves " << mv << ".\n";
}

void log_pass(const std::string& player) {
    out() << player << " passes.\n";
}

void log_outcome(const std::string& text) {
    out() << text << "\n";
}

void log_illegal_move() {
    out() << "that move is illegal\n";
}

void log_error(const std::string& what) {
    out() << "error: " << what << "\n";
}

void log_board(const std::string& dump) {
    out() << dump << "\n";
}

void log_help() {
    out() << "Commands:\n"
          << "  c0r0-c1r1        move a piece (e.g. a7-b6)\n"
          << "  -                pass (only when no move is possible)\n"
          << "  start            start playing from the current position\n"
          << "  clear            abandon the game and clear the board\n"
          << "  auto red|blue    let the AI play that color\n"
          << "  manual red|blue  play that color from input\n"
          << "  block cr         place a block and its reflections (setup)\n"
          << "  seed n           record a seed (accepted, search is deterministic)\n"
          << "  dump             print the board\n"
          << "  load file        read commands from a file\n"
          << "  help             print this summary\n"
          << "  quit             leave\n";
}
} // namespace Game

} // namespace LogMsgs
