#pragma once
#include "Board.hpp"
#include "AI.hpp"
#include "Command.hpp"
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class GameController {
public:
    enum class State { Setup, Playing, Finished };

    // Lê comandos de INPUT; as AIs pesquisam a 'ai_depth' plies.
    explicit GameController(std::istream& input, int ai_depth = AI::MAX_DEPTH, int debug_level = 0);

    // Sessão completa: termina com 'quit' ou fim da última fonte de input.
    void run();

    // Cor com mais peças; Empty em caso de empate.
    static PieceColor winner(const Board& board);

    const Board& get_board() const { return board; }
    State get_state() const { return state; }
    bool is_auto(PieceColor color) const;
    std::uint64_t get_seed() const { return seed; }
    void set_prompts(bool on) { prompts = on; }

private:
    struct Source {
        std::istream* in;
        std::unique_ptr<std::istream> owned; // só para ficheiros de 'load'
    };

    Board board;
    AI red_ai;
    AI blue_ai;
    bool red_auto = false;
    bool blue_auto = true;
    State state = State::Setup;
    bool running = false;
    bool prompts = true;
    std::uint64_t seed = 0;
    std::vector<Source> inputs;

    std::optional<std::string> read_line(const std::string& prompt);
    void do_command();
    void play_turn();
    void play_ai_turn(PieceColor mover);
    void play_human_turn(PieceColor mover);
    void dispatch(const Command& cmd);
    void execute(const Command& cmd);
    void apply_move(const Move& move);
    void check_state(Command::Type type, State allowed) const;
    void report_winner();
};
