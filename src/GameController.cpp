#include "GameController.hpp"
#include "LogMsgs.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>


GameController::GameController(std::istream& input, int ai_depth, int debug_level)
    : red_ai(PieceColor::Red, ai_depth, debug_level),
      blue_ai(PieceColor::Blue, ai_depth, debug_level)
{
    inputs.push_back({&input, nullptr});
}


void GameController::run() {
    running = true;
    state = State::Setup;
    board.clear();

    while (running) {
        if (state == State::Playing) {
            play_turn();
        } else {
            do_command();
        }
    }
}

bool GameController::is_auto(PieceColor color) const {
    return color == PieceColor::Red ? red_auto : blue_auto;
}

PieceColor GameController::winner(const Board& board) {
    int red = board.num_pieces(PieceColor::Red);
    int blue = board.num_pieces(PieceColor::Blue);
    if (red > blue) return PieceColor::Red;
    if (blue > red) return PieceColor::Blue;
    return PieceColor::Empty;
}

// ----------------------------------------------------------------------------
// Input: pilha de fontes. 'load' empilha um ficheiro; quando uma fonte acaba
// volta-se à anterior. Linhas em branco são ignoradas.
// ----------------------------------------------------------------------------
std::optional<std::string> GameController::read_line(const std::string& prompt) {
    while (!inputs.empty()) {
        Source& src = inputs.back();
        // só a fonte base é interativa
        if (prompts && inputs.size() == 1) {
            LogMsgs::Game::prompt(prompt);
        }
        std::string line;
        if (!std::getline(*src.in, line)) {
            inputs.pop_back();
            continue;
        }
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        return line;
    }
    return std::nullopt;
}

void GameController::do_command() {
    auto line = read_line("ataxx: ");
    if (!line) {
        running = false;
        return;
    }
    dispatch(Command::parse(*line));
}

void GameController::play_turn() {
    if (board.game_over()) {
        report_winner();
        state = State::Finished;
        return;
    }

    const PieceColor mover = board.whose_move();
    if (is_auto(mover)) {
        play_ai_turn(mover);
    } else {
        play_human_turn(mover);
    }
}

void GameController::play_ai_turn(PieceColor mover) {
    AI& ai = mover == PieceColor::Red ? red_ai : blue_ai;
    auto move = ai.choose_move(board);
    if (!move) {
        // sem peças: game_over() apanha o caso na próxima volta
        return;
    }
    board.make_move(*move);
    if (move->is_pass) {
        LogMsgs::Game::log_pass(color_name(mover));
    } else {
        LogMsgs::Game::log_move(color_name(mover), move->to_string());
    }
}

void GameController::play_human_turn(PieceColor mover) {
    auto line = read_line(std::string(color_name(mover)) + ": ");
    if (!line) {
        running = false;
        return;
    }
    dispatch(Command::parse(*line));
}

// ----------------------------------------------------------------------------
// Comandos
// ----------------------------------------------------------------------------
void GameController::dispatch(const Command& cmd) {
    try {
        execute(cmd);
    } catch (const std::invalid_argument& e) {
        LogMsgs::Game::log_error(e.what());
    } catch (const std::runtime_error& e) {
        LogMsgs::Game::log_error(e.what());
    }
}

void GameController::check_state(Command::Type type, State allowed) const {
    if (state != allowed) {
        throw std::invalid_argument(std::string("'") + Command::type_name(type) +
                                    "' command is not allowed now.");
    }
}

void GameController::execute(const Command& cmd) {
    const auto& ops = cmd.operands();

    switch (cmd.type()) {
    case Command::Type::PieceMove:
        if (state == State::Finished) check_state(cmd.type(), State::Playing);
        apply_move(Move::move(ops[0][0], ops[1][0], ops[2][0], ops[3][0]));
        break;
    case Command::Type::Pass:
        if (state == State::Finished) check_state(cmd.type(), State::Playing);
        apply_move(Move::pass());
        break;
    case Command::Type::Auto:
        (ops[0] == "red" ? red_auto : blue_auto) = true;
        break;
    case Command::Type::Manual:
        (ops[0] == "red" ? red_auto : blue_auto) = false;
        break;
    case Command::Type::Block:
        check_state(cmd.type(), State::Setup);
        board.set_block(ops[0]);
        break;
    case Command::Type::Seed:
        // valores demasiado grandes saturam
        seed = std::strtoull(ops[0].c_str(), nullptr, 10);
        break;
    case Command::Type::Start:
        check_state(cmd.type(), State::Setup);
        state = State::Playing;
        break;
    case Command::Type::Clear:
        board.clear();
        state = State::Setup;
        break;
    case Command::Type::Dump:
        LogMsgs::Game::log_board(board.to_string());
        break;
    case Command::Type::Help:
        LogMsgs::Game::log_help();
        break;
    case Command::Type::Load: {
        auto file = std::make_unique<std::ifstream>(ops[0]);
        if (!file->is_open()) {
            throw std::runtime_error("Cannot open file " + ops[0]);
        }
        std::istream* in = file.get();
        inputs.push_back({in, std::move(file)});
        break;
    }
    case Command::Type::Quit:
        running = false;
        break;
    case Command::Type::Error:
        throw std::invalid_argument("Command not understood");
    case Command::Type::Eof:
        running = false;
        break;
    }
}

// Jogada vinda do input (setup ou jogador manual).
void GameController::apply_move(const Move& move) {
    const bool ok = move.is_pass ? !board.can_move(board.whose_move())
                                 : board.legal_move(move);
    if (!ok) {
        LogMsgs::Game::log_illegal_move();
        return;
    }
    board.make_move(move);
}

void GameController::report_winner() {
    switch (winner(board)) {
        case PieceColor::Red:  LogMsgs::Game::log_outcome("Red wins."); break;
        case PieceColor::Blue: LogMsgs::Game::log_outcome("Blue wins."); break;
        default:               LogMsgs::Game::log_outcome("Draw."); break;
    }
}
