#ifndef COMMAND_HPP
#define COMMAND_HPP

#include <string>
#include <utility>
#include <vector>

// Uma linha de comando já reconhecida: tipo + operandos capturados.
class Command {
public:
    enum class Type {
        Auto, Block, Clear, Dump, Help, Load, Manual, Pass, PieceMove,
        Quit, Seed, Start, Error, Eof
    };

    // Reconhece LINE (espaços nas pontas ignorados). Linhas que não
    // correspondem a nenhum padrão dão Type::Error.
    static Command parse(const std::string& line);
    static Command eof() { return Command(Type::Eof, {}); }

    Type type() const { return kind; }
    const std::vector<std::string>& operands() const { return args; }

    // nome usado nas mensagens de erro ("start", "block", ...)
    static const char* type_name(Type t);

private:
    Command(Type t, std::vector<std::string> ops) : kind(t), args(std::move(ops)) {}

    Type kind;
    std::vector<std::string> args;
};

#endif // COMMAND_HPP
