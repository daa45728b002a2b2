#include "Command.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <utility>

namespace {

struct Pattern {
    Command::Type type;
    std::regex re;
};

const std::vector<Pattern>& patterns() {
    static const auto flags = std::regex::ECMAScript | std::regex::icase;
    static const std::vector<Pattern> table = {
        {Command::Type::PieceMove, std::regex(R"(^([a-g])([1-7])-([a-g])([1-7])$)", flags)},
        {Command::Type::Pass,      std::regex(R"(^-$)", flags)},
        {Command::Type::Auto,      std::regex(R"(^auto\s+(red|blue)$)", flags)},
        {Command::Type::Manual,    std::regex(R"(^manual\s+(red|blue)$)", flags)},
        {Command::Type::Block,     std::regex(R"(^block\s+([a-g][1-7])$)", flags)},
        {Command::Type::Seed,      std::regex(R"(^seed\s+(\d+)$)", flags)},
        {Command::Type::Load,      std::regex(R"(^load\s+(\S+)$)", flags)},
        {Command::Type::Start,     std::regex(R"(^start$)", flags)},
        {Command::Type::Clear,     std::regex(R"(^clear$)", flags)},
        {Command::Type::Dump,      std::regex(R"(^dump$)", flags)},
        {Command::Type::Help,      std::regex(R"(^help$)", flags)},
        {Command::Type::Quit,      std::regex(R"(^quit$)", flags)},
    };
    return table;
}

std::string trim(const std::string& s) {
    auto first = std::find_if_not(s.begin(), s.end(),
                                  [](unsigned char ch) { return std::isspace(ch); });
    auto last = std::find_if_not(s.rbegin(), s.rend(),
                                 [](unsigned char ch) { return std::isspace(ch); }).base();
    return first < last ? std::string(first, last) : std::string();
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return s;
}

} // namespace

Command Command::parse(const std::string& line) {
    const std::string text = trim(line);
    std::smatch m;
    for (const auto& p : patterns()) {
        if (std::regex_match(text, m, p.re)) {
            std::vector<std::string> ops;
            for (std::size_t i = 1; i < m.size(); ++i) {
                // nomes de ficheiro mantêm a capitalização
                ops.push_back(p.type == Type::Load ? m[i].str() : lower(m[i].str()));
            }
            return Command(p.type, std::move(ops));
        }
    }
    return Command(Type::Error, {text});
}

const char* Command::type_name(Type t) {
    switch (t) {
        case Type::Auto:      return "auto";
        case Type::Block:     return "block";
        case Type::Clear:     return "clear";
        case Type::Dump:      return "dump";
        case Type::Help:      return "help";
        case Type::Load:      return "load";
        case Type::Manual:    return "manual";
        case Type::Pass:      return "pass";
        case Type::PieceMove: return "move";
        case Type::Quit:      return "quit";
        case Type::Seed:      return "seed";
        case Type::Start:     return "start";
        case Type::Error:     return "error";
        case Type::Eof:       return "eof";
    }
    return "error";
}
