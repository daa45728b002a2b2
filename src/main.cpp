#include <iostream>
#include "GameController.hpp"
#include "LogMsgs.hpp"
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>


//input helpers
static std::optional<int> get_flag_int(int argc, char* argv[], const std::string& shortf, const std::string& longf) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == shortf || a == longf) {
            if (i + 1 < argc) return std::stoi(argv[i + 1]);
        } else if (a.rfind(longf + "=", 0) == 0) {
            return std::stoi(a.substr(longf.size() + 1));
        }
    }
    return std::nullopt;
}

static bool has_flag(int argc, char* argv[], const std::string& shortf, const std::string& longf) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == shortf || a == longf) return true;
    }
    return false;
}

// Argumentos que sobram depois de retirar as flags conhecidas
static std::vector<std::string> strip_flags(int argc, char* argv[]) {
    std::vector<std::string> out;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-d" || a == "--depth" ||
            a == "-v" || a == "--debug") {
            // skip this and the next (its value), if present
            ++i;
            continue;
        }
        if (a.rfind("--depth=", 0) == 0 ||
            a.rfind("--debug=", 0) == 0 ||
            a == "-q" || a == "--quiet") {
            continue;
        }
        if (!a.empty() && a[0] == '-') {
            throw std::invalid_argument("unknown flag " + a);
        }
        out.push_back(a);
    }
    return out;
}

static void usage() {
    std::cerr << "Usage: ataxx [-d|--depth N] [-v|--debug N] [-q|--quiet] [FILE]\n";
}


int main(int argc, char* argv[]) {
    int depth = AI::MAX_DEPTH;
    int debug = 0;
    std::vector<std::string> rest;

    try {
        depth = get_flag_int(argc, argv, "-d", "--depth").value_or(AI::MAX_DEPTH);
        debug = get_flag_int(argc, argv, "-v", "--debug").value_or(0);
        rest = strip_flags(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Erro: " << e.what() << "\n";
        usage();
        return 1;
    } catch (const std::out_of_range& e) {
        std::cerr << "Erro: valor fora de alcance (" << e.what() << ")\n";
        usage();
        return 1;
    }

    if (rest.size() > 1) {
        usage();
        return 1;
    }

    std::ifstream file;
    std::istream* input = &std::cin;
    if (!rest.empty()) {
        file.open(rest[0]);
        if (!file.is_open()) {
            std::cerr << "Erro: não foi possível abrir " << rest[0] << "\n";
            return 1;
        }
        input = &file;
    }

    GameController controller(*input, depth, debug);
    // prompts só fazem sentido em modo interativo
    controller.set_prompts(rest.empty() && !has_flag(argc, argv, "-q", "--quiet"));
    controller.run();

    return 0;
}
