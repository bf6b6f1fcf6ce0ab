// WATSIM - WebAssembly Text SIMilarity
// Main entry point with git-style subcommand dispatch

#include <watsim/config.hpp>
#include <iostream>
#include <string>

// Forward declarations for subcommands
namespace watsim {
    int cmd_tokenize(int argc, char** argv);
    int cmd_ngrams(int argc, char** argv);
    int cmd_matrix(int argc, char** argv);
    int cmd_trim(int argc, char** argv);
    int cmd_average(int argc, char** argv);
}

constexpr const char* CODENAME = "WebAssembly Text SIMilarity";

static void print_version() {
    std::cout << "watsim " << watsim::VERSION << "\n";
    std::cout << CODENAME << "\n";
}

static void print_usage(const char* prog) {
    std::cerr << "WATSIM - WebAssembly Text SIMilarity\n";
    std::cerr << "Version: " << watsim::VERSION << "\n\n";
    std::cerr << "Usage: " << prog << " <command> [options]\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  tokenize         Print the instruction tokens of a WAT file\n";
    std::cerr << "  ngrams           Write instruction n-gram tables\n";
    std::cerr << "  matrix           Build pairwise similarity matrices\n";
    std::cerr << "  trim             Produce head/middle/tail/random trimmed corpora\n";
    std::cerr << "  average          Average trial matrices, correlate with a baseline\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -h, --help     Show this help message\n";
    std::cerr << "  -v, --version  Show version information\n";
    std::cerr << "\n";
    std::cerr << "Examples:\n";
    std::cerr << "  watsim trim --input data --output trimmed --method random --lines 1000 --seed 42\n";
    std::cerr << "  watsim matrix --corpus trimmed/1 --output results/1 --threads 8\n";
    std::cerr << "\n";
    std::cerr << "For command-specific help, use: watsim <command> --help\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string cmd = argv[1];

    if (cmd == "-h" || cmd == "--help") {
        print_usage(argv[0]);
        return 0;
    }

    if (cmd == "-v" || cmd == "--version") {
        print_version();
        return 0;
    }

    if (cmd == "tokenize") {
        return watsim::cmd_tokenize(argc - 1, argv + 1);
    } else if (cmd == "ngrams") {
        return watsim::cmd_ngrams(argc - 1, argv + 1);
    } else if (cmd == "matrix") {
        return watsim::cmd_matrix(argc - 1, argv + 1);
    } else if (cmd == "trim") {
        return watsim::cmd_trim(argc - 1, argv + 1);
    } else if (cmd == "average") {
        return watsim::cmd_average(argc - 1, argv + 1);
    } else {
        std::cerr << "Error: Unknown command '" << cmd << "'\n";
        print_usage(argv[0]);
        return 1;
    }
}
