#ifndef BLOCKALIGN_CMDLINE_HPP
#define BLOCKALIGN_CMDLINE_HPP

#include <cstddef>
#include <string>

struct CommandLineOptions {
    bool verbose { false };

    // Scoring
    int A { 2 };
    int B { 8 };
    int O { 12 };
    int E { 1 };
    bool blosum62 { false };

    // Block
    int min_block { 32 };
    int max_block { 256 };
    int lanes { 0 };
    size_t max_steps { 0 };

    // Mode
    bool xdrop { false };
    int x_drop { 50 };
    bool trace { true };

    std::string query;
    std::string reference;
};

CommandLineOptions parse_command_line_arguments(int argc, char **argv);

#endif
