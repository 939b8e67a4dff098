#include "cmdline.hpp"

#include <iostream>
#include <args.hxx>
#include "version.hpp"

class Version {};

CommandLineOptions parse_command_line_arguments(int argc, char **argv) {

    args::ArgumentParser parser("blockalign " + version_string() + " - align two sequences with an adaptive block");
    parser.helpParams.showTerminator = false;
    parser.helpParams.helpindent = 20;
    parser.helpParams.width = 90;
    parser.helpParams.programName = "blockalign";
    parser.helpParams.shortSeparator = " ";

    args::HelpFlag help(parser, "help", "Print help and exit", {'h', "help"});
    args::ActionFlag version(parser, "version", "Print version and exit", {"version"}, []() { throw Version(); });
    args::Flag v(parser, "v", "Verbose output", {'v'});

    args::Group scoring(parser, "Scoring:");
    args::ValueFlag<int> A(parser, "INT", "Matching score [2]", {'A'});
    args::ValueFlag<int> B(parser, "INT", "Mismatch penalty [8]", {'B'});
    args::ValueFlag<int> O(parser, "INT", "Gap open penalty, includes the first gap symbol [12]", {'O'});
    args::ValueFlag<int> E(parser, "INT", "Gap extension penalty [1]", {'E'});
    args::Flag blosum62(parser, "blosum62", "Score protein sequences with BLOSUM62 (ignores -A and -B)", {"blosum62"});

    args::Group block(parser, "Block:");
    args::ValueFlag<int> min_block(parser, "INT", "Minimum block size [32]", {"min-block"});
    args::ValueFlag<int> max_block(parser, "INT", "Maximum block size [256]", {"max-block"});
    args::ValueFlag<int> lanes(parser, "INT", "Number of 16-bit lanes (1, 2, 4, 8, 16 or 32). Default: detect from CPU", {"lanes"});
    args::ValueFlag<size_t> max_steps(parser, "INT", "Give up after this many block steps (0: no limit) [0]", {"max-steps"});

    args::Group mode(parser, "Mode:");
    args::ValueFlag<int> x(parser, "INT", "X-drop alignment: stop once the score drops INT below the best score", {'x', "x-drop"});
    args::Flag no_trace(parser, "no-trace", "Report score and end position only, without CIGAR", {"no-trace"});

    args::Positional<std::string> query(parser, "query", "Query sequence", args::Options::Required);
    args::Positional<std::string> reference(parser, "reference", "Reference sequence", args::Options::Required);

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Completion& e) {
        std::cout << e.what();
        exit(EXIT_SUCCESS);
    }
    catch (const args::Help&) {
        std::cout << parser;
        exit(EXIT_SUCCESS);
    }
    catch (const Version& e) {
        std::cout << version_string() << std::endl;
        exit(EXIT_SUCCESS);
    }
    catch (const args::Error& e) {
        std::cerr << parser;
        std::cerr << "Error: " << e.what() << std::endl;
        exit(EXIT_FAILURE);
    }

    CommandLineOptions opt;

    if (v) { opt.verbose = true; }

    // Scoring
    if (A) { opt.A = args::get(A); }
    if (B) { opt.B = args::get(B); }
    if (O) { opt.O = args::get(O); }
    if (E) { opt.E = args::get(E); }
    if (blosum62) { opt.blosum62 = true; }

    // Block
    if (min_block) { opt.min_block = args::get(min_block); }
    if (max_block) { opt.max_block = args::get(max_block); }
    if (lanes) { opt.lanes = args::get(lanes); }
    if (max_steps) { opt.max_steps = args::get(max_steps); }

    // Mode
    if (x) { opt.xdrop = true; opt.x_drop = args::get(x); }
    if (no_trace) { opt.trace = false; }

    opt.query = args::get(query);
    opt.reference = args::get(reference);

    if (opt.min_block <= 0 || opt.max_block <= 0) {
        std::cerr << "Error: Block sizes must be positive." << std::endl;
        exit(EXIT_FAILURE);
    }

    return opt;
}
