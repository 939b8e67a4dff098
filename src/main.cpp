#include <cstdlib>
#include <iostream>
#include <iomanip>
#include <string>

#include "aligner.hpp"
#include "cmdline.hpp"
#include "exceptions.hpp"
#include "logger.hpp"
#include "timer.hpp"
#include "version.hpp"
#include "buildconfig.hpp"


static Logger& logger = Logger::get();

void warn_if_no_optimizations() {
    if (std::string(CMAKE_BUILD_TYPE) == "Debug") {
        logger.info() << "\n    ***** Binary was compiled without optimizations - this will be very slow *****\n\n";
    }
}

int run_blockalign(int argc, char **argv) {
    auto opt = parse_command_line_arguments(argc, argv);

    logger.set_level(opt.verbose ? LOG_DEBUG : LOG_INFO);
    logger.info() << std::setprecision(2) << std::fixed;
    logger.info() << "This is blockalign " << version_string() << '\n';
    logger.debug() << "Build type: " << CMAKE_BUILD_TYPE << '\n';
    warn_if_no_optimizations();

    auto scoring = opt.blosum62
        ? ScoringProfile::blosum62()
        : ScoringProfile::constant(opt.A, opt.B);

    AlignmentParameters params;
    params.gaps = GapCosts{opt.O, opt.E};
    params.block_size = BlockSizeRange{size_t(opt.min_block), size_t(opt.max_block)};
    params.mode = opt.xdrop ? AlignMode::xdrop : AlignMode::global;
    params.x_drop = opt.x_drop;
    params.trace = opt.trace;
    params.lanes = opt.lanes;
    params.max_steps = opt.max_steps;
    logger.debug() << params << '\n';

    Timer timer;
    AlignmentSession session(opt.query, opt.reference, scoring, params);
    logger.debug() << "Using " << session.lanes() << " lanes\n";
    auto result = session.run();
    logger.info() << "Aligned " << opt.query.size() << " x " << opt.reference.size()
        << " symbols in " << timer.elapsed() << " s\n";
    logger.debug() << result.statistics;

    std::cout << result.score << '\t' << result.query_end << '\t' << result.reference_end << '\t'
        << (result.cigar ? result.cigar->to_string() : "*") << '\n';
    return EXIT_SUCCESS;
}

int main(int argc, char **argv) {
    try {
        return run_blockalign(argc, argv);
    } catch (const ConfigError& e) {
        logger.error() << "A parameter is invalid: " << e.what() << std::endl;
    } catch (const std::runtime_error& e) {
        logger.error() << e.what() << std::endl;
    }
    return EXIT_FAILURE;
}
