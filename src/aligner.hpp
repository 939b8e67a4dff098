#ifndef BLOCKALIGN_ALIGNER_HPP
#define BLOCKALIGN_ALIGNER_HPP

#include <optional>
#include <string_view>
#include "cigar.hpp"
#include "kernel.hpp"
#include "parameters.hpp"
#include "scoring.hpp"
#include "sequence.hpp"
#include "statistics.hpp"

struct AlignmentResult {
    int score{0};
    // The alignment covers query[0, query_end) and reference[0, reference_end)
    size_t query_end{0};
    size_t reference_end{0};
    std::optional<Cigar> cigar;  // only if AlignmentParameters::trace is set
    AlignStatistics statistics;
};

/*
 * One alignment of a query against a reference. The constructor validates
 * parameters and sequences, so that all errors are reported before any
 * block is computed:
 *
 * - ConfigError for invalid gap costs, block sizes, lane width or other settings
 * - AlphabetError for a symbol that the scoring profile does not know
 * - SequenceTooShortError if a sequence is shorter than the minimum block size
 *
 * run() may throw StepBudgetExceeded if AlignmentParameters::max_steps is set.
 */
class AlignmentSession {
public:
    AlignmentSession(
        std::string_view query,
        std::string_view reference,
        const ScoringProfile& scoring,
        const AlignmentParameters& params
    );

    AlignmentResult run(BlockObserver* observer = nullptr) const;

    /* Number of 16-bit lanes used by the kernel */
    int lanes() const { return m_kernels.lanes; }

private:
    ScoringProfile m_scoring;
    AlignmentParameters m_params;
    Sequence m_query;
    Sequence m_reference;
    LaneKernels m_kernels;
};

AlignmentResult align(
    std::string_view query,
    std::string_view reference,
    const ScoringProfile& scoring,
    const AlignmentParameters& params,
    BlockObserver* observer = nullptr
);

AlignmentResult global_alignment(
    std::string_view query,
    std::string_view reference,
    const ScoringProfile& scoring,
    const GapCosts& gaps,
    const BlockSizeRange& block_size
);

AlignmentResult xdrop_alignment(
    std::string_view query,
    std::string_view reference,
    const ScoringProfile& scoring,
    const GapCosts& gaps,
    const BlockSizeRange& block_size,
    int x_drop
);

/*
 * Score of the alignment described by cigar, which must start at the
 * beginning of both sequences. Throws std::invalid_argument if the cigar
 * runs past the end of a sequence or claims a match for differing symbols
 * (or a mismatch for identical ones).
 */
int score_alignment(
    std::string_view query,
    std::string_view reference,
    const Cigar& cigar,
    const ScoringProfile& scoring,
    const GapCosts& gaps
);

#endif
