#include <algorithm>
#include <sstream>
#include <stdexcept>
#include "aligner.hpp"
#include "block.hpp"
#include "exceptions.hpp"
#include "lanes.hpp"
#include "logger.hpp"
#include "traceback.hpp"

static Logger& logger = Logger::get();

namespace {

// Largest magnitude a score may reach; leaves room below NEG_LIMIT in 32-bit lanes
constexpr int64_t MAX_SCORE_RANGE = int64_t(1) << 28;

void check_parameters(const AlignmentParameters& params) {
    if (params.gaps.open < 0 || params.gaps.extend < 0) {
        throw ConfigError("Gap costs must be nonnegative");
    }
    if (params.gaps.open > MAX_ABS_COST || params.gaps.extend > MAX_ABS_COST) {
        throw ConfigError("Gap costs must be at most " + std::to_string(MAX_ABS_COST));
    }
    if (params.block_size.min == 0) {
        throw ConfigError("Minimum block size must be positive");
    }
    if (params.block_size.min > params.block_size.max) {
        std::stringstream s;
        s << "Minimum block size (" << params.block_size.min << ") must not exceed the maximum block size ("
          << params.block_size.max << ")";
        throw ConfigError(s.str());
    }
    if (params.lanes != 0 && !is_supported_lane_width(params.lanes)) {
        throw ConfigError("Unsupported lane width " + std::to_string(params.lanes));
    }
    if (params.x_drop < 0) {
        throw ConfigError("X-drop threshold must be nonnegative");
    }
    if (params.checkpoint_interval == 0) {
        throw ConfigError("Checkpoint interval must be positive");
    }
    if (params.min_improvement < 0) {
        throw ConfigError("Minimum improvement must be nonnegative");
    }
}

/*
 * Use the requested lane width, or probe the CPU and take the widest
 * supported width that divides both block sizes.
 */
int choose_lane_width(const AlignmentParameters& params) {
    const BlockSizeRange& size = params.block_size;
    if (params.lanes != 0) {
        if (size.min % params.lanes != 0 || size.max % params.lanes != 0) {
            std::stringstream s;
            s << "Block sizes " << size.min << " and " << size.max << " must be multiples of the lane width "
              << params.lanes;
            throw ConfigError(s.str());
        }
        return params.lanes;
    }
    int lanes = probe_lane_width();
    while (lanes > 1 && (size.min % lanes != 0 || size.max % lanes != 0)) {
        lanes /= 2;
    }
    logger.debug() << "CPU features: " << cpu_features() << "; using " << lanes << " lanes\n";
    return lanes;
}

}  // namespace

AlignmentSession::AlignmentSession(
    std::string_view query,
    std::string_view reference,
    const ScoringProfile& scoring,
    const AlignmentParameters& params
)
    : m_scoring(scoring)
    , m_params(params)
{
    check_parameters(m_params);
    m_kernels = select_kernels(choose_lane_width(m_params));

    m_query = m_scoring.encode(query, "query");
    m_reference = m_scoring.encode(reference, "reference");

    const size_t min_size = m_params.block_size.min;
    if (m_query.size() < min_size || m_reference.size() < min_size) {
        std::stringstream s;
        s << "Sequences must be at least as long as the minimum block size " << min_size
          << " (query: " << m_query.size() << ", reference: " << m_reference.size() << ")";
        throw SequenceTooShortError(s.str());
    }

    int64_t max_cost = std::max({
        int64_t(m_scoring.max_score()), -int64_t(m_scoring.min_score()),
        int64_t(m_params.gaps.open), int64_t(m_params.gaps.extend)
    });
    if (int64_t(m_query.size() + m_reference.size() + 2) * max_cost >= MAX_SCORE_RANGE) {
        throw ConfigError("Sequences are too long for the score range with these scores and gap costs");
    }
}

AlignmentResult AlignmentSession::run(BlockObserver* observer) const {
    BlockEngine engine(m_query, m_reference, m_scoring, m_params.gaps, m_params.block_size, m_kernels);
    BlockController controller(engine, m_params, observer);
    controller.run();

    AlignmentResult result;
    result.score = controller.score();
    result.query_end = controller.query_end();
    result.reference_end = controller.reference_end();
    result.statistics = controller.statistics();
    if (m_params.trace) {
        TracebackEngine traceback(engine, controller.history());
        result.cigar = traceback.trace(result.query_end, result.reference_end, result.statistics);
    }
    if (result.statistics.escalations > 0) {
        logger.debug() << result.statistics.escalations << " of " << result.statistics.strips
            << " strips needed 32-bit lanes\n";
    }
    return result;
}

AlignmentResult align(
    std::string_view query,
    std::string_view reference,
    const ScoringProfile& scoring,
    const AlignmentParameters& params,
    BlockObserver* observer
) {
    AlignmentSession session(query, reference, scoring, params);
    return session.run(observer);
}

AlignmentResult global_alignment(
    std::string_view query,
    std::string_view reference,
    const ScoringProfile& scoring,
    const GapCosts& gaps,
    const BlockSizeRange& block_size
) {
    AlignmentParameters params;
    params.gaps = gaps;
    params.block_size = block_size;
    params.mode = AlignMode::global;
    return align(query, reference, scoring, params);
}

AlignmentResult xdrop_alignment(
    std::string_view query,
    std::string_view reference,
    const ScoringProfile& scoring,
    const GapCosts& gaps,
    const BlockSizeRange& block_size,
    int x_drop
) {
    AlignmentParameters params;
    params.gaps = gaps;
    params.block_size = block_size;
    params.mode = AlignMode::xdrop;
    params.x_drop = x_drop;
    return align(query, reference, scoring, params);
}

int score_alignment(
    std::string_view query,
    std::string_view reference,
    const Cigar& cigar,
    const ScoringProfile& scoring,
    const GapCosts& gaps
) {
    Sequence q = scoring.encode(query, "query");
    Sequence r = scoring.encode(reference, "reference");
    if (cigar.query_length() > q.size() || cigar.reference_length() > r.size()) {
        throw std::invalid_argument("CIGAR " + cigar.to_string() + " is longer than the sequences");
    }
    int score = 0;
    size_t i = 0;
    size_t j = 0;
    for (const auto& op_len : cigar.to_vec()) {
        switch (op_len.op) {
            case CIGAR_EQ:
            case CIGAR_X:
                for (size_t t = 0; t < op_len.len; ++t, ++i, ++j) {
                    if ((q[i] == r[j]) != (op_len.op == CIGAR_EQ)) {
                        std::stringstream s;
                        s << "CIGAR operation " << "=X"[op_len.op] << " does not match the symbols at query position "
                          << i << " and reference position " << j;
                        throw std::invalid_argument(s.str());
                    }
                    score += scoring.score(q[i], r[j]);
                }
                break;
            case CIGAR_INS:
                score -= gaps.cost(op_len.len);
                j += op_len.len;
                break;
            case CIGAR_DEL:
                score -= gaps.cost(op_len.len);
                i += op_len.len;
                break;
        }
    }
    return score;
}
