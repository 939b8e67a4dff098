#ifndef BLOCKALIGN_SCORING_HPP
#define BLOCKALIGN_SCORING_HPP

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include "sequence.hpp"

// Largest magnitude accepted for substitution scores and gap costs
constexpr int MAX_ABS_COST = 10000;

/*
 * Affine gap costs (both are penalties, that is, nonnegative).
 * A gap of length L costs open + (L - 1) * extend.
 */
struct GapCosts {
    int open;
    int extend;

    int cost(size_t length) const {
        return length == 0 ? 0 : open + static_cast<int>(length - 1) * extend;
    }
};

/*
 * Substitution scores over a fixed alphabet. Symbols are case-insensitive.
 * score(a, b) takes a query symbol and a reference symbol (as alphabet
 * indices).
 */
class ScoringProfile {
public:
    /* match is a score, mismatch a penalty (both nonnegative) */
    static ScoringProfile constant(int match, int mismatch, const std::string& alphabet = "ACGTN");

    /* scores is a row-major alphabet.size() x alphabet.size() matrix, rows are query symbols */
    static ScoringProfile from_matrix(const std::string& alphabet, const std::vector<int>& scores);

    static ScoringProfile blosum62();

    int score(uint8_t query_symbol, uint8_t reference_symbol) const {
        return m_scores[query_symbol * m_alphabet.size() + reference_symbol];
    }

    /* Convert text to alphabet indices. name ("query", "reference") is used in error messages */
    Sequence encode(std::string_view text, const std::string& name) const;

    const std::string& alphabet() const { return m_alphabet; }
    size_t alphabet_size() const { return m_alphabet.size(); }
    int max_score() const { return m_max_score; }
    int min_score() const { return m_min_score; }

private:
    ScoringProfile(const std::string& alphabet, std::vector<int> scores);

    std::string m_alphabet;
    std::array<int16_t, 256> m_index;  // -1: not in alphabet
    std::vector<int> m_scores;
    int m_max_score;
    int m_min_score;
};

/*
 * Substitution scores laid out for the lane kernel: for every alphabet
 * symbol, one row with the score of that symbol against each position of
 * the sequence that runs along the lanes. Rows are padded so that vector
 * loads may run past the end of the sequence.
 */
class LaneProfile {
public:
    static constexpr size_t padding = 64;

    LaneProfile(const ScoringProfile& scoring, const Sequence& lanes, bool lanes_are_query);

    const int16_t* row(uint8_t symbol) const { return m_table.data() + symbol * m_stride; }
    size_t stride() const { return m_stride; }

private:
    size_t m_stride;
    std::vector<int16_t> m_table;
};

#endif
