#include <algorithm>
#include <cctype>
#include <sstream>
#include "scoring.hpp"
#include "exceptions.hpp"

namespace {

const std::string blosum62_alphabet{"ARNDCQEGHILKMFPSTWYVBZX*"};

const std::vector<int> blosum62_scores{
     4, -1, -2, -2,  0, -1, -1,  0, -2, -1, -1, -1, -1, -2, -1,  1,  0, -3, -2,  0, -2, -1,  0, -4,  // A
    -1,  5,  0, -2, -3,  1,  0, -2,  0, -3, -2,  2, -1, -3, -2, -1, -1, -3, -2, -3, -1,  0, -1, -4,  // R
    -2,  0,  6,  1, -3,  0,  0,  0,  1, -3, -3,  0, -2, -3, -2,  1,  0, -4, -2, -3,  3,  0, -1, -4,  // N
    -2, -2,  1,  6, -3,  0,  2, -1, -1, -3, -4, -1, -3, -3, -1,  0, -1, -4, -3, -3,  4,  1, -1, -4,  // D
     0, -3, -3, -3,  9, -3, -4, -3, -3, -1, -1, -3, -1, -2, -3, -1, -1, -2, -2, -1, -3, -3, -2, -4,  // C
    -1,  1,  0,  0, -3,  5,  2, -2,  0, -3, -2,  1,  0, -3, -1,  0, -1, -2, -1, -2,  0,  3, -1, -4,  // Q
    -1,  0,  0,  2, -4,  2,  5, -2,  0, -3, -3,  1, -2, -3, -1,  0, -1, -3, -2, -2,  1,  4, -1, -4,  // E
     0, -2,  0, -1, -3, -2, -2,  6, -2, -4, -4, -2, -3, -3, -2,  0, -2, -2, -3, -3, -1, -2, -1, -4,  // G
    -2,  0,  1, -1, -3,  0,  0, -2,  8, -3, -3, -1, -2, -1, -2, -1, -2, -2,  2, -3,  0,  0, -1, -4,  // H
    -1, -3, -3, -3, -1, -3, -3, -4, -3,  4,  2, -3,  1,  0, -3, -2, -1, -3, -1,  3, -3, -3, -1, -4,  // I
    -1, -2, -3, -4, -1, -2, -3, -4, -3,  2,  4, -2,  2,  0, -3, -2, -1, -2, -1,  1, -4, -3, -1, -4,  // L
    -1,  2,  0, -1, -3,  1,  1, -2, -1, -3, -2,  5, -1, -3, -1,  0, -1, -3, -2, -2,  0,  1, -1, -4,  // K
    -1, -1, -2, -3, -1,  0, -2, -3, -2,  1,  2, -1,  5,  0, -2, -1, -1, -1, -1,  1, -3, -1, -1, -4,  // M
    -2, -3, -3, -3, -2, -3, -3, -3, -1,  0,  0, -3,  0,  6, -4, -2, -2,  1,  3, -1, -3, -3, -1, -4,  // F
    -1, -2, -2, -1, -3, -1, -1, -2, -2, -3, -3, -1, -2, -4,  7, -1, -1, -4, -3, -2, -2, -1, -2, -4,  // P
     1, -1,  1,  0, -1,  0,  0,  0, -1, -2, -2,  0, -1, -2, -1,  4,  1, -3, -2, -2,  0,  0,  0, -4,  // S
     0, -1,  0, -1, -1, -1, -1, -2, -2, -1, -1, -1, -1, -2, -1,  1,  5, -2, -2,  0, -1, -1,  0, -4,  // T
    -3, -3, -4, -4, -2, -2, -3, -2, -2, -3, -2, -3, -1,  1, -4, -3, -2, 11,  2, -3, -4, -3, -2, -4,  // W
    -2, -2, -2, -3, -2, -1, -2, -3,  2, -1, -1, -2, -1,  3, -3, -2, -2,  2,  7, -1, -3, -2, -1, -4,  // Y
     0, -3, -3, -3, -1, -2, -2, -3, -3,  3,  1, -2,  1, -1, -2, -2,  0, -3, -1,  4, -3, -2, -1, -4,  // V
    -2, -1,  3,  4, -3,  0,  1, -1,  0, -3, -4,  0, -3, -3, -2,  0, -1, -4, -3, -3,  4,  1, -1, -4,  // B
    -1,  0,  0,  1, -3,  3,  4, -2,  0, -3, -3,  1, -1, -3, -1,  0, -1, -3, -2, -2,  1,  4, -1, -4,  // Z
     0, -1, -1, -1, -2, -1, -1, -1, -1, -1, -1, -1, -1, -1, -2,  0,  0, -2, -1, -1, -1, -1, -1, -4,  // X
    -4, -4, -4, -4, -4, -4, -4, -4, -4, -4, -4, -4, -4, -4, -4, -4, -4, -4, -4, -4, -4, -4, -4,  1,  // *
};

}  // namespace

ScoringProfile::ScoringProfile(const std::string& alphabet, std::vector<int> scores)
    : m_alphabet(alphabet)
    , m_scores(std::move(scores))
{
    if (m_alphabet.empty()) {
        throw ConfigError("Alphabet must not be empty");
    }
    if (m_alphabet.size() > 255) {
        throw ConfigError("Alphabet must have at most 255 symbols");
    }
    if (m_scores.size() != m_alphabet.size() * m_alphabet.size()) {
        std::stringstream s;
        s << "Substitution matrix must have " << m_alphabet.size() * m_alphabet.size()
          << " entries, but has " << m_scores.size();
        throw ConfigError(s.str());
    }
    m_index.fill(-1);
    for (size_t i = 0; i < m_alphabet.size(); ++i) {
        auto upper = static_cast<unsigned char>(std::toupper(static_cast<unsigned char>(m_alphabet[i])));
        auto lower = static_cast<unsigned char>(std::tolower(static_cast<unsigned char>(m_alphabet[i])));
        if (m_index[upper] != -1) {
            throw ConfigError(std::string("Symbol '") + m_alphabet[i] + "' occurs more than once in the alphabet");
        }
        m_index[upper] = static_cast<int16_t>(i);
        m_index[lower] = static_cast<int16_t>(i);
    }
    for (auto score : m_scores) {
        if (score > MAX_ABS_COST || score < -MAX_ABS_COST) {
            throw ConfigError("Substitution scores must lie in [-" + std::to_string(MAX_ABS_COST) + ", " + std::to_string(MAX_ABS_COST) + "]");
        }
    }
    m_max_score = *std::max_element(m_scores.begin(), m_scores.end());
    m_min_score = *std::min_element(m_scores.begin(), m_scores.end());
}

ScoringProfile ScoringProfile::constant(int match, int mismatch, const std::string& alphabet) {
    if (match < 0 || mismatch < 0) {
        throw ConfigError("Match score and mismatch penalty must be nonnegative");
    }
    std::vector<int> scores(alphabet.size() * alphabet.size());
    for (size_t a = 0; a < alphabet.size(); ++a) {
        for (size_t b = 0; b < alphabet.size(); ++b) {
            scores[a * alphabet.size() + b] = a == b ? match : -mismatch;
        }
    }
    return ScoringProfile(alphabet, std::move(scores));
}

ScoringProfile ScoringProfile::from_matrix(const std::string& alphabet, const std::vector<int>& scores) {
    return ScoringProfile(alphabet, scores);
}

ScoringProfile ScoringProfile::blosum62() {
    return ScoringProfile(blosum62_alphabet, blosum62_scores);
}

Sequence ScoringProfile::encode(std::string_view text, const std::string& name) const {
    std::vector<uint8_t> symbols(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        auto index = m_index[static_cast<unsigned char>(text[i])];
        if (index == -1) {
            std::stringstream s;
            s << "Symbol '" << text[i] << "' at position " << i << " of the " << name
              << " is not in the alphabet " << m_alphabet;
            throw AlphabetError(s.str());
        }
        symbols[i] = static_cast<uint8_t>(index);
    }
    return Sequence(std::move(symbols));
}

LaneProfile::LaneProfile(const ScoringProfile& scoring, const Sequence& lanes, bool lanes_are_query)
    : m_stride(lanes.size() + padding)
    , m_table(scoring.alphabet_size() * m_stride, 0)
{
    for (size_t symbol = 0; symbol < scoring.alphabet_size(); ++symbol) {
        int16_t* row = m_table.data() + symbol * m_stride;
        for (size_t pos = 0; pos < lanes.size(); ++pos) {
            row[pos] = static_cast<int16_t>(
                lanes_are_query ? scoring.score(lanes[pos], symbol) : scoring.score(symbol, lanes[pos])
            );
        }
    }
}
