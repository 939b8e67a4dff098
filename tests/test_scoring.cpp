#include "doctest.h"
#include "scoring.hpp"
#include "exceptions.hpp"

TEST_CASE("constant scoring profile") {
    auto scoring = ScoringProfile::constant(2, 3, "ACGT");
    CHECK(scoring.alphabet_size() == 4);
    CHECK(scoring.score(0, 0) == 2);
    CHECK(scoring.score(0, 1) == -3);
    CHECK(scoring.score(3, 3) == 2);
    CHECK(scoring.max_score() == 2);
    CHECK(scoring.min_score() == -3);

    CHECK_THROWS_AS(ScoringProfile::constant(-1, 1), ConfigError);
    CHECK_THROWS_AS(ScoringProfile::constant(1, -1), ConfigError);
}

TEST_CASE("encoding is case-insensitive") {
    auto scoring = ScoringProfile::constant(1, 1, "ACGT");
    auto upper = scoring.encode("ACGT", "query");
    auto lower = scoring.encode("acgt", "query");
    REQUIRE(upper.size() == 4);
    REQUIRE(lower.size() == 4);
    for (size_t i = 0; i < 4; ++i) {
        CHECK(upper[i] == i);
        CHECK(lower[i] == upper[i]);
    }
    CHECK(scoring.encode("", "query").empty());
}

TEST_CASE("symbols outside the alphabet") {
    auto scoring = ScoringProfile::constant(1, 1, "ACGT");
    CHECK_THROWS_AS(scoring.encode("ACNT", "query"), AlphabetError);
    CHECK_THROWS_AS(scoring.encode("AC-T", "reference"), AlignError);
    try {
        scoring.encode("ACNT", "reference");
        FAIL("no exception thrown");
    } catch (const AlphabetError& e) {
        std::string message{e.what()};
        CHECK(message.find("'N'") != std::string::npos);
        CHECK(message.find("position 2") != std::string::npos);
        CHECK(message.find("reference") != std::string::npos);
    }
}

TEST_CASE("BLOSUM62") {
    auto scoring = ScoringProfile::blosum62();
    CHECK(scoring.alphabet() == "ARNDCQEGHILKMFPSTWYVBZX*");
    auto s = scoring.encode("AWCR*", "query");
    CHECK(scoring.score(s[0], s[0]) == 4);
    CHECK(scoring.score(s[1], s[1]) == 11);
    CHECK(scoring.score(s[2], s[2]) == 9);
    CHECK(scoring.score(s[0], s[3]) == -1);
    CHECK(scoring.score(s[4], s[4]) == 1);
    CHECK(scoring.max_score() == 11);
    CHECK(scoring.min_score() == -4);
    for (uint8_t a = 0; a < scoring.alphabet_size(); ++a) {
        for (uint8_t b = 0; b < scoring.alphabet_size(); ++b) {
            CHECK(scoring.score(a, b) == scoring.score(b, a));
        }
    }
}

TEST_CASE("substitution matrix validation") {
    CHECK_THROWS_AS(ScoringProfile::from_matrix("AC", {1, -1, -1}), ConfigError);
    CHECK_THROWS_AS(ScoringProfile::from_matrix("", {}), ConfigError);
    CHECK_THROWS_AS(ScoringProfile::from_matrix("Aa", {1, 0, 0, 1}), ConfigError);
    CHECK_THROWS_AS(ScoringProfile::from_matrix("AC", {1, 0, 0, 20000}), ConfigError);

    // Asymmetric matrices are allowed; rows are query symbols
    auto scoring = ScoringProfile::from_matrix("AC", {1, -2, -3, 4});
    CHECK(scoring.score(0, 1) == -2);
    CHECK(scoring.score(1, 0) == -3);
}

TEST_CASE("lane profile") {
    auto scoring = ScoringProfile::from_matrix("AC", {1, -2, -3, 4});
    auto seq = scoring.encode("ACCA", "query");

    LaneProfile along_query(scoring, seq, true);
    CHECK(along_query.stride() == 4 + LaneProfile::padding);
    // Row of reference symbol C: score(query[pos], C)
    const int16_t* row = along_query.row(1);
    CHECK(row[0] == -2);
    CHECK(row[1] == 4);
    CHECK(row[2] == 4);
    CHECK(row[3] == -2);
    for (size_t pos = 4; pos < along_query.stride(); ++pos) {
        CHECK(row[pos] == 0);
    }

    LaneProfile along_reference(scoring, seq, false);
    // Row of query symbol C: score(C, reference[pos])
    row = along_reference.row(1);
    CHECK(row[0] == -3);
    CHECK(row[1] == 4);
}

TEST_CASE("gap costs") {
    GapCosts gaps{5, 2};
    CHECK(gaps.cost(0) == 0);
    CHECK(gaps.cost(1) == 5);
    CHECK(gaps.cost(3) == 9);
}
