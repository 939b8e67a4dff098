#include "doctest.h"
#include "cigar.hpp"

TEST_CASE("Parse CIGAR") {
    std::vector<std::string> cigars = {"", "1=", "10=2I1D99=1X"};
    for (auto& s : cigars) {
        CHECK(Cigar(s).to_string() == s);
    }
    // Not standard, only for convenience
    CHECK(Cigar("=").to_string() == "1=");
    CHECK(Cigar("= =").to_string() == "2=");
    CHECK(Cigar("==II").to_string() == "2=2I");
    CHECK(Cigar("= 2= X").to_string() == "3=1X");
    CHECK(Cigar("1= 2D 1=").to_string() == "1=2D1=");
    CHECK(Cigar("0= 3X").to_string() == "3X");
}

TEST_CASE("Parse invalid CIGAR") {
    CHECK_THROWS_AS(Cigar("3M"), std::invalid_argument);
    CHECK_THROWS_AS(Cigar("3=4"), std::invalid_argument);
}

TEST_CASE("Cigar construction and push") {
    Cigar c1;
    CHECK(c1.to_string() == "");
    CHECK(c1.empty());

    c1.push(CIGAR_EQ, 1);
    CHECK(c1.to_string() == "1=");

    c1.push(CIGAR_EQ, 1);
    CHECK(c1.to_string() == "2=");

    c1.push(CIGAR_INS, 3);
    CHECK(c1.to_string() == "2=3I");

    c1.push(CIGAR_DEL, 0);
    CHECK(c1.to_string() == "2=3I");

    Cigar c2{std::vector<uint32_t>{
        3 << 4 | CIGAR_EQ,
        5 << 4 | CIGAR_X,
        7 << 4 | CIGAR_INS,
        13 << 4 | CIGAR_DEL
    }};
    CHECK(c2.size() == 4);
    CHECK(c2.to_string() == "3=5X7I13D");

    CHECK_THROWS_AS(c2.push(7, 1), std::invalid_argument);
}

TEST_CASE("concatenate Cigar") {
    Cigar c{"3="};
    c += Cigar{"2=1X"};
    CHECK(c.to_string() == "5=1X");
}

TEST_CASE("edit distance") {
    CHECK(Cigar("3=1X4D5I7=").edit_distance() == 10);
}

TEST_CASE("query and reference lengths") {
    Cigar c{"3=1X4D5I7="};
    CHECK(c.query_length() == 15);
    CHECK(c.reference_length() == 16);
    CHECK(Cigar().query_length() == 0);
}

TEST_CASE("reverse") {
    Cigar c{"3=1X4D5I7="};
    c.reverse();
    CHECK(c.to_string() == "7=5I4D1X3=");
}

TEST_CASE("to_vec") {
    Cigar c{"2=1I3X"};
    std::vector<OpLen> expected{{CIGAR_EQ, 2}, {CIGAR_INS, 1}, {CIGAR_X, 3}};
    CHECK(c.to_vec() == expected);
}
