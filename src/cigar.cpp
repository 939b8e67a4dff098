#include <cctype>
#include <sstream>
#include "cigar.hpp"


size_t Cigar::query_length() const {
    size_t length = 0;
    for (auto op_len : m_ops) {
        auto op = op_len & 0xf;
        if (op != CIGAR_INS) {
            length += op_len >> 4;
        }
    }
    return length;
}

size_t Cigar::reference_length() const {
    size_t length = 0;
    for (auto op_len : m_ops) {
        auto op = op_len & 0xf;
        if (op != CIGAR_DEL) {
            length += op_len >> 4;
        }
    }
    return length;
}

std::vector<OpLen> Cigar::to_vec() const {
    std::vector<OpLen> result;
    result.reserve(m_ops.size());
    for (auto op_len : m_ops) {
        result.push_back(OpLen{static_cast<CigarOp>(op_len & 0xf), op_len >> 4});
    }
    return result;
}

std::string Cigar::to_string() const {
    std::stringstream s;
    for (auto op_len : m_ops) {
        s << (op_len >> 4) << "=XID"[op_len & 0xf];
    }
    return s.str();
}

namespace {

CigarOp parse_operation(char c, size_t position) {
    switch (c) {
        case '=': return CIGAR_EQ;
        case 'X': return CIGAR_X;
        case 'I': return CIGAR_INS;
        case 'D': return CIGAR_DEL;
    }
    std::stringstream s;
    s << "Invalid CIGAR operation '" << c << "' at position " << position;
    throw std::invalid_argument(s.str());
}

}  // namespace

/* Parse "3=1X2D", allowing spaces between runs and omitted run lengths of 1 */
Cigar::Cigar(const std::string& cig) {
    size_t i = 0;
    while (i < cig.size()) {
        if (cig[i] == ' ') {
            ++i;
            continue;
        }
        uint32_t length = 1;
        if (isdigit(static_cast<unsigned char>(cig[i]))) {
            length = 0;
            while (i < cig.size() && isdigit(static_cast<unsigned char>(cig[i]))) {
                length = length * 10 + (cig[i] - '0');
                ++i;
            }
            if (i == cig.size()) {
                throw std::invalid_argument("CIGAR must not end with a number");
            }
        }
        push(parse_operation(cig[i], i), length);
        ++i;
    }
}
