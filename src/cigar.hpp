#ifndef BLOCKALIGN_CIGAR_HPP
#define BLOCKALIGN_CIGAR_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <algorithm>
#include <stdexcept>


/*
 * Alignment operations. An insertion consumes a reference symbol only,
 * a deletion consumes a query symbol only.
 */
enum CigarOp {
    CIGAR_EQ = 0,
    CIGAR_X = 1,
    CIGAR_INS = 2,
    CIGAR_DEL = 3,
};

struct OpLen {
    CigarOp op;
    uint32_t len;

    bool operator==(const OpLen& other) const {
        return op == other.op && len == other.len;
    }
};

class Cigar {
public:
    Cigar() { }

    explicit Cigar(std::vector<uint32_t> ops) : m_ops(std::move(ops)) { }

    explicit Cigar(const std::string& cig);

    bool empty() const { return m_ops.empty(); }

    /* Number of runs */
    size_t size() const { return m_ops.size(); }

    void push(uint8_t op, uint32_t len) {
        if (op > CIGAR_DEL) {
            throw std::invalid_argument("Invalid CIGAR operation");
        }
        if (len == 0) {
            return;
        }
        if (m_ops.empty() || (m_ops.back() & 0xf) != op) {
            m_ops.push_back(len << 4 | op);
        } else {
            m_ops.back() += len << 4;
        }
    }

    void operator+=(const Cigar& other) {
        for (auto op_len : other.m_ops) {
            push(op_len & 0xf, op_len >> 4);
        }
    }

    bool operator==(const Cigar& other) const { return m_ops == other.m_ops; }
    bool operator!=(const Cigar& other) const { return m_ops != other.m_ops; }

    int edit_distance() const {
        auto dist = 0;
        for (auto op_len : m_ops) {
            auto op = op_len & 0xf;
            auto len = op_len >> 4;
            if (op == CIGAR_INS || op == CIGAR_DEL || op == CIGAR_X) {
                dist += len;
            }
        }
        return dist;
    }

    /* Number of query symbols covered (=, X and D) */
    size_t query_length() const;

    /* Number of reference symbols covered (=, X and I) */
    size_t reference_length() const;

    void reverse() {
        std::reverse(m_ops.begin(), m_ops.end());
    }

    std::vector<OpLen> to_vec() const;

    std::string to_string() const;

    std::vector<uint32_t> m_ops;
};

#endif
