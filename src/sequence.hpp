#ifndef BLOCKALIGN_SEQUENCE_HPP
#define BLOCKALIGN_SEQUENCE_HPP

#include <cstdint>
#include <vector>

/* A sequence encoded as indices into the alphabet of a ScoringProfile */
class Sequence {
public:
    Sequence() { }
    explicit Sequence(std::vector<uint8_t> symbols) : m_symbols(std::move(symbols)) { }

    size_t size() const { return m_symbols.size(); }
    bool empty() const { return m_symbols.empty(); }
    uint8_t operator[](size_t i) const { return m_symbols[i]; }
    const uint8_t* data() const { return m_symbols.data(); }

private:
    std::vector<uint8_t> m_symbols;
};

#endif
