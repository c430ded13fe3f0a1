#include "geohash/alphabet.hpp"
#include "geohash/error.hpp"
#include "geohash/logging.hpp"

#include <array>

namespace geohash {

namespace {

constexpr int8_t NO_VALUE = -1;

// Inverse of Alphabet::SYMBOLS over the full byte range
constexpr std::array<int8_t, 256> build_decode_table() {
    std::array<int8_t, 256> table{};
    for (auto& entry : table) {
        entry = NO_VALUE;
    }
    for (uint32_t v = 0; v < Alphabet::SIZE; ++v) {
        table[static_cast<unsigned char>(Alphabet::SYMBOLS[v])] = static_cast<int8_t>(v);
    }
    return table;
}

constexpr std::array<int8_t, 256> DECODE_TABLE = build_decode_table();

} // anonymous namespace

char Alphabet::symbol_for(uint8_t value) noexcept {
    return SYMBOLS[value & 0x1F];
}

std::optional<uint8_t> Alphabet::find_value(char symbol) noexcept {
    int8_t v = DECODE_TABLE[static_cast<unsigned char>(symbol)];
    if (v == NO_VALUE) {
        return std::nullopt;
    }
    return static_cast<uint8_t>(v);
}

bool Alphabet::is_symbol(char symbol) noexcept {
    return DECODE_TABLE[static_cast<unsigned char>(symbol)] != NO_VALUE;
}

uint8_t Alphabet::value_for(char symbol) {
    auto value = find_value(symbol);
    if (!value) {
        LOG_DEBUG("Rejected geohash symbol code ", static_cast<int>(static_cast<unsigned char>(symbol)));
        throw InvalidSymbolError(symbol, InvalidSymbolError::npos, __func__);
    }
    return *value;
}

} // namespace geohash
