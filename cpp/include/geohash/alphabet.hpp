#pragma once

#include <cstdint>
#include <optional>

namespace geohash {

/**
 * Base-32 geohash alphabet
 *
 * Maps a 5-bit value (0..31) to one ASCII symbol of
 * "0123456789bcdefghjkmnpqrstuvwxyz" and back. The letters a, i, l and o
 * are not part of the alphabet, and upper case is never accepted.
 */
class Alphabet {
public:
    static constexpr uint32_t SIZE = 32;
    static constexpr uint32_t BITS_PER_SYMBOL = 5;
    static constexpr const char* SYMBOLS = "0123456789bcdefghjkmnpqrstuvwxyz";

    /**
     * Symbol for a 5-bit value. Only the low 5 bits of value are used.
     */
    static char symbol_for(uint8_t value) noexcept;

    /**
     * 5-bit value of a symbol
     * @throws InvalidSymbolError if symbol is not in the alphabet
     */
    static uint8_t value_for(char symbol);

    /**
     * Non-throwing lookup
     * @return std::nullopt if symbol is not in the alphabet
     */
    static std::optional<uint8_t> find_value(char symbol) noexcept;

    static bool is_symbol(char symbol) noexcept;
};

} // namespace geohash
