#pragma once

#include "geohash/types.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace geohash {

/**
 * Geohash interval codec
 *
 * Encodes a (longitude, latitude) coordinate by repeatedly halving the
 * longitude range [-180, 180] and the latitude range [-90, 90]. Each
 * halving emits one bit: 1 when the coordinate lies strictly above the
 * midpoint, 0 otherwise. Bits alternate between the axes starting with
 * longitude, so bit i (0-based) belongs to longitude when i is even.
 * Every 5 bits form one base-32 symbol.
 *
 * All functions are pure and safe to call concurrently.
 */
class IntervalCodec {
public:
    static constexpr size_t MAX_FIXED_BITS = 64;

    /**
     * Encode a coordinate to a geohash string
     * @param coord Coordinate inside the valid ranges (not checked)
     * @param length Number of symbols to produce
     * @return Geohash of exactly length symbols
     */
    static std::string encode(const Coordinate& coord, size_t length);

    /**
     * Encode a coordinate to an integer geohash of bit_count bits
     *
     * The first produced bit is the most significant of the result. The
     * bit sequence matches encode() for the first bit_count bits.
     * @throws InvalidArgumentError if bit_count > MAX_FIXED_BITS
     */
    static uint64_t encode_fixed_bits(const Coordinate& coord, size_t bit_count);

    /**
     * Bounding box of an integer geohash produced by encode_fixed_bits
     * @throws InvalidArgumentError if bit_count > MAX_FIXED_BITS
     */
    static BoundingBox decode_fixed_bits(uint64_t hash, size_t bit_count);

    /**
     * Exact bounding box denoted by a geohash string
     * @throws InvalidSymbolError on the first character outside the alphabet
     */
    static BoundingBox decode_bbox(std::string_view hash);

    /**
     * Center of the bounding box plus half its width and height
     * @throws InvalidSymbolError on the first character outside the alphabet
     */
    static DecodedCoordinate decode(std::string_view hash);
};

} // namespace geohash
