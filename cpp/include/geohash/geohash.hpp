#pragma once

// Umbrella header: component classes plus free-function entry points

#include "geohash/alphabet.hpp"
#include "geohash/codec.hpp"
#include "geohash/error.hpp"
#include "geohash/neighbors.hpp"
#include "geohash/types.hpp"

#define GEOHASH_VERSION_MAJOR 1
#define GEOHASH_VERSION_MINOR 0
#define GEOHASH_VERSION_PATCH 0
#define GEOHASH_VERSION_STRING "1.0.0"

namespace geohash {

inline std::string encode(const Coordinate& coord, size_t length) {
    return IntervalCodec::encode(coord, length);
}

inline uint64_t encode_fixed_bits(const Coordinate& coord, size_t bit_count) {
    return IntervalCodec::encode_fixed_bits(coord, bit_count);
}

inline BoundingBox decode_fixed_bits(uint64_t hash, size_t bit_count) {
    return IntervalCodec::decode_fixed_bits(hash, bit_count);
}

inline BoundingBox decode_bbox(std::string_view hash) {
    return IntervalCodec::decode_bbox(hash);
}

inline DecodedCoordinate decode(std::string_view hash) {
    return IntervalCodec::decode(hash);
}

inline std::string neighbor(std::string_view hash, Direction direction) {
    return NeighborResolver::neighbor(hash, direction);
}

inline Neighbors neighbors(std::string_view hash) {
    return NeighborResolver::neighbors(hash);
}

} // namespace geohash
