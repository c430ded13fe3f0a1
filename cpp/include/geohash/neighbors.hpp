#pragma once

#include "geohash/types.hpp"
#include <string>
#include <string_view>

namespace geohash {

/**
 * Adjacent-cell lookup
 *
 * A neighbor is found by decoding the hash, moving the cell center by
 * twice the half-error (one full cell) along the requested direction and
 * re-encoding at the same length. Cells at the poles and the antimeridian
 * get no special treatment: the moved point may fall outside the valid
 * ranges and the result there is unspecified.
 */
class NeighborResolver {
public:
    /**
     * Adjacent geohash in one direction
     * @throws InvalidSymbolError if hash contains a character outside the alphabet
     */
    static std::string neighbor(std::string_view hash, Direction direction);

    /**
     * All eight adjacent geohashes. Decodes once.
     * @throws InvalidSymbolError if hash contains a character outside the alphabet
     */
    static Neighbors neighbors(std::string_view hash);

    /**
     * Center of the adjacent cell in the given direction
     */
    static Coordinate nudge(const DecodedCoordinate& decoded, Direction direction) noexcept;
};

} // namespace geohash
